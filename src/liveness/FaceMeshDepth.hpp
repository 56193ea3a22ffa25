#pragma once
#include <mutex>
#include <string>
#include <vector>
#include <opencv2/opencv.hpp>
#include <opencv2/dnn.hpp>

// 라이브니스 depth 검사용 랜드마크 z 값 공급자
class ILandmarkDepthSource {
	public:
		virtual ~ILandmarkDepthSource() = default;

		// face: BGR 얼굴 크롭. 성공 시 zs 에 정규화된 z 값들 (입력 폭 기준)
		virtual bool depthOf(const cv::Mat& face, std::vector<float>& zs) const = 0;
};

// MediaPipe face mesh(468점) ONNX 모델. 입력 192x192 RGB, 출력 1x1404 (x,y,z)
class DnnFaceMeshDepth : public ILandmarkDepthSource {
	public:
		explicit DnnFaceMeshDepth(const std::string& modelPath);

		bool isReady() const { return ready_; }
		bool depthOf(const cv::Mat& face, std::vector<float>& zs) const override;

		// 코끝, 눈꼬리, 입꼬리, 턱 (mesh index)
		static const std::vector<int> kDepthIndices;

	private:
		static constexpr int kInput		= 192;
		static constexpr int kPoints	= 468;

		mutable std::mutex mtx_;
		mutable cv::dnn::Net net_;
		bool ready_ = false;
};
