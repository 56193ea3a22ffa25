#pragma once
#include <mutex>
#include <string>
#include <vector>
#include <opencv2/opencv.hpp>
#include <opencv2/dnn.hpp>
#include <opencv2/objdetect.hpp>  // cv::FaceDetectorYN
#include "include/types.hpp"			// FaceDet

// 검출 백엔드 경계 (테스트에서는 가짜 구현)
class IFaceDetector {
	public:
		virtual ~IFaceDetector() = default;

		// 프레임 좌표계의 얼굴 후보 전부, score 내림차순
		virtual std::vector<FaceDet> detectAll(const cv::Mat& frame) const = 0;

		// 백엔드 자체 score 필터가 있으면 갱신 (없으면 무시)
		virtual void setScoreThreshold(float thr) { (void)thr; }
};

// YuNet (cv::FaceDetectorYN). 출석 워커와 등록 경로가 같은 인스턴스를 공유하므로 내부 락
class FaceDetector : public IFaceDetector {
	public:
		FaceDetector() = default;

		bool init(const std::string& modelPath,
				  int inputW = 320, int inputH = 240,
				  float scoreThr = 0.6f, float nmsThr = 0.3f, int topK = 500,
				  int backend = cv::dnn::DNN_BACKEND_OPENCV,
				  int target  = cv::dnn::DNN_TARGET_CPU);

		bool isReady() const;
		void setScoreThreshold(float thr) override;

		std::vector<FaceDet> detectAll(const cv::Mat& frame) const override;

		// 박스는 frame 안으로 잘림. 빈 박스와 scoreThresh 미만은 버림
		static std::vector<FaceDet> parseYuNet(const cv::Mat& dets, float scoreThresh, const cv::Size& frame);

	private:
		mutable std::mutex mtx_;
		bool ready_ = false;
		float scoreThr_ = 0.6f;
		std::string modelPath_;
		cv::Ptr<cv::FaceDetectorYN> yunet_;
		mutable cv::Size inputSize_{0, 0};
};
