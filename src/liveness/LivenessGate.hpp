#pragma once
#include <memory>
#include <opencv2/opencv.hpp>
#include "include/types.hpp"
#include "liveness/FaceMeshDepth.hpp"

// 휴리스틱 스푸핑 판별 (보안 통제가 아니라 참고 신호)
// 검사: texture / depth_variance(깊이 소스가 있을 때만) / color_distribution
class LivenessGate {
	public:
		LivenessGate() = default;
		explicit LivenessGate(std::shared_ptr<ILandmarkDepthSource> depth)
			: depth_(std::move(depth)) {}

		void setDepthSource(std::shared_ptr<ILandmarkDepthSource> depth) { depth_ = std::move(depth); }
		bool hasDepthSource() const { return depth_ != nullptr; }

		// 프레임에서 box 영역을 잘라 검사. 계산 실패는 해당 검사 실패로 처리.
		LivenessReport check(const cv::Mat& frame, const cv::Rect& box) const;

		static bool textureCheck(const cv::Mat& face);
		static bool colorDistributionCheck(const cv::Mat& face);
		bool depthCheck(const cv::Mat& face) const;

	private:
		std::shared_ptr<ILandmarkDepthSource> depth_;
};
