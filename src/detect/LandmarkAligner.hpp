#pragma once
#include <array>
#include <opencv2/core.hpp>
#include "include/types.hpp"

// 5점 랜드마크 기반 얼굴 정렬 + 박스 폴백
class LandmarkAligner {
	public:
		using Points5 = std::array<cv::Point2f, 5>;		// [LE, RE, Nose, LM, RM]

		// 랜드마크가 있으면 유사변환 정렬, 없거나 실패하면 확장 박스를 패딩/리사이즈.
		// 둘 다 안 되면 빈 Mat
		cv::Mat cropFace(const cv::Mat& srcBgr, const FaceDet& det,
						 const cv::Size& outSize = {112, 112}) const;

		// 기준 템플릿으로 warp. 변환 추정 실패 시 빈 Mat
		static cv::Mat warpToTemplate(const cv::Mat& srcBgr, Points5 pts, const cv::Size& outSize);
		// 박스 중심 기준 정사각 확장 후 이미지 경계로 자름
		static cv::Rect squareRoi(const cv::Rect& box, float scale, const cv::Size& imgSz);
		// 회색 패딩으로 정사각 만든 뒤 side x side
		static cv::Mat padToSquare(const cv::Mat& src, int side);

		static constexpr float kFallbackScale = 1.3f;
};
