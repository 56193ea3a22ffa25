#pragma once
#include <array>
#include <opencv2/opencv.hpp>
#include "include/types.hpp"

// 얼굴 크롭의 사용 가능성 평가. 어떤 입력에도 예외 없이 낮은 점수를 돌려준다.
class QualityAssessor {
	public:
		// face: BGR/Gray 얼굴 크롭
		// lmk : 크롭과 같은 스케일의 5점 랜드마크 (없으면 nullptr)
		QualityReport assess(const cv::Mat& face,
							 const std::array<cv::Point2f, 5>* lmk = nullptr) const;

		static double sharpness(const cv::Mat& gray);
		static double brightness(const cv::Mat& gray);
		static double contrast(const cv::Mat& gray);
		static double resolution(const cv::Mat& face);
		static double frontal(const std::array<cv::Point2f, 5>* lmk, int faceWidth);

		static cv::Mat toGray(const cv::Mat& face);
};
