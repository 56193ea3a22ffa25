#include "quality/QualityAssessor.hpp"
#include "include/recog_params.hpp"
#include <QtCore/QDebug>
#include <algorithm>
#include <cmath>

// #define DEBUG

namespace {
inline double clamp01(double v) {
	if (!std::isfinite(v)) return 0.0;
	return std::max(0.0, std::min(1.0, v));
}
} // namespace

cv::Mat QualityAssessor::toGray(const cv::Mat& face)
{
	cv::Mat gray;
	if (face.empty()) return gray;

	if (face.channels() == 3) cv::cvtColor(face, gray, cv::COLOR_BGR2GRAY);
	else if (face.channels() == 4) cv::cvtColor(face, gray, cv::COLOR_BGRA2GRAY);
	else gray = face;

	if (gray.depth() != CV_8U) gray.convertTo(gray, CV_8U);
	return gray;
}

// === 샤프니스: Laplacian variance / K_SHARP ===
double QualityAssessor::sharpness(const cv::Mat& gray)
{
	if (gray.empty()) return 0.0;
	cv::Mat lap;
	cv::Laplacian(gray, lap, CV_64F);
	cv::Scalar mu, sigma;
	cv::meanStdDev(lap, mu, sigma);
	const double lapVar = sigma[0] * sigma[0];
	return clamp01(lapVar / recog::K_SHARP);
}

// === 밝기: 127.5에서 멀어질수록 감점 ===
double QualityAssessor::brightness(const cv::Mat& gray)
{
	if (gray.empty()) return 0.0;
	const double m = cv::mean(gray)[0];
	return clamp01(1.0 - std::abs(m - 127.5) / 127.5);
}

// === 대비: 256-bin 히스토그램 Shannon entropy / 8bit ===
double QualityAssessor::contrast(const cv::Mat& gray)
{
	if (gray.empty()) return 0.0;

	int histSizes[]			 = { 256 };
	float range[]			 = { 0, 256 };
	const float* rangesArr[] = { range };
	int channels[]			 = { 0 };

	cv::Mat hist;
	cv::calcHist(&gray, 1, channels, cv::Mat(), hist, 1, histSizes, rangesArr, true, false);

	const double total = static_cast<double>(gray.total());
	if (total <= 0.0) return 0.0;

	double entropy = 0.0;
	for (int i = 0; i < 256; ++i) {
		const double p = hist.at<float>(i) / total;
		if (p > 0.0) entropy -= p * std::log2(p);
	}
	return clamp01(entropy / 8.0);
}

double QualityAssessor::resolution(const cv::Mat& face)
{
	if (face.empty()) return 0.0;
	return clamp01(std::min(face.rows, face.cols) / recog::MIN_USABLE_PX);
}

// === 정면성: 눈 사이 거리 / 얼굴 폭 이 0.3에 가까울수록 1 ===
double QualityAssessor::frontal(const std::array<cv::Point2f, 5>* lmk, int faceWidth)
{
	if (!lmk) return recog::NEUTRAL_FRONTAL;
	if (faceWidth <= 0) return 0.0;

	const cv::Point2f d = (*lmk)[0] - (*lmk)[1];		// LE - RE
	const double eyeDist = std::hypot(d.x, d.y);
	const double ratio = eyeDist / static_cast<double>(faceWidth);
	return clamp01(1.0 - std::abs(ratio - recog::IDEAL_EYE_RATIO) / recog::IDEAL_EYE_RATIO);
}

QualityReport QualityAssessor::assess(const cv::Mat& face,
									  const std::array<cv::Point2f, 5>* lmk) const
{
	QualityReport q;
	if (face.empty()) {
		qDebug() << "[Quality] empty crop";
		return q;
	}

	cv::Mat gray;
	try {
		gray = toGray(face);
	} catch (const cv::Exception& e) {
		qWarning() << "[Quality] gray conversion failed:" << e.what();
		return q;
	}

	q.sharpness	 = sharpness(gray);
	q.brightness = brightness(gray);
	q.contrast	 = contrast(gray);
	q.resolution = resolution(face);
	q.frontal	 = frontal(lmk, face.cols);
	q.overall	 = (q.sharpness + q.brightness + q.contrast + q.resolution + q.frontal) / 5.0;

#ifdef DEBUG
	qDebug() << "[Quality]"
			 << "sharp=" << q.sharpness << "bright=" << q.brightness
			 << "contrast=" << q.contrast << "res=" << q.resolution
			 << "frontal=" << q.frontal << "overall=" << q.overall;
#endif

	return q;
}
