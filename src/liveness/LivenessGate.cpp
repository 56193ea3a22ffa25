#include "LivenessGate.hpp"
#include "include/recog_params.hpp"
#include <QtCore/QDebug>
#include <algorithm>
#include <cmath>
#include <numeric>

// #define DEBUG

// === 1) 텍스처: 인쇄물/화면은 Laplacian variance 가 낮다 ===
bool LivenessGate::textureCheck(const cv::Mat& face)
{
	if (face.empty()) return false;
	try {
		cv::Mat gray;
		if (face.channels() == 3) cv::cvtColor(face, gray, cv::COLOR_BGR2GRAY);
		else gray = face;

		cv::Mat lap;
		cv::Laplacian(gray, lap, CV_64F);
		cv::Scalar mu, sigma;
		cv::meanStdDev(lap, mu, sigma);
		const double lapVar = sigma[0] * sigma[0];
#ifdef DEBUG
		qDebug() << "[Liveness] texture lapVar=" << lapVar;
#endif
		return lapVar > recog::TEXTURE_FLOOR;
	} catch (const cv::Exception& e) {
		qWarning() << "[Liveness] texture failed:" << e.what();
		return false;
	}
}

// === 3) 색 분포: 8x8x8 히스토그램 자기 유사도 + 단색 입력 방지 ===
bool LivenessGate::colorDistributionCheck(const cv::Mat& face)
{
	if (face.empty() || face.channels() != 3) return false;
	try {
		int histSizes[]			 = { 8, 8, 8 };
		float range[]			 = { 0, 256 };
		const float* rangesArr[] = { range, range, range };
		int channels[]			 = { 0, 1, 2 };

		cv::Mat hist;
		cv::calcHist(&face, 1, channels, cv::Mat(), hist, 3, histSizes, rangesArr, true, false);
		cv::normalize(hist, hist);

		const double score = cv::compareHist(hist, hist, cv::HISTCMP_CHISQR);
		const int populated = cv::countNonZero(hist.reshape(1, 1));
#ifdef DEBUG
		qDebug() << "[Liveness] hist chisqr=" << score << "bins=" << populated;
#endif
		return std::isfinite(score) && score < recog::HIST_CHISQR_MAX
			   && populated >= recog::HIST_MIN_BINS;
	} catch (const cv::Exception& e) {
		qWarning() << "[Liveness] color histogram failed:" << e.what();
		return false;
	}
}

// === 2) 깊이: face mesh z 분산 (평면 스푸핑은 분산이 작다) ===
bool LivenessGate::depthCheck(const cv::Mat& face) const
{
	if (!depth_) return false;

	std::vector<float> zs;
	if (!depth_->depthOf(face, zs) || zs.size() < 4) {
		qDebug() << "[Liveness] depth landmarks unavailable for this face";
		return false;
	}

	const double mean = std::accumulate(zs.begin(), zs.end(), 0.0) / zs.size();
	double var = 0.0;
	for (float z : zs) var += (z - mean) * (z - mean);
	var /= zs.size();

#ifdef DEBUG
	qDebug() << "[Liveness] depth var=" << var;
#endif
	return std::isfinite(var) && var > recog::DEPTH_VAR_FLOOR;
}

LivenessReport LivenessGate::check(const cv::Mat& frame, const cv::Rect& box) const
{
	LivenessReport r;
	r.evaluated = true;

	cv::Mat face;
	if (!frame.empty()) {
		const cv::Rect roi = box & cv::Rect(0, 0, frame.cols, frame.rows);
		if (roi.area() > 0) face = frame(roi);
	}

	r.checks.insert(QStringLiteral("texture"), textureCheck(face));
	// 깊이 소스가 없으면 분모에서 제외
	if (depth_) {
		r.checks.insert(QStringLiteral("depth_variance"), !face.empty() && depthCheck(face));
	}
	r.checks.insert(QStringLiteral("color_distribution"), colorDistributionCheck(face));

	int failed = 0;
	for (auto it = r.checks.cbegin(); it != r.checks.cend(); ++it) {
		if (!it.value()) ++failed;
	}

	r.confidence = 1.0 - static_cast<double>(failed) / static_cast<double>(r.checks.size());
	r.isReal = r.confidence > 0.5;

	if (!r.isReal) {
		qDebug() << "[Liveness] spoof suspected conf=" << r.confidence << "checks=" << r.checks;
	}
	return r;
}
