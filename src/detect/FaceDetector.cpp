#include "detect/FaceDetector.hpp"
#include <QtCore/QDebug>
#include <algorithm>

// #define DEBUG

namespace {
// YuNet 한 행: x y w h | 5점 (x,y) x5 | score
constexpr int kCols		  = 15;
constexpr int kLmkBegin	  = 4;
constexpr int kScoreCol	  = 14;
}

bool FaceDetector::init(const std::string& modelPath,
						int inputW, int inputH,
						float scoreThr, float nmsThr, int topK,
						int backend, int target)
{
	std::lock_guard<std::mutex> lk(mtx_);
	ready_ = false;
	modelPath_ = modelPath;
	inputSize_ = cv::Size(inputW, inputH);
	scoreThr_ = scoreThr;

	if (modelPath_.empty()) {
		qWarning() << "[FaceDetector] model path is empty";
		return false;
	}

	try {
		yunet_ = cv::FaceDetectorYN::create(modelPath_, "", inputSize_,
											scoreThr_, nmsThr, topK, backend, target);
	} catch (const cv::Exception& e) {
		qWarning() << "[FaceDetector] YuNet load failed:" << QString::fromStdString(modelPath_) << e.what();
		yunet_.release();
		return false;
	}
	if (yunet_.empty()) {
		qWarning() << "[FaceDetector] YuNet not created:" << QString::fromStdString(modelPath_);
		return false;
	}

	ready_ = true;
	qInfo() << "[FaceDetector] YuNet ready" << QString::fromStdString(modelPath_)
			<< "thr=" << scoreThr_ << "nms=" << nmsThr << "topK=" << topK;
	return true;
}

bool FaceDetector::isReady() const
{
	std::lock_guard<std::mutex> lk(mtx_);
	return ready_;
}

void FaceDetector::setScoreThreshold(float thr)
{
	std::lock_guard<std::mutex> lk(mtx_);
	if (thr == scoreThr_) return;
	scoreThr_ = thr;
	if (yunet_) yunet_->setScoreThreshold(thr);
}

std::vector<FaceDet> FaceDetector::parseYuNet(const cv::Mat& dets, float scoreThresh, const cv::Size& frame)
{
	std::vector<FaceDet> out;
	if (dets.empty() || dets.cols < kCols || dets.type() != CV_32F) return out;

	const cv::Rect bounds(cv::Point(0, 0), frame);
	for (int i = 0; i < dets.rows; ++i) {
		const float* row = dets.ptr<float>(i);
		if (row[kScoreCol] < scoreThresh) continue;

		FaceDet f;
		f.score = row[kScoreCol];
		// 프레임 밖으로 나간 박스는 잘라냄 (가장자리 얼굴)
		f.box = cv::Rect(cvRound(row[0]), cvRound(row[1]), cvRound(row[2]), cvRound(row[3])) & bounds;
		if (f.box.area() <= 0) continue;

		for (int k = 0; k < 5; ++k)
			f.lmk[k] = cv::Point2f(row[kLmkBegin + 2 * k], row[kLmkBegin + 2 * k + 1]);
		f.hasLandmarks = true;
		out.push_back(f);
	}

	std::sort(out.begin(), out.end(), [](const FaceDet& a, const FaceDet& b) { return a.score > b.score; });
	return out;
}

std::vector<FaceDet> FaceDetector::detectAll(const cv::Mat& frame) const
{
	if (frame.empty()) return {};

	cv::Mat bgr = frame;
	if (frame.channels() == 1) cv::cvtColor(frame, bgr, cv::COLOR_GRAY2BGR);
	else if (frame.channels() == 4) cv::cvtColor(frame, bgr, cv::COLOR_BGRA2BGR);

	std::lock_guard<std::mutex> lk(mtx_);
	if (!ready_) return {};

	cv::Mat dets;
	try {
		// 프레임 크기가 바뀌면 입력 크기도 맞춰야 함
		if (bgr.size() != inputSize_) {
			yunet_->setInputSize(bgr.size());
			inputSize_ = bgr.size();
		}
		yunet_->detect(bgr, dets);
	} catch (const cv::Exception& e) {
		qWarning() << "[FaceDetector] detect failed:" << e.what();
		return {};
	}

	auto out = parseYuNet(dets, scoreThr_, bgr.size());

#ifdef DEBUG
	qDebug() << "[FaceDetector] raw=" << dets.rows << "kept=" << (int)out.size();
#endif
	return out;
}
