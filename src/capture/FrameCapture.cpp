// capture/FrameCapture.cpp
#include "FrameCapture.hpp"
#include <algorithm>
#include <QDateTime>
#include <QElapsedTimer>
#include <QtCore/QDebug>

FrameCapture::FrameCapture(LatestFrameMailbox* mailbox, const Options& opt)
	: QObject(nullptr), mailbox_(mailbox), opt_(opt)
{
	connect(&thread_, &QThread::started, this, &FrameCapture::loop, Qt::QueuedConnection);
	moveToThread(&thread_);
}

FrameCapture::~FrameCapture()
{
	stop();
}

void FrameCapture::start()
{
	if (running_.exchange(true)) return;
	thread_.start();
}

void FrameCapture::stop()
{
	running_ = false;
	if (thread_.isRunning() && QThread::currentThread() != &thread_) {
		thread_.quit();
		thread_.wait();
	}
}

bool FrameCapture::openCamera()
{
	if (cap_.isOpened()) cap_.release();

	try {
		const bool ok = opt_.device.isEmpty() ? cap_.open(opt_.index, cv::CAP_V4L2)
											  : cap_.open(opt_.device.toStdString(), cv::CAP_V4L2);
		if (!ok) return false;
	} catch (const cv::Exception& e) {
		qWarning() << "[FrameCapture] open failed:" << e.what();
		return false;
	}

	if (opt_.width > 0)	 cap_.set(cv::CAP_PROP_FRAME_WIDTH, opt_.width);
	if (opt_.height > 0) cap_.set(cv::CAP_PROP_FRAME_HEIGHT, opt_.height);
	if (opt_.fps > 0)	 cap_.set(cv::CAP_PROP_FPS, opt_.fps);

	const int w = int(cap_.get(cv::CAP_PROP_FRAME_WIDTH));
	const int h = int(cap_.get(cv::CAP_PROP_FRAME_HEIGHT));
	const double fps = cap_.get(cv::CAP_PROP_FPS);
	qInfo() << "[FrameCapture] opened"
			<< (opt_.device.isEmpty() ? QString("index %1").arg(opt_.index) : opt_.device)
			<< w << "x" << h << "@" << fps;
	emit cameraOpened(w, h, fps);
	return true;
}

// 요청 fps 에 맞춰 쉬기 (최소 1ms)
void FrameCapture::pace(qint64 elapsedMs) const
{
	qint64 sleepMs = 1;
	if (opt_.fps > 0) sleepMs = std::max<qint64>(1, qint64(1000.0 / opt_.fps) - elapsedMs);
	QThread::msleep(static_cast<unsigned long>(sleepMs));
}

void FrameCapture::loop()
{
	int failures = 0;
	QElapsedTimer tick;
	tick.start();

	while (running_.load()) {
		if (!cap_.isOpened() && !openCamera()) {
			QThread::msleep(opt_.reopenDelayMs);
			continue;
		}

		Frame f;
		if (!cap_.read(f.bgr) || f.bgr.empty()) {
			if (++failures >= opt_.maxReadFailures) {
				emit cameraError(QString("[FrameCapture] %1 consecutive read failures, reopening").arg(failures));
				cap_.release();
				++reopens_;
				failures = 0;
				QThread::msleep(opt_.reopenDelayMs);
			} else {
				QThread::msleep(5);
			}
			continue;
		}
		failures = 0;
		++framesRead_;

		f.capturedAt = QDateTime::currentDateTime();
		if (mailbox_) mailbox_->publish(f);

		pace(tick.restart());
	}

	if (cap_.isOpened()) cap_.release();
	qInfo() << "[FrameCapture] stopped, frames=" << framesRead_.load();
	thread_.quit();
}
