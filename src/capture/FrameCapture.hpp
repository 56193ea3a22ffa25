// capture/FrameCapture.hpp
#pragma once
#include <atomic>
#include <QObject>
#include <QString>
#include <QThread>
#include <opencv2/opencv.hpp>
#include "include/capture/LatestFrameMailbox.hpp"

// 카메라 전용 스레드. 읽은 프레임은 우편함에 게시만 하고 처리 속도는 기다리지 않는다
class FrameCapture : public QObject {
	Q_OBJECT
public:
	struct Options {
		int		index	= 0;
		QString device;				// 비어 있지 않으면 index 대신 사용 (/dev/videoN)
		int		width	= 640;
		int		height	= 480;
		double	fps		= 30.0;
		int		maxReadFailures = 10;	// 연속 실패 시 재오픈
		int		reopenDelayMs	= 300;
	};

	FrameCapture(LatestFrameMailbox* mailbox, const Options& opt);
	~FrameCapture() override;

	void start();
	void stop();		// 루프 종료 후 스레드 join

	bool isRunning() const { return running_.load(); }
	quint64 framesRead() const { return framesRead_.load(); }
	int reopenCount() const { return reopens_.load(); }

signals:
	void cameraOpened(int width, int height, double fps);
	void cameraError(const QString& msg);

private slots:
	void loop();

private:
	bool openCamera();
	void pace(qint64 elapsedMs) const;

	LatestFrameMailbox* mailbox_ = nullptr;
	Options opt_;
	cv::VideoCapture cap_;

	QThread thread_;
	std::atomic_bool running_{false};
	std::atomic<quint64> framesRead_{0};
	std::atomic_int reopens_{0};
};
