#pragma once
#include <atomic>
#include <QObject>
#include <QThread>
#include "include/capture/LatestFrameMailbox.hpp"
#include "pipeline/RecognitionPipeline.hpp"
#include "session/AttendanceSession.hpp"

// 우편함의 최신 프레임 -> 파이프라인 -> session.observe (전용 스레드)
class RecognitionWorker : public QObject {
	Q_OBJECT
public:
	RecognitionWorker(LatestFrameMailbox* mailbox, RecognitionPipeline* pipeline,
					  AttendanceSession* session);
	~RecognitionWorker() override;

	void start();
	void stop();		// 진행 중인 프레임은 끝까지 처리 후 종료

	// 프레임 1장 동기 처리. 새로 출석한 인원 수 반환
	int processOnce(const Frame& frame);

signals:
	void presenceMarked(const QString& identity, float confidence);
	void deadlineReached();

private slots:
	void loop();

private:
	LatestFrameMailbox* mailbox_ = nullptr;
	RecognitionPipeline* pipeline_ = nullptr;
	AttendanceSession* session_ = nullptr;

	QThread thread_;
	std::atomic_bool running_{false};
	bool deadlineSignalled_ = false;
};
