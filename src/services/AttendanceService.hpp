#pragma once
#include <memory>
#include <QObject>
#include <QStringList>
#include <QTimer>

#include "include/types.hpp"
#include "include/capture/LatestFrameMailbox.hpp"
#include "capture/FrameCapture.hpp"
#include "config/RecognitionSettings.hpp"
#include "detect/FaceDetector.hpp"
#include "ai/Embedder.hpp"
#include "liveness/LivenessGate.hpp"
#include "gallery/Gallery.hpp"
#include "pipeline/RecognitionPipeline.hpp"
#include "pipeline/RecognitionWorker.hpp"
#include "session/AttendanceSession.hpp"
#include "services/EnrollmentService.hpp"
#include "services/JsonGalleryStore.hpp"
#include "services/QSqliteService.hpp"
#include "services/SqliteAttendanceSink.hpp"

// capture -> worker -> pipeline -> session -> sink 배선 + 마감 타이머
class AttendanceService : public QObject {
	Q_OBJECT
public:
	explicit AttendanceService(RecognitionSettings* settings, QObject* parent = nullptr);
	~AttendanceService() override;

	// 모델, DB, 갤러리 준비. 갤러리 로드 실패는 치명적(false)
	bool initialize();
	// 모델을 밖에서 넣는 경우 (DB/갤러리는 설정 경로 그대로)
	bool initializeWith(std::shared_ptr<IFaceDetector> detector,
						std::shared_ptr<IEmbedder> embedder,
						std::shared_ptr<LivenessGate> liveness);

	// 세션과 카메라 등록은 동시에 돌지 않는다 (카메라/메일박스 하나)
	bool startSession(const QStringList& roster);
	SessionSummary stopSession();
	bool isSessionActive() const;

	// 카메라로 identity 등록. timeoutSec 안에 최대 샘플을 못 채우면 모인 만큼으로 마무리
	bool startEnrollment(const QString& identity, const QVariantMap& metadata, int timeoutSec);
	void cancelEnrollment();
	bool isEnrolling() const;

	// 설정 재적재 후 호출. 검출기 내부 score 필터를 새 값으로
	void applySettings(const RecognitionConfig& cfg);

	Gallery& gallery() { return gallery_; }
	const RecognitionPipeline* pipeline() const { return pipeline_.get(); }

signals:
	void sessionFinished(const SessionSummary& summary);
	void enrollmentFinished(const RegistrationResult& result);

private slots:
	void onDeadline();
	void onEnrollTick();

private:
	bool openStorage();
	bool wire(std::shared_ptr<IFaceDetector> detector,
			  std::shared_ptr<IEmbedder> embedder,
			  std::shared_ptr<LivenessGate> liveness);
	void startCapture();
	void stopCapture();
	void finishEnrollment();
	void reportSummary(const SessionSummary& s);

	RecognitionSettings* settings_ = nullptr;

	Gallery gallery_;
	std::unique_ptr<JsonGalleryStore> store_;
	std::shared_ptr<QSqliteService> db_;
	std::unique_ptr<SqliteAttendanceSink> sink_;

	std::shared_ptr<IFaceDetector> detector_;
	std::shared_ptr<IEmbedder> embedder_;
	std::shared_ptr<LivenessGate> liveness_;
	std::unique_ptr<RecognitionPipeline> pipeline_;
	std::unique_ptr<EnrollmentService> enroll_;

	std::unique_ptr<AttendanceSession> session_;
	std::unique_ptr<LatestFrameMailbox> mailbox_;
	std::unique_ptr<FrameCapture> capture_;
	std::unique_ptr<RecognitionWorker> worker_;

	QTimer deadlineTimer_;
	QTimer enrollTimer_;
	QTimer enrollTimeout_;
	bool sessionReported_ = false;
};
