#include "services/AttendanceService.hpp"
#include "log/SystemLogger.hpp"
#include "log/attendance_logging.hpp"
#include "logger.hpp"
#include <algorithm>
#include <QFileInfo>
#include <QtCore/QDebug>

namespace {
constexpr int kEnrollTickMs = 700;		// 자세를 바꿀 시간
}

AttendanceService::AttendanceService(RecognitionSettings* settings, QObject* parent)
	: QObject(parent), settings_(settings)
{
	deadlineTimer_.setSingleShot(true);
	connect(&deadlineTimer_, &QTimer::timeout, this, &AttendanceService::onDeadline);

	enrollTimer_.setInterval(kEnrollTickMs);
	connect(&enrollTimer_, &QTimer::timeout, this, &AttendanceService::onEnrollTick);

	enrollTimeout_.setSingleShot(true);
	connect(&enrollTimeout_, &QTimer::timeout, this, &AttendanceService::finishEnrollment);
}

AttendanceService::~AttendanceService()
{
	if (isSessionActive()) stopSession();
	if (isEnrolling()) cancelEnrollment();
	stopCapture();
}

bool AttendanceService::openStorage()
{
	const RecognitionConfig cfg = settings_->snapshot();

	// ── DB ──
	db_ = std::make_shared<QSqliteService>(cfg.databaseFile);
	if (!db_->initializeDatabase()) {
		qCritical() << "[Service] database init failed:" << cfg.databaseFile;
		return false;
	}
	sink_ = std::make_unique<SqliteAttendanceSink>(db_);

	// ── 갤러리 (실패 시 치명적) ──
	store_ = std::make_unique<JsonGalleryStore>(cfg.galleryFile);
	std::vector<GalleryRecord> records;
	if (!store_->load(records) || !gallery_.loadRecords(records)) {
		qCritical() << "[Service] gallery load failed:" << cfg.galleryFile;
		SystemLogger::critical("APP", "gallery load failed", cfg.galleryFile);
		return false;
	}
	return true;
}

bool AttendanceService::initialize()
{
	if (!openStorage()) return false;
	const RecognitionConfig cfg = settings_->snapshot();

	// ── 모델 ──
	auto detector = std::make_shared<FaceDetector>();
	if (!detector->init(cfg.detectorModel.toStdString(), 320, 240,
						static_cast<float>(cfg.detectorScoreThreshold))) {
		qCritical() << "[Service] detector init failed:" << cfg.detectorModel;
		return false;
	}

	Embedder::Options eo;
	eo.modelPath = cfg.embedderModel;
	auto embedder = std::make_shared<Embedder>(eo);
	if (!embedder->isReady()) {
		qCritical() << "[Service] embedder not ready:" << cfg.embedderModel;
		return false;
	}

	auto liveness = std::make_shared<LivenessGate>();
	if (!cfg.faceMeshModel.isEmpty() && QFileInfo::exists(cfg.faceMeshModel)) {
		auto mesh = std::make_shared<DnnFaceMeshDepth>(cfg.faceMeshModel.toStdString());
		if (mesh->isReady()) liveness->setDepthSource(mesh);
	}
	if (!liveness->hasDepthSource())
		qWarning() << "[Service] no face-mesh depth source, depth check omitted";

	return wire(detector, embedder, liveness);
}

bool AttendanceService::initializeWith(std::shared_ptr<IFaceDetector> detector,
									   std::shared_ptr<IEmbedder> embedder,
									   std::shared_ptr<LivenessGate> liveness)
{
	if (!detector || !embedder) return false;
	if (!openStorage()) return false;
	if (!liveness) liveness = std::make_shared<LivenessGate>();
	return wire(std::move(detector), std::move(embedder), std::move(liveness));
}

bool AttendanceService::wire(std::shared_ptr<IFaceDetector> detector,
							 std::shared_ptr<IEmbedder> embedder,
							 std::shared_ptr<LivenessGate> liveness)
{
	detector_ = std::move(detector);
	embedder_ = std::move(embedder);
	liveness_ = std::move(liveness);

	pipeline_ = std::make_unique<RecognitionPipeline>(detector_, embedder_, liveness_, &gallery_, settings_);
	enroll_ = std::make_unique<EnrollmentService>(detector_, embedder_, &gallery_, store_.get(), settings_);
	mailbox_ = std::make_unique<LatestFrameMailbox>();

	qInfo() << "[Service] ready identities=" << gallery_.size() << "dim=" << gallery_.dim();
	SystemLogger::info("APP", "service initialized", QString("identities=%1").arg(gallery_.size()));
	return true;
}

void AttendanceService::applySettings(const RecognitionConfig& cfg)
{
	if (detector_) detector_->setScoreThreshold(static_cast<float>(cfg.detectorScoreThreshold));
}

void AttendanceService::startCapture()
{
	// 이전 워커/카메라가 옛 메일박스를 잡고 있지 않게 먼저 정리
	stopCapture();

	const RecognitionConfig cfg = settings_->snapshot();
	mailbox_ = std::make_unique<LatestFrameMailbox>();
	FrameCapture::Options co;
	co.index = cfg.cameraIndex;
	co.width = cfg.frameWidth;
	co.height = cfg.frameHeight;
	co.fps = cfg.fps;
	capture_ = std::make_unique<FrameCapture>(mailbox_.get(), co);
	connect(capture_.get(), &FrameCapture::cameraError, this, [](const QString& msg) {
		qWarning() << msg;
		SystemLogger::warn("CAMERA", msg);
	}, Qt::QueuedConnection);
	capture_->start();
}

void AttendanceService::stopCapture()
{
	if (worker_) {
		worker_->stop();
		worker_.reset();
	}
	if (capture_) {
		capture_->stop();
		capture_.reset();
	}
	if (mailbox_) mailbox_->close();
}

bool AttendanceService::startSession(const QStringList& roster)
{
	if (!pipeline_) {
		qWarning() << "[Service] startSession before initialize";
		return false;
	}
	if (isSessionActive()) {
		qWarning() << "[Service] session already active";
		return false;
	}
	if (isEnrolling()) {
		qWarning() << "[Service] session rejected while registration is running";
		return false;
	}
	// observe 안에서 마감된 이전 세션의 워커가 아직 돌고 있으면 먼저 마무리
	if (worker_) stopSession();

	const RecognitionConfig cfg = settings_->snapshot();
	AttendanceSession::Options so;
	so.durationSec = cfg.sessionDurationSec;
	so.acceptSpoofed = cfg.acceptSpoofed;

	session_ = std::make_unique<AttendanceSession>(sink_.get(), so);
	if (!session_->start(roster)) return false;
	sessionReported_ = false;
	pipeline_->resetStats();

	startCapture();
	worker_ = std::make_unique<RecognitionWorker>(mailbox_.get(), pipeline_.get(), session_.get());
	// 큐에 남은 옛 워커의 마감 신호가 새 세션을 끝내지 않도록
	connect(worker_.get(), &RecognitionWorker::deadlineReached, this, [this, w = worker_.get()] {
		if (w == worker_.get()) onDeadline();
	}, Qt::QueuedConnection);
	connect(worker_.get(), &RecognitionWorker::presenceMarked, this, [](const QString& id, float conf) {
		SystemLogger::info("SESSION", QString("present %1").arg(id), QString("confidence=%1").arg(conf));
	}, Qt::QueuedConnection);
	worker_->start();

	deadlineTimer_.start(cfg.sessionDurationSec * 1000);

	LOG_INFO(QString("session started roster=%1 duration=%2s")
				 .arg(session_->roster().size()).arg(cfg.sessionDurationSec));
	SystemLogger::info("SESSION", "session started", QString("roster=%1").arg(session_->roster().size()));
	return true;
}

SessionSummary AttendanceService::stopSession()
{
	deadlineTimer_.stop();
	if (!session_) return {};

	// end() 가 먼저 락을 잡으면 진행 중 프레임의 observe 는 무시된다
	const SessionSummary s = session_->end();
	if (worker_) stopCapture();

	if (!sessionReported_ && session_->state() == SessionState::Ended) {
		sessionReported_ = true;
		reportSummary(s);
		emit sessionFinished(s);
	}
	return s;
}

bool AttendanceService::isSessionActive() const
{
	return session_ && session_->state() == SessionState::Active;
}

void AttendanceService::onDeadline()
{
	qCInfo(LC_SESSION) << "[Service] session deadline";
	stopSession();
}

void AttendanceService::reportSummary(const SessionSummary& s)
{
	bool ok = Logger::writef("session ended: total=%d present=%d absent=%d rate=%.1f%% avgConf=%.3f",
							 s.total, static_cast<int>(s.present.size()), static_cast<int>(s.absent.size()),
							 s.attendanceRate, s.averageConfidence);
	if (!s.present.isEmpty()) ok = Logger::write("present: " + s.present.join(", ").toStdString()) && ok;
	if (!s.absent.isEmpty()) ok = Logger::write("absent: " + s.absent.join(", ").toStdString()) && ok;

	if (pipeline_) {
		const auto st = pipeline_->stats();
		ok = Logger::writef("pipeline: frames=%llu/%llu faces=%llu lowQ=%llu extractFail=%llu recognized=%llu spoof=%llu",
							static_cast<unsigned long long>(st.framesProcessed),
							static_cast<unsigned long long>(st.framesSeen),
							static_cast<unsigned long long>(st.faces),
							static_cast<unsigned long long>(st.lowQuality),
							static_cast<unsigned long long>(st.extractionFailed),
							static_cast<unsigned long long>(st.recognized),
							static_cast<unsigned long long>(st.spoofSuspected)) && ok;
	}
	if (!ok) qWarning() << "[Service] session report not written:" << QString::fromStdString(Logger::currentFile());

	SystemLogger::info("SESSION", "session ended",
					   QString("present=%1 absent=%2 rate=%3").arg(s.present.size())
						   .arg(s.absent.size()).arg(s.attendanceRate, 0, 'f', 1));
}

bool AttendanceService::startEnrollment(const QString& identity, const QVariantMap& metadata, int timeoutSec)
{
	RegistrationResult rejected;
	if (isSessionActive() || worker_) {
		qWarning() << "[Service] registration rejected while a session is active";
		rejected.reason = "attendance session is active";
		emit enrollmentFinished(rejected);
		return false;
	}
	if (!enroll_ || !enroll_->begin(identity, metadata)) {
		rejected.reason = "cannot start registration";
		emit enrollmentFinished(rejected);
		return false;
	}
	startCapture();
	enrollTimer_.start();
	enrollTimeout_.start(std::max(1, timeoutSec) * 1000);
	qInfo() << "[Service] enrolling" << identity << "timeout=" << timeoutSec << "s";
	return true;
}

bool AttendanceService::isEnrolling() const
{
	return enroll_ && enroll_->isActive();
}

void AttendanceService::cancelEnrollment()
{
	enrollTimer_.stop();
	enrollTimeout_.stop();
	if (!isEnrolling()) return;
	stopCapture();
	enroll_->cancel();
}

// 타임아웃 또는 최대 샘플 도달
void AttendanceService::finishEnrollment()
{
	enrollTimer_.stop();
	enrollTimeout_.stop();
	if (!isEnrolling()) return;
	stopCapture();
	const RegistrationResult r = enroll_->finish();
	emit enrollmentFinished(r);
}

void AttendanceService::onEnrollTick()
{
	if (!isEnrolling() || !mailbox_) return;

	Frame f;
	if (!mailbox_->tryConsume(f)) return;

	const CaptureStatus st = enroll_->addFrame(f.bgr);
	if (st != CaptureStatus::Captured && st != CaptureStatus::Complete)
		qDebug() << "[Service] enroll frame status=" << static_cast<int>(st);
	if (st == CaptureStatus::Complete) finishEnrollment();
}
