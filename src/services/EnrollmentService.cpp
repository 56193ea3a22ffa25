#include "services/EnrollmentService.hpp"
#include "match/FaceMatcher.hpp"
#include "log/SystemLogger.hpp"
#include "logger.hpp"
#include <QDateTime>
#include <QMutexLocker>
#include <QtCore/QDebug>

EnrollmentService::EnrollmentService(std::shared_ptr<IFaceDetector> detector,
									 std::shared_ptr<IEmbedder> embedder,
									 Gallery* gallery,
									 IGalleryStore* store,
									 const RecognitionSettings* settings)
	: detector_(std::move(detector)),
	  embedder_(std::move(embedder)),
	  gallery_(gallery),
	  store_(store),
	  settings_(settings)
{
}

bool EnrollmentService::begin(const QString& identity, const QVariantMap& metadata)
{
	QMutexLocker lk(&mu_);
	if (active_) {
		qWarning() << "[Enroll] already registering" << identity_;
		return false;
	}
	if (identity.trimmed().isEmpty()) {
		qWarning() << "[Enroll] empty identity";
		return false;
	}

	resetLocked();
	active_ = true;
	identity_ = identity.trimmed();
	metadata_ = metadata;
	LOG_INFO(QString("registration started: %1").arg(identity_));
	return true;
}

void EnrollmentService::resetLocked()
{
	active_ = false;
	identity_.clear();
	metadata_.clear();
	samples_.clear();
	lastReason_.clear();
}

void EnrollmentService::cancel()
{
	QMutexLocker lk(&mu_);
	if (active_) qInfo() << "[Enroll] cancelled" << identity_ << "samples=" << (int)samples_.size();
	resetLocked();
}

bool EnrollmentService::isActive() const
{
	QMutexLocker lk(&mu_);
	return active_;
}

int EnrollmentService::sampleCount() const
{
	QMutexLocker lk(&mu_);
	return static_cast<int>(samples_.size());
}

QString EnrollmentService::identity() const
{
	QMutexLocker lk(&mu_);
	return identity_;
}

// === 다른 사람으로 이미 등록된 얼굴인지 ===
bool EnrollmentService::isDuplicate(const std::vector<float>& emb, const RecognitionConfig& cfg,
									QString* who, float* sim) const
{
	if (!gallery_) return false;

	const GallerySnapshot snap = gallery_->snapshot();
	for (const auto& rec : *snap) {
		if (rec.identity == identity_) continue;
		float avg = 0.0f;
		if (!FaceMatcher::scoreIdentity(emb, rec.templates, avg)) continue;
		if (avg > cfg.duplicateThreshold) {
			if (who) *who = rec.identity;
			if (sim) *sim = avg;
			return true;
		}
	}
	return false;
}

CaptureStatus EnrollmentService::captureLocked(const cv::Mat& frame, const RecognitionConfig& cfg)
{
	if (!active_) return CaptureStatus::NotRegistering;
	if (static_cast<int>(samples_.size()) >= cfg.maxRegistrationSamples) return CaptureStatus::Complete;

	// ── 1) 한 사람만 ──
	std::vector<FaceDet> faces;
	bool tooSmall = false;
	if (detector_) {
		for (auto& d : detector_->detectAll(frame)) {
			if (d.score < cfg.detectorScoreThreshold) continue;
			// 인식 경로와 같은 최소 크기
			if (d.box.width < cfg.minFaceSize || d.box.height < cfg.minFaceSize) {
				tooSmall = true;
				continue;
			}
			faces.push_back(std::move(d));
		}
	}
	if (faces.empty()) {
		lastReason_ = tooSmall ? QString("face smaller than %1 px").arg(cfg.minFaceSize)
							   : QString("no face detected");
		return CaptureStatus::FaceNotDetected;
	}
	if (faces.size() > 1) {
		lastReason_ = "multiple faces in frame";
		return CaptureStatus::MultipleFaces;
	}
	const FaceDet& fd = faces.front();

	// ── 2) 품질 ──
	const cv::Rect box = fd.box & cv::Rect(0, 0, frame.cols, frame.rows);
	if (box.area() <= 0) {
		lastReason_ = "face outside frame";
		return CaptureStatus::FaceNotDetected;
	}
	const QualityReport q = quality_.assess(frame(box), fd.hasLandmarks ? &fd.lmk : nullptr);
	if (q.overall < cfg.qualityThreshold) {
		lastReason_ = QString("quality too low: %1 < %2").arg(q.overall, 0, 'f', 2).arg(cfg.qualityThreshold);
		return CaptureStatus::LowQuality;
	}

	// ── 3) 임베딩 ──
	std::vector<float> emb;
	try {
		if (!embedder_) throw ExtractionError("no embedder");
		const cv::Mat aligned = aligner_.cropFace(frame, fd, cv::Size(recog::EMB_INPUT, recog::EMB_INPUT));
		if (aligned.empty()) throw ExtractionError("alignment and fallback crop failed");
		emb = embedder_->extract(aligned);
	} catch (const ExtractionError& e) {
		lastReason_ = QString("extraction failed: %1").arg(e.what());
		qWarning() << "[Enroll]" << lastReason_;
		return CaptureStatus::ExtractionFailed;
	}

	// ── 4) 같은 자세 반복 방지 ──
	for (const auto& s : samples_) {
		const float sim = Embedder::cosine(emb, s);
		if (sim >= recog::SAME_POSE_SIM) {
			lastReason_ = QString("too similar to previous sample (%1)").arg(sim, 0, 'f', 3);
			return CaptureStatus::TooSimilar;
		}
	}

	// ── 5) 다른 identity 와 중복 ──
	QString dupId;
	float dupSim = 0.0f;
	if (isDuplicate(emb, cfg, &dupId, &dupSim)) {
		lastReason_ = QString("face already registered as %1 (%2)").arg(dupId).arg(dupSim, 0, 'f', 3);
		qWarning() << "[Enroll]" << lastReason_;
		return CaptureStatus::DuplicateFace;
	}

	samples_.push_back(std::move(emb));
	qInfo() << "[Enroll] captured" << (int)samples_.size() << "/" << cfg.maxRegistrationSamples
			<< "quality=" << q.overall;

	if (static_cast<int>(samples_.size()) >= cfg.maxRegistrationSamples) return CaptureStatus::Complete;
	return CaptureStatus::Captured;
}

CaptureStatus EnrollmentService::addFrame(const cv::Mat& frame)
{
	const RecognitionConfig cfg = settings_ ? settings_->snapshot() : RecognitionConfig{};
	QMutexLocker lk(&mu_);
	if (frame.empty()) {
		lastReason_ = "empty frame";
		return active_ ? CaptureStatus::FaceNotDetected : CaptureStatus::NotRegistering;
	}
	return captureLocked(frame, cfg);
}

RegistrationResult EnrollmentService::finish()
{
	const RecognitionConfig cfg = settings_ ? settings_->snapshot() : RecognitionConfig{};

	QMutexLocker lk(&mu_);
	RegistrationResult r;
	if (!active_) {
		r.reason = "no registration in progress";
		return r;
	}

	const QString id = identity_;
	const int n = static_cast<int>(samples_.size());
	if (n < cfg.minRegistrationSamples) {
		r.reason = QString("too few samples: %1 < %2").arg(n).arg(cfg.minRegistrationSamples);
		if (!lastReason_.isEmpty()) r.reason += QString(" (last: %1)").arg(lastReason_);
		qWarning() << "[Enroll]" << id << r.reason;
		resetLocked();
		return r;
	}

	// 커밋 전 검증 (저장소에 쓴 뒤 갤러리에서 거절되는 일이 없도록)
	const int gdim = gallery_ ? gallery_->dim() : 0;
	for (const auto& s : samples_) {
		std::vector<float> tmp;
		if (!Gallery::normalized(s, tmp) || (gdim > 0 && static_cast<int>(s.size()) != gdim)) {
			r.reason = "invalid template dimension";
			resetLocked();
			return r;
		}
	}

	QVariantMap meta = metadata_;
	meta.insert("registered_at", QDateTime::currentDateTime().toString(Qt::ISODate));
	meta.insert("num_templates", n);

	if (store_ && !store_->saveAll(id, samples_, meta)) {
		r.reason = "gallery store write failed";
		qCritical() << "[Enroll]" << id << r.reason;
		SystemLogger::error("ENROLL", r.reason, id);
		resetLocked();
		return r;
	}
	if (gallery_ && !gallery_->addAll(id, samples_, meta)) {
		r.reason = "gallery rejected templates";
		qCritical() << "[Enroll]" << id << r.reason;
		if (store_ && !store_->remove(id))
			qCritical() << "[Enroll] store rollback failed for" << id;
		resetLocked();
		return r;
	}

	r.success = true;
	r.templates = n;
	LOG_INFO(QString("registered %1 with %2 templates").arg(id).arg(n));
	SystemLogger::info("ENROLL", QString("registered %1").arg(id), QString("templates=%1").arg(n));
	resetLocked();
	return r;
}

RegistrationResult EnrollmentService::registerImages(const QString& identity,
													 const std::vector<cv::Mat>& images,
													 const QVariantMap& metadata)
{
	RegistrationResult fail;
	if (!begin(identity, metadata)) {
		fail.reason = identity.trimmed().isEmpty() ? "empty identity" : "registration already in progress";
		return fail;
	}

	for (size_t i = 0; i < images.size(); ++i) {
		const CaptureStatus st = addFrame(images[i]);
		if (st == CaptureStatus::Complete) {
			// 최대치 도달 이후 이미지는 사용하지 않음
			if (i + 1 < images.size())
				qInfo() << "[Enroll] max samples reached, ignoring" << int(images.size() - i - 1) << "images";
			break;
		}
		if (st != CaptureStatus::Captured) {
			{
				QMutexLocker lk(&mu_);
				fail.reason = QString("image %1: %2").arg(i + 1).arg(lastReason_);
			}
			cancel();
			qWarning() << "[Enroll]" << identity << fail.reason;
			return fail;
		}
	}
	return finish();
}
