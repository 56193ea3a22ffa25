#include "session/AttendanceSession.hpp"
#include "log/attendance_logging.hpp"
#include <QMutexLocker>
#include <QtCore/QDebug>

AttendanceSession::AttendanceSession(IAttendanceSink* sink, const Options& opt, Clock clock)
	: sink_(sink), opt_(opt), clock_(std::move(clock))
{
	if (!clock_) clock_ = [] { return QDateTime::currentDateTime(); };
	if (opt_.durationSec < 1) opt_.durationSec = 1;
}

bool AttendanceSession::start(const QStringList& roster)
{
	QMutexLocker lk(&mu_);
	if (state_ != SessionState::Idle) {
		qCWarning(LC_SESSION) << "[Session] start rejected in state" << toString(state_);
		return false;
	}

	roster_.clear();
	rosterSet_.clear();
	for (const auto& id : roster) {
		if (id.isEmpty() || rosterSet_.contains(id)) continue;
		rosterSet_.insert(id);
		roster_ << id;
	}

	marked_.clear();
	markedSet_.clear();
	spoofLogged_.clear();
	confidenceSum_ = 0.0;
	startedAt_ = clock_();
	deadline_ = startedAt_.addSecs(opt_.durationSec);
	state_ = SessionState::Active;

	qCInfo(LC_SESSION) << "[Session] started roster=" << roster_.size()
					   << "deadline=" << deadline_.toString(Qt::ISODate);
	return true;
}

bool AttendanceSession::isSpoofed(const MatchResult& r) const
{
	return r.liveness.evaluated && !r.liveness.isReal;
}

std::vector<PresenceEvent> AttendanceSession::observe(const std::vector<MatchResult>& results)
{
	std::vector<PresenceEvent> out;

	QMutexLocker lk(&mu_);
	if (state_ != SessionState::Active) return out;

	const QDateTime now = clock_();
	if (now >= deadline_) {
		qCInfo(LC_SESSION) << "[Session] deadline reached in observe";
		endLocked();
		return out;
	}

	for (const auto& r : results) {
		if (r.status != FaceStatus::Recognized || !r.known()) continue;

		if (!rosterSet_.contains(r.identity)) {
			qCDebug(LC_SESSION) << "[Session] not in roster:" << r.identity;
			continue;
		}
		if (markedSet_.contains(r.identity)) continue;

		const bool spoofed = isSpoofed(r);
		if (spoofed) {
			// 세션당 identity 별 한 번만 기록
			if (!spoofLogged_.contains(r.identity)) {
				spoofLogged_.insert(r.identity);
				if (sink_) sink_->onRecognitionLog(r.identity, true, r.confidence, r.quality.overall, true);
				qCWarning(LC_SESSION) << "[Session] spoof suspected:" << r.identity
									  << "liveness=" << r.liveness.confidence
									  << (opt_.acceptSpoofed ? "(marking anyway)" : "(not marked)");
			}
			if (!opt_.acceptSpoofed) continue;
		}

		PresenceEvent ev;
		ev.identity = r.identity;
		ev.timestamp = now;
		ev.confidence = r.confidence;
		ev.qualityOverall = r.quality.overall;
		ev.snapshot = r.faceCrop;

		markedSet_.insert(r.identity);
		marked_ << r.identity;
		confidenceSum_ += r.confidence;

		if (sink_) sink_->onPresence(ev);
		qCInfo(LC_SESSION) << "[Session] present:" << r.identity << "conf=" << r.confidence;
		out.push_back(std::move(ev));
	}
	return out;
}

SessionSummary AttendanceSession::end()
{
	QMutexLocker lk(&mu_);
	return endLocked();
}

SessionSummary AttendanceSession::endLocked()
{
	if (state_ == SessionState::Ended) return summary_;
	if (state_ == SessionState::Idle) {
		qCWarning(LC_SESSION) << "[Session] end() on idle session ignored";
		return {};
	}

	const QDateTime now = clock_();
	SessionSummary s;
	s.present = marked_;
	for (const auto& id : roster_) {
		if (markedSet_.contains(id)) continue;
		s.absent << id;
		if (sink_) sink_->onAbsence(AbsenceEvent{ id, now });
	}
	s.total = roster_.size();
	s.attendanceRate = s.total > 0 ? 100.0 * s.present.size() / s.total : 0.0;
	s.averageConfidence = s.present.isEmpty() ? 0.0 : confidenceSum_ / s.present.size();

	summary_ = s;
	state_ = SessionState::Ended;

	qCInfo(LC_SESSION) << "[Session] ended present=" << s.present.size()
					   << "absent=" << s.absent.size() << "rate=" << s.attendanceRate;
	return summary_;
}

SessionState AttendanceSession::state() const
{
	QMutexLocker lk(&mu_);
	return state_;
}

QStringList AttendanceSession::roster() const
{
	QMutexLocker lk(&mu_);
	return roster_;
}

QStringList AttendanceSession::marked() const
{
	QMutexLocker lk(&mu_);
	return marked_;
}

QDateTime AttendanceSession::startedAt() const
{
	QMutexLocker lk(&mu_);
	return startedAt_;
}

QDateTime AttendanceSession::deadline() const
{
	QMutexLocker lk(&mu_);
	return deadline_;
}

bool AttendanceSession::deadlinePassed() const
{
	QMutexLocker lk(&mu_);
	return state_ == SessionState::Active && clock_() >= deadline_;
}
