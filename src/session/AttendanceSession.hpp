#pragma once
#include <functional>
#include <vector>
#include <QDateTime>
#include <QMutex>
#include <QSet>
#include <QStringList>

#include "include/types.hpp"
#include "services/IAttendanceSink.hpp"

// 한 번의 출석 세션: Idle -> Active -> Ended (종료 상태)
// start/observe/end 는 하나의 뮤텍스로 직렬화되고, sink 호출도 그 안에서 한다
class AttendanceSession {
	public:
		using Clock = std::function<QDateTime()>;

		struct Options {
			int	 durationSec   = 600;
			bool acceptSpoofed = false;
		};

		AttendanceSession(IAttendanceSink* sink, const Options& opt, Clock clock = {});

		// Idle 에서만 성공. roster 는 중복 제거 후 순서 유지
		bool start(const QStringList& roster);

		// 새로 출석 처리된 사람만 반환. 마감이 지났으면 end() 후 빈 결과
		std::vector<PresenceEvent> observe(const std::vector<MatchResult>& results);

		// Active -> Ended. 반복 호출은 같은 요약 반환. Idle 에서는 빈 요약
		SessionSummary end();

		SessionState state() const;
		QStringList roster() const;
		QStringList marked() const;
		QDateTime startedAt() const;
		QDateTime deadline() const;
		bool deadlinePassed() const;

	private:
		SessionSummary endLocked();
		bool isSpoofed(const MatchResult& r) const;

		IAttendanceSink* sink_ = nullptr;
		Options opt_;
		Clock clock_;

		mutable QMutex mu_;
		SessionState state_ = SessionState::Idle;
		QStringList roster_;
		QSet<QString> rosterSet_;
		QStringList marked_;				// 출석 순서
		QSet<QString> markedSet_;
		QSet<QString> spoofLogged_;
		double confidenceSum_ = 0.0;
		QDateTime startedAt_;
		QDateTime deadline_;
		SessionSummary summary_;
};
