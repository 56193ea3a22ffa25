#pragma once
#include <QString>
#include "include/types.hpp"

// 세션이 확정한 출석 이벤트를 받는 쪽 (DB, 파일 등)
class IAttendanceSink {
	public:
		virtual ~IAttendanceSink() = default;

		virtual void onPresence(const PresenceEvent& ev) = 0;
		virtual void onAbsence(const AbsenceEvent& ev) = 0;
		// 스푸핑 의심 등 인식 판정 기록
		virtual void onRecognitionLog(const QString& identity, bool recognized, float confidence,
									  double quality, bool spoofSuspected) = 0;
};
