#pragma once
#include <memory>
#include "services/IAttendanceSink.hpp"
#include "services/QSqliteService.hpp"

// attendance / recognition_logs 테이블에 기록
// 같은 날 같은 사람은 UNIQUE(identity, date) + INSERT OR IGNORE 로 1건만 남는다
class SqliteAttendanceSink : public IAttendanceSink {
	public:
		explicit SqliteAttendanceSink(std::shared_ptr<QSqliteService> db);

		void onPresence(const PresenceEvent& ev) override;
		void onAbsence(const AbsenceEvent& ev) override;
		void onRecognitionLog(const QString& identity, bool recognized, float confidence,
							  double quality, bool spoofSuspected) override;

		static QByteArray encodeSnapshot(const cv::Mat& bgr);

	private:
		std::shared_ptr<QSqliteService> db_;
};
