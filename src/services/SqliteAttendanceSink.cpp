#include "services/SqliteAttendanceSink.hpp"
#include <QDateTime>
#include <QtCore/QDebug>
#include <vector>

SqliteAttendanceSink::SqliteAttendanceSink(std::shared_ptr<QSqliteService> db)
	: db_(std::move(db))
{
}

QByteArray SqliteAttendanceSink::encodeSnapshot(const cv::Mat& bgr)
{
	if (bgr.empty()) return {};

	std::vector<uchar> buf;
	try {
		if (!cv::imencode(".jpg", bgr, buf, { cv::IMWRITE_JPEG_QUALITY, 90 })) {
			qWarning() << "[AttendanceSink] imencode failed";
			return {};
		}
	} catch (const cv::Exception& e) {
		qWarning() << "[AttendanceSink] imencode failed:" << e.what();
		return {};
	}
	return QByteArray(reinterpret_cast<const char*>(buf.data()), static_cast<int>(buf.size()));
}

void SqliteAttendanceSink::onPresence(const PresenceEvent& ev)
{
	if (!db_) return;

	bool inserted = false;
	if (!db_->insertAttendance(ev.identity, ev.timestamp.date(), QStringLiteral("P"), ev.timestamp,
							   ev.confidence, ev.qualityOverall, encodeSnapshot(ev.snapshot), &inserted)) {
		qWarning() << "[AttendanceSink] presence write failed:" << ev.identity;
		return;
	}
	if (!inserted) {
		qDebug() << "[AttendanceSink] already recorded today:" << ev.identity;
	}
}

void SqliteAttendanceSink::onAbsence(const AbsenceEvent& ev)
{
	if (!db_) return;

	bool inserted = false;
	if (!db_->insertAttendance(ev.identity, ev.timestamp.date(), QStringLiteral("A"), ev.timestamp,
							   0.0, 0.0, QByteArray(), &inserted)) {
		qWarning() << "[AttendanceSink] absence write failed:" << ev.identity;
		return;
	}
	if (!inserted) {
		qDebug() << "[AttendanceSink] absence ignored, row exists for today:" << ev.identity;
	}
}

void SqliteAttendanceSink::onRecognitionLog(const QString& identity, bool recognized, float confidence,
											double quality, bool spoofSuspected)
{
	if (!db_) return;
	if (!db_->insertRecognitionLog(identity, recognized, confidence, quality, spoofSuspected,
								   QDateTime::currentDateTime())) {
		qWarning() << "[AttendanceSink] recognition log write failed:" << identity;
	}
}
