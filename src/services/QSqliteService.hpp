#pragma once
#include <QByteArray>
#include <QDate>
#include <QDateTime>
#include <QVector>
#include <QString>
#include <QMutex>
#include "include/LogDtos.hpp"

// attendance / recognition_logs / system_logs 세 테이블을 다루는 SQLite 래퍼
class QSqliteService {
public:
    explicit QSqliteService(const QString& dbPath = QString());
    ~QSqliteService();

    bool initializeDatabase();
    QString databasePath() const { return dbPath_; }

    // (identity, date) 가 이미 있으면 무시. inserted 로 새 행 여부 반환
    bool insertAttendance(const QString& identity, const QDate& date, const QString& status,
                          const QDateTime& timestamp, double confidence, double quality,
                          const QByteArray& snapshotJpeg, bool* inserted = nullptr);

    bool insertRecognitionLog(const QString& identity, bool recognized, double confidence,
                              double quality, bool spoofSuspected, const QDateTime& timestamp);

    bool insertSystemLog(int level, const QString& tag, const QString& message,
                         const QDateTime& timestamp, const QString& extra = QString());

    bool selectAttendance(const QDate& date, QVector<AttendanceRow>* outRows);
    bool selectRecognitionLogs(int offset, int limit, QVector<RecognitionLogRow>* outRows);
    bool selectSystemLogs(int offset, int limit,
                          int minLevel, const QString& tagLike,
                          QVector<SystemLog>* outRows,
                          int* outTotal);

private:
    QString dbPath_;
	QMutex dbMutex;
};
