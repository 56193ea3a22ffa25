#include "QSqliteService.hpp"
#include "services/SqlCommon.hpp"
#include <QSqlDatabase>
#include <QSqlError>
#include <QSqlQuery>
#include <QVariant>
#include <QtCore/QDebug>

namespace {

// 이 스레드 + 이 DB 파일 전용 커넥션 (없으면 만들고 open)
QSqlDatabase threadConnection(const QString& dbPath)
{
	const QString name = SqlCommon::connectionNameForCurrentThread(dbPath);
	QSqlDatabase db = QSqlDatabase::contains(name)
						  ? QSqlDatabase::database(name, /*open=*/false)
						  : QSqlDatabase::addDatabase(QStringLiteral("QSQLITE"), name);
	if (db.databaseName().isEmpty()) db.setDatabaseName(dbPath);

	if (!db.isOpen() && !db.open()) {
		qCritical() << "[SQL] open failed:" << db.lastError().text()
					<< "path=" << dbPath << "drivers=" << QSqlDatabase::drivers();
	}
	return db;
}

bool run(QSqlQuery& q, const char* what)
{
	if (q.exec()) return true;
	qCritical() << "[SQL]" << what << "failed:" << q.lastError().text();
	return false;
}

bool runSql(QSqlQuery& q, const QString& sql, const char* what)
{
	if (q.exec(sql)) return true;
	qCritical() << "[SQL]" << what << "failed:" << q.lastError().text();
	return false;
}

QString isoTs(const QDateTime& ts)
{
	return (ts.isValid() ? ts : QDateTime::currentDateTime()).toString(Qt::ISODateWithMs);
}

QDateTime fromIsoTs(const QVariant& v)
{
	return QDateTime::fromString(v.toString(), Qt::ISODateWithMs);
}

} // namespace

QSqliteService::QSqliteService(const QString& dbPath)
	: dbPath_(SqlCommon::prepareDbFilePath(dbPath))
{
}

QSqliteService::~QSqliteService()
{
	// 이 스레드에서 만든 커넥션만 정리할 수 있다
	const QString name = SqlCommon::connectionNameForCurrentThread(dbPath_);
	if (!QSqlDatabase::contains(name)) return;
	{
		QSqlDatabase db = QSqlDatabase::database(name, /*open=*/false);
		if (db.isOpen()) db.close();
	}
	QSqlDatabase::removeDatabase(name);
}

bool QSqliteService::initializeDatabase()
{
	QMutexLocker locker(&dbMutex);
	QSqlDatabase db = threadConnection(dbPath_);
	if (!db.isOpen()) return false;

	QSqlQuery q(db);
	// WAL 실패는 치명적이지 않음
	if (!q.exec("PRAGMA journal_mode=WAL;"))
		qWarning() << "[SQL] WAL pragma ignored:" << q.lastError().text();
	if (!q.exec("PRAGMA synchronous=NORMAL;"))
		qWarning() << "[SQL] synchronous pragma ignored:" << q.lastError().text();

	// 출석: 하루 1건 (identity, date) UNIQUE
	const bool ok =
		runSql(q,
			   "CREATE TABLE IF NOT EXISTS attendance ("
			   "id         INTEGER PRIMARY KEY AUTOINCREMENT, "
			   "identity   TEXT NOT NULL, "
			   "date       TEXT NOT NULL, "
			   "status     TEXT NOT NULL CHECK (status IN ('P','A')), "
			   "timestamp  TEXT NOT NULL, "
			   "confidence REAL, "
			   "quality    REAL, "
			   "snapshot   BLOB, "
			   "UNIQUE(identity, date))",
			   "create attendance")
		// 인식 판정 로그 (스푸핑 의심 포함)
		&& runSql(q,
				  "CREATE TABLE IF NOT EXISTS recognition_logs ("
				  "id         INTEGER PRIMARY KEY AUTOINCREMENT, "
				  "identity   TEXT, "
				  "recognized INTEGER NOT NULL, "
				  "confidence REAL, "
				  "quality    REAL, "
				  "spoof      INTEGER NOT NULL, "
				  "timestamp  TEXT NOT NULL)",
				  "create recognition_logs")
		&& runSql(q,
				  "CREATE TABLE IF NOT EXISTS system_logs ("
				  "id        INTEGER PRIMARY KEY AUTOINCREMENT, "
				  "level     INTEGER NOT NULL, "
				  "tag       TEXT, "
				  "message   TEXT NOT NULL, "
				  "timestamp TEXT NOT NULL, "
				  "extra     TEXT)",
				  "create system_logs");
	if (!ok) return false;

	static const char* kIndexes[] = {
		"CREATE INDEX IF NOT EXISTS idx_att_date  ON attendance(date)",
		"CREATE INDEX IF NOT EXISTS idx_rec_ts    ON recognition_logs(timestamp)",
		"CREATE INDEX IF NOT EXISTS idx_sys_ts    ON system_logs(timestamp)",
		"CREATE INDEX IF NOT EXISTS idx_sys_level ON system_logs(level)",
	};
	for (const char* sql : kIndexes) {
		if (!q.exec(sql)) qWarning() << "[SQL] index ignored:" << q.lastError().text();
	}

	qDebug() << "[SQL] schema ready:" << db.databaseName();
	return true;
}

bool QSqliteService::insertAttendance(const QString& identity, const QDate& date, const QString& status,
									  const QDateTime& timestamp, double confidence, double quality,
									  const QByteArray& snapshotJpeg, bool* inserted)
{
	if (inserted) *inserted = false;

	QMutexLocker locker(&dbMutex);
	QSqlDatabase db = threadConnection(dbPath_);
	if (!db.isOpen()) return false;

	QSqlQuery q(db);
	q.prepare("INSERT OR IGNORE INTO attendance "
			  "(identity, date, status, timestamp, confidence, quality, snapshot) "
			  "VALUES (?, ?, ?, ?, ?, ?, ?)");
	q.addBindValue(identity);
	q.addBindValue(date.toString(Qt::ISODate));
	q.addBindValue(status);
	q.addBindValue(isoTs(timestamp));
	q.addBindValue(confidence);
	q.addBindValue(quality);
	q.addBindValue(snapshotJpeg.isEmpty() ? QVariant() : QVariant(snapshotJpeg));
	if (!run(q, "insert attendance")) return false;

	if (inserted) *inserted = q.numRowsAffected() > 0;
	return true;
}

bool QSqliteService::insertRecognitionLog(const QString& identity, bool recognized, double confidence,
										  double quality, bool spoofSuspected, const QDateTime& timestamp)
{
	QMutexLocker locker(&dbMutex);
	QSqlDatabase db = threadConnection(dbPath_);
	if (!db.isOpen()) return false;

	QSqlQuery q(db);
	q.prepare("INSERT INTO recognition_logs (identity, recognized, confidence, quality, spoof, timestamp) "
			  "VALUES (?, ?, ?, ?, ?, ?)");
	q.addBindValue(identity);
	q.addBindValue(recognized ? 1 : 0);
	q.addBindValue(confidence);
	q.addBindValue(quality);
	q.addBindValue(spoofSuspected ? 1 : 0);
	q.addBindValue(isoTs(timestamp));
	return run(q, "insert recognition log");
}

bool QSqliteService::insertSystemLog(int level, const QString& tag, const QString& message,
									 const QDateTime& timestamp, const QString& extra)
{
	QMutexLocker locker(&dbMutex);
	QSqlDatabase db = threadConnection(dbPath_);
	if (!db.isOpen()) return false;

	QSqlQuery q(db);
	q.prepare("INSERT INTO system_logs (level, tag, message, timestamp, extra) VALUES (?, ?, ?, ?, ?)");
	q.addBindValue(level);
	q.addBindValue(tag);
	q.addBindValue(message);
	q.addBindValue(isoTs(timestamp));
	q.addBindValue(extra);
	return run(q, "insert system log");
}

// ---------- 조회 ----------

bool QSqliteService::selectAttendance(const QDate& date, QVector<AttendanceRow>* outRows)
{
	QMutexLocker locker(&dbMutex);
	QSqlDatabase db = threadConnection(dbPath_);
	if (!db.isOpen()) return false;

	QSqlQuery q(db);
	q.prepare("SELECT id, identity, date, status, timestamp, confidence, quality, snapshot "
			  "FROM attendance WHERE date = ? ORDER BY id ASC");
	q.addBindValue(date.toString(Qt::ISODate));
	if (!run(q, "select attendance")) return false;
	if (!outRows) return true;

	outRows->clear();
	while (q.next()) {
		AttendanceRow r;
		r.id		   = q.value(0).toInt();
		r.identity	   = q.value(1).toString();
		r.date		   = QDate::fromString(q.value(2).toString(), Qt::ISODate);
		r.status	   = q.value(3).toString();
		r.timestamp	   = fromIsoTs(q.value(4));
		r.confidence   = q.value(5).toDouble();
		r.quality	   = q.value(6).toDouble();
		r.snapshotJpeg = q.value(7).toByteArray();
		outRows->push_back(r);
	}
	return true;
}

bool QSqliteService::selectRecognitionLogs(int offset, int limit, QVector<RecognitionLogRow>* outRows)
{
	QMutexLocker locker(&dbMutex);
	QSqlDatabase db = threadConnection(dbPath_);
	if (!db.isOpen()) return false;

	QSqlQuery q(db);
	q.prepare("SELECT id, identity, recognized, confidence, quality, spoof, timestamp "
			  "FROM recognition_logs ORDER BY id DESC LIMIT ? OFFSET ?");
	q.addBindValue(limit);
	q.addBindValue(offset);
	if (!run(q, "select recognition logs")) return false;
	if (!outRows) return true;

	outRows->clear();
	while (q.next()) {
		RecognitionLogRow r;
		r.id			 = q.value(0).toInt();
		r.identity		 = q.value(1).toString();
		r.recognized	 = q.value(2).toInt() != 0;
		r.confidence	 = q.value(3).toDouble();
		r.quality		 = q.value(4).toDouble();
		r.spoofSuspected = q.value(5).toInt() != 0;
		r.timestamp		 = fromIsoTs(q.value(6));
		outRows->push_back(r);
	}
	return true;
}

bool QSqliteService::selectSystemLogs(int offset, int limit, int minLevel, const QString& tagLike,
									  QVector<SystemLog>* outRows, int* outTotal)
{
	QMutexLocker locker(&dbMutex);
	QSqlDatabase db = threadConnection(dbPath_);
	if (!db.isOpen()) return false;

	QString where = "WHERE level >= ?";
	QVariantList binds{ minLevel };
	if (!tagLike.isEmpty()) {
		where += " AND tag LIKE ?";
		binds << QString("%" + tagLike + "%");
	}

	QSqlQuery qc(db);
	qc.prepare("SELECT COUNT(*) FROM system_logs " + where);
	for (const auto& v : binds) qc.addBindValue(v);
	if (!run(qc, "count system logs") || !qc.next()) return false;
	if (outTotal) *outTotal = qc.value(0).toInt();

	QSqlQuery q(db);
	q.prepare("SELECT id, level, tag, message, timestamp, extra FROM system_logs "
			  + where + " ORDER BY id DESC LIMIT ? OFFSET ?");
	for (const auto& v : binds) q.addBindValue(v);
	q.addBindValue(limit);
	q.addBindValue(offset);
	if (!run(q, "select system logs")) return false;
	if (!outRows) return true;

	outRows->clear();
	while (q.next()) {
		SystemLog r;
		r.id		= q.value(0).toInt();
		r.level		= q.value(1).toInt();
		r.tag		= q.value(2).toString();
		r.message	= q.value(3).toString();
		r.timestamp = fromIsoTs(q.value(4));
		r.extra		= q.value(5).toString();
		outRows->push_back(r);
	}
	return true;
}
