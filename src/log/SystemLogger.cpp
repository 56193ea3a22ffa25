#include "SystemLogger.hpp"
#include <memory>
#include <QMetaObject>
#include <QtCore/QDebug>
#include "services/QSqliteService.hpp"
#include "log/attendance_logging.hpp"

namespace syslog_detail {

// 전용 스레드에서만 동작. DB 커넥션도 이 스레드에서 만든다
class SystemLogWriter : public QObject {
	Q_OBJECT
public:
	explicit SystemLogWriter(const QString& dbPath) : dbPath_(dbPath) {}

public slots:
	void append(const SystemLogEntry& e) {
		if (!svc_) {
			svc_ = std::make_unique<QSqliteService>(dbPath_);
			ready_ = svc_->initializeDatabase();
			if (!ready_) qCWarning(LC_APP) << "[SystemLogger] database unavailable:" << dbPath_;
		}
		if (!ready_) return;

		const bool ok = svc_->insertSystemLog(static_cast<int>(e.level), e.tag, e.message,
											  e.ts.isValid() ? e.ts : QDateTime::currentDateTime(), e.extra);
		if (!ok && ++failures_ == 1)
			qCWarning(LC_APP) << "[SystemLogger] insert failed, further failures are not reported";
	}

private:
	QString dbPath_;
	std::unique_ptr<QSqliteService> svc_;
	bool ready_ = false;
	int failures_ = 0;
};

} // namespace syslog_detail

SystemLogger& SystemLogger::instance()
{
	static SystemLogger inst;
	return inst;
}

SystemLogger::SystemLogger(QObject* p) : QObject(p) {}

SystemLogger::~SystemLogger() = default;

bool SystemLogger::isActive()
{
	return instance().active_.load();
}

void SystemLogger::init(const QString& dbPath)
{
	auto& inst = instance();
	if (inst.th_) return;

	qRegisterMetaType<SystemLogEntry>("SystemLogEntry");

	inst.th_ = new QThread;
	inst.th_->setObjectName("SystemLogger");
	inst.wr_ = new syslog_detail::SystemLogWriter(dbPath);
	inst.wr_->moveToThread(inst.th_);

	QObject::connect(&inst, &SystemLogger::appendRequested,
					 inst.wr_, &syslog_detail::SystemLogWriter::append, Qt::QueuedConnection);
	QObject::connect(inst.th_, &QThread::finished, inst.wr_, &QObject::deleteLater);
	inst.th_->start();
	inst.active_ = true;
}

void SystemLogger::shutdown()
{
	auto& inst = instance();
	if (!inst.th_) return;

	inst.active_ = false;
	QObject::disconnect(&inst, &SystemLogger::appendRequested, nullptr, nullptr);

	// 큐에 남은 append 가 모두 처리될 때까지 대기
	if (inst.th_->isRunning() && QThread::currentThread() != inst.th_
		&& !QMetaObject::invokeMethod(inst.wr_, [] {}, Qt::BlockingQueuedConnection))
		qCWarning(LC_APP) << "[SystemLogger] flush failed, pending entries may be lost";

	inst.th_->quit();
	if (!inst.th_->wait(3000)) {
		qCWarning(LC_APP) << "[SystemLogger] writer thread did not stop in time";
		inst.th_->terminate();
		inst.th_->wait();
	}

	delete inst.th_;
	inst.th_ = nullptr;
	inst.wr_ = nullptr;
}

void SystemLogger::log(SysLogLevel lv, const QString& tag, const QString& msg, const QString& extra)
{
	auto& inst = instance();
	if (!inst.active_.load()) {
		// DB 기록기가 없으면 Qt 로그로
		const QString line = QString("[%1] %2 %3").arg(tag, msg, extra);
		if (lv >= SysLogLevel::Warn) qCWarning(LC_APP).noquote() << levelName(lv) << line;
		else qCDebug(LC_APP).noquote() << levelName(lv) << line;
		return;
	}
	emit inst.appendRequested(SystemLogEntry{ lv, tag, msg, QDateTime::currentDateTime(), extra });
}

void SystemLogger::debug(const QString& tag, const QString& msg, const QString& extra)	 { log(SysLogLevel::Debug, tag, msg, extra); }
void SystemLogger::info(const QString& tag, const QString& msg, const QString& extra)	 { log(SysLogLevel::Info, tag, msg, extra); }
void SystemLogger::warn(const QString& tag, const QString& msg, const QString& extra)	 { log(SysLogLevel::Warn, tag, msg, extra); }
void SystemLogger::error(const QString& tag, const QString& msg, const QString& extra)	 { log(SysLogLevel::Error, tag, msg, extra); }
void SystemLogger::critical(const QString& tag, const QString& msg, const QString& extra) { log(SysLogLevel::Critical, tag, msg, extra); }

#include "SystemLogger.moc"
