#pragma once
#include <atomic>
#include <QObject>
#include <QThread>

#include "SystemLogTypes.hpp"

namespace syslog_detail { class SystemLogWriter; }

// system_logs 테이블 비동기 기록기
// init() 이후: 전용 스레드가 DB 에 기록. init() 전 / shutdown() 후: Qt 로그로만 출력
class SystemLogger final : public QObject {
	Q_OBJECT
public:
	static SystemLogger& instance();
	static void init(const QString& dbPath);	// 앱 시작시 1회
	static void shutdown();						// 남은 항목을 모두 기록한 뒤 스레드 종료
	static bool isActive();

	static void log(SysLogLevel lv, const QString& tag, const QString& msg, const QString& extra = {});
	static void debug(const QString& tag, const QString& msg, const QString& extra = {});
	static void info (const QString& tag, const QString& msg, const QString& extra = {});
	static void warn (const QString& tag, const QString& msg, const QString& extra = {});
	static void error(const QString& tag, const QString& msg, const QString& extra = {});
	static void critical(const QString& tag, const QString& msg, const QString& extra = {});

signals:
	void appendRequested(const SystemLogEntry& e);

private:
	explicit SystemLogger(QObject* parent = nullptr);
	~SystemLogger() override;

	QThread* th_ = nullptr;
	syslog_detail::SystemLogWriter* wr_ = nullptr;
	std::atomic_bool active_{false};
};
