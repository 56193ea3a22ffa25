#pragma once
#include <QString>
#include <QDateTime>
#include <QMetaType>

// system_logs.level 컬럼 값
enum class SysLogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3, Critical = 4 };

inline const char* levelName(SysLogLevel lv)
{
	switch (lv) {
		case SysLogLevel::Debug:	return "DEBUG";
		case SysLogLevel::Info:		return "INFO";
		case SysLogLevel::Warn:		return "WARN";
		case SysLogLevel::Error:	return "ERROR";
		case SysLogLevel::Critical:	return "CRITICAL";
	}
	return "?";
}

// 태그: "APP", "SESSION", "ENROLL", "CAMERA", "CONFIG"
struct SystemLogEntry {
	SysLogLevel level = SysLogLevel::Info;
	QString		tag;
	QString		message;
	QDateTime	ts;
	QString		extra;			// identity, 수치 등 부가 정보
};

Q_DECLARE_METATYPE(SystemLogEntry)
