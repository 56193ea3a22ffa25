// logger.hpp
#pragma once
#include <string>
#include <QString>
#include <QtGlobal>
#include "include/common_path.hpp"
#include "log/attendance_logging.hpp"

// 사람이 읽는 세션 보고서 (날짜별 텍스트 파일: <dir>/attendance-YYYY-MM-DD.txt)
class Logger {
public:
	static void setDirectory(const std::string& dir);
	static std::string directory();
	static std::string currentFile();

	static bool write(const std::string& message);
	static bool writef(const char* format, ...)
#if defined(__GNUC__)
		__attribute__((format(printf, 1, 2)))
#endif
		;
};

namespace GlobalLogger {

// attendance.app 카테고리로 "[함수] 메시지" 출력
inline void logMessage(QtMsgType type, const char* func, const QString& message)
{
	const QString line = QStringLiteral("[%1] %2").arg(QString::fromLatin1(func), message);
	switch (type) {
		case QtDebugMsg:	qCDebug(LC_APP).noquote() << line;		break;
		case QtInfoMsg:		qCInfo(LC_APP).noquote() << line;		break;
		case QtWarningMsg:	qCWarning(LC_APP).noquote() << line;	break;
		case QtCriticalMsg:	qCCritical(LC_APP).noquote() << line;	break;
		case QtFatalMsg:	qFatal("%s", qUtf8Printable(line));		break;
	}
}

}		// namespace GlobalLogger

#define LOG_DEBUG(msg)		GlobalLogger::logMessage(QtDebugMsg, __FUNCTION__, msg)
#define LOG_INFO(msg)		GlobalLogger::logMessage(QtInfoMsg, __FUNCTION__, msg)
#define LOG_WARN(msg)		GlobalLogger::logMessage(QtWarningMsg, __FUNCTION__, msg)
#define LOG_CRITICAL(msg)	GlobalLogger::logMessage(QtCriticalMsg, __FUNCTION__, msg)
