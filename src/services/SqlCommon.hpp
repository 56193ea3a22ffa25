#pragma once
#include <QDir>
#include <QFileInfo>
#include <QHash>
#include <QString>
#include <QThread>
#include "include/common_path.hpp"

namespace SqlCommon {
	inline QString baseConnName() { return QStringLiteral("attendance"); }

    inline QString defaultDbFilePath()
    {
        return QStringLiteral(DB_PATH DB);
    }

    // 상위 디렉토리 보장 후 그대로 반환
    inline QString prepareDbFilePath(const QString& path)
    {
        const QString p = path.isEmpty() ? defaultDbFilePath() : path;
        QDir().mkpath(QFileInfo(p).absolutePath());
        return p;
    }

    // QSqlDatabase 커넥션은 스레드별, DB 파일별로 분리
    inline QString connectionNameForCurrentThread(const QString& dbPath)
    {
        return QString("%1_%2_%3").arg(baseConnName())
                                  .arg(qHash(dbPath), 0, 16)
                                  .arg(static_cast<qulonglong>(reinterpret_cast<quintptr>(QThread::currentThreadId())));
    }
} // namespace SqlCommon
