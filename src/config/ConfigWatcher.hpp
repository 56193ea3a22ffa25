#pragma once
#include <QObject>
#include <QFileSystemWatcher>
#include <QString>
#include "config/RecognitionSettings.hpp"

// 설정 파일이 바뀌면 다시 읽어 RecognitionSettings 에 반영
class ConfigWatcher : public QObject {
	Q_OBJECT
	public:
		ConfigWatcher(const QString& path, RecognitionSettings* settings, QObject* parent = nullptr);

		bool reload();
		QString path() const { return path_; }

	signals:
		void reloaded(const RecognitionConfig& cfg);
		void reloadFailed(const QString& path);

	private slots:
		void onFileChanged(const QString& path);

	private:
		QString path_;
		RecognitionSettings* settings_ = nullptr;
		QFileSystemWatcher watcher_;
};
