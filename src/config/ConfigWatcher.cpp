#include "config/ConfigWatcher.hpp"
#include "config/ConfigLoader.hpp"
#include <QFileInfo>
#include <QtCore/QDebug>

ConfigWatcher::ConfigWatcher(const QString& path, RecognitionSettings* settings, QObject* parent)
	: QObject(parent), path_(path), settings_(settings)
{
	if (QFileInfo::exists(path_)) watcher_.addPath(path_);
	else qWarning() << "[ConfigWatcher] not watching missing file" << path_;

	connect(&watcher_, &QFileSystemWatcher::fileChanged, this, &ConfigWatcher::onFileChanged);
}

bool ConfigWatcher::reload()
{
	if (!settings_) return false;

	RecognitionConfig cfg = settings_->snapshot();
	if (!ConfigLoader::loadFile(path_, cfg)) {
		emit reloadFailed(path_);
		return false;
	}
	settings_->update(cfg);
	emit reloaded(cfg);
	return true;
}

void ConfigWatcher::onFileChanged(const QString& path)
{
	qInfo() << "[ConfigWatcher] changed:" << path;

	// 에디터가 rename 으로 저장하면 감시가 풀리므로 다시 등록
	if (!watcher_.files().contains(path) && QFileInfo::exists(path))
		watcher_.addPath(path);

	reload();
}
