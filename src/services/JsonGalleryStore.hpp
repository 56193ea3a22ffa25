#pragma once
#include <QMutex>
#include <QString>
#include "services/IGalleryStore.hpp"

// {version, dim, count, items:[{id, metadata, templates}]} 형식 JSON 파일
// 쓰기는 QSaveFile (임시 파일에 쓴 뒤 rename)
class JsonGalleryStore : public IGalleryStore {
	public:
		explicit JsonGalleryStore(const QString& path);

		bool load(std::vector<GalleryRecord>& out) override;
		bool save(const QString& identity, const std::vector<float>& tmpl,
				  const QVariantMap& metadata) override;
		bool saveAll(const QString& identity, const std::vector<std::vector<float>>& tmpls,
					 const QVariantMap& metadata) override;
		bool remove(const QString& identity) override;

		QString path() const { return path_; }

	private:
		bool ensureFile();
		bool writeLocked(const std::vector<GalleryRecord>& records) const;

		QString path_;
		mutable QMutex mu_;
		std::vector<GalleryRecord> records_;	// 파일과 동일한 내용
		bool loaded_ = false;
};
