#pragma once
#include <vector>
#include <QString>
#include <QVariantMap>
#include "include/types.hpp"

// 갤러리 영속화 경계
class IGalleryStore {
	public:
		virtual ~IGalleryStore() = default;

		// 시작 시 1회. 저장소를 읽을 수 없으면 false
		virtual bool load(std::vector<GalleryRecord>& out) = 0;
		virtual bool save(const QString& identity, const std::vector<float>& tmpl,
						  const QVariantMap& metadata) = 0;
		// 여러 템플릿을 한 번에 (전부 저장되거나 아무것도 안 됨)
		virtual bool saveAll(const QString& identity, const std::vector<std::vector<float>>& tmpls,
							 const QVariantMap& metadata) = 0;
		virtual bool remove(const QString& identity) = 0;
};
