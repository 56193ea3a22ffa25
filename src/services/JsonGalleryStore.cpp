#include "services/JsonGalleryStore.hpp"
#include <algorithm>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QMutexLocker>
#include <QSaveFile>
#include <QtCore/QDebug>

namespace {
constexpr int kFormatVersion = 1;

int dimOf(const std::vector<GalleryRecord>& recs)
{
	for (const auto& r : recs) {
		if (!r.templates.empty()) return static_cast<int>(r.templates.front().size());
	}
	return 0;
}
} // namespace

JsonGalleryStore::JsonGalleryStore(const QString& path) : path_(path) {}

bool JsonGalleryStore::ensureFile()
{
	if (path_.isEmpty()) return false;
	if (QFile::exists(path_)) return true;

	const QFileInfo fi(path_);
	if (!QDir().mkpath(fi.absolutePath())) {
		qWarning() << "[GalleryStore] mkpath failed:" << fi.absolutePath();
		return false;
	}
	if (!writeLocked({})) return false;

	qInfo() << "[GalleryStore] created empty file:" << path_;
	return true;
}

bool JsonGalleryStore::writeLocked(const std::vector<GalleryRecord>& records) const
{
	QJsonArray items;
	for (const auto& r : records) {
		QJsonObject o;
		o["id"] = r.identity;
		o["metadata"] = QJsonObject::fromVariantMap(r.metadata);

		QJsonArray tmpls;
		for (const auto& t : r.templates) {
			QJsonArray emb;
			for (float v : t) emb.append(double(v));
			tmpls.append(emb);
		}
		o["templates"] = tmpls;
		items.append(o);
	}

	QJsonObject root;
	root["version"] = kFormatVersion;
	root["dim"]		= dimOf(records);
	root["count"]	= int(items.size());
	root["items"]	= items;

	const QByteArray out = QJsonDocument(root).toJson(QJsonDocument::Indented);

	QSaveFile f(path_);
	if (!f.open(QIODevice::WriteOnly)) {
		qWarning() << "[GalleryStore] open failed:" << path_ << f.errorString();
		return false;
	}
	if (f.write(out) != out.size()) {
		qWarning() << "[GalleryStore] write failed:" << path_ << f.errorString();
		f.cancelWriting();
		return false;
	}
	if (!f.commit()) {
		qWarning() << "[GalleryStore] commit failed:" << path_ << f.errorString();
		return false;
	}
	return true;
}

bool JsonGalleryStore::load(std::vector<GalleryRecord>& out)
{
	QMutexLocker lk(&mu_);
	out.clear();

	if (!ensureFile()) {
		qCritical() << "[GalleryStore] cannot create" << path_;
		return false;
	}

	QFile f(path_);
	if (!f.open(QIODevice::ReadOnly)) {
		qCritical() << "[GalleryStore] open failed ->" << path_ << f.errorString();
		return false;
	}

	QJsonParseError perr;
	const QJsonDocument jd = QJsonDocument::fromJson(f.readAll(), &perr);
	f.close();
	if (perr.error != QJsonParseError::NoError || !jd.isObject()) {
		qCritical() << "[GalleryStore] parse failed ->" << path_ << perr.errorString();
		return false;
	}

	const auto root	 = jd.object();
	const int dim	 = root.value("dim").toInt(0);
	if (!root.value("items").isArray()) {
		qCritical() << "[GalleryStore] missing items array ->" << path_;
		return false;
	}
	const auto items = root.value("items").toArray();

	std::vector<GalleryRecord> temp;
	temp.reserve(items.size());

	for (const auto& v : items) {
		const auto o = v.toObject();
		GalleryRecord r;
		r.identity = o.value("id").toString();
		r.metadata = o.value("metadata").toObject().toVariantMap();

		for (const auto& tv : o.value("templates").toArray()) {
			const auto arr = tv.toArray();
			std::vector<float> t;
			t.reserve(arr.size());
			for (const auto& ev : arr) t.push_back(float(ev.toDouble()));
			if (t.empty() || (dim > 0 && static_cast<int>(t.size()) != dim)) {
				qCritical() << "[GalleryStore] bad template for" << r.identity << "size=" << (int)t.size();
				return false;
			}
			r.templates.push_back(std::move(t));
		}

		if (r.identity.isEmpty() || r.templates.empty()) {
			qCritical() << "[GalleryStore] invalid item in" << path_;
			return false;
		}
		temp.push_back(std::move(r));
	}

	records_ = temp;
	loaded_ = true;
	out = std::move(temp);
	qInfo() << "[GalleryStore]" << int(out.size()) << "identities from" << path_;
	return true;
}

bool JsonGalleryStore::save(const QString& identity, const std::vector<float>& tmpl,
							const QVariantMap& metadata)
{
	return saveAll(identity, { tmpl }, metadata);
}

bool JsonGalleryStore::saveAll(const QString& identity, const std::vector<std::vector<float>>& tmpls,
							   const QVariantMap& metadata)
{
	if (identity.isEmpty() || tmpls.empty()) return false;

	QMutexLocker lk(&mu_);
	if (!loaded_) {
		qWarning() << "[GalleryStore] save before load:" << path_;
		return false;
	}

	std::vector<GalleryRecord> next = records_;
	auto it = std::find_if(next.begin(), next.end(),
						   [&](const GalleryRecord& r) { return r.identity == identity; });
	if (it == next.end()) {
		GalleryRecord r;
		r.identity = identity;
		r.metadata = metadata;
		r.templates = tmpls;
		next.push_back(std::move(r));
	} else {
		for (const auto& t : tmpls) it->templates.push_back(t);
		for (auto m = metadata.cbegin(); m != metadata.cend(); ++m)
			it->metadata.insert(m.key(), m.value());
	}

	if (!writeLocked(next)) return false;
	records_ = std::move(next);
	qInfo() << "[GalleryStore] saved" << identity << "+" << (int)tmpls.size() << "templates";
	return true;
}

bool JsonGalleryStore::remove(const QString& identity)
{
	QMutexLocker lk(&mu_);
	if (!loaded_) return false;

	std::vector<GalleryRecord> next = records_;
	auto it = std::remove_if(next.begin(), next.end(),
							 [&](const GalleryRecord& r) { return r.identity == identity; });
	if (it == next.end()) return true;		// 이미 없음
	next.erase(it, next.end());

	if (!writeLocked(next)) return false;
	records_ = std::move(next);
	qInfo() << "[GalleryStore] removed" << identity;
	return true;
}
