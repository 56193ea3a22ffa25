#include "gallery/Gallery.hpp"
#include "ai/Embedder.hpp"
#include <QtCore/QDebug>
#include <QMutexLocker>
#include <cmath>

namespace {
int indexOf(const std::vector<GalleryRecord>& v, const QString& id)
{
	for (int i = 0; i < static_cast<int>(v.size()); ++i) {
		if (v[i].identity == id) return i;
	}
	return -1;
}
} // namespace

bool Gallery::normalized(const std::vector<float>& in, std::vector<float>& out)
{
	if (in.empty()) return false;
	for (float x : in) {
		if (!std::isfinite(x)) return false;
	}
	out = in;
	return Embedder::l2normInPlace(out);
}

bool Gallery::acceptDim(std::size_t d) const
{
	if (dim_ <= 0) return true;
	return static_cast<int>(d) == dim_;
}

bool Gallery::add(const QString& identity, const std::vector<float>& tmpl,
				  const QVariantMap& metadata)
{
	return addAll(identity, { tmpl }, metadata);
}

bool Gallery::addAll(const QString& identity, const std::vector<std::vector<float>>& tmpls,
					 const QVariantMap& metadata)
{
	if (identity.isEmpty() || tmpls.empty()) {
		qWarning() << "[Gallery] add rejected: empty identity or no templates";
		return false;
	}

	QMutexLocker lk(&mu_);

	std::vector<std::vector<float>> clean;
	clean.reserve(tmpls.size());
	const std::size_t d0 = tmpls.front().size();
	for (const auto& t : tmpls) {
		std::vector<float> n;
		if (t.size() != d0 || !acceptDim(t.size()) || !normalized(t, n)) {
			qWarning() << "[Gallery] add rejected for" << identity
					   << "dim=" << (int)t.size() << "expected=" << dim_;
			return false;
		}
		clean.push_back(std::move(n));
	}

	auto next = std::make_shared<std::vector<GalleryRecord>>(*items_);
	const int idx = indexOf(*next, identity);
	if (idx < 0) {
		GalleryRecord r;
		r.identity = identity;
		r.metadata = metadata;
		r.templates = std::move(clean);
		next->push_back(std::move(r));
	} else {
		auto& r = (*next)[idx];
		for (auto& t : clean) r.templates.push_back(std::move(t));
		for (auto it = metadata.cbegin(); it != metadata.cend(); ++it)
			r.metadata.insert(it.key(), it.value());
	}

	if (dim_ <= 0) dim_ = static_cast<int>(d0);
	items_ = std::move(next);
	return true;
}

bool Gallery::remove(const QString& identity)
{
	QMutexLocker lk(&mu_);
	const int idx = indexOf(*items_, identity);
	if (idx < 0) return false;

	auto next = std::make_shared<std::vector<GalleryRecord>>(*items_);
	next->erase(next->begin() + idx);
	items_ = std::move(next);
	qDebug() << "[Gallery] removed" << identity;
	return true;
}

void Gallery::clear()
{
	QMutexLocker lk(&mu_);
	items_ = std::make_shared<const std::vector<GalleryRecord>>();
	if (!dimFixed_) dim_ = 0;
}

bool Gallery::loadRecords(const std::vector<GalleryRecord>& records)
{
	auto next = std::make_shared<std::vector<GalleryRecord>>();
	int d = 0;
	{
		QMutexLocker lk(&mu_);
		d = dimFixed_ ? dim_ : 0;
	}

	for (const auto& rec : records) {
		if (rec.identity.isEmpty() || rec.templates.empty()) {
			qWarning() << "[Gallery] load: invalid record" << rec.identity;
			return false;
		}
		GalleryRecord r;
		r.identity = rec.identity;
		r.metadata = rec.metadata;
		for (const auto& t : rec.templates) {
			if (d > 0 && static_cast<int>(t.size()) != d) {
				qWarning() << "[Gallery] load: dim mismatch for" << rec.identity;
				return false;
			}
			std::vector<float> n;
			if (!normalized(t, n)) {
				qWarning() << "[Gallery] load: degenerate template for" << rec.identity;
				return false;
			}
			d = static_cast<int>(n.size());
			r.templates.push_back(std::move(n));
		}

		const int idx = indexOf(*next, r.identity);
		if (idx < 0) {
			next->push_back(std::move(r));
		} else {
			auto& dst = (*next)[idx];
			for (auto& t : r.templates) dst.templates.push_back(std::move(t));
		}
	}

	QMutexLocker lk(&mu_);
	items_ = std::move(next);
	if (!dimFixed_) dim_ = d;
	qInfo() << "[Gallery] loaded identities=" << (int)items_->size() << "dim=" << dim_;
	return true;
}

QStringList Gallery::allIdentities() const
{
	const auto snap = snapshot();
	QStringList out;
	for (const auto& r : *snap) out << r.identity;
	return out;
}

std::vector<std::vector<float>> Gallery::templatesOf(const QString& identity) const
{
	const auto snap = snapshot();
	const int idx = indexOf(*snap, identity);
	if (idx < 0) return {};
	return (*snap)[idx].templates;
}

QVariantMap Gallery::metadataOf(const QString& identity) const
{
	const auto snap = snapshot();
	const int idx = indexOf(*snap, identity);
	if (idx < 0) return {};
	return (*snap)[idx].metadata;
}

bool Gallery::contains(const QString& identity) const
{
	const auto snap = snapshot();
	return indexOf(*snap, identity) >= 0;
}

int Gallery::size() const
{
	return static_cast<int>(snapshot()->size());
}

int Gallery::dim() const
{
	QMutexLocker lk(&mu_);
	return dim_;
}

GallerySnapshot Gallery::snapshot() const
{
	QMutexLocker lk(&mu_);
	return items_;
}
