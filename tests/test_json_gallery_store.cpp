#include <gtest/gtest.h>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>
#include "services/JsonGalleryStore.hpp"

namespace {

void writeRaw(const QString& path, const QByteArray& data)
{
	QFile f(path);
	ASSERT_TRUE(f.open(QIODevice::WriteOnly));
	f.write(data);
}

} // namespace

TEST(JsonGalleryStoreTest, MissingFileIsCreatedEmpty)
{
	QTemporaryDir dir;
	ASSERT_TRUE(dir.isValid());
	const QString path = dir.filePath("sub/gallery.json");

	JsonGalleryStore store(path);
	std::vector<GalleryRecord> out;
	ASSERT_TRUE(store.load(out));
	EXPECT_TRUE(out.empty());
	EXPECT_TRUE(QFile::exists(path));
}

TEST(JsonGalleryStoreTest, SavedRecordsSurviveReload)
{
	QTemporaryDir dir;
	const QString path = dir.filePath("gallery.json");
	{
		JsonGalleryStore store(path);
		std::vector<GalleryRecord> out;
		ASSERT_TRUE(store.load(out));
		ASSERT_TRUE(store.saveAll("alice", { { 1.f, 0.f, 0.f }, { 0.f, 1.f, 0.f } },
								  { { "name", "Alice" }, { "department", "CS" } }));
		ASSERT_TRUE(store.save("bob", { 0.f, 0.f, 1.f }, {}));
		ASSERT_TRUE(store.save("alice", { 0.6f, 0.8f, 0.f }, { { "year", 2 } }));
	}

	JsonGalleryStore again(path);
	std::vector<GalleryRecord> out;
	ASSERT_TRUE(again.load(out));
	ASSERT_EQ(out.size(), 2u);
	EXPECT_EQ(out[0].identity, QString("alice"));
	EXPECT_EQ(out[0].templates.size(), 3u);
	EXPECT_FLOAT_EQ(out[0].templates[2][1], 0.8f);
	EXPECT_EQ(out[0].metadata.value("department").toString(), QString("CS"));
	EXPECT_EQ(out[0].metadata.value("year").toInt(), 2);
	EXPECT_EQ(out[1].identity, QString("bob"));

	QFile f(path);
	ASSERT_TRUE(f.open(QIODevice::ReadOnly));
	const QJsonObject root = QJsonDocument::fromJson(f.readAll()).object();
	EXPECT_EQ(root.value("version").toInt(), 1);
	EXPECT_EQ(root.value("dim").toInt(), 3);
	EXPECT_EQ(root.value("count").toInt(), 2);
}

TEST(JsonGalleryStoreTest, CorruptFileFailsLoad)
{
	QTemporaryDir dir;
	const QString path = dir.filePath("gallery.json");
	writeRaw(path, "{ not json");

	JsonGalleryStore store(path);
	std::vector<GalleryRecord> out;
	EXPECT_FALSE(store.load(out));
	EXPECT_FALSE(store.save("x", { 1.f }, {}));		// load 전 쓰기 거절
}

TEST(JsonGalleryStoreTest, WrongTemplateSizeFailsLoad)
{
	QTemporaryDir dir;
	const QString path = dir.filePath("gallery.json");
	writeRaw(path, R"({"version":1,"dim":3,"count":1,
		"items":[{"id":"a","metadata":{},"templates":[[1,0,0],[1,0]]}]})");

	JsonGalleryStore store(path);
	std::vector<GalleryRecord> out;
	EXPECT_FALSE(store.load(out));
	EXPECT_TRUE(out.empty());
}

TEST(JsonGalleryStoreTest, RemoveIsIdempotent)
{
	QTemporaryDir dir;
	const QString path = dir.filePath("gallery.json");
	JsonGalleryStore store(path);
	std::vector<GalleryRecord> out;
	ASSERT_TRUE(store.load(out));
	ASSERT_TRUE(store.save("a", { 1.f, 0.f }, {}));
	ASSERT_TRUE(store.save("b", { 0.f, 1.f }, {}));

	EXPECT_TRUE(store.remove("a"));
	EXPECT_TRUE(store.remove("a"));

	JsonGalleryStore again(path);
	ASSERT_TRUE(again.load(out));
	ASSERT_EQ(out.size(), 1u);
	EXPECT_EQ(out[0].identity, QString("b"));
}
