#include <gtest/gtest.h>
#include <cmath>
#include "gallery/Gallery.hpp"
#include "test_fakes.hpp"

namespace {
double norm(const std::vector<float>& v)
{
	double s = 0.0;
	for (float x : v) s += double(x) * x;
	return std::sqrt(s);
}
} // namespace

TEST(GalleryTest, StoredTemplatesAreUnitNorm)
{
	Gallery g;
	ASSERT_TRUE(g.add("alice", { 3.f, 4.f, 0.f, 12.f }));
	ASSERT_TRUE(g.add("alice", { 0.1f, 0.2f, 0.3f, 0.4f }));

	const auto t = g.templatesOf("alice");
	ASSERT_EQ(t.size(), 2u);
	for (const auto& v : t) EXPECT_NEAR(norm(v), 1.0, 1e-5);
	EXPECT_NEAR(t[0][0], 3.f / 13.f, 1e-6);
}

TEST(GalleryTest, RejectsDegenerateTemplates)
{
	Gallery g;
	EXPECT_FALSE(g.add("bob", {}));
	EXPECT_FALSE(g.add("bob", { 0.f, 0.f, 0.f }));
	EXPECT_FALSE(g.add("bob", { 1.f, NAN, 0.f }));
	EXPECT_FALSE(g.add("", { 1.f, 0.f, 0.f }));
	EXPECT_EQ(g.size(), 0);
	EXPECT_FALSE(g.contains("bob"));
}

TEST(GalleryTest, DimensionIsFixedByFirstTemplate)
{
	Gallery g;
	ASSERT_TRUE(g.add("a", { 1.f, 0.f, 0.f }));
	EXPECT_EQ(g.dim(), 3);
	EXPECT_FALSE(g.add("b", { 1.f, 0.f }));
	EXPECT_FALSE(g.contains("b"));

	Gallery fixed(4);
	EXPECT_FALSE(fixed.add("a", { 1.f, 0.f, 0.f }));
	EXPECT_TRUE(fixed.add("a", { 1.f, 0.f, 0.f, 0.f }));
}

TEST(GalleryTest, RepeatedAddAccumulatesAndKeepsInsertionOrder)
{
	Gallery g;
	g.add("carol", testutil::axis(4, 0));
	g.add("alice", testutil::axis(4, 1));
	g.add("carol", testutil::axis(4, 2));

	EXPECT_EQ(g.allIdentities(), QStringList({ "carol", "alice" }));
	EXPECT_EQ(g.templatesOf("carol").size(), 2u);
	EXPECT_TRUE(g.templatesOf("nobody").empty());
}

TEST(GalleryTest, RemoveIsIdempotent)
{
	Gallery g;
	g.add("a", testutil::axis(4, 0), { { "name", "A" } });
	EXPECT_TRUE(g.remove("a"));
	EXPECT_FALSE(g.remove("a"));
	EXPECT_FALSE(g.contains("a"));
	EXPECT_TRUE(g.metadataOf("a").isEmpty());
	EXPECT_EQ(g.size(), 0);
}

TEST(GalleryTest, AddAllIsAllOrNothing)
{
	Gallery g;
	g.add("a", testutil::axis(4, 0));

	const std::vector<std::vector<float>> batch = {
		testutil::axis(4, 1), { 0.f, 0.f, 0.f, 0.f }, testutil::axis(4, 3)
	};
	EXPECT_FALSE(g.addAll("b", batch));
	EXPECT_FALSE(g.contains("b"));
	EXPECT_EQ(g.templatesOf("a").size(), 1u);
}

TEST(GalleryTest, SnapshotIsUnaffectedByLaterMutation)
{
	Gallery g;
	g.add("a", testutil::axis(4, 0));
	const GallerySnapshot before = g.snapshot();

	g.add("b", testutil::axis(4, 1));
	g.remove("a");

	ASSERT_EQ(before->size(), 1u);
	EXPECT_EQ(before->front().identity, QString("a"));
	EXPECT_EQ(g.snapshot()->size(), 1u);
	EXPECT_EQ(g.snapshot()->front().identity, QString("b"));
}

TEST(GalleryTest, MetadataMergesOnRepeatedAdd)
{
	Gallery g;
	g.add("a", testutil::axis(4, 0), { { "name", "Ann" } });
	g.add("a", testutil::axis(4, 1), { { "email", "ann@example.com" } });

	const QVariantMap m = g.metadataOf("a");
	EXPECT_EQ(m.value("name").toString(), QString("Ann"));
	EXPECT_EQ(m.value("email").toString(), QString("ann@example.com"));
}

TEST(GalleryTest, LoadRecordsRebuildsAndRejectsBadInput)
{
	Gallery g;
	g.add("old", testutil::axis(3, 0));

	std::vector<GalleryRecord> recs = {
		{ "x", { { 2.f, 0.f, 0.f }, { 0.f, 5.f, 0.f } }, {} },
		{ "y", { { 0.f, 0.f, 1.f } }, {} },
	};
	ASSERT_TRUE(g.loadRecords(recs));
	EXPECT_EQ(g.allIdentities(), QStringList({ "x", "y" }));
	EXPECT_NEAR(g.templatesOf("x")[0][0], 1.f, 1e-6);

	std::vector<GalleryRecord> bad = { { "z", { { 0.f, 0.f, 0.f } }, {} } };
	EXPECT_FALSE(g.loadRecords(bad));
	EXPECT_EQ(g.allIdentities(), QStringList({ "x", "y" }));		// 기존 상태 유지
}
