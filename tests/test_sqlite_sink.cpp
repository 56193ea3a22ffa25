#include <gtest/gtest.h>
#include <QTemporaryDir>
#include "services/SqliteAttendanceSink.hpp"
#include "test_fakes.hpp"

namespace {

class SqliteSinkTest : public ::testing::Test {
	protected:
		void SetUp() override {
			ASSERT_TRUE(dir.isValid());
			db = std::make_shared<QSqliteService>(dir.filePath("db/attendance.db"));
			ASSERT_TRUE(db->initializeDatabase());
			sink = std::make_unique<SqliteAttendanceSink>(db);
		}

		void TearDown() override {
			sink.reset();
			db.reset();
		}

		PresenceEvent presence(const QString& id, const QDateTime& ts) {
			PresenceEvent ev;
			ev.identity = id;
			ev.timestamp = ts;
			ev.confidence = 0.83f;
			ev.qualityOverall = 0.77;
			return ev;
		}

		QVector<AttendanceRow> rowsOn(const QDate& d) {
			QVector<AttendanceRow> rows;
			EXPECT_TRUE(db->selectAttendance(d, &rows));
			return rows;
		}

		QTemporaryDir dir;
		std::shared_ptr<QSqliteService> db;
		std::unique_ptr<SqliteAttendanceSink> sink;
		const QDateTime morning = QDateTime(QDate(2024, 5, 2), QTime(9, 0, 0));
};

} // namespace

TEST_F(SqliteSinkTest, OnePresenceRowPerIdentityPerDay)
{
	sink->onPresence(presence("alice", morning));
	sink->onPresence(presence("alice", morning.addSecs(3600)));
	sink->onPresence(presence("alice", morning.addDays(1)));

	const auto today = rowsOn(morning.date());
	ASSERT_EQ(today.size(), 1);
	EXPECT_EQ(today[0].identity, QString("alice"));
	EXPECT_EQ(today[0].status, QString("P"));
	EXPECT_NEAR(today[0].confidence, 0.83, 1e-6);
	EXPECT_NEAR(today[0].quality, 0.77, 1e-9);
	EXPECT_EQ(today[0].timestamp.time(), QTime(9, 0, 0));

	EXPECT_EQ(rowsOn(morning.date().addDays(1)).size(), 1);
}

TEST_F(SqliteSinkTest, AbsenceDoesNotOverwritePresence)
{
	sink->onPresence(presence("alice", morning));
	sink->onAbsence(AbsenceEvent{ "alice", morning.addSecs(600) });
	sink->onAbsence(AbsenceEvent{ "bob", morning.addSecs(600) });

	const auto rows = rowsOn(morning.date());
	ASSERT_EQ(rows.size(), 2);
	EXPECT_EQ(rows[0].identity, QString("alice"));
	EXPECT_EQ(rows[0].status, QString("P"));
	EXPECT_EQ(rows[1].identity, QString("bob"));
	EXPECT_EQ(rows[1].status, QString("A"));
}

TEST_F(SqliteSinkTest, InsertReportsWhetherRowWasNew)
{
	bool inserted = false;
	ASSERT_TRUE(db->insertAttendance("carol", morning.date(), "P", morning, 0.9, 0.8, {}, &inserted));
	EXPECT_TRUE(inserted);
	ASSERT_TRUE(db->insertAttendance("carol", morning.date(), "A", morning, 0.0, 0.0, {}, &inserted));
	EXPECT_FALSE(inserted);
}

TEST_F(SqliteSinkTest, SnapshotIsStoredAsJpeg)
{
	PresenceEvent ev = presence("dave", morning);
	ev.snapshot = testutil::noiseImage(112, 112);
	sink->onPresence(ev);

	const auto rows = rowsOn(morning.date());
	ASSERT_EQ(rows.size(), 1);
	const QByteArray& jpg = rows[0].snapshotJpeg;
	ASSERT_GT(jpg.size(), 2);
	EXPECT_EQ(static_cast<unsigned char>(jpg[0]), 0xFF);
	EXPECT_EQ(static_cast<unsigned char>(jpg[1]), 0xD8);

	std::vector<uchar> buf(jpg.begin(), jpg.end());
	const cv::Mat decoded = cv::imdecode(buf, cv::IMREAD_COLOR);
	EXPECT_EQ(decoded.size(), cv::Size(112, 112));
}

TEST_F(SqliteSinkTest, RecognitionLogsAreRecorded)
{
	sink->onRecognitionLog("erin", true, 0.91f, 0.7, true);
	sink->onRecognitionLog("", false, 0.0f, 0.4, false);

	QVector<RecognitionLogRow> rows;
	ASSERT_TRUE(db->selectRecognitionLogs(0, 10, &rows));
	ASSERT_EQ(rows.size(), 2);
	// 최신순
	EXPECT_TRUE(rows[0].identity.isEmpty());
	EXPECT_FALSE(rows[0].recognized);
	EXPECT_EQ(rows[1].identity, QString("erin"));
	EXPECT_TRUE(rows[1].spoofSuspected);
	EXPECT_NEAR(rows[1].confidence, 0.91, 1e-6);
}

TEST_F(SqliteSinkTest, SystemLogsFilterByLevelAndTag)
{
	ASSERT_TRUE(db->insertSystemLog(1, "SESSION", "started", morning));
	ASSERT_TRUE(db->insertSystemLog(3, "ENROLL", "store write failed", morning, "alice"));
	ASSERT_TRUE(db->insertSystemLog(3, "SESSION", "camera lost", morning));

	QVector<SystemLog> rows;
	int total = 0;
	ASSERT_TRUE(db->selectSystemLogs(0, 10, 3, "SESS", &rows, &total));
	EXPECT_EQ(total, 1);
	ASSERT_EQ(rows.size(), 1);
	EXPECT_EQ(rows[0].message, QString("camera lost"));
}
