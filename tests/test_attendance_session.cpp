#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include "session/AttendanceSession.hpp"
#include "test_fakes.hpp"

namespace {

MatchResult recognized(const QString& id, float conf = 0.9f)
{
	MatchResult r;
	r.status = FaceStatus::Recognized;
	r.identity = id;
	r.confidence = conf;
	r.quality.overall = 0.8;
	return r;
}

MatchResult spoofed(const QString& id)
{
	MatchResult r = recognized(id);
	r.liveness.evaluated = true;
	r.liveness.isReal = false;
	r.liveness.confidence = 1.0 / 3.0;
	return r;
}

class AttendanceSessionTest : public ::testing::Test {
	protected:
		AttendanceSession::Clock clock() {
			return [this] { return now; };
		}
		AttendanceSession make(int sec = 600, bool acceptSpoofed = false) {
			AttendanceSession::Options opt;
			opt.durationSec = sec;
			opt.acceptSpoofed = acceptSpoofed;
			return AttendanceSession(&sink, opt, clock());
		}

		RecordingSink sink;
		QDateTime now = QDateTime(QDate(2024, 3, 4), QTime(9, 0, 0));
};

} // namespace

TEST_F(AttendanceSessionTest, StartOnlyFromIdle)
{
	auto s = make();
	EXPECT_EQ(s.state(), SessionState::Idle);
	EXPECT_TRUE(s.start({ "A", "B", "A", "" }));
	EXPECT_EQ(s.state(), SessionState::Active);
	EXPECT_EQ(s.roster(), QStringList({ "A", "B" }));
	EXPECT_EQ(s.deadline(), now.addSecs(600));

	EXPECT_FALSE(s.start({ "C" }));
	EXPECT_EQ(s.roster(), QStringList({ "A", "B" }));
}

TEST_F(AttendanceSessionTest, PresenceIsMarkedOnce)
{
	auto s = make();
	s.start({ "A", "B" });

	EXPECT_EQ(s.observe({ recognized("A") }).size(), 1u);
	now = now.addSecs(5);
	EXPECT_TRUE(s.observe({ recognized("A"), recognized("A") }).empty());

	ASSERT_EQ(sink.presences.size(), 1u);
	EXPECT_EQ(sink.presences[0].identity, QString("A"));
	EXPECT_EQ(sink.presences[0].timestamp, QDateTime(QDate(2024, 3, 4), QTime(9, 0, 0)));
	EXPECT_EQ(s.marked(), QStringList({ "A" }));
}

TEST_F(AttendanceSessionTest, EndEmitsAbsencesForUnmarkedRoster)
{
	auto s = make();
	s.start({ "A", "B", "C" });
	s.observe({ recognized("A", 0.8f) });
	s.observe({ recognized("B", 0.6f) });

	const SessionSummary sum = s.end();
	EXPECT_EQ(s.state(), SessionState::Ended);
	EXPECT_EQ(sum.present, QStringList({ "A", "B" }));
	EXPECT_EQ(sum.absent, QStringList({ "C" }));
	EXPECT_EQ(sum.total, 3);
	EXPECT_NEAR(sum.attendanceRate, 66.67, 0.01);
	EXPECT_NEAR(sum.averageConfidence, 0.7, 1e-6);

	ASSERT_EQ(sink.absences.size(), 1u);
	EXPECT_EQ(sink.absences[0].identity, QString("C"));
	EXPECT_EQ(sink.presences.size(), 2u);
}

TEST_F(AttendanceSessionTest, ObservedOnlyOneOfThree)
{
	auto s = make();
	s.start({ "A", "B", "C" });
	s.observe({ recognized("A") });
	s.end();

	ASSERT_EQ(sink.presences.size(), 1u);
	EXPECT_EQ(sink.presences[0].identity, QString("A"));
	ASSERT_EQ(sink.absences.size(), 2u);
	EXPECT_EQ(sink.absences[0].identity, QString("B"));
	EXPECT_EQ(sink.absences[1].identity, QString("C"));
}

TEST_F(AttendanceSessionTest, SecondEndReturnsSameSummaryWithoutSideEffects)
{
	auto s = make();
	s.start({ "A", "B" });
	const SessionSummary first = s.end();
	const SessionSummary second = s.end();

	EXPECT_EQ(first.absent, second.absent);
	EXPECT_EQ(first.total, second.total);
	EXPECT_EQ(sink.absences.size(), 2u);
}

TEST_F(AttendanceSessionTest, EndOnIdleIsRejected)
{
	auto s = make();
	const SessionSummary sum = s.end();
	EXPECT_EQ(sum.total, 0);
	EXPECT_TRUE(sum.absent.isEmpty());
	EXPECT_EQ(s.state(), SessionState::Idle);
	EXPECT_TRUE(s.start({ "A" }));
}

TEST_F(AttendanceSessionTest, IdentitiesOutsideRosterAreIgnored)
{
	auto s = make();
	s.start({ "A" });

	MatchResult unknown;
	unknown.status = FaceStatus::Unknown;
	MatchResult lowQ = recognized("A");
	lowQ.status = FaceStatus::LowQuality;

	EXPECT_TRUE(s.observe({ recognized("Z"), unknown, lowQ }).empty());
	EXPECT_TRUE(sink.presences.empty());
	EXPECT_TRUE(s.marked().isEmpty());
}

TEST_F(AttendanceSessionTest, SpoofSuspectedIsLoggedButNotMarked)
{
	auto s = make();
	s.start({ "A" });

	EXPECT_TRUE(s.observe({ spoofed("A") }).empty());
	EXPECT_TRUE(sink.presences.empty());
	ASSERT_EQ(sink.logs.size(), 1u);
	EXPECT_TRUE(sink.logs[0].spoof);
	EXPECT_EQ(sink.logs[0].identity, QString("A"));

	// 같은 사람이 실제 얼굴로 다시 오면 출석
	EXPECT_EQ(s.observe({ recognized("A") }).size(), 1u);
}

TEST_F(AttendanceSessionTest, RepeatedSpoofIsLoggedOncePerSession)
{
	auto s = make();
	s.start({ "A", "B" });
	for (int i = 0; i < 20; ++i) s.observe({ spoofed("A") });
	s.observe({ spoofed("B") });

	ASSERT_EQ(sink.logs.size(), 2u);
	EXPECT_EQ(sink.logs[0].identity, QString("A"));
	EXPECT_EQ(sink.logs[1].identity, QString("B"));
	EXPECT_TRUE(sink.presences.empty());
}

TEST_F(AttendanceSessionTest, AcceptSpoofedOptionMarksAnyway)
{
	auto s = make(600, true);
	s.start({ "A" });
	EXPECT_EQ(s.observe({ spoofed("A") }).size(), 1u);
	EXPECT_EQ(sink.logs.size(), 1u);
	EXPECT_EQ(sink.presences.size(), 1u);
}

TEST_F(AttendanceSessionTest, DeadlineEndsSessionOnObserve)
{
	auto s = make(60);
	s.start({ "A", "B" });
	now = now.addSecs(30);
	EXPECT_FALSE(s.deadlinePassed());
	s.observe({ recognized("A") });

	now = now.addSecs(30);
	EXPECT_TRUE(s.deadlinePassed());
	EXPECT_TRUE(s.observe({ recognized("B") }).empty());
	EXPECT_EQ(s.state(), SessionState::Ended);
	ASSERT_EQ(sink.absences.size(), 1u);
	EXPECT_EQ(sink.absences[0].identity, QString("B"));
}

TEST_F(AttendanceSessionTest, ObserveAfterEndDoesNothing)
{
	auto s = make();
	s.start({ "A" });
	s.end();
	EXPECT_TRUE(s.observe({ recognized("A") }).empty());
	EXPECT_TRUE(sink.presences.empty());
	EXPECT_FALSE(s.start({ "A" }));
}

TEST_F(AttendanceSessionTest, ConcurrentObserversMarkOnce)
{
	auto s = make();
	s.start({ "A", "B" });

	std::vector<std::thread> workers;
	for (int i = 0; i < 8; ++i) {
		workers.emplace_back([&s] {
			for (int k = 0; k < 50; ++k) s.observe({ recognized("A") });
		});
	}
	for (auto& t : workers) t.join();

	EXPECT_EQ(sink.presences.size(), 1u);
	const SessionSummary sum = s.end();
	EXPECT_EQ(sum.present, QStringList({ "A" }));
	EXPECT_EQ(sum.absent, QStringList({ "B" }));
}

TEST_F(AttendanceSessionTest, EndRacingObserversKeepsRosterPartition)
{
	const QStringList roster{ "A", "B", "C", "D", "E", "F", "G", "H" };
	auto s = make();
	s.start(roster);

	std::atomic<bool> go{ false };
	std::vector<std::thread> workers;
	for (int i = 0; i < 4; ++i) {
		workers.emplace_back([&, i] {
			while (!go.load()) std::this_thread::yield();
			for (int k = 0; k < 200; ++k) s.observe({ recognized(roster[(i + k) % roster.size()]) });
		});
	}
	std::thread closer([&] {
		while (!go.load()) std::this_thread::yield();
		std::this_thread::yield();
		s.end();
	});
	go = true;
	for (auto& t : workers) t.join();
	closer.join();

	const SessionSummary sum = s.end();
	EXPECT_EQ(s.state(), SessionState::Ended);

	QStringList fromSink;
	for (const auto& p : sink.presences) fromSink << p.identity;
	for (const auto& a : sink.absences) fromSink << a.identity;
	EXPECT_EQ(fromSink.size(), roster.size());
	EXPECT_EQ(fromSink.removeDuplicates(), 0);

	QStringList sorted = fromSink;
	sorted.sort();
	QStringList expected = roster;
	expected.sort();
	EXPECT_EQ(sorted, expected);

	EXPECT_EQ(static_cast<int>(sink.presences.size()), sum.present.size());
	EXPECT_EQ(static_cast<int>(sink.absences.size()), sum.absent.size());
	EXPECT_EQ(sum.present.size() + sum.absent.size(), roster.size());
}
