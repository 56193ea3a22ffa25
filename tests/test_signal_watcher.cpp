#include <gtest/gtest.h>
#include <QCoreApplication>
#include <QElapsedTimer>
#include <csignal>
#include <functional>
#include "util/UnixSignalWatcher.hpp"

namespace {
bool pumpUntil(const std::function<bool()>& done, int timeoutMs = 2000)
{
	QElapsedTimer t;
	t.start();
	while (!done() && t.elapsed() < timeoutMs) {
		QCoreApplication::processEvents(QEventLoop::AllEvents, 20);
	}
	return done();
}
} // namespace

TEST(UnixSignalWatcherTest, SignalArrivesOnEventLoop)
{
	UnixSignalWatcher w({ SIGUSR1 });
	ASSERT_TRUE(w.isValid());

	QList<int> got;
	QObject::connect(&w, &UnixSignalWatcher::signalReceived, &w, [&got](int s) { got << s; });

	ASSERT_EQ(std::raise(SIGUSR1), 0);
	EXPECT_TRUE(got.isEmpty());		// 핸들러에서는 emit 하지 않는다
	ASSERT_TRUE(pumpUntil([&] { return !got.isEmpty(); }));
	EXPECT_EQ(got, QList<int>({ SIGUSR1 }));

	ASSERT_EQ(std::raise(SIGUSR1), 0);
	ASSERT_TRUE(pumpUntil([&] { return got.size() == 2; }));
}

TEST(UnixSignalWatcherTest, OnlyOneWatcherPerProcess)
{
	UnixSignalWatcher first({ SIGUSR2 });
	UnixSignalWatcher second({ SIGUSR2 });
	EXPECT_TRUE(first.isValid());
	EXPECT_FALSE(second.isValid());
}

TEST(UnixSignalWatcherTest, PreviousHandlerIsRestored)
{
	struct sigaction before;
	ASSERT_EQ(::sigaction(SIGUSR1, nullptr, &before), 0);
	{
		UnixSignalWatcher w({ SIGUSR1 });
		ASSERT_TRUE(w.isValid());
	}
	struct sigaction after;
	ASSERT_EQ(::sigaction(SIGUSR1, nullptr, &after), 0);
	EXPECT_EQ(after.sa_handler, before.sa_handler);
}
