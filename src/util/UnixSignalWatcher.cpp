#include "util/UnixSignalWatcher.hpp"
#include <QSocketNotifier>
#include <QtCore/QDebug>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/socket.h>
#include <unistd.h>

int UnixSignalWatcher::fds_[2] = { -1, -1 };

UnixSignalWatcher::UnixSignalWatcher(const QList<int>& signums, QObject* parent)
	: QObject(parent)
{
	if (fds_[0] != -1) {
		qWarning() << "[Signal] watcher already installed";
		return;
	}
	if (::socketpair(AF_UNIX, SOCK_STREAM, 0, fds_) != 0) {
		qWarning() << "[Signal] socketpair failed:" << std::strerror(errno);
		fds_[0] = fds_[1] = -1;
		return;
	}
	for (int fd : fds_) {
		::fcntl(fd, F_SETFD, FD_CLOEXEC);
		::fcntl(fd, F_SETFL, ::fcntl(fd, F_GETFL) | O_NONBLOCK);
	}

	notifier_ = new QSocketNotifier(fds_[1], QSocketNotifier::Read, this);
	connect(notifier_, &QSocketNotifier::activated, this, &UnixSignalWatcher::drain);

	for (int sig : signums) {
		struct sigaction sa;
		std::memset(&sa, 0, sizeof(sa));
		sa.sa_handler = &UnixSignalWatcher::handler;
		sigemptyset(&sa.sa_mask);
		sa.sa_flags = SA_RESTART;

		struct sigaction old;
		if (::sigaction(sig, &sa, &old) != 0) {
			qWarning() << "[Signal] sigaction failed for" << sig << std::strerror(errno);
			continue;
		}
		signums_ << sig;
		previous_ << old;
	}
}

UnixSignalWatcher::~UnixSignalWatcher()
{
	for (int i = 0; i < signums_.size(); ++i) ::sigaction(signums_[i], &previous_[i], nullptr);
	if (!notifier_) return;

	delete notifier_;
	notifier_ = nullptr;
	::close(fds_[0]);
	::close(fds_[1]);
	fds_[0] = fds_[1] = -1;
}

void UnixSignalWatcher::handler(int signum)
{
	// async-signal-safe 함수만. 실패해도 핸들러 안에서는 할 수 있는 게 없다
	const int saved = errno;
	const unsigned char b = static_cast<unsigned char>(signum);
	const ssize_t n = ::write(fds_[0], &b, 1);
	(void)n;
	errno = saved;
}

void UnixSignalWatcher::drain()
{
	notifier_->setEnabled(false);
	unsigned char b = 0;
	while (::read(fds_[1], &b, 1) == 1) {
		qInfo() << "[Signal] received" << static_cast<int>(b);
		emit signalReceived(static_cast<int>(b));
	}
	notifier_->setEnabled(true);
}
