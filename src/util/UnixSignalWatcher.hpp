#pragma once
#include <QList>
#include <QObject>
#include <signal.h>

class QSocketNotifier;

// 유닉스 시그널을 이벤트 루프의 Qt 시그널로 넘긴다 (self-pipe).
// 핸들러는 바이트 하나만 쓰고, 나머지는 메인 스레드에서 처리.
// 프로세스당 하나만 만들 수 있다.
class UnixSignalWatcher : public QObject {
	Q_OBJECT
public:
	explicit UnixSignalWatcher(const QList<int>& signums, QObject* parent = nullptr);
	~UnixSignalWatcher() override;

	bool isValid() const { return notifier_ != nullptr; }

signals:
	void signalReceived(int signum);

private:
	void drain();
	static void handler(int signum);

	static int fds_[2];			// [0] 핸들러가 쓰는 쪽, [1] 노티파이어가 읽는 쪽

	QSocketNotifier* notifier_ = nullptr;
	QList<int> signums_;
	QList<struct sigaction> previous_;
};
