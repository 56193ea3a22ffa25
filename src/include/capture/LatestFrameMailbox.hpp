#pragma once
#include <cstdint>
#include <QDeadlineTimer>
#include <QMutex>
#include <QMutexLocker>
#include <QWaitCondition>
#include "include/types.hpp"

// 캡처 스레드 -> 인식 워커 사이의 1칸 우편함
// 소비되지 않은 프레임은 새 프레임으로 덮어씀 (과부하 시 drop, 지연 상한 유지)
class LatestFrameMailbox {
public:
    // 캡처 스레드: 최신 프레임 게시
    void publish(const Frame& f) {
        QMutexLocker lk(&mu_);
        if (closed_) return;
        if (hasFrame_) ++dropped_;
        slot_ = f;
        slot_.bgr = f.bgr.clone();             // deep copy 1회, 캡처 버퍼와 분리
        slot_.seq = ++seq_;
        hasFrame_ = true;
        cv_.wakeOne();
    }

    // 소비자: 새 프레임이 있으면 꺼냄 (없으면 false)
    bool tryConsume(Frame& out) {
        QMutexLocker lk(&mu_);
        return takeLocked(out);
    }

    // 소비자: timeoutMs 까지 대기. close() 되면 false
    bool waitConsume(Frame& out, unsigned long timeoutMs) {
        QMutexLocker lk(&mu_);
        QDeadlineTimer deadline(static_cast<qint64>(timeoutMs));
        while (!hasFrame_ && !closed_) {
            if (!cv_.wait(&mu_, deadline)) break;
        }
        return takeLocked(out);
    }

    void close() {
        QMutexLocker lk(&mu_);
        closed_ = true;
        cv_.wakeAll();
    }

    uint64_t published() const { QMutexLocker lk(&mu_); return seq_; }
    uint64_t dropped() const { QMutexLocker lk(&mu_); return dropped_; }

private:
    bool takeLocked(Frame& out) {
        if (!hasFrame_ || closed_) return false;
        out = slot_;
        slot_ = Frame{};
        hasFrame_ = false;
        return !out.bgr.empty();
    }

    mutable QMutex mu_;
    QWaitCondition cv_;
    Frame slot_;
    bool hasFrame_ = false;
    bool closed_ = false;
    uint64_t seq_ = 0;
    uint64_t dropped_ = 0;
};
