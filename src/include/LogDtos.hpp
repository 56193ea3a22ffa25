#pragma once
#include <QString>
#include <QDate>
#include <QDateTime>
#include <QByteArray>

// 출석 DTO (attendance 테이블 1행)
struct AttendanceRow {
    int id{};
    QString identity;
    QDate date;
    QString status;         // "P" / "A"
    QDateTime timestamp;
    double confidence{};
    double quality{};
    QByteArray snapshotJpeg;
};

// 인식 판정 로그 DTO
struct RecognitionLogRow {
    int id{};
    QString identity;
    bool recognized{};
    double confidence{};
    double quality{};
    bool spoofSuspected{};
    QDateTime timestamp;
};

// 시스템 로그 DTO
struct SystemLog {
    int id{};
    int level{};        // 0~4
    QString tag;
    QString message;
    QDateTime timestamp;
    QString extra;
};
