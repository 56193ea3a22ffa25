#include <QCoreApplication>
#include <QCommandLineParser>
#include <QFile>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QTextStream>
#include <QTimer>
#include <QDebug>
#include <algorithm>
#include <exception>
#include "config/ConfigLoader.hpp"
#include "config/ConfigWatcher.hpp"
#include "config/RecognitionSettings.hpp"
#include "services/AttendanceService.hpp"
#include "log/SystemLogger.hpp"
#include "log/SystemLogTypes.hpp"
#include "services/QSqliteService.hpp"
#include "logger.hpp"
#include "util/UnixSignalWatcher.hpp"

// 파일(한 줄에 한 명) 또는 콤마 구분 목록
static QStringList readRoster(const QString& arg)
{
	QStringList out;
	if (QFileInfo::exists(arg)) {
		QFile f(arg);
		if (!f.open(QIODevice::ReadOnly | QIODevice::Text)) {
			qWarning() << "[main] roster open failed:" << arg << f.errorString();
			return out;
		}
		QTextStream ts(&f);
		while (!ts.atEnd()) {
			const QString line = ts.readLine().trimmed();
			if (!line.isEmpty() && !line.startsWith('#')) out << line;
		}
		return out;
	}
	for (const auto& s : arg.split(',', Qt::SkipEmptyParts)) out << s.trimmed();
	return out;
}

// 하루 출석표 + 최근 인식/시스템 경고 로그 출력
static int printReport(const QString& dbPath, const QString& dateArg, int limit)
{
	const QDate day = dateArg == "today" ? QDate::currentDate() : QDate::fromString(dateArg, Qt::ISODate);
	if (!day.isValid()) {
		qCritical() << "[main] invalid --report date (YYYY-MM-DD or today):" << dateArg;
		return -1;
	}

	QSqliteService db(dbPath);
	QVector<AttendanceRow> rows;
	QVector<RecognitionLogRow> recog;
	QVector<SystemLog> sys;
	int sysTotal = 0;
	if (!db.initializeDatabase() || !db.selectAttendance(day, &rows)
		|| !db.selectRecognitionLogs(0, limit, &recog)
		|| !db.selectSystemLogs(0, limit, static_cast<int>(SysLogLevel::Warn), QString(), &sys, &sysTotal)) {
		qCritical() << "[main] report query failed:" << dbPath;
		return -1;
	}

	QTextStream out(stdout);
	out << "attendance " << day.toString(Qt::ISODate) << " (" << rows.size() << ")\n";
	for (const auto& r : rows) {
		out << "  " << r.status << "  " << r.identity << "  " << r.timestamp.toString("hh:mm:ss");
		if (r.status == "P") out << "  conf=" << QString::number(r.confidence, 'f', 3);
		out << "\n";
	}
	out << "recent recognition logs (" << recog.size() << ")\n";
	for (const auto& r : recog) {
		out << "  " << r.timestamp.toString(Qt::ISODate) << "  " << r.identity
			<< (r.spoofSuspected ? "  SPOOF" : "") << "  conf=" << QString::number(r.confidence, 'f', 3) << "\n";
	}
	out << "warnings/errors (" << sys.size() << "/" << sysTotal << ")\n";
	for (const auto& l : sys) {
		out << "  " << l.timestamp.toString(Qt::ISODate) << "  " << levelName(static_cast<SysLogLevel>(l.level))
			<< "  [" << l.tag << "] " << l.message << "\n";
	}
	return 0;
}

int main(int argc, char *argv[])
{
		try {
				QCoreApplication app(argc, argv);
				QCoreApplication::setApplicationName("face_attendance");

				qSetMessagePattern(QStringLiteral("%{time hh:mm:ss.zzz} %{type} %{category} - %{message}"));
				QLoggingCategory::setFilterRules(
						"attendance.app.debug=false\n"
						"attendance.session.debug=false\n"
						"attendance.pipeline.debug=false\n"
						"attendance.match.debug=false\n"
				);

				QCommandLineParser parser;
				parser.setApplicationDescription("Camera based attendance with face recognition");
				parser.addHelpOption();
				QCommandLineOption configOpt("config", "Config JSON file.", "file",
											 QStringLiteral(CONFIG_PATH CONFIG_JSON));
				QCommandLineOption rosterOpt("roster", "Roster file (one id per line) or comma list.", "roster");
				QCommandLineOption durationOpt("duration", "Session duration in seconds.", "sec");
				QCommandLineOption enrollOpt("enroll", "Register the given identity from the camera.", "id");
				QCommandLineOption nameOpt("name", "Display name for --enroll.", "name");
				QCommandLineOption emailOpt("email", "Email for --enroll.", "email");
				QCommandLineOption deptOpt("department", "Department for --enroll.", "dept");
				QCommandLineOption yearOpt("year", "Year for --enroll.", "year");
				QCommandLineOption enrollTimeoutOpt("enroll-timeout", "Registration timeout in seconds.", "sec", "60");
				QCommandLineOption reportOpt("report", "Print attendance of a day (YYYY-MM-DD or today) and recent logs.", "date");
				QCommandLineOption limitOpt("limit", "Number of log rows for --report.", "n", "20");
				parser.addOptions({ configOpt, rosterOpt, durationOpt, enrollOpt,
									nameOpt, emailOpt, deptOpt, yearOpt, enrollTimeoutOpt,
									reportOpt, limitOpt });
				parser.process(app);

				// 설정
				RecognitionConfig cfg;
				const QString configPath = parser.value(configOpt);
				if (QFileInfo::exists(configPath)) {
					if (!ConfigLoader::loadFile(configPath, cfg)) {
						qCritical() << "설정 파일 파싱 실패:" << configPath;
						return -1;
					}
				} else {
					qWarning() << "[main] config not found, using defaults:" << configPath;
				}
				if (parser.isSet(durationOpt)) {
					bool ok = false;
					const int sec = parser.value(durationOpt).toInt(&ok);
					if (!ok || sec < 1) {
						qCritical() << "[main] invalid --duration" << parser.value(durationOpt);
						return -1;
					}
					cfg.sessionDurationSec = sec;
				}
				RecognitionSettings settings(cfg);
				Logger::setDirectory(cfg.logDir.toStdString());

				// 시스템로거 준비
				SystemLogger::init(cfg.databaseFile);
				SystemLogger::info("APP", "Logger initialized");

				// 조회 모드 (모델/카메라 불필요)
				if (parser.isSet(reportOpt)) {
					const int rc = printReport(cfg.databaseFile, parser.value(reportOpt),
											   std::max(1, parser.value(limitOpt).toInt()));
					SystemLogger::shutdown();
					return rc;
				}

				AttendanceService service(&settings);
				if (!service.initialize()) {
					qCritical() << "초기화 실패 (DB/갤러리/모델)";
					SystemLogger::shutdown();
					return -1;
				}

				// Ctrl-C / kill: 이벤트 루프를 정상 종료시켜 세션 마감을 거치게 한다
				UnixSignalWatcher sigWatcher({ SIGINT, SIGTERM });
				QObject::connect(&sigWatcher, &UnixSignalWatcher::signalReceived, &app, [](int signum) {
					qInfo() << "[main] signal" << signum << "- stopping";
					QCoreApplication::quit();
				});

				// 조기 종료여도 end() 로 결석까지 기록한 뒤 로거를 닫는다
				QObject::connect(&app, &QCoreApplication::aboutToQuit, &service, [&service] {
					service.cancelEnrollment();
					service.stopSession();
					SystemLogger::info("APP", "aboutToQuit");
					SystemLogger::shutdown();
				});

				ConfigWatcher watcher(configPath, &settings);
				QObject::connect(&watcher, &ConfigWatcher::reloaded, &service, [&service](const RecognitionConfig& c) {
					service.applySettings(c);
					LOG_INFO(QString("config reloaded thr=%1 quality=%2 skip=%3 detect=%4")
								 .arg(c.recognitionThreshold).arg(c.qualityThreshold).arg(c.frameSkip)
								 .arg(c.detectorScoreThreshold));
				});

				int exitCode = 0;

				// 등록 모드
				if (parser.isSet(enrollOpt)) {
					QVariantMap meta;
					meta.insert("name", parser.isSet(nameOpt) ? parser.value(nameOpt) : parser.value(enrollOpt));
					if (parser.isSet(emailOpt)) meta.insert("email", parser.value(emailOpt));
					if (parser.isSet(deptOpt))	meta.insert("department", parser.value(deptOpt));
					if (parser.isSet(yearOpt))	meta.insert("year", parser.value(yearOpt).toInt());

					QObject::connect(&service, &AttendanceService::enrollmentFinished,
									 [&](const RegistrationResult& r) {
						if (r.success) {
							qInfo() << "[main] registered" << parser.value(enrollOpt) << "templates=" << r.templates;
						} else {
							qWarning() << "[main] registration failed:" << r.reason;
							exitCode = 1;
						}
						QCoreApplication::exit(exitCode);
					});
					const int timeout = parser.value(enrollTimeoutOpt).toInt();
					QTimer::singleShot(0, &service, [&] {
						service.startEnrollment(parser.value(enrollOpt), meta, timeout);
					});
					return app.exec();
				}

				// 출석 세션
				QStringList roster = parser.isSet(rosterOpt) ? readRoster(parser.value(rosterOpt))
															 : service.gallery().allIdentities();
				if (roster.isEmpty()) {
					qCritical() << "[main] roster is empty";
					SystemLogger::shutdown();
					return -1;
				}

				QObject::connect(&service, &AttendanceService::sessionFinished, [](const SessionSummary& s) {
					QTextStream out(stdout);
					out << "present (" << s.present.size() << "/" << s.total << "): " << s.present.join(", ") << "\n";
					out << "absent: " << s.absent.join(", ") << "\n";
					out << "rate: " << QString::number(s.attendanceRate, 'f', 1) << "%  avg confidence: "
						<< QString::number(s.averageConfidence, 'f', 3) << "\n";
					QCoreApplication::quit();
				});

				if (!service.startSession(roster)) {
					qCritical() << "[main] session start failed";
					SystemLogger::shutdown();
					return -1;
				}
				return app.exec();
		} catch (const std::exception& e) {
				qCritical() << "[" << __func__ << "] Fatal exception: " << e.what();
		}

		return -1;
}
