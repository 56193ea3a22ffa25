#pragma once
#include <QLoggingCategory>

// main()에서 QLoggingCategory::setFilterRules 로 on/off
Q_DECLARE_LOGGING_CATEGORY(LC_APP)			// attendance.app
Q_DECLARE_LOGGING_CATEGORY(LC_SESSION)		// attendance.session
Q_DECLARE_LOGGING_CATEGORY(LC_PIPELINE)		// attendance.pipeline
Q_DECLARE_LOGGING_CATEGORY(LC_MATCH)		// attendance.match
