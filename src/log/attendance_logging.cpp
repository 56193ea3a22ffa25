#include "log/attendance_logging.hpp"

Q_LOGGING_CATEGORY(LC_APP,      "attendance.app")
Q_LOGGING_CATEGORY(LC_SESSION,  "attendance.session")
Q_LOGGING_CATEGORY(LC_PIPELINE, "attendance.pipeline")
Q_LOGGING_CATEGORY(LC_MATCH,    "attendance.match")
