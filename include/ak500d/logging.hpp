#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcConfig)
Q_DECLARE_LOGGING_CATEGORY(lcDevice)
Q_DECLARE_LOGGING_CATEGORY(lcDriver)
Q_DECLARE_LOGGING_CATEGORY(lcSensor)

namespace ak500d {

// Installs the message pattern used by the service and, when verbose,
// enables the debug level for every ak500d category.
void init_logging(bool verbose);

} // namespace ak500d
