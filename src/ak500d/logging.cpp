#include "ak500d/logging.hpp"

#include <QtGlobal>

Q_LOGGING_CATEGORY(lcConfig, "ak500d.config", QtInfoMsg)
Q_LOGGING_CATEGORY(lcDevice, "ak500d.device", QtInfoMsg)
Q_LOGGING_CATEGORY(lcDriver, "ak500d.driver", QtInfoMsg)
Q_LOGGING_CATEGORY(lcSensor, "ak500d.sensor", QtInfoMsg)

namespace ak500d {

void init_logging(bool verbose)
{
    // journald adds its own timestamp, keep lines short
    qSetMessagePattern("%{if-debug}D%{endif}%{if-info}I%{endif}%{if-warning}W%{endif}"
                       "%{if-critical}C%{endif}%{if-fatal}F%{endif} %{category}: %{message}");

    if (verbose)
        QLoggingCategory::setFilterRules(QStringLiteral("ak500d.*.debug=true"));
}

} // namespace ak500d
