#include "ak500d/config.hpp"

#include <cmath>
#include <functional>
#include <map>
#include <string>

#include <QFile>

#include <toml++/toml.h>

#include "ak500d/logging.hpp"

namespace ak500d {

const char *const DEFAULT_CONFIG_PATH = AK500D_SYSCONFDIR "/ak500-digital/config.toml";

namespace {

QString from_view(std::string_view text)
{
    return QString::fromUtf8(text.data(), static_cast<int>(text.size()));
}

bool get_string(const toml::node &node, QString &out, QString &error)
{
    const auto *value = node.as_string();
    if (!value) {
        error = QStringLiteral("expected a string");
        return false;
    }
    out = QString::fromStdString(value->get());
    return true;
}

bool get_bool(const toml::node &node, bool &out, QString &error)
{
    const auto *value = node.as_boolean();
    if (!value) {
        error = QStringLiteral("expected true or false");
        return false;
    }
    out = value->get();
    return true;
}

bool get_integer(const toml::node &node, qlonglong min, qlonglong max, qlonglong &out, QString &error)
{
    const auto *value = node.as_integer();
    if (!value) {
        error = QStringLiteral("expected an integer");
        return false;
    }
    out = value->get();
    if (out < min || out > max) {
        error = QStringLiteral("%1 is outside %2..%3").arg(out).arg(min).arg(max);
        return false;
    }
    return true;
}

// Integers are accepted too: `warning_temperature = 90`
bool get_float(const toml::node &node, float &out, QString &error)
{
    double value = 0.0;
    if (const auto *real = node.as_floating_point())
        value = real->get();
    else if (const auto *whole = node.as_integer())
        value = static_cast<double>(whole->get());
    else {
        error = QStringLiteral("expected a number");
        return false;
    }
    if (!std::isfinite(value)) {
        error = QStringLiteral("expected a finite number");
        return false;
    }
    out = static_cast<float>(value);
    return true;
}

bool get_millis(const toml::node &node, qlonglong min, qlonglong max,
                std::chrono::milliseconds &out, QString &error)
{
    qlonglong value = 0;
    if (!get_integer(node, min, max, value, error))
        return false;
    out = std::chrono::milliseconds(value);
    return true;
}

using Setter = std::function<bool(const toml::node &node, DisplayConfig &config, QString &error)>;

const std::map<std::string, Setter> &setters()
{
    static const std::map<std::string, Setter> table = {
        {"update_interval_ms", [](const toml::node &n, DisplayConfig &c, QString &e) {
             return get_millis(n, 100, 60000, c.update_interval, e);
         }},
        {"temperature_unit", [](const toml::node &n, DisplayConfig &c, QString &e) {
             QString name;
             if (!get_string(n, name, e))
                 return false;
             if (name.compare(QLatin1String("celsius"), Qt::CaseInsensitive) == 0)
                 c.temperature_unit = TemperatureUnit::Celsius;
             else if (name.compare(QLatin1String("fahrenheit"), Qt::CaseInsensitive) == 0)
                 c.temperature_unit = TemperatureUnit::Fahrenheit;
             else {
                 e = QStringLiteral("expected \"celsius\" or \"fahrenheit\", got \"%1\"").arg(name);
                 return false;
             }
             return true;
         }},
        {"display_mode", [](const toml::node &n, DisplayConfig &c, QString &e) {
             QString name;
             if (!get_string(n, name, e))
                 return false;
             if (name.compare(QLatin1String("temperature"), Qt::CaseInsensitive) == 0)
                 c.display_mode = DisplayMode::Temperature;
             else if (name.compare(QLatin1String("usage"), Qt::CaseInsensitive) == 0)
                 c.display_mode = DisplayMode::Usage;
             else {
                 e = QStringLiteral("expected \"temperature\" or \"usage\", got \"%1\"").arg(name);
                 return false;
             }
             return true;
         }},
        {"display_digits", [](const toml::node &n, DisplayConfig &c, QString &e) {
             qlonglong value = 0;
             if (!get_integer(n, 2, 3, value, e))
                 return false;
             c.display_digits = static_cast<int>(value);
             return true;
         }},
        {"vendor_id", [](const toml::node &n, DisplayConfig &c, QString &e) {
             qlonglong value = 0;
             if (!get_integer(n, 0, 0xffff, value, e))
                 return false;
             c.vendor_id = static_cast<std::uint16_t>(value);
             return true;
         }},
        {"product_id", [](const toml::node &n, DisplayConfig &c, QString &e) {
             qlonglong value = 0;
             if (!get_integer(n, 0, 0xffff, value, e))
                 return false;
             c.product_id = static_cast<std::uint16_t>(value);
             return true;
         }},
        {"show_warning", [](const toml::node &n, DisplayConfig &c, QString &e) {
             return get_bool(n, c.show_warning, e);
         }},
        {"warning_temperature", [](const toml::node &n, DisplayConfig &c, QString &e) {
             return get_float(n, c.warning_temperature, e);
         }},
        {"show_load_bar", [](const toml::node &n, DisplayConfig &c, QString &e) {
             return get_bool(n, c.show_load_bar, e);
         }},
        {"write_stall_ms", [](const toml::node &n, DisplayConfig &c, QString &e) {
             return get_millis(n, 50, 10000, c.write_stall, e);
         }},
        {"backoff_initial_ms", [](const toml::node &n, DisplayConfig &c, QString &e) {
             return get_millis(n, 100, 600000, c.backoff_initial, e);
         }},
        {"backoff_max_ms", [](const toml::node &n, DisplayConfig &c, QString &e) {
             return get_millis(n, 100, 600000, c.backoff_max, e);
         }},
        {"loading_on_exit", [](const toml::node &n, DisplayConfig &c, QString &e) {
             return get_bool(n, c.loading_on_exit, e);
         }},
        {"temperature_input", [](const toml::node &n, DisplayConfig &c, QString &e) {
             return get_string(n, c.temperature_input, e);
         }},
        {"fan_input", [](const toml::node &n, DisplayConfig &c, QString &e) {
             return get_string(n, c.fan_input, e);
         }},
    };
    return table;
}

} // namespace

bool load_config(const QString &path, bool required, DisplayConfig &config, QString &error)
{
    if (!QFile::exists(path)) {
        if (required) {
            error = QStringLiteral("%1: no such file").arg(path);
            return false;
        }
        qCInfo(lcConfig) << "no configuration at" << path << "- using defaults";
        return true;
    }

    toml::table table;
    try {
        table = toml::parse_file(path.toStdString());
    } catch (const toml::parse_error &err) {
        error = QStringLiteral("%1:%2: %3")
                    .arg(path)
                    .arg(err.source().begin.line)
                    .arg(from_view(err.description()));
        return false;
    }

    // The parser already rejects duplicate keys
    DisplayConfig parsed = config;
    for (auto &&[key, node] : table) {
        const QString name = from_view(key.str());
        const auto line = key.source().begin.line;

        if (node.is_table() || node.is_array_of_tables()) {
            error = QStringLiteral("%1:%2: tables are not supported ('%3')").arg(path).arg(line).arg(name);
            return false;
        }

        const auto setter = setters().find(std::string(key.str()));
        if (setter == setters().end()) {
            error = QStringLiteral("%1:%2: unknown key '%3'").arg(path).arg(line).arg(name);
            return false;
        }

        QString why;
        if (!setter->second(node, parsed, why)) {
            error = QStringLiteral("%1:%2: %3: %4").arg(path).arg(line).arg(name, why);
            return false;
        }
    }

    if (parsed.backoff_max < parsed.backoff_initial) {
        error = QStringLiteral("%1: backoff_max_ms (%2) is below backoff_initial_ms (%3)")
                    .arg(path)
                    .arg(parsed.backoff_max.count())
                    .arg(parsed.backoff_initial.count());
        return false;
    }

    config = parsed;
    qCInfo(lcConfig) << "loaded" << path;
    return true;
}

const char *to_string(TemperatureUnit unit)
{
    switch (unit) {
    case TemperatureUnit::Celsius:
        return "celsius";
    case TemperatureUnit::Fahrenheit:
        return "fahrenheit";
    }
    return "unknown";
}

const char *to_string(DisplayMode mode)
{
    switch (mode) {
    case DisplayMode::Temperature:
        return "temperature";
    case DisplayMode::Usage:
        return "usage";
    }
    return "unknown";
}

} // namespace ak500d
