#include "ak500d/sensors/sysfs_sensor_source.hpp"

#include <utility>

#include <QDir>
#include <QFile>
#include <QStringList>

#include "ak500d/logging.hpp"

namespace ak500d {

namespace {

// hwmon drivers that report the CPU package, most specific first
const char *const CPU_HWMON_NAMES[] = {"coretemp", "k10temp", "zenpower", "cpu_thermal"};

std::optional<qlonglong> read_integer(const QString &path, QString *error = nullptr)
{
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) {
        if (error)
            *error = QStringLiteral("%1: %2").arg(path, f.errorString());
        return std::nullopt;
    }

    const QByteArray data = f.readAll().trimmed();
    bool ok = false;
    const qlonglong value = data.toLongLong(&ok);
    if (!ok) {
        if (error)
            *error = QStringLiteral("%1: not a number").arg(path);
        return std::nullopt;
    }
    return value;
}

QString read_line(const QString &path)
{
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly))
        return QString();
    return QString::fromLatin1(f.readLine()).trimmed();
}

} // namespace

SysfsSensorSource::SysfsSensorSource(QString temperature_input,
                                     QString fan_input,
                                     QString sys_root,
                                     QString proc_root)
    : configured_input_(std::move(temperature_input))
    , fan_input_(std::move(fan_input))
    , sys_root_(std::move(sys_root))
    , proc_root_(std::move(proc_root))
{
}

std::optional<SensorSample> SysfsSensorSource::sample(QString &error)
{
    const auto temperature = read_temperature(error);
    if (!temperature)
        return std::nullopt;

    SensorSample sample;
    sample.temperature_celsius = *temperature;
    sample.cpu_load_percent = read_cpu_load();
    sample.fan_rpm = read_fan_rpm();
    sample.timestamp = std::chrono::steady_clock::now();
    return sample;
}

QString SysfsSensorSource::find_temperature_input() const
{
    if (!configured_input_.isEmpty())
        return configured_input_;

    const QDir hwmon(sys_root_ + QStringLiteral("/class/hwmon"));
    const QStringList entries = hwmon.entryList(QDir::Dirs | QDir::NoDotAndDotDot, QDir::Name);
    for (const char *wanted : CPU_HWMON_NAMES) {
        for (const QString &entry : entries) {
            const QString dir = hwmon.filePath(entry);
            if (read_line(dir + QStringLiteral("/name")) != QLatin1String(wanted))
                continue;
            const QString input = dir + QStringLiteral("/temp1_input");
            if (QFile::exists(input))
                return input;
        }
    }

    // No known CPU hwmon driver, use the first thermal zone
    const QString zone = sys_root_ + QStringLiteral("/class/thermal/thermal_zone0/temp");
    if (QFile::exists(zone))
        return zone;
    return QString();
}

std::optional<float> SysfsSensorSource::read_temperature(QString &error)
{
    if (temperature_path_.isEmpty()) {
        temperature_path_ = find_temperature_input();
        if (temperature_path_.isEmpty()) {
            error = QStringLiteral("no CPU temperature sensor under %1").arg(sys_root_);
            return std::nullopt;
        }
        qCInfo(lcSensor).noquote() << "reading CPU temperature from" << temperature_path_;
    }

    const auto milli = read_integer(temperature_path_, &error);
    if (!milli) {
        // hwmon numbering can change across module reloads, look again next time
        if (configured_input_.isEmpty())
            temperature_path_.clear();
        return std::nullopt;
    }
    return static_cast<float>(*milli / 1000.0);
}

std::optional<float> SysfsSensorSource::read_cpu_load()
{
    // cpu  user nice system idle iowait irq softirq steal guest guest_nice
    const QStringList fields = read_line(proc_root_ + QStringLiteral("/stat"))
                                   .split(QLatin1Char(' '), Qt::SkipEmptyParts);
    if (fields.size() < 5 || fields.first() != QLatin1String("cpu"))
        return std::nullopt;

    CpuTimes times;
    for (int i = 1; i < fields.size() && i <= 8; ++i) {
        bool ok = false;
        const quint64 value = fields.at(i).toULongLong(&ok);
        if (!ok)
            return std::nullopt;
        times.total += value;
        if (i == 4 || i == 5)
            times.idle += value;
    }

    const auto previous = previous_times_;
    previous_times_ = times;
    if (!previous || times.total <= previous->total || times.idle < previous->idle)
        return std::nullopt;

    const double total = static_cast<double>(times.total - previous->total);
    const double idle = static_cast<double>(times.idle - previous->idle);
    const double busy = total > idle ? total - idle : 0.0;
    return static_cast<float>(busy / total * 100.0);
}

std::optional<std::uint32_t> SysfsSensorSource::read_fan_rpm() const
{
    if (fan_input_.isEmpty())
        return std::nullopt;

    QString error;
    const auto rpm = read_integer(fan_input_, &error);
    if (!rpm || *rpm < 0) {
        qCDebug(lcSensor).noquote() << "fan:" << error;
        return std::nullopt;
    }
    return static_cast<std::uint32_t>(*rpm);
}

} // namespace ak500d
