#pragma once

#include <optional>

#include <QString>
#include <QtGlobal>

#include "ak500d/sensors/sensor_source.hpp"

namespace ak500d {

// CPU temperature from hwmon or the first thermal zone, CPU load from
// /proc/stat and an optional fan tachometer input.
class SysfsSensorSource : public SensorSource
{
public:
    // Roots are overridable so tests can point at a fake tree.
    SysfsSensorSource(QString temperature_input,
                      QString fan_input,
                      QString sys_root = QStringLiteral("/sys"),
                      QString proc_root = QStringLiteral("/proc"));

    std::optional<SensorSample> sample(QString &error) override;

    // Path the temperature is currently read from, empty until resolved.
    QString temperature_path() const { return temperature_path_; }

private:
    struct CpuTimes {
        quint64 idle = 0;
        quint64 total = 0;
    };

    const QString configured_input_;
    const QString fan_input_;
    const QString sys_root_;
    const QString proc_root_;

    QString temperature_path_;
    std::optional<CpuTimes> previous_times_;

    QString find_temperature_input() const;
    std::optional<float> read_temperature(QString &error);
    std::optional<float> read_cpu_load();
    std::optional<std::uint32_t> read_fan_rpm() const;
};

} // namespace ak500d
