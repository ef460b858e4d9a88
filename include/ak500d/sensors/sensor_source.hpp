#pragma once

#include <chrono>
#include <cstdint>
#include <optional>

#include <QString>

namespace ak500d {

struct SensorSample {
    float temperature_celsius = 0.0f;
    std::optional<float> cpu_load_percent;
    std::optional<std::uint32_t> fan_rpm;
    std::chrono::steady_clock::time_point timestamp;
};

class SensorSource
{
public:
    virtual ~SensorSource() = default;

    // Returns nullopt and fills `error` when no temperature could be read.
    virtual std::optional<SensorSample> sample(QString &error) = 0;
};

} // namespace ak500d
