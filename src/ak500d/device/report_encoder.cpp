#include "ak500d/device/report_encoder.hpp"

#include <algorithm>
#include <cmath>

namespace ak500d {

namespace {

// Rounds to the nearest integer inside 0..max. NaN and negatives give 0.
int saturate(float value, int max)
{
    if (!(value > 0.0f))
        return 0;
    if (value >= static_cast<float>(max))
        return max;
    return std::min(static_cast<int>(std::lround(value)), max);
}

ControlUnit unit_symbol(TemperatureUnit unit)
{
    return unit == TemperatureUnit::Fahrenheit ? ControlUnit::Fahrenheit : ControlUnit::Celsius;
}

std::uint8_t load_bar(const SensorSample &sample, const DisplayConfig &config)
{
    if (!config.show_load_bar || !sample.cpu_load_percent)
        return 0;

    const float load = *sample.cpu_load_percent;
    if (!(load > 0.0f))
        return 1;

    const int segments = static_cast<int>(load / 100.0f * LOAD_BAR_SEGMENTS);
    return static_cast<std::uint8_t>(std::clamp(segments, 1, LOAD_BAR_SEGMENTS));
}

} // namespace

float to_display_unit(float celsius, TemperatureUnit unit)
{
    if (unit == TemperatureUnit::Fahrenheit)
        return celsius * 9.0f / 5.0f + 32.0f;
    return celsius;
}

int max_display_value(int digits)
{
    return digits <= 2 ? 99 : 999;
}

std::array<std::uint8_t, 3> to_digits(int value)
{
    value = std::clamp(value, 0, 999);
    return {
        static_cast<std::uint8_t>(value / 100),
        static_cast<std::uint8_t>((value % 100) / 10),
        static_cast<std::uint8_t>(value % 10),
    };
}

Report encode(const SensorSample &sample, const DisplayConfig &config)
{
    const int max = max_display_value(config.display_digits);
    const float temperature = to_display_unit(sample.temperature_celsius, config.temperature_unit);

    ControlUnit unit = unit_symbol(config.temperature_unit);
    int value = 0;
    if (config.display_mode == DisplayMode::Usage && sample.cpu_load_percent) {
        unit = ControlUnit::Percentage;
        value = saturate(*sample.cpu_load_percent, std::min(max, 100));
    } else {
        value = saturate(temperature, max);
    }

    const auto digits = to_digits(value);
    // Against the rounded value so the flag agrees with the digits shown
    const bool warning = config.show_warning && std::round(temperature) >= config.warning_temperature;

    Report report{};
    report[ReportLayout::ID] = REPORT_ID;
    report[ReportLayout::UNIT] = static_cast<std::uint8_t>(unit);
    report[ReportLayout::LOAD_BAR] = load_bar(sample, config);
    report[ReportLayout::HUNDREDS] = digits[0];
    report[ReportLayout::TENS] = digits[1];
    report[ReportLayout::UNITS] = digits[2];
    report[ReportLayout::WARNING] = warning ? 1 : 0;
    return report;
}

Report encode_loading()
{
    Report report{};
    report[ReportLayout::ID] = REPORT_ID;
    report[ReportLayout::UNIT] = static_cast<std::uint8_t>(ControlUnit::Loading);
    return report;
}

} // namespace ak500d
