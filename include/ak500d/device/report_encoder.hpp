#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

#include "ak500d/config.hpp"
#include "ak500d/sensors/sensor_source.hpp"

namespace ak500d {

constexpr std::size_t REPORT_SIZE = 64;
constexpr std::uint8_t REPORT_ID = 16;

using Report = std::array<std::uint8_t, REPORT_SIZE>;

// Byte offsets inside a report
namespace ReportLayout {
constexpr std::size_t ID = 0;
constexpr std::size_t UNIT = 1;
constexpr std::size_t LOAD_BAR = 2;
constexpr std::size_t HUNDREDS = 3;
constexpr std::size_t TENS = 4;
constexpr std::size_t UNITS = 5;
constexpr std::size_t WARNING = 6;
} // namespace ReportLayout

// Symbol lit next to the digits
enum class ControlUnit : std::uint8_t {
    Celsius = 19,
    Fahrenheit = 35,
    Percentage = 76,
    Loading = 170 // plays the boot animation, digits ignored
};

constexpr int LOAD_BAR_SEGMENTS = 10;

float to_display_unit(float celsius, TemperatureUnit unit);

// Largest value the panel can show with `digits` digits.
int max_display_value(int digits);

// Splits 0..999 into hundreds, tens and units. Out of range values saturate.
std::array<std::uint8_t, 3> to_digits(int value);

Report encode(const SensorSample &sample, const DisplayConfig &config);

Report encode_loading();

} // namespace ak500d
