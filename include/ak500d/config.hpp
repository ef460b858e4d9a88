#pragma once

#include <chrono>
#include <cstdint>

#include <QString>

namespace ak500d {

// DeepCool AK500-DIGITAL
constexpr std::uint16_t DEFAULT_VENDOR_ID = 0x3633;
constexpr std::uint16_t DEFAULT_PRODUCT_ID = 0x0003;

extern const char *const DEFAULT_CONFIG_PATH;

enum class TemperatureUnit {
    Celsius,
    Fahrenheit
};

enum class DisplayMode {
    Temperature,
    Usage // CPU load in percent
};

struct DisplayConfig {
    std::chrono::milliseconds update_interval{1000};
    TemperatureUnit temperature_unit = TemperatureUnit::Celsius;
    DisplayMode display_mode = DisplayMode::Temperature;

    std::uint16_t vendor_id = DEFAULT_VENDOR_ID;
    std::uint16_t product_id = DEFAULT_PRODUCT_ID;

    // The AK500 panel has three digits; 2 limits the value to 99.
    int display_digits = 3;

    bool show_warning = true;
    float warning_temperature = 90.0f; // in temperature_unit
    bool show_load_bar = true;

    // A write that returns later than this counts as a stalled device. It does
    // not interrupt the write; the kernel's USB timeout bounds the call.
    std::chrono::milliseconds write_stall{1000};
    std::chrono::milliseconds backoff_initial{1000};
    std::chrono::milliseconds backoff_max{30000};

    bool loading_on_exit = false;

    // Empty means autodetect (temperature) or not shown (fan).
    QString temperature_input;
    QString fan_input;
};

// Reads a TOML file of top-level keys into `config`. Keys absent from the
// file keep their defaults. Returns false with a one-line diagnostic in
// `error` on any unreadable file, unknown key or malformed value.
//
// When `required` is false a missing file is not an error and leaves the
// defaults in place.
bool load_config(const QString &path, bool required, DisplayConfig &config, QString &error);

const char *to_string(TemperatureUnit unit);
const char *to_string(DisplayMode mode);

} // namespace ak500d
