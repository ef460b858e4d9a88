#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "ak500d/device/report_encoder.hpp"

namespace ak500d {

struct DeviceDescriptor {
    std::string path;
    std::uint16_t vendor_id = 0;
    std::uint16_t product_id = 0;
    std::string serial;
    std::string product;
};

enum class OpenError {
    NotFound,
    PermissionDenied,
    Busy,
    Other
};

enum class WriteError {
    None,
    Disconnected,
    Timeout,
    Other
};

const char *to_string(OpenError error);
const char *to_string(WriteError error);

// One open handle to the display. The owner holds it through a unique_ptr;
// destroying the session closes the handle.
class DeviceSession
{
public:
    virtual ~DeviceSession() = default;

    virtual WriteError write_report(const Report &report) = 0;
    virtual bool is_alive() const = 0;

    // Releases the handle. Safe to call more than once.
    virtual void close() = 0;
};

class DeviceLocator
{
public:
    virtual ~DeviceLocator() = default;

    // First visible device with exactly these ids, or nullopt when none is
    // present. Never opens the device.
    virtual std::optional<DeviceDescriptor> find_device(std::uint16_t vendor_id,
                                                        std::uint16_t product_id) = 0;
};

class SessionFactory
{
public:
    virtual ~SessionFactory() = default;

    // Returns nullptr and sets `error` when the device cannot be opened.
    virtual std::unique_ptr<DeviceSession> open(const DeviceDescriptor &descriptor,
                                                OpenError &error) = 0;
};

} // namespace ak500d
