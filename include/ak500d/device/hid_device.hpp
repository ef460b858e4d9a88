#pragma once

#include <chrono>
#include <memory>

#include <QString>

#include "ak500d/device/device_session.hpp"

struct hid_device_;
typedef struct hid_device_ hid_device;

namespace ak500d {

// Owns hid_init()/hid_exit() for the lifetime of the process.
class HidLibrary
{
public:
    HidLibrary();
    ~HidLibrary();

    HidLibrary(const HidLibrary &) = delete;
    HidLibrary &operator=(const HidLibrary &) = delete;

    bool initialized() const { return initialized_; }
    QString error() const { return error_; }

private:
    bool initialized_ = false;
    QString error_;
};

class HidDeviceLocator : public DeviceLocator
{
public:
    std::optional<DeviceDescriptor> find_device(std::uint16_t vendor_id,
                                                std::uint16_t product_id) override;
};

class HidDeviceSession : public DeviceSession
{
public:
    struct HidDeleter {
        void operator()(hid_device *device) const noexcept;
    };
    using Handle = std::unique_ptr<hid_device, HidDeleter>;

    HidDeviceSession(DeviceDescriptor descriptor, Handle handle, int lock_fd,
                     std::chrono::milliseconds write_stall);
    ~HidDeviceSession() override;

    WriteError write_report(const Report &report) override;
    bool is_alive() const override;
    void close() override;

private:
    DeviceDescriptor descriptor_;
    Handle handle_;
    int lock_fd_ = -1;
    std::chrono::milliseconds stall_threshold_;
    bool alive_ = true;
};

class HidSessionFactory : public SessionFactory
{
public:
    explicit HidSessionFactory(std::chrono::milliseconds write_stall);

    std::unique_ptr<DeviceSession> open(const DeviceDescriptor &descriptor,
                                        OpenError &error) override;

private:
    std::chrono::milliseconds stall_threshold_;
};

// errno classification shared by open and write paths
OpenError classify_open_errno(int err);
WriteError classify_write_errno(int err);

} // namespace ak500d
