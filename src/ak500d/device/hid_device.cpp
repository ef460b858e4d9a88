#include "ak500d/device/hid_device.hpp"

#include <cerrno>
#include <utility>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <hidapi/hidapi.h>

#include <QElapsedTimer>

#include "ak500d/logging.hpp"

namespace ak500d {

namespace {

QString hid_error_text(hid_device *device)
{
    const wchar_t *text = hid_error(device);
    if (!text)
        return QStringLiteral("unknown hidapi error");
    return QString::fromWCharArray(text);
}

std::string narrow(const wchar_t *text)
{
    return text ? QString::fromWCharArray(text).toStdString() : std::string();
}

struct EnumerationDeleter {
    void operator()(hid_device_info *info) const noexcept { hid_free_enumeration(info); }
};

} // namespace

const char *to_string(OpenError error)
{
    switch (error) {
    case OpenError::NotFound:
        return "not found";
    case OpenError::PermissionDenied:
        return "permission denied";
    case OpenError::Busy:
        return "busy";
    case OpenError::Other:
        return "error";
    }
    return "unknown";
}

const char *to_string(WriteError error)
{
    switch (error) {
    case WriteError::None:
        return "ok";
    case WriteError::Disconnected:
        return "disconnected";
    case WriteError::Timeout:
        return "timeout";
    case WriteError::Other:
        return "error";
    }
    return "unknown";
}

OpenError classify_open_errno(int err)
{
    switch (err) {
    case ENOENT:
    case ENODEV:
    case ENXIO:
        return OpenError::NotFound;
    case EACCES:
    case EPERM:
        return OpenError::PermissionDenied;
    case EBUSY:
    case EWOULDBLOCK:
        return OpenError::Busy;
    default:
        return OpenError::Other;
    }
}

WriteError classify_write_errno(int err)
{
    switch (err) {
    case ENODEV:
    case ENOENT:
    case ENXIO:
    case EPIPE:
    case ESHUTDOWN:
    case EIO:
        return WriteError::Disconnected;
    case ETIMEDOUT:
        return WriteError::Timeout;
    default:
        return WriteError::Other;
    }
}

HidLibrary::HidLibrary()
{
    if (hid_init() == 0) {
        initialized_ = true;
        return;
    }
    error_ = hid_error_text(nullptr);
}

HidLibrary::~HidLibrary()
{
    if (initialized_)
        hid_exit();
}

std::optional<DeviceDescriptor> HidDeviceLocator::find_device(std::uint16_t vendor_id,
                                                              std::uint16_t product_id)
{
    std::unique_ptr<hid_device_info, EnumerationDeleter> list(hid_enumerate(vendor_id, product_id));

    for (const hid_device_info *info = list.get(); info; info = info->next) {
        if (info->vendor_id != vendor_id || info->product_id != product_id || !info->path)
            continue;

        DeviceDescriptor descriptor;
        descriptor.path = info->path;
        descriptor.vendor_id = info->vendor_id;
        descriptor.product_id = info->product_id;
        descriptor.serial = narrow(info->serial_number);
        descriptor.product = narrow(info->product_string);
        return descriptor;
    }
    return std::nullopt;
}

void HidDeviceSession::HidDeleter::operator()(hid_device *device) const noexcept
{
    hid_close(device);
}

HidDeviceSession::HidDeviceSession(DeviceDescriptor descriptor, Handle handle, int lock_fd,
                                   std::chrono::milliseconds write_stall)
    : descriptor_(std::move(descriptor))
    , handle_(std::move(handle))
    , lock_fd_(lock_fd)
    , stall_threshold_(write_stall)
{
}

HidDeviceSession::~HidDeviceSession()
{
    close();
}

WriteError HidDeviceSession::write_report(const Report &report)
{
    if (!handle_ || !alive_)
        return WriteError::Disconnected;

    QElapsedTimer timer;
    timer.start();

    errno = 0;
    const int written = hid_write(handle_.get(), report.data(), report.size());
    const int err = errno;
    const qint64 elapsed = timer.elapsed();

    if (written < 0) {
        alive_ = false;
        const WriteError result = classify_write_errno(err);
        qCWarning(lcDevice).noquote() << "write to" << QString::fromStdString(descriptor_.path)
                                      << "failed:" << hid_error_text(handle_.get())
                                      << QStringLiteral("(%1)").arg(to_string(result));
        return result;
    }
    if (static_cast<std::size_t>(written) != report.size()) {
        alive_ = false;
        qCWarning(lcDevice) << "short write:" << written << "of" << report.size() << "bytes";
        return WriteError::Other;
    }
    if (elapsed > stall_threshold_.count()) {
        // hidraw writes block in the kernel and cannot be cut short here;
        // a late return means a stalled device
        alive_ = false;
        qCWarning(lcDevice) << "write took" << elapsed << "ms, stall threshold is" << stall_threshold_.count() << "ms";
        return WriteError::Timeout;
    }
    return WriteError::None;
}

bool HidDeviceSession::is_alive() const
{
    if (!handle_ || !alive_)
        return false;
    return ::access(descriptor_.path.c_str(), F_OK) == 0;
}

void HidDeviceSession::close()
{
    if (handle_) {
        handle_.reset();
        qCDebug(lcDevice).noquote() << "closed" << QString::fromStdString(descriptor_.path);
    }
    if (lock_fd_ >= 0) {
        ::close(lock_fd_);
        lock_fd_ = -1;
    }
    alive_ = false;
}

HidSessionFactory::HidSessionFactory(std::chrono::milliseconds write_stall)
    : stall_threshold_(write_stall)
{
}

std::unique_ptr<DeviceSession> HidSessionFactory::open(const DeviceDescriptor &descriptor,
                                                       OpenError &error)
{
    const char *path = descriptor.path.c_str();

    // hid_open_path() only reports a string, so probe the node first to tell
    // a missing device from a missing udev rule.
    if (::access(path, R_OK | W_OK) != 0) {
        error = classify_open_errno(errno);
        return nullptr;
    }

    // Advisory lock keeps a second instance off the same display
    const int lock_fd = ::open(path, O_RDONLY | O_CLOEXEC);
    if (lock_fd < 0) {
        error = classify_open_errno(errno);
        return nullptr;
    }
    if (::flock(lock_fd, LOCK_EX | LOCK_NB) != 0) {
        const int err = errno;
        ::close(lock_fd);
        error = err == EWOULDBLOCK ? OpenError::Busy : classify_open_errno(err);
        return nullptr;
    }

    errno = 0;
    HidDeviceSession::Handle handle(hid_open_path(path));
    const int err = errno;
    if (!handle) {
        ::close(lock_fd);
        error = err != 0 ? classify_open_errno(err) : OpenError::Other;
        qCDebug(lcDevice).noquote() << "hid_open_path" << descriptor.path.c_str() << "failed:"
                                    << hid_error_text(nullptr);
        return nullptr;
    }

    return std::make_unique<HidDeviceSession>(descriptor, std::move(handle), lock_fd, stall_threshold_);
}

} // namespace ak500d
