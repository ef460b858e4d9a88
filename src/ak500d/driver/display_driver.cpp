#include "ak500d/driver/display_driver.hpp"

#include <utility>

#include <QTimer>

#include "ak500d/device/report_encoder.hpp"
#include "ak500d/logging.hpp"

namespace ak500d {

namespace {

QString device_id(const DisplayConfig &config)
{
    return QStringLiteral("%1:%2")
        .arg(config.vendor_id, 4, 16, QLatin1Char('0'))
        .arg(config.product_id, 4, 16, QLatin1Char('0'));
}

} // namespace

const char *to_string(DisplayDriver::State state)
{
    switch (state) {
    case DisplayDriver::State::Disconnected:
        return "disconnected";
    case DisplayDriver::State::Connecting:
        return "connecting";
    case DisplayDriver::State::Connected:
        return "connected";
    case DisplayDriver::State::ShuttingDown:
        return "shutting down";
    }
    return "unknown";
}

DisplayDriver::DisplayDriver(const DisplayConfig &config,
                             SensorSource &sensor,
                             DeviceLocator &locator,
                             SessionFactory &factory,
                             QObject *parent)
    : QObject(parent)
    , config_(config)
    , sensor_(sensor)
    , locator_(locator)
    , factory_(factory)
    , backoff_(config.backoff_initial, config.backoff_max)
{
    timer_ = new QTimer(this);
    timer_->setSingleShot(true);
    timer_->setTimerType(Qt::CoarseTimer);

    connect(timer_, &QTimer::timeout, this, [this]{
        const auto delay = step();
        if (state_ != State::ShuttingDown)
            schedule(delay);
    });
}

DisplayDriver::~DisplayDriver()
{
    if (session_)
        session_->close();
}

void DisplayDriver::start()
{
    qCInfo(lcDriver).noquote() << "driving" << device_id(config_) << "every"
                               << config_.update_interval.count() << "ms, unit"
                               << to_string(config_.temperature_unit) << ", mode"
                               << to_string(config_.display_mode);
    schedule(std::chrono::milliseconds(0));
}

void DisplayDriver::stop()
{
    if (state_ == State::ShuttingDown)
        return;

    timer_->stop();
    set_state(State::ShuttingDown);

    if (session_) {
        if (config_.loading_on_exit && session_->is_alive()) {
            const WriteError result = session_->write_report(encode_loading());
            if (result != WriteError::None)
                qCWarning(lcDriver) << "exit report not written:" << to_string(result);
        }
        session_->close();
        session_.reset();
    }

    emit finished();
}

std::chrono::milliseconds DisplayDriver::step()
{
    switch (state_) {
    case State::Disconnected:
        set_state(State::Connecting);
        return std::chrono::milliseconds(0);
    case State::Connecting:
        return connect_device();
    case State::Connected:
        return update_display();
    case State::ShuttingDown:
        break;
    }
    return std::chrono::milliseconds(0);
}

void DisplayDriver::set_state(State state)
{
    if (state_ == state)
        return;

    qCDebug(lcDriver) << to_string(state_) << "->" << to_string(state);
    state_ = state;
    emit state_changed(state);
}

std::chrono::milliseconds DisplayDriver::connect_device()
{
    const auto descriptor = locator_.find_device(config_.vendor_id, config_.product_id);
    if (!descriptor) {
        if (!reported_missing_) {
            qCInfo(lcDevice).noquote() << "no device" << device_id(config_) << "present, waiting";
            reported_missing_ = true;
        } else {
            qCDebug(lcDevice).noquote() << "still no device" << device_id(config_);
        }
        set_state(State::Disconnected);
        return backoff_.next();
    }

    OpenError error = OpenError::Other;
    auto session = factory_.open(*descriptor, error);
    if (!session) {
        const QString path = QString::fromStdString(descriptor->path);
        switch (error) {
        case OpenError::PermissionDenied:
            qCWarning(lcDevice).noquote()
                << "permission denied opening" << path
                << "- install the udev rule or run with access to the hidraw node";
            break;
        case OpenError::NotFound:
            qCInfo(lcDevice).noquote() << path << "vanished before it could be opened";
            break;
        case OpenError::Busy:
            qCWarning(lcDevice).noquote() << path << "is held by another process";
            break;
        case OpenError::Other:
            qCWarning(lcDevice).noquote() << "cannot open" << path;
            break;
        }
        set_state(State::Disconnected);
        return backoff_.next();
    }

    // Never two sessions; anything left over is closed before replacing it
    if (session_)
        session_->close();
    session_ = std::move(session);
    reported_missing_ = false;

    qCInfo(lcDevice).noquote() << "connected to" << QString::fromStdString(descriptor->path)
                               << QString::fromStdString(descriptor->product);
    set_state(State::Connected);

    const WriteError result = session_->write_report(encode_loading());
    if (result != WriteError::None)
        return drop_session(to_string(result));

    return std::chrono::milliseconds(0);
}

std::chrono::milliseconds DisplayDriver::update_display()
{
    if (!session_ || !session_->is_alive())
        return drop_session("device gone");

    QString error;
    const auto sample = sensor_.sample(error);
    if (!sample) {
        if (!sensor_failing_)
            qCWarning(lcSensor).noquote() << "no reading, display not updated:" << error;
        else
            qCDebug(lcSensor).noquote() << "no reading:" << error;
        sensor_failing_ = true;
        return config_.update_interval;
    }
    if (sensor_failing_) {
        qCInfo(lcSensor) << "readings available again";
        sensor_failing_ = false;
    }

    const WriteError result = session_->write_report(encode(*sample, config_));
    if (result != WriteError::None)
        return drop_session(to_string(result));

    backoff_.reset();
    return config_.update_interval;
}

std::chrono::milliseconds DisplayDriver::drop_session(const char *reason)
{
    qCWarning(lcDevice) << "lost device:" << reason;

    if (session_) {
        session_->close();
        session_.reset();
    }
    set_state(State::Disconnected);
    return backoff_.next();
}

void DisplayDriver::schedule(std::chrono::milliseconds delay)
{
    timer_->start(static_cast<int>(delay.count()));
}

} // namespace ak500d
