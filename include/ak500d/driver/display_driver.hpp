#pragma once

#include <chrono>
#include <memory>

#include <QObject>

#include "ak500d/config.hpp"
#include "ak500d/device/device_session.hpp"
#include "ak500d/driver/backoff.hpp"
#include "ak500d/sensors/sensor_source.hpp"

class QTimer;

namespace ak500d {

// Keeps the cooler display updated. Owns the only session to the device and
// reconnects with backoff whenever it is lost.
class DisplayDriver : public QObject
{
    Q_OBJECT
public:
    enum class State {
        Disconnected,
        Connecting,
        Connected,
        ShuttingDown
    };
    Q_ENUM(State)

    DisplayDriver(const DisplayConfig &config,
                  SensorSource &sensor,
                  DeviceLocator &locator,
                  SessionFactory &factory,
                  QObject *parent = nullptr);
    ~DisplayDriver() override;

    // Runs step() from the event loop until stop().
    void start();

    // Enters ShuttingDown, optionally writes the exit report and releases
    // the session. Emits finished() once.
    void stop();

    // One state machine transition. Returns how long to wait before the
    // next one.
    std::chrono::milliseconds step();

    State state() const { return state_; }
    bool has_session() const { return session_ != nullptr; }

signals:
    void state_changed(ak500d::DisplayDriver::State state);
    void finished();

private:
    const DisplayConfig config_;
    SensorSource &sensor_;
    DeviceLocator &locator_;
    SessionFactory &factory_;

    std::unique_ptr<DeviceSession> session_;
    Backoff backoff_;
    State state_ = State::Disconnected;
    QTimer *timer_ = nullptr;

    bool reported_missing_ = false;
    bool sensor_failing_ = false;

    void set_state(State state);
    std::chrono::milliseconds connect_device();
    std::chrono::milliseconds update_display();
    std::chrono::milliseconds drop_session(const char *reason);
    void schedule(std::chrono::milliseconds delay);
};

const char *to_string(DisplayDriver::State state);

} // namespace ak500d
