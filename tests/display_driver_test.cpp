#include <vector>

#include <gtest/gtest.h>

#include "ak500d/device/report_encoder.hpp"
#include "ak500d/driver/display_driver.hpp"
#include "fakes.hpp"

using namespace ak500d;
using namespace ak500d::testing;
using namespace std::chrono_literals;

using State = DisplayDriver::State;

namespace {

class DisplayDriverTest : public ::testing::Test
{
protected:
    DisplayDriverTest()
        : locator(log)
        , factory(log)
    {
        config.update_interval = 1000ms;
        config.backoff_initial = 1000ms;
        config.backoff_max = 30000ms;
    }

    std::unique_ptr<DisplayDriver> make_driver()
    {
        auto driver = std::make_unique<DisplayDriver>(config, sensor, locator, factory);
        QObject::connect(driver.get(), &DisplayDriver::state_changed, [this](State state) {
            states.push_back(state);
        });
        QObject::connect(driver.get(), &DisplayDriver::finished, [this] { ++finished; });
        return driver;
    }

    // Steps until `wanted` is reached; returns the number of steps taken or
    // -1 when it did not happen within `limit`.
    int step_until(DisplayDriver &driver, State wanted, int limit = 100)
    {
        for (int i = 1; i <= limit; ++i) {
            last_delay = driver.step();
            if (driver.state() == wanted)
                return i;
        }
        return -1;
    }

    DisplayConfig config;
    DeviceLog log;
    FakeSensor sensor;
    FakeLocator locator;
    FakeSessionFactory factory;

    std::vector<State> states;
    int finished = 0;
    std::chrono::milliseconds last_delay{-1};
};

} // namespace

TEST_F(DisplayDriverTest, StartsDisconnectedAndConnectsImmediately)
{
    auto driver = make_driver();
    EXPECT_EQ(driver->state(), State::Disconnected);

    EXPECT_EQ(driver->step(), 0ms);
    EXPECT_EQ(driver->state(), State::Connecting);

    EXPECT_EQ(driver->step(), 0ms);
    EXPECT_EQ(driver->state(), State::Connected);
    EXPECT_TRUE(driver->has_session());
    EXPECT_EQ(log.live_sessions, 1);
}

TEST_F(DisplayDriverTest, WritesLoadingReportOnConnect)
{
    auto driver = make_driver();
    ASSERT_GT(step_until(*driver, State::Connected), 0);

    ASSERT_EQ(log.writes.size(), 1u);
    EXPECT_EQ(log.writes.front(), encode_loading());
}

TEST_F(DisplayDriverTest, TicksWriteEncodedSample)
{
    sensor.temperature = 45.0f;
    auto driver = make_driver();
    ASSERT_GT(step_until(*driver, State::Connected), 0);

    EXPECT_EQ(driver->step(), config.update_interval);
    EXPECT_EQ(driver->step(), config.update_interval);

    ASSERT_EQ(log.writes.size(), 3u);
    const Report &report = log.writes.back();
    EXPECT_EQ(report, encode(SensorSample{45.0f, std::nullopt, std::nullopt, {}}, config));
    EXPECT_EQ(report[ReportLayout::TENS], 4);
    EXPECT_EQ(report[ReportLayout::UNITS], 5);
    EXPECT_EQ(driver->state(), State::Connected);
}

TEST_F(DisplayDriverTest, StaysAliveWhenDeviceNeverAppears)
{
    locator.present_from_call = 0;
    auto driver = make_driver();

    std::vector<std::chrono::milliseconds> waits;
    for (int i = 0; i < 200; ++i) {
        const auto delay = driver->step();
        ASSERT_TRUE(driver->state() == State::Disconnected || driver->state() == State::Connecting);
        if (driver->state() == State::Disconnected)
            waits.push_back(delay);
    }

    ASSERT_EQ(waits.size(), 100u);
    EXPECT_EQ(waits[0], 1000ms);
    EXPECT_EQ(waits[1], 2000ms);
    EXPECT_EQ(waits[2], 4000ms);
    for (std::size_t i = 1; i < waits.size(); ++i) {
        EXPECT_GE(waits[i], waits[i - 1]);
        EXPECT_LE(waits[i], config.backoff_max);
    }
    EXPECT_EQ(waits.back(), config.backoff_max);
    EXPECT_EQ(log.open_calls, 0);
    EXPECT_EQ(log.live_sessions, 0);
}

TEST_F(DisplayDriverTest, StaysAliveWhenEveryOpenFails)
{
    factory.fail_forever = true;
    factory.forever_error = OpenError::PermissionDenied;
    auto driver = make_driver();

    std::chrono::milliseconds previous{0};
    for (int i = 0; i < 100; ++i) {
        const auto delay = driver->step();
        ASSERT_NE(driver->state(), State::Connected);
        ASSERT_NE(driver->state(), State::ShuttingDown);
        if (driver->state() == State::Disconnected) {
            EXPECT_GE(delay, previous);
            EXPECT_LE(delay, config.backoff_max);
            previous = delay;
        }
    }
    EXPECT_EQ(log.open_calls, 50);
    EXPECT_FALSE(driver->has_session());
}

TEST_F(DisplayDriverTest, RecoversOnNthAttempt)
{
    locator.present_from_call = 4;
    auto driver = make_driver();

    // Three misses, each Disconnected -> Connecting -> Disconnected
    EXPECT_EQ(step_until(*driver, State::Connected), 8);
    EXPECT_EQ(last_delay, 0ms);
    EXPECT_EQ(log.find_calls, 4);

    // First data write on the very next step
    driver->step();
    EXPECT_EQ(log.writes.size(), 2u);
    EXPECT_EQ(sensor.calls, 1);
}

TEST_F(DisplayDriverTest, RecoversAfterOpenErrors)
{
    factory.failures = {OpenError::PermissionDenied, OpenError::Busy, OpenError::NotFound};
    auto driver = make_driver();

    EXPECT_GT(step_until(*driver, State::Connected), 0);
    EXPECT_EQ(log.open_calls, 4);
    EXPECT_EQ(log.live_sessions, 1);
}

TEST_F(DisplayDriverTest, DisconnectClosesSessionOnce)
{
    auto driver = make_driver();
    ASSERT_GT(step_until(*driver, State::Connected), 0);
    driver->step();

    log.write_results = {WriteError::Disconnected};
    driver->step();

    EXPECT_EQ(driver->state(), State::Disconnected);
    EXPECT_FALSE(driver->has_session());
    EXPECT_EQ(log.close_calls, 1);
    EXPECT_EQ(log.live_sessions, 0);
}

TEST_F(DisplayDriverTest, TimeoutTearsDownAndReconnects)
{
    auto driver = make_driver();
    ASSERT_GT(step_until(*driver, State::Connected), 0);

    log.write_results = {WriteError::Timeout};
    driver->step();
    EXPECT_EQ(driver->state(), State::Disconnected);
    EXPECT_EQ(log.close_calls, 1);

    EXPECT_GT(step_until(*driver, State::Connected), 0);
    EXPECT_EQ(log.open_calls, 2);
    EXPECT_EQ(log.live_sessions, 1);
}

TEST_F(DisplayDriverTest, DeadSessionIsDroppedBeforeSampling)
{
    auto driver = make_driver();
    ASSERT_GT(step_until(*driver, State::Connected), 0);

    factory.last->unplug();
    driver->step();

    EXPECT_EQ(driver->state(), State::Disconnected);
    EXPECT_EQ(sensor.calls, 0);
    EXPECT_EQ(log.close_calls, 1);
}

TEST_F(DisplayDriverTest, BackoffResetsAfterSuccessfulWrite)
{
    locator.present_from_call = 3;
    auto driver = make_driver();
    ASSERT_GT(step_until(*driver, State::Connected), 0);
    driver->step();

    log.write_results = {WriteError::Disconnected};
    EXPECT_EQ(driver->step(), config.backoff_initial);
}

TEST_F(DisplayDriverTest, SensorFailureKeepsSession)
{
    sensor.script = {std::nullopt, std::nullopt, 50.0f};
    auto driver = make_driver();
    ASSERT_GT(step_until(*driver, State::Connected), 0);

    EXPECT_EQ(driver->step(), config.update_interval);
    EXPECT_EQ(driver->step(), config.update_interval);
    EXPECT_EQ(driver->state(), State::Connected);
    EXPECT_EQ(log.writes.size(), 1u);
    EXPECT_EQ(log.close_calls, 0);

    driver->step();
    EXPECT_EQ(log.writes.size(), 2u);
    EXPECT_EQ(log.writes.back()[ReportLayout::TENS], 5);
}

TEST_F(DisplayDriverTest, StopWhileConnectedClosesSession)
{
    auto driver = make_driver();
    ASSERT_GT(step_until(*driver, State::Connected), 0);
    driver->step();

    driver->stop();

    EXPECT_EQ(driver->state(), State::ShuttingDown);
    EXPECT_FALSE(driver->has_session());
    EXPECT_EQ(log.close_calls, 1);
    EXPECT_EQ(log.live_sessions, 0);
    EXPECT_EQ(finished, 1);

    // Terminal
    const auto writes = log.writes.size();
    driver->step();
    driver->stop();
    EXPECT_EQ(driver->state(), State::ShuttingDown);
    EXPECT_EQ(log.writes.size(), writes);
    EXPECT_EQ(finished, 1);
}

TEST_F(DisplayDriverTest, StopWhileDisconnected)
{
    locator.present_from_call = 0;
    auto driver = make_driver();
    driver->step();
    driver->step();

    driver->stop();
    EXPECT_EQ(driver->state(), State::ShuttingDown);
    EXPECT_EQ(log.close_calls, 0);
    EXPECT_EQ(finished, 1);
}

TEST_F(DisplayDriverTest, LoadingReportOnExit)
{
    config.loading_on_exit = true;
    auto driver = make_driver();
    ASSERT_GT(step_until(*driver, State::Connected), 0);
    driver->step();

    driver->stop();
    ASSERT_EQ(log.writes.size(), 3u);
    EXPECT_EQ(log.writes.back(), encode_loading());
    EXPECT_EQ(log.close_calls, 1);
}

TEST_F(DisplayDriverTest, ReportsEveryTransition)
{
    locator.present_from_call = 2;
    auto driver = make_driver();
    ASSERT_GT(step_until(*driver, State::Connected), 0);
    driver->stop();

    const std::vector<State> expected = {
        State::Connecting, State::Disconnected, State::Connecting, State::Connected, State::ShuttingDown,
    };
    EXPECT_EQ(states, expected);
}
