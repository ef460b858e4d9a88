#include <csignal>

#include <QCommandLineParser>
#include <QCoreApplication>

#include "ak500d/config.hpp"
#include "ak500d/device/hid_device.hpp"
#include "ak500d/driver/display_driver.hpp"
#include "ak500d/logging.hpp"
#include "ak500d/sensors/sysfs_sensor_source.hpp"
#include "ak500d/services/signal_watcher.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("ak500d");
    QCoreApplication::setApplicationVersion(AK500D_VERSION);

    QCommandLineParser parser;
    parser.setApplicationDescription("Drives the DeepCool AK500-DIGITAL cooler display");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption config_option(QStringList{"c", "config"}, "Configuration file.", "path");
    QCommandLineOption verbose_option(QStringList{"v", "verbose"}, "Enable debug logging.");
    parser.addOption(config_option);
    parser.addOption(verbose_option);
    parser.process(app);

    ak500d::init_logging(parser.isSet(verbose_option));

    // An explicit path must exist; the default one is optional
    const bool explicit_config = parser.isSet(config_option);
    const QString config_path = explicit_config ? parser.value(config_option)
                                                : QString::fromLatin1(ak500d::DEFAULT_CONFIG_PATH);

    ak500d::DisplayConfig config;
    QString error;
    if (!ak500d::load_config(config_path, explicit_config, config, error)) {
        qCCritical(lcConfig).noquote() << error;
        return 1;
    }

    ak500d::HidLibrary hid;
    if (!hid.initialized()) {
        qCCritical(lcDevice).noquote() << "hidapi init failed:" << hid.error();
        return 1;
    }

    ak500d::SysfsSensorSource sensor(config.temperature_input, config.fan_input);
    ak500d::HidDeviceLocator locator;
    ak500d::HidSessionFactory factory(config.write_stall);
    ak500d::DisplayDriver driver(config, sensor, locator, factory);

    ak500d::SignalWatcher signals_in;
    if (!signals_in.watch({SIGTERM, SIGINT, SIGHUP}))
        return 1;

    QObject::connect(&signals_in, &ak500d::SignalWatcher::received, &driver, [&driver](int){
        driver.stop();
    });
    QObject::connect(&driver, &ak500d::DisplayDriver::finished, &app, &QCoreApplication::quit,
                     Qt::QueuedConnection);

    driver.start();
    return app.exec();
}
