#include "buildjson/buildjson.hpp"
#include "core/logging.hpp"
#include "core/periodic_task.hpp"
#include "dbus/constants.hpp"
#include "dbus/fan_status_publisher.hpp"
#include "fan/fan_monitor.hpp"
#include "fan/options.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <sdbusplus/asio/connection.hpp>
#include <sdbusplus/asio/object_server.hpp>

#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

static constexpr const char* kConfigPath =
    "/usr/share/accton-platform-monitor/platform.json";

// Platform config is optional; absent file means compiled-in tables.
static std::optional<platmon::Config> loadConfig(const std::string& path)
{
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
    {
        platmon::log::info(platmon::log::concat(
            "no ", path, ", using built-in platform tables"));
        return platmon::defaultConfig();
    }

    try
    {
        return platmon::loadConfigFromJsonFile(path);
    }
    catch (const std::exception& e)
    {
        platmon::log::error(
            platmon::log::concat("Config error: ", e.what()));
        return std::nullopt;
    }
}

static std::string programName(const char* argv0)
{
    return std::filesystem::path(argv0).filename().string();
}

int main(int argc, char** argv)
{
    const auto opts = platmon::fan::parseOptions(argc, argv);
    if (opts.showUsage)
    {
        std::cout << platmon::fan::usage(argv[0]) << "\n";
        return 0;
    }

    // Log sink setup is the one thing we cannot run without.
    auto& logger = platmon::log::Logger::instance();
    logger.setLevel(opts.level);
    try
    {
        logger.openFile(opts.logFile);
    }
    catch (const std::exception& e)
    {
        std::cerr << "[fan-monitor] " << e.what() << "\n";
        return 1;
    }
    logger.enableConsole(opts.level == platmon::log::Level::Debug);
    logger.enableSyslog(programName(argv[0]), platmon::log::Level::Info);

    platmon::log::debug(platmon::log::concat(
        "SET. logfile:", opts.logFile,
        " / loglevel:", platmon::log::levelName(opts.level)));

    auto cfg = loadConfig(kConfigPath);
    if (!cfg)
        return 1;

    std::optional<platmon::fan::FanMonitor> monitor;
    try
    {
        monitor.emplace(cfg->fan);
    }
    catch (const std::exception& e)
    {
        platmon::log::error(
            platmon::log::concat("Fan monitor setup failed: ", e.what()));
        return 1;
    }

    boost::asio::io_context io;
    bool enabled = true;

    platmon::core::PeriodicTask poller(
        io, std::chrono::seconds(cfg->basic.pollIntervalSec), [&]() {
            if (enabled)
                monitor->manageFans();
        });

    boost::asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int sig) {
        if (ec)
            return;
        platmon::log::info(
            platmon::log::concat("Shutting down on signal ", sig));
        poller.stop();
        io.stop();
    });

    std::shared_ptr<sdbusplus::asio::connection> conn;
    std::unique_ptr<sdbusplus::asio::object_server> server;
    std::unique_ptr<platmon::dbus::FanStatusPublisher> publisher;
    if (cfg->basic.dbus)
    {
        try
        {
            conn = std::make_shared<sdbusplus::asio::connection>(io);
            conn->request_name(platmon::dbusconst::kService);
            server = std::make_unique<sdbusplus::asio::object_server>(conn);
            publisher = std::make_unique<platmon::dbus::FanStatusPublisher>(
                *server, monitor->numFans(),
                [&enabled](bool on) { enabled = on; });
            publisher->attach(*monitor);
        }
        catch (const std::exception& e)
        {
            platmon::log::error(
                platmon::log::concat("D-Bus setup failed: ", e.what()));
            return 1;
        }
    }

    platmon::log::info(platmon::log::concat(
        "monitoring ", monitor->numFans(), " fans every ",
        cfg->basic.pollIntervalSec, "s"));

    poller.start();
    io.run();
    return 0;
}
