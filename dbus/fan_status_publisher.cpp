#include "fan_status_publisher.hpp"

#include "../core/logging.hpp"
#include "constants.hpp"

#include <sdbusplus/exception.hpp>

#include <string>

namespace platmon::dbus
{

FanStatusPublisher::FanStatusPublisher(sdbusplus::asio::object_server& server,
                                       size_t numFans,
                                       EnableHandler onEnable)
{
    fanIfaces.reserve(numFans);
    for (size_t i = 0; i < numFans; ++i)
    {
        const std::string path =
            dbusconst::kFanInventoryPrefix + std::to_string(i + 1);
        auto iface =
            server.add_interface(path, dbusconst::kOperationalStatusIface);
        iface->register_property(dbusconst::kFunctionalProp, true);
        iface->initialize();
        fanIfaces.push_back(std::move(iface));
    }

    // sdbusplus stores the value; the setter only forwards the request.
    enableIface = server.add_interface(dbusconst::kEnablePath,
                                       dbusconst::kEnableIface);
    enableIface->register_property(
        "Enabled", true,
        [onEnable](const bool& req, bool& current) {
            current = req;
            log::info(log::concat("fan monitoring ",
                                  (req ? "enabled" : "disabled"),
                                  " via D-Bus"));
            if (onEnable)
                onEnable(req);
            return true;
        });
    enableIface->initialize();
}

void FanStatusPublisher::attach(fan::FanMonitor& monitor)
{
    monitor.onTransition(
        [this](size_t idx, fan::FanStatus status) { update(idx, status); });
}

void FanStatusPublisher::update(size_t fanIndex, fan::FanStatus status)
{
    if (fanIndex >= fanIfaces.size() ||
        status == fan::FanStatus::Uninitialized)
        return;

    const bool functional = (status == fan::FanStatus::Normal);
    try
    {
        fanIfaces[fanIndex]->set_property(dbusconst::kFunctionalProp,
                                          functional);
    }
    catch (const sdbusplus::exception_t& e)
    {
        log::error(log::concat("set ", dbusconst::kFunctionalProp,
                               " for FAN-", fanIndex + 1,
                               " failed: ", e.what()));
    }
}

} // namespace platmon::dbus
