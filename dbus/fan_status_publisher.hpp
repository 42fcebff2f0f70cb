#pragma once

#include "../fan/fan_monitor.hpp"

#include <sdbusplus/asio/object_server.hpp>

#include <functional>
#include <memory>
#include <vector>

namespace platmon::dbus
{

// Mirrors FanMonitor state onto OperationalStatus.Functional objects and
// exposes an Object.Enable switch for pausing the poll loop.
class FanStatusPublisher
{
  public:
    using EnableHandler = std::function<void(bool)>;

    FanStatusPublisher(sdbusplus::asio::object_server& server, size_t numFans,
                       EnableHandler onEnable);

    // Hook into monitor transitions.
    void attach(fan::FanMonitor& monitor);

    void update(size_t fanIndex, fan::FanStatus status);

  private:
    std::vector<std::shared_ptr<sdbusplus::asio::dbus_interface>> fanIfaces;
    std::shared_ptr<sdbusplus::asio::dbus_interface> enableIface;
};

} // namespace platmon::dbus
