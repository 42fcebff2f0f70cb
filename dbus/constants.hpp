#pragma once

namespace platmon::dbusconst
{

inline constexpr const char* kService =
    "xyz.openbmc_project.AcctonPlatformMonitor";

// Pause/resume switch for fan polling.
inline constexpr const char* kEnablePath =
    "/xyz/openbmc_project/AcctonPlatformMonitor";
inline constexpr const char* kEnableIface =
    "xyz.openbmc_project.Object.Enable"; // property: Enabled (bool)

// Per-fan health, FAN-<n> -> .../fan<n>
inline constexpr const char* kFanInventoryPrefix =
    "/xyz/openbmc_project/inventory/system/chassis/motherboard/fan";
inline constexpr const char* kOperationalStatusIface =
    "xyz.openbmc_project.State.Decorator.OperationalStatus";
inline constexpr const char* kFunctionalProp = "Functional";

} // namespace platmon::dbusconst
