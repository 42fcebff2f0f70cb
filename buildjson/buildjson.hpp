#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace platmon
{

struct BasicSettings
{
    int pollIntervalSec{3}; // seconds between fan polls
    bool dbus{false};       // publish fan status on D-Bus
};

// as5712-54x: /sys/devices/platform/as5712_54x_fan/fan<n>_fault
struct FanMonitorCfg
{
    std::string path;                    // directory holding fault nodes
    std::vector<std::string> faultNodes; // fan index 0.. -> node name
};

// as7816-64x: LM75-class sensors behind the I2C mux.
struct ThermalNode
{
    std::string bus;  // {0} in the template, e.g. "18"
    std::string addr; // {1} in the template, e.g. "4a"
};

struct ThermalCfg
{
    std::string pathTemplate;
    int startIndex{1};
    std::map<int, ThermalNode> nodes; // thermal index -> node
};

struct Config
{
    BasicSettings basic;
    FanMonitorCfg fan;
    ThermalCfg thermal;
};

FanMonitorCfg defaultFanMonitorCfg();
ThermalCfg defaultThermalCfg();
Config defaultConfig();

// Load from file (JSON). Keys that are absent keep their default value.
// Throws std::runtime_error on hard schema issues.
Config loadConfigFromJsonFile(const std::string& jsonPath);

} // namespace platmon
