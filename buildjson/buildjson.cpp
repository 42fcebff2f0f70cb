#include "buildjson.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <stdexcept>

namespace j = nlohmann;

namespace platmon
{

static int read_int(const j::json& obj, const char* key, int def = 0)
{
    auto it = obj.find(key);
    return (it == obj.end()) ? def : it->get<int>();
}

FanMonitorCfg defaultFanMonitorCfg()
{
    FanMonitorCfg cfg;
    cfg.path = "/sys/devices/platform/as5712_54x_fan/";
    cfg.faultNodes = {"fan1_fault", "fan2_fault", "fan3_fault", "fan4_fault",
                      "fan5_fault"};
    return cfg;
}

ThermalCfg defaultThermalCfg()
{
    ThermalCfg cfg;
    cfg.pathTemplate = "/sys/bus/i2c/devices/{0}-00{1}/hwmon/hwmon*/temp1_input";
    cfg.startIndex = 1;
    cfg.nodes = {
        {1, {"18", "48"}}, {2, {"18", "49"}}, {3, {"18", "4a"}},
        {4, {"18", "4b"}}, {5, {"17", "4d"}}, {6, {"17", "4e"}},
    };
    return cfg;
}

Config defaultConfig()
{
    Config out{};
    out.fan = defaultFanMonitorCfg();
    out.thermal = defaultThermalCfg();
    return out;
}

Config loadConfigFromJsonFile(const std::string& jsonPath)
{
    std::ifstream ifs(jsonPath);
    if (!ifs.good())
    {
        throw std::runtime_error("Cannot open config file: " + jsonPath);
    }

    j::json root = j::json::parse(ifs);
    if (!root.is_object())
    {
        throw std::runtime_error("Config root must be an object: " + jsonPath);
    }

    Config out = defaultConfig();

    // ===== basic settings =====
    if (root.contains("basic settings"))
    {
        const auto& arr = root["basic settings"];
        if (!arr.is_array() || arr.empty())
        {
            throw std::runtime_error("basic settings must be a non-empty array");
        }
        const auto& basic = arr.at(0);
        out.basic.pollIntervalSec =
            read_int(basic, "pollInterval", out.basic.pollIntervalSec);
        out.basic.dbus = basic.value("dbus", out.basic.dbus);

        if (out.basic.pollIntervalSec < 1)
        {
            throw std::runtime_error("pollInterval must be >= 1");
        }
    }

    // ===== fan =====
    if (root.contains("fan"))
    {
        const auto& f = root["fan"];
        if (!f.is_object())
        {
            throw std::runtime_error("fan must be an object");
        }
        out.fan.path = f.value("path", out.fan.path);
        if (f.contains("faultnodes"))
        {
            if (!f["faultnodes"].is_array() || f["faultnodes"].empty())
            {
                throw std::runtime_error(
                    "fan.faultnodes must be a non-empty array");
            }
            out.fan.faultNodes.clear();
            for (const auto& n : f["faultnodes"])
                out.fan.faultNodes.push_back(n.get<std::string>());
        }
    }

    // ===== thermal =====
    if (root.contains("thermal"))
    {
        const auto& t = root["thermal"];
        if (!t.is_object())
        {
            throw std::runtime_error("thermal must be an object");
        }
        out.thermal.pathTemplate =
            t.value("pathtemplate", out.thermal.pathTemplate);
        out.thermal.startIndex =
            read_int(t, "startindex", out.thermal.startIndex);

        if (t.contains("nodes"))
        {
            if (!t["nodes"].is_array() || t["nodes"].empty())
            {
                throw std::runtime_error(
                    "thermal.nodes must be a non-empty array");
            }
            out.thermal.nodes.clear();
            for (const auto& n : t["nodes"])
            {
                if (!n.contains("index") || !n.contains("bus") ||
                    !n.contains("addr"))
                {
                    throw std::runtime_error(
                        "thermal node requires index, bus and addr");
                }
                ThermalNode node{n["bus"].get<std::string>(),
                                 n["addr"].get<std::string>()};
                const int idx = n["index"].get<int>();
                if (!out.thermal.nodes.emplace(idx, node).second)
                {
                    throw std::runtime_error("duplicate thermal index " +
                                             std::to_string(idx));
                }
            }
        }
    }

    // ===== validation =====
    if (out.fan.faultNodes.empty() || out.thermal.pathTemplate.empty())
    {
        throw std::runtime_error(
            "Invalid config: require fault nodes and a thermal path template.");
    }

    return out;
}

} // namespace platmon
