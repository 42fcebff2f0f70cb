#include "thermal_util.hpp"

#include "../core/logging.hpp"
#include "../core/numeric.hpp"
#include "../core/sysfs_io.hpp"

#include <stdexcept>

namespace platmon::thermal
{

static void replaceAll(std::string& s, const std::string& from,
                       const std::string& to)
{
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos)
    {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

std::string formatDevicePath(const std::string& tmpl, const ThermalNode& node)
{
    std::string out = tmpl;
    replaceAll(out, "{0}", node.bus);
    replaceAll(out, "{1}", node.addr);
    return out;
}

ThermalUtil::ThermalUtil(const ThermalCfg& cfg) :
    startIndex(cfg.startIndex), nodeMap(cfg.nodes)
{
    if (nodeMap.empty())
    {
        throw std::invalid_argument("ThermalUtil: no thermal nodes configured");
    }

    int expected = startIndex;
    for (const auto& [idx, node] : nodeMap)
    {
        if (idx != expected)
        {
            throw std::invalid_argument(
                "ThermalUtil: thermal indices must be contiguous from " +
                std::to_string(startIndex) + ", got " + std::to_string(idx));
        }
        if (node.bus.empty() || node.addr.empty())
        {
            throw std::invalid_argument(
                "ThermalUtil: thermal " + std::to_string(idx) +
                " needs both bus and address");
        }
        pathMap[idx] = formatDevicePath(cfg.pathTemplate, node);
        ++expected;
    }
}

bool ThermalUtil::inRange(int thermal) const
{
    return thermal >= startIndex && thermal < startIndex + numThermals();
}

std::optional<std::string> ThermalUtil::thermalToDevicePath(int thermal) const
{
    auto it = pathMap.find(thermal);
    if (it == pathMap.end())
        return std::nullopt;
    return it->second;
}

std::optional<long> ThermalUtil::thermalTempFor(int thermal) const
{
    if (!inRange(thermal))
    {
        log::debug(log::concat("GET. Parameter error. thermal_num, ", thermal));
        return std::nullopt;
    }

    const std::string& devicePath = pathMap.at(thermal);
    const auto matches = sysfs::expandPattern(devicePath);
    if (matches.empty())
    {
        log::error(log::concat("GET. no device matched. device_path:",
                               devicePath));
        return std::nullopt;
    }

    const auto content = sysfs::readFirstLine(matches.front());
    if (!content)
    {
        log::error(
            log::concat("GET. unable to read file: ", matches.front()));
        return std::nullopt;
    }

    if (content->empty())
    {
        log::debug(
            log::concat("GET. content is NULL. device_path:", devicePath));
        return std::nullopt;
    }

    auto value = sysfs::parseLong(*content);
    if (!value)
    {
        log::error(log::concat("GET. malformed content '", *content,
                               "'. device_path:", matches.front()));
        return std::nullopt;
    }

    return value;
}

std::optional<long> ThermalUtil::averageTemp() const
{
    long sum = 0;
    for (int x = startIndex; x < startIndex + numThermals(); ++x)
    {
        auto v = thermalTempFor(x);
        if (!v)
        {
            log::error(log::concat("thermal ", x,
                                   " unavailable, no average reading"));
            return std::nullopt;
        }
        sum += *v;
    }
    return numeric::roundedDivide(sum, numThermals());
}

} // namespace platmon::thermal
