#pragma once

#include "../buildjson/buildjson.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>

namespace platmon::thermal
{

// Platform thermal sensors exposed as hwmon temp*_input nodes.
// Values are millidegree C as reported by the kernel.
class ThermalUtil
{
  public:
    // Builds index -> device path from cfg.pathTemplate ({0} = bus,
    // {1} = address). Throws std::invalid_argument if the node table is
    // empty or the indices are not contiguous from cfg.startIndex.
    explicit ThermalUtil(const ThermalCfg& cfg = defaultThermalCfg());

    int numThermals() const
    {
        return static_cast<int>(nodeMap.size());
    }

    int idxThermalStart() const
    {
        return startIndex;
    }

    size_t sizeNodeMap() const
    {
        return nodeMap.size();
    }

    size_t sizePathMap() const
    {
        return pathMap.size();
    }

    // Unresolved path (still containing the hwmon wildcard).
    std::optional<std::string> thermalToDevicePath(int thermal) const;

    // Read one sensor. nullopt on bad index, no match, unreadable,
    // empty or malformed content.
    std::optional<long> thermalTempFor(int thermal) const;

    // Mean of all sensors, rounded to nearest millidegree (ties away from
    // zero). nullopt if any sensor cannot be read.
    std::optional<long> averageTemp() const;

  private:
    bool inRange(int thermal) const;

    int startIndex;
    std::map<int, ThermalNode> nodeMap;
    std::map<int, std::string> pathMap;
};

// Substitute {0} and {1} in tmpl.
std::string formatDevicePath(const std::string& tmpl, const ThermalNode& node);

} // namespace platmon::thermal
