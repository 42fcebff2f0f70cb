#include "buildjson/buildjson.hpp"
#include "core/logging.hpp"
#include "core/units.hpp"
#include "thermal/thermal_util.hpp"

#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

// Dump the thermal path map and current readings.
int main(int argc, char** argv)
{
    auto& logger = platmon::log::Logger::instance();
    logger.setLevel(platmon::log::Level::Info);
    logger.enableConsole(true);

    platmon::ThermalCfg cfg = platmon::defaultThermalCfg();
    if (argc > 1)
    {
        try
        {
            cfg = platmon::loadConfigFromJsonFile(argv[1]).thermal;
        }
        catch (const std::exception& e)
        {
            std::cerr << "[thermal-util] Config error: " << e.what() << "\n";
            return 1;
        }
    }

    std::optional<platmon::thermal::ThermalUtil> thermal;
    try
    {
        thermal.emplace(cfg);
    }
    catch (const std::invalid_argument& e)
    {
        std::cerr << "[thermal-util] " << e.what() << "\n";
        return 1;
    }

    std::cout << "get_size_node_map : " << thermal->sizeNodeMap() << "\n";
    std::cout << "get_size_path_map : " << thermal->sizePathMap() << "\n";

    const int first = thermal->idxThermalStart();
    for (int x = first; x < first + thermal->numThermals(); ++x)
    {
        auto temp = thermal->thermalTempFor(x);
        std::cout << x << " " << thermal->thermalToDevicePath(x).value_or("")
                  << " "
                  << (temp ? platmon::units::celsiusFromMilli(*temp) : "N/A")
                  << "\n";
    }

    auto avg = thermal->averageTemp();
    std::cout << "average : "
              << (avg ? platmon::units::celsiusFromMilli(*avg) : "N/A") << "\n";
    return avg ? 0 : 2;
}
