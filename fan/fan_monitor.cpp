#include "fan_monitor.hpp"

#include "../core/logging.hpp"
#include "../core/sysfs_io.hpp"

#include <stdexcept>
#include <utility>

namespace platmon::fan
{

FanMonitor::FanMonitor(const FanMonitorCfg& cfg)
{
    if (cfg.faultNodes.empty())
    {
        throw std::invalid_argument("FanMonitor: no fault nodes configured");
    }

    std::string base = cfg.path;
    if (!base.empty() && base.back() != '/')
        base += '/';

    nodePaths.reserve(cfg.faultNodes.size());
    for (const auto& node : cfg.faultNodes)
        nodePaths.push_back(base + node);

    fanState.status.assign(nodePaths.size(), FanStatus::Uninitialized);
}

FanStatus FanMonitor::status(size_t fanIndex) const
{
    return fanState.status.at(fanIndex);
}

const std::string& FanMonitor::faultPath(size_t fanIndex) const
{
    return nodePaths.at(fanIndex);
}

void FanMonitor::onTransition(TransitionCallback cb)
{
    observers.push_back(std::move(cb));
}

bool FanMonitor::manageFans()
{
    bool ok = true;

    for (size_t idx = 0; idx < nodePaths.size(); ++idx)
    {
        const auto content = sysfs::readFirstLine(nodePaths[idx]);
        if (!content)
        {
            log::error(log::concat("unable to read file: ", nodePaths[idx]));
            ok = false;
            continue;
        }

        // content is a string, either "0" or "1"
        if (*content == "1")
        {
            if (fanState.status[idx] != FanStatus::Fault)
            {
                log::warning(log::concat("Alarm for FAN-", idx + 1,
                                         " fault is detected"));
                setStatus(idx, FanStatus::Fault);
            }
        }
        else
        {
            if (fanState.status[idx] != FanStatus::Normal)
            {
                log::info(log::concat("FAN-", idx + 1, " normal is detected"));
                setStatus(idx, FanStatus::Normal);
            }
        }
    }

    return ok;
}

void FanMonitor::setStatus(size_t idx, FanStatus next)
{
    fanState.status[idx] = next;
    for (const auto& cb : observers)
        cb(idx, next);
}

} // namespace platmon::fan
