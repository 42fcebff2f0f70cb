#pragma once

#include "../buildjson/buildjson.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace platmon::fan
{

enum class FanStatus
{
    Uninitialized, // never read; first reading always logs
    Normal,
    Fault,
};

// Last known status per fan index (0-based).
struct FanState
{
    std::vector<FanStatus> status;
};

// Polls the per-fan fault flags and logs transitions.
class FanMonitor
{
  public:
    using TransitionCallback = std::function<void(size_t, FanStatus)>;

    explicit FanMonitor(const FanMonitorCfg& cfg);

    // One polling tick over all fans. A fan whose node cannot be read keeps
    // its previous status and does not stop the other fans from being
    // polled. Returns false if any node could not be read.
    bool manageFans();

    size_t numFans() const
    {
        return nodePaths.size();
    }

    const FanState& state() const
    {
        return fanState;
    }

    FanStatus status(size_t fanIndex) const;

    const std::string& faultPath(size_t fanIndex) const;

    // Called after each logged transition.
    void onTransition(TransitionCallback cb);

  private:
    void setStatus(size_t idx, FanStatus next);

    std::vector<std::string> nodePaths;
    FanState fanState;
    std::vector<TransitionCallback> observers;
};

} // namespace platmon::fan
