#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <cstdint>
#include <functional>

namespace platmon::core
{

// Runs a callback on the io_context right away and then once per interval
// until stop() is called. The callback may call stop() itself.
class PeriodicTask
{
  public:
    PeriodicTask(boost::asio::io_context& io,
                 std::chrono::milliseconds interval,
                 std::function<void()> tick);
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    void start();
    void stop();

    bool running() const
    {
        return active;
    }

    uint64_t ticks() const
    {
        return count;
    }

  private:
    void arm(uint64_t gen);
    void fire(uint64_t gen);

    boost::asio::io_context& io;
    boost::asio::steady_timer timer;
    std::chrono::milliseconds interval;
    std::function<void()> tick;
    bool active{false};
    uint64_t count{0};
    // Bumped by start(); handlers from an earlier run see a stale value.
    uint64_t generation{0};
};

} // namespace platmon::core
