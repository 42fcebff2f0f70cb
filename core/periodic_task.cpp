#include "periodic_task.hpp"

#include <boost/asio/post.hpp>

#include <utility>

namespace platmon::core
{

PeriodicTask::PeriodicTask(boost::asio::io_context& io,
                           std::chrono::milliseconds interval,
                           std::function<void()> tick) :
    io(io), timer(io), interval(interval), tick(std::move(tick))
{}

PeriodicTask::~PeriodicTask()
{
    stop();
}

void PeriodicTask::start()
{
    if (active)
        return;
    active = true;
    const uint64_t gen = ++generation;
    boost::asio::post(io, [this, gen] { fire(gen); });
}

void PeriodicTask::stop()
{
    active = false;
    timer.cancel();
}

void PeriodicTask::fire(uint64_t gen)
{
    if (!active || gen != generation)
        return;

    ++count;
    tick();

    // tick() may have stopped us, or stopped and restarted a new chain.
    if (active && gen == generation)
        arm(gen);
}

void PeriodicTask::arm(uint64_t gen)
{
    timer.expires_after(interval);
    timer.async_wait([this, gen](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted)
            return;
        fire(gen);
    });
}

} // namespace platmon::core
