#include <coinchase/session/BroadcastClock.hpp>

#include <coinchase/core/Logger.hpp>
#include <coinchase/core/ThreadContext.hpp>

namespace coinchase::session
{

BroadcastClock::BroadcastClock(std::chrono::milliseconds interval) : interval_(interval) {}

BroadcastClock::~BroadcastClock()
{
    stop();
}

void BroadcastClock::start()
{
    if (th_.joinable())
    {
        return;
    }
    {
        std::scoped_lock lk(mu_);
        stopping_ = false;
    }
    th_ = std::thread([this] { threadMain_(); });
}

void BroadcastClock::stop()
{
    {
        std::scoped_lock lk(mu_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (th_.joinable())
    {
        th_.join();
    }
}

void BroadcastClock::tick()
{
    {
        std::scoped_lock lk(mu_);
        ++generation_;
    }
    cv_.notify_all();
}

std::uint64_t BroadcastClock::generation() const
{
    std::scoped_lock lk(mu_);
    return generation_;
}

std::optional<std::uint64_t> BroadcastClock::waitNextTick(std::uint64_t lastSeen,
                                                          std::chrono::milliseconds timeout) const
{
    std::unique_lock lk(mu_);
    if (!cv_.wait_for(lk, timeout, [&] { return generation_ > lastSeen; }))
    {
        return std::nullopt;
    }
    return generation_;
}

void BroadcastClock::threadMain_()
{
    core::ThreadContext::setThreadName("clock");
    SLOG_INFO("BroadcastClock", "Started", "interval_ms={}", interval_.count());

    auto next = std::chrono::steady_clock::now() + interval_;
    std::unique_lock lk(mu_);
    while (!stopping_)
    {
        if (cv_.wait_until(lk, next, [this] { return stopping_; }))
        {
            break;
        }
        ++generation_;
        lk.unlock();
        cv_.notify_all();
        lk.lock();

        next += interval_;
        const auto now = std::chrono::steady_clock::now();
        if (next < now)
        {
            next = now + interval_; // 밀린 tick 은 몰아서 보내지 않는다
        }
    }

    SLOG_INFO("BroadcastClock", "Stopped", "generation={}", generation_);
}

} // namespace coinchase::session
