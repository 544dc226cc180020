#include <coinchase/session/SessionReaper.hpp>

#include <coinchase/core/Logger.hpp>
#include <coinchase/core/ThreadContext.hpp>

#include <utility>

namespace coinchase::session
{

SessionReaper::~SessionReaper()
{
    stop();
}

void SessionReaper::start()
{
    std::scoped_lock lk(mu_);
    if (running_)
    {
        return;
    }
    stopping_ = false;
    th_ = std::thread([this] { threadMain_(); });
    running_ = true;
}

void SessionReaper::stop()
{
    {
        std::scoped_lock lk(mu_);
        if (!running_)
        {
            return;
        }
        stopping_ = true;
    }
    cv_.notify_all();
    if (th_.joinable())
    {
        th_.join();
    }

    std::scoped_lock lk(mu_);
    running_ = false;
}

void SessionReaper::submit(std::shared_ptr<SessionContext> ctx)
{
    if (!ctx)
    {
        return;
    }

    {
        std::scoped_lock lk(mu_);
        if (running_ && !stopping_)
        {
            q_.push_back(std::move(ctx));
            cv_.notify_one();
            return;
        }
    }

    ctx->join();
}

std::size_t SessionReaper::pending() const
{
    std::scoped_lock lk(mu_);
    return q_.size() + inFlight_;
}

void SessionReaper::threadMain_()
{
    core::ThreadContext::setThreadName("reaper");

    std::unique_lock lk(mu_);
    for (;;)
    {
        cv_.wait(lk, [this] { return stopping_ || !q_.empty(); });
        if (q_.empty())
        {
            break; // stopping_ 이고 남은 것 없음
        }

        std::shared_ptr<SessionContext> ctx = std::move(q_.front());
        q_.pop_front();
        ++inFlight_;
        lk.unlock();

        const auto gen = ctx->generation();
        ctx->join();
        ctx.reset();
        SLOG_DEBUG("SessionReaper", "Joined", "gen={}", gen);

        lk.lock();
        --inFlight_;
    }
}

} // namespace coinchase::session
