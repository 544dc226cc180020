#include <coinchase/monitoring/LivenessMonitor.hpp>

#include <coinchase/core/Logger.hpp>
#include <coinchase/core/ThreadContext.hpp>
#include <coinchase/monitoring/Metrics.hpp>
#include <coinchase/pool/WorkerPool.hpp>

#include <fmt/format.h>

#include <chrono>
#include <exception>
#include <optional>
#include <stdexcept>
#include <vector>

namespace coinchase::monitoring
{

namespace
{
struct ProbeTarget
{
    int id{-1};
    session::SessionSlot *slot{nullptr};
    bool terminated{false};
    std::optional<session::ProbeTicket> ticket;
};
} // namespace

LivenessMonitor::LivenessMonitor(pool::WorkerPool &pool, LivenessOptions options)
    : pool_(pool), options_(options)
{
}

LivenessMonitor::~LivenessMonitor()
{
    stop();
}

void LivenessMonitor::verifyInitialCapacity() const
{
    const std::size_t available = pool_.availableCount();
    const std::size_t active = pool_.activeCount();
    if (available != pool_.capacity() || active != 0)
    {
        throw std::logic_error(
            fmt::format("[LivenessMonitor] pool must start with {} available slots (available={} "
                        "active={})",
                        pool_.capacity(), available, active));
    }

    for (const int id : pool_.availableIds())
    {
        const session::SessionSlot *slot = pool_.slotAt(id);
        if (slot == nullptr || slot->status() != session::WorkerStatus::Available ||
            !slot->sessionAlive())
        {
            throw std::logic_error(
                fmt::format("[LivenessMonitor] slot {} is not armed and AVAILABLE", id));
        }
    }
}

void LivenessMonitor::start()
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

void LivenessMonitor::stop()
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

LivenessMonitor::RunReport LivenessMonitor::runOnce()
{
    RunReport report;

    // 1) 모든 in-use 슬롯에 먼저 ping
    std::vector<ProbeTarget> targets;
    for (const int id : pool_.inUseIds())
    {
        ProbeTarget t;
        t.id = id;
        t.slot = pool_.slotAt(id);
        if (t.slot == nullptr)
        {
            continue;
        }
        t.terminated = t.slot->status() == session::WorkerStatus::Terminated;
        if (!t.terminated)
        {
            t.ticket = t.slot->beginProbe();
        }
        targets.push_back(std::move(t));
    }
    report.probed = targets.size();

    // 2) 공통 deadline 으로 echo 대기
    const auto deadline =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(options_.probeTimeoutMs);
    for (auto &t : targets)
    {
        const bool responsive =
            !t.terminated && t.ticket && session::SessionSlot::awaitProbe(*t.ticket, deadline);
        t.ticket.reset();
        if (responsive)
        {
            continue;
        }

        SLOG_WARN("LivenessMonitor", "Reclaim", "slot={} user={} status={}", t.id,
                  t.slot->ownerUserId(), session::toString(t.slot->status()));
        t.slot->forceExit();
        pool_.put(t.id, t.slot);
        serverMetrics().onSlotRevived();
        ++report.reclaimed;
    }

    // 3) 세션이 죽은 idle 슬롯 재무장
    for (const int id : pool_.availableIds())
    {
        session::SessionSlot *slot = pool_.slotAt(id);
        if (slot == nullptr || slot->sessionAlive())
        {
            continue;
        }
        if (pool_.reviveIdle(id))
        {
            serverMetrics().onSlotRevived();
            ++report.revivedIdle;
        }
    }

    if (report.reclaimed > 0 || report.revivedIdle > 0)
    {
        SLOG_INFO("LivenessMonitor", "RunDone", "probed={} reclaimed={} revived_idle={}",
                  report.probed, report.reclaimed, report.revivedIdle);
    }
    return report;
}

void LivenessMonitor::threadMain_()
{
    core::ThreadContext::setThreadName("monitor");
    SLOG_INFO("LivenessMonitor", "Started", "interval_ms={} probe_timeout_ms={}",
              options_.intervalMs, options_.probeTimeoutMs);

    const auto interval = std::chrono::milliseconds(options_.intervalMs);
    std::unique_lock lk(mu_);
    while (!cv_.wait_for(lk, interval, [this] { return stopping_; }))
    {
        lk.unlock();
        try
        {
            (void)runOnce();
        }
        catch (const std::exception &e)
        {
            SLOG_ERROR("LivenessMonitor", "RunFailed", "what='{}'", e.what());
        }
        lk.lock();
    }

    SLOG_INFO("LivenessMonitor", "Stopped");
}

} // namespace coinchase::monitoring
