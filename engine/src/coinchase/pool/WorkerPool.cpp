#include <coinchase/pool/WorkerPool.hpp>

#include <coinchase/core/Error.hpp>
#include <coinchase/core/Logger.hpp>
#include <coinchase/monitoring/Metrics.hpp>
#include <coinchase/net/Acceptor.hpp>

#include <fmt/format.h>

#include <stdexcept>
#include <utility>

namespace coinchase::pool
{

WorkerPool::WorkerPool(std::uint32_t capacity, std::string slotAddress, std::uint16_t basePort,
                       session::SessionEnvironment env)
    : capacity_(capacity), slotAddress_(std::move(slotAddress)), basePort_(basePort),
      env_(std::move(env))
{
}

WorkerPool::~WorkerPool()
{
    stop();
}

void WorkerPool::start()
{
    if (!slots_.empty())
    {
        throw std::logic_error("[WorkerPool] start() called twice");
    }
    if (capacity_ == 0)
    {
        throw std::invalid_argument("[WorkerPool] capacity must be > 0");
    }

    slots_.reserve(capacity_);
    for (std::uint32_t i = 0; i < capacity_; ++i)
    {
        const auto port =
            basePort_ == 0 ? std::uint16_t{0} : static_cast<std::uint16_t>(basePort_ + i);
        auto listener = std::make_unique<net::Acceptor>(slotAddress_, port);
        slots_.push_back(std::make_unique<session::SessionSlot>(static_cast<int>(i),
                                                                std::move(listener), env_, *this));
    }

    reaper_.start();

    std::scoped_lock lk(mu_);
    for (auto &slot : slots_)
    {
        std::scoped_lock slk(slot->mutex());
        if (!slot->armLocked())
        {
            throw std::runtime_error(fmt::format("[WorkerPool] failed to arm slot {}", slot->id()));
        }
        available_.insert(slot->id());
    }

    SLOG_INFO("WorkerPool", "Started", "capacity={} address={} base_port={}", capacity_,
              slotAddress_, basePort_);
}

void WorkerPool::stop()
{
    {
        std::scoped_lock lk(mu_);
        if (stopped_)
        {
            return;
        }
        stopped_ = true;
    }

    for (auto &slot : slots_)
    {
        slot->shutdown();
    }
    // 회수 대기 중인 이전 세션은 슬롯을 참조하므로 슬롯보다 먼저 끝나야 한다
    reaper_.stop();
    if (!slots_.empty())
    {
        SLOG_INFO("WorkerPool", "Stopped", "capacity={}", capacity_);
    }
}

std::error_code WorkerPool::pull(SlotLease &out)
{
    std::scoped_lock lk(mu_);
    if (!stopped_)
    {
        for (auto it = available_.begin(); it != available_.end(); ++it)
        {
            session::SessionSlot *slot = slots_[static_cast<std::size_t>(*it)].get();
            // 세션이 죽은 idle 슬롯은 monitor 가 되살릴 때까지 건너뛴다
            if (!slot->sessionAlive())
            {
                continue;
            }

            {
                std::scoped_lock slk(slot->mutex());
                slot->markPulledOutLocked();
            }

            const int id = *it;
            available_.erase(it);
            inUse_.insert(id);
            monitoring::serverMetrics().onSessionAcquired();

            out = SlotLease{id, slot};
            SLOG_DEBUG("WorkerPool", "Pulled", "slot={} port={} available={}", id, slot->port(),
                       available_.size());
            return {};
        }
    }

    monitoring::serverMetrics().onCapacityRejection();
    SLOG_DEBUG("WorkerPool", "CapacityRejected", "available={} in_use={}", available_.size(),
               inUse_.size());
    return core::Errc::Capacity;
}

void WorkerPool::put(int id, session::SessionSlot *slot)
{
    (void)release_(id, slot, nullptr);
}

bool WorkerPool::putIfOwner(int id, session::SessionSlot *slot, const std::string &expectedOwner)
{
    return release_(id, slot, &expectedOwner);
}

bool WorkerPool::release_(int id, session::SessionSlot *slot, const std::string *expectedOwner)
{
    if (slot == nullptr || slotAt(id) != slot)
    {
        SLOG_WARN("WorkerPool", "PutMismatch", "slot={}", id);
        return false;
    }

    std::shared_ptr<session::SessionContext> ctx;
    {
        std::scoped_lock lk(mu_);
        if (inUse_.count(id) == 0 || reclaiming_.count(id) != 0)
        {
            return false;
        }
        if (expectedOwner != nullptr)
        {
            std::scoped_lock slk(slot->mutex());
            if (slot->ownerUserIdLocked() != *expectedOwner)
            {
                SLOG_INFO("WorkerPool", "PutOwnerChanged", "slot={} expected={} owner={}", id,
                          *expectedOwner, slot->ownerUserIdLocked());
                return false;
            }
        }
        ctx = beginReclaimLocked_(id);
    }

    reaper_.submit(std::move(ctx));
    finishReclaim_(id, true);
    return true;
}

bool WorkerPool::reviveIdle(int id)
{
    std::shared_ptr<session::SessionContext> ctx;
    {
        std::scoped_lock lk(mu_);
        if (stopped_ || available_.count(id) == 0)
        {
            return false;
        }
        available_.erase(id);
        inUse_.insert(id);
        ctx = beginReclaimLocked_(id);
    }

    SLOG_WARN("WorkerPool", "ReviveIdle", "slot={}", id);
    reaper_.submit(std::move(ctx));
    finishReclaim_(id, false);
    return true;
}

std::shared_ptr<session::SessionContext> WorkerPool::beginReclaimLocked_(int id)
{
    reclaiming_.insert(id);
    session::SessionSlot &slot = *slots_[static_cast<std::size_t>(id)];
    std::scoped_lock slk(slot.mutex());
    return slot.detachSessionLocked(session::TerminationReason::Reclaim);
}

void WorkerPool::finishReclaim_(int id, bool countRelease)
{
    session::SessionSlot &slot = *slots_[static_cast<std::size_t>(id)];

    std::scoped_lock lk(mu_);
    std::string owner;
    bool armed = false;
    {
        std::scoped_lock slk(slot.mutex());
        owner = slot.resetToAvailableLocked();
        if (!stopped_)
        {
            armed = slot.armLocked();
        }
    }

    reclaiming_.erase(id);
    inUse_.erase(id);
    available_.insert(id);
    if (countRelease)
    {
        monitoring::serverMetrics().onSessionReleased();
    }

    if (!armed && !stopped_)
    {
        // 슬롯은 AVAILABLE 로 돌아가지만 pull 대상에서 빠지고, monitor 가 다시 재무장을 시도한다
        SLOG_ERROR("WorkerPool", "RearmFailed", "slot={} user={}", id, owner);
    }
    SLOG_INFO("WorkerPool", "Released", "slot={} user={} armed={} available={}", id, owner, armed,
              available_.size());
}

std::error_code WorkerPool::getByUserId(const std::string &userId, SlotLease &out) const
{
    std::scoped_lock lk(ownersMu_);
    const auto it = owners_.find(userId);
    if (it == owners_.end())
    {
        return core::Errc::NotFound;
    }
    out = SlotLease{it->second, slots_[static_cast<std::size_t>(it->second)].get()};
    return {};
}

std::size_t WorkerPool::availableCount() const
{
    std::scoped_lock lk(mu_);
    return available_.size();
}

std::size_t WorkerPool::activeCount() const
{
    std::scoped_lock lk(mu_);
    return inUse_.size();
}

session::SessionSlot *WorkerPool::slotAt(int id) const noexcept
{
    if (id < 0 || static_cast<std::size_t>(id) >= slots_.size())
    {
        return nullptr;
    }
    return slots_[static_cast<std::size_t>(id)].get();
}

std::vector<int> WorkerPool::inUseIds() const
{
    std::scoped_lock lk(mu_);
    return {inUse_.begin(), inUse_.end()};
}

std::vector<int> WorkerPool::availableIds() const
{
    std::scoped_lock lk(mu_);
    return {available_.begin(), available_.end()};
}

bool WorkerPool::claimOwner(const std::string &userId, int slotId)
{
    std::scoped_lock lk(ownersMu_);
    const auto [it, inserted] = owners_.emplace(userId, slotId);
    return inserted || it->second == slotId;
}

void WorkerPool::releaseOwner(const std::string &userId, int slotId) noexcept
{
    std::scoped_lock lk(ownersMu_);
    const auto it = owners_.find(userId);
    if (it != owners_.end() && it->second == slotId)
    {
        owners_.erase(it);
    }
}

} // namespace coinchase::pool
