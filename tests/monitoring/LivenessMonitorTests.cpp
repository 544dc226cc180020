#include <coinchase/core/Error.hpp>
#include <coinchase/monitoring/LivenessMonitor.hpp>
#include <coinchase/monitoring/Metrics.hpp>
#include <coinchase/pool/WorkerPool.hpp>
#include <coinchase/protocol/InboundCodec.hpp>
#include <coinchase/session/WorkerStatus.hpp>

#include "support/SessionHarness.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using coinchase::LivenessOptions;
using coinchase::monitoring::LivenessMonitor;
using coinchase::pool::SlotLease;
using coinchase::pool::WorkerPool;
using coinchase::session::WorkerStatus;

namespace {

LivenessOptions fastLiveness() {
    LivenessOptions o;
    o.intervalMs = 50;
    o.probeTimeoutMs = 200;
    return o;
}

/// updateUserPosition 안에서 release() 까지 멈춰 있는 게임 상태
class StallingGameState final : public coinchase::game::IGameState {
  public:
    explicit StallingGameState(coinchase::game::IGameState &inner) : inner_(inner) {}

    void updateUserPosition(const coinchase::game::StatusEvent &event) override {
        std::unique_lock lk(mu_);
        entered_ = true;
        cv_.notify_all();
        cv_.wait(lk, [this] { return released_; });
        lk.unlock();
        inner_.updateUserPosition(event);
    }
    void applyAttack(const coinchase::game::AttackEvent &event) override {
        inner_.applyAttack(event);
    }
    std::vector<coinchase::game::RelatedPosition>
    getRelatedPositions(const coinchase::game::Position &p, std::int32_t m) const override {
        return inner_.getRelatedPositions(p, m);
    }
    void removeUser(const std::string &userId) override { inner_.removeUser(userId); }
    Summary summary() const override { return inner_.summary(); }

    bool entered() {
        std::scoped_lock lk(mu_);
        return entered_;
    }
    void release() {
        std::scoped_lock lk(mu_);
        released_ = true;
        cv_.notify_all();
    }

  private:
    coinchase::game::IGameState &inner_;
    std::mutex mu_;
    std::condition_variable cv_;
    bool entered_{false};
    bool released_{false};
};

bool test_initial_capacity_check() {
    testsupport::Harness h;
    WorkerPool pool(2, "127.0.0.1", 0, h.env);
    pool.start();
    LivenessMonitor monitor(pool, fastLiveness());

    try {
        monitor.verifyInitialCapacity();
    } catch (const std::logic_error &e) {
        std::cerr << "[initial] fresh pool rejected: " << e.what() << "\n";
        return false;
    }

    SlotLease lease;
    if (pool.pull(lease)) {
        return false;
    }
    try {
        monitor.verifyInitialCapacity();
        std::cerr << "[initial] pool with a pulled slot accepted\n";
        return false;
    } catch (const std::logic_error &) {
    }
    return true;
}

bool test_terminated_slot_is_reclaimed() {
    coinchase::monitoring::serverMetrics().reset();

    testsupport::Harness h;
    WorkerPool pool(2, "127.0.0.1", 0, h.env);
    pool.start();
    LivenessMonitor monitor(pool, fastLiveness());

    SlotLease lease;
    if (pool.pull(lease) || lease.slot->setClientInformation("alice", "127.0.0.1", 7200)) {
        return false;
    }
    lease.slot->forceExit();
    if (!testsupport::waitUntil([&] { return lease.slot->status() == WorkerStatus::Terminated; })) {
        std::cerr << "[reclaim] slot did not terminate\n";
        return false;
    }

    const auto report = monitor.runOnce();
    if (report.probed != 1 || report.reclaimed != 1) {
        std::cerr << "[reclaim] probed=" << report.probed << " reclaimed=" << report.reclaimed
                  << "\n";
        return false;
    }
    if (lease.slot->status() != WorkerStatus::Available || !lease.slot->ownerUserId().empty() ||
        !lease.slot->clientAddress().empty() || !lease.slot->sessionAlive()) {
        std::cerr << "[reclaim] slot not back to a clean AVAILABLE state\n";
        return false;
    }

    SlotLease found;
    if (pool.getByUserId("alice", found) != coinchase::core::Errc::NotFound) {
        std::cerr << "[reclaim] owner index still points at the slot\n";
        return false;
    }
    if (pool.availableCount() != 2) {
        return false;
    }
    return coinchase::monitoring::serverMetrics().snapshot().revivedSlotsTotal == 1;
}

bool test_healthy_session_is_left_alone() {
    testsupport::Harness h;
    WorkerPool pool(1, "127.0.0.1", 0, h.env);
    pool.start();
    LivenessMonitor monitor(pool, fastLiveness());

    SlotLease lease;
    if (pool.pull(lease) || lease.slot->setClientInformation("bob", "127.0.0.1", 7201)) {
        return false;
    }

    const auto report = monitor.runOnce();
    if (report.probed != 1 || report.reclaimed != 0 || report.revivedIdle != 0) {
        std::cerr << "[healthy] reclaimed=" << report.reclaimed << "\n";
        return false;
    }
    return lease.slot->status() == WorkerStatus::InfoReceived && lease.slot->ownerUserId() == "bob";
}

bool test_stalled_processor_does_not_block_reclaim() {
    testsupport::Harness h;
    StallingGameState stalling(h.world.gameState());
    h.env.services.gameState = &stalling;
    h.world.registerUser("frank");

    WorkerPool pool(1, "127.0.0.1", 0, h.env);
    pool.start();
    LivenessMonitor monitor(pool, fastLiveness());

    SlotLease lease;
    if (pool.pull(lease) || lease.slot->setClientInformation("frank", "127.0.0.1", 7202)) {
        return false;
    }

    std::vector<std::byte> frame;
    if (!coinchase::protocol::encodeInbound(coinchase::game::StatusEvent{"frank", {2, 3}}, frame)) {
        return false;
    }
    auto client = testsupport::connectLoopback(lease.slot->port());
    if (!client.isValid() || !testsupport::sendAll(client, frame)) {
        std::cerr << "[stalled] could not reach slot\n";
        stalling.release();
        return false;
    }
    if (!testsupport::waitUntil([&] { return stalling.entered(); })) {
        std::cerr << "[stalled] processor never picked up the event\n";
        stalling.release();
        return false;
    }

    // processor 는 협력자 안에서 멈춰 있어 ping 에 답하지 못한다
    const auto begin = std::chrono::steady_clock::now();
    const auto report = monitor.runOnce();
    const auto took = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - begin);

    const bool rearmed = lease.slot->status() == WorkerStatus::Available &&
                         lease.slot->ownerUserId().empty() && lease.slot->sessionAlive() &&
                         pool.availableCount() == 1;
    const bool stillReaping = pool.pendingReaps() == 1;

    stalling.release();
    client.close();

    if (report.reclaimed != 1 || took > std::chrono::milliseconds(1500)) {
        std::cerr << "[stalled] reclaimed=" << report.reclaimed << " took_ms=" << took.count()
                  << "\n";
        return false;
    }
    if (!rearmed || !stillReaping) {
        std::cerr << "[stalled] slot not re-armed while the old session was still running\n";
        return false;
    }
    if (!testsupport::waitUntil([&] { return pool.pendingReaps() == 0; })) {
        std::cerr << "[stalled] released session was never joined\n";
        return false;
    }
    return true;
}

bool test_dead_idle_slot_is_rearmed() {
    testsupport::Harness h;
    WorkerPool pool(1, "127.0.0.1", 0, h.env);
    pool.start();
    LivenessMonitor monitor(pool, fastLiveness());

    // AVAILABLE 슬롯에 잘못된 바이트를 보내 세션을 죽인다
    auto *slot = pool.slotAt(0);
    auto client = testsupport::connectLoopback(slot->port());
    const std::vector<std::byte> junk(300, std::byte{'Z'});
    if (!client.isValid() || !testsupport::sendAll(client, junk)) {
        std::cerr << "[idle] could not reach slot\n";
        return false;
    }
    if (!testsupport::waitUntil([&] { return !slot->sessionAlive(); })) {
        std::cerr << "[idle] session survived a protocol violation\n";
        return false;
    }
    client.close();

    SlotLease lease;
    if (pool.pull(lease) != coinchase::core::Errc::Capacity) {
        std::cerr << "[idle] dead slot must not be handed out\n";
        return false;
    }

    const auto report = monitor.runOnce();
    if (report.revivedIdle != 1 || !slot->sessionAlive()) {
        std::cerr << "[idle] revived=" << report.revivedIdle << "\n";
        return false;
    }
    return !pool.pull(lease) && lease.id == 0;
}

bool test_background_thread_reclaims() {
    testsupport::Harness h;
    WorkerPool pool(1, "127.0.0.1", 0, h.env);
    pool.start();
    LivenessMonitor monitor(pool, fastLiveness());
    monitor.start();

    SlotLease lease;
    if (pool.pull(lease)) {
        return false;
    }
    lease.slot->forceExit();

    const bool ok = testsupport::waitUntil(
        [&] { return pool.availableCount() == 1 && lease.slot->sessionAlive(); },
        std::chrono::milliseconds(3000));
    monitor.stop();
    if (!ok) {
        std::cerr << "[thread] monitor thread never reclaimed the slot\n";
        return false;
    }
    return true;
}

bool test_metrics_text() {
    const std::string text = coinchase::monitoring::serverMetrics().toPrometheusText();
    for (const char *name : {"coinchase_active_sessions", "coinchase_revived_slots_total",
                             "coinchase_capacity_rejections_total",
                             "coinchase_protocol_violations_total"}) {
        if (text.find(std::string("# TYPE ") + name) == std::string::npos) {
            std::cerr << "[metrics] missing " << name << "\n";
            return false;
        }
    }
    return true;
}

} // namespace

int main() {
    bool ok = true;

    ok = ok && test_initial_capacity_check();
    ok = ok && test_terminated_slot_is_reclaimed();
    ok = ok && test_healthy_session_is_left_alone();
    ok = ok && test_stalled_processor_does_not_block_reclaim();
    ok = ok && test_dead_idle_slot_is_rearmed();
    ok = ok && test_background_thread_reclaims();
    ok = ok && test_metrics_text();

    if (!ok) {
        std::cerr << "LivenessMonitor tests FAILED\n";
        return 1;
    }

    std::cout << "LivenessMonitor tests PASSED\n";
    return 0;
}
