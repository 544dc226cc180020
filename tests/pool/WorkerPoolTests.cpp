#include <coinchase/core/Error.hpp>
#include <coinchase/pool/WorkerPool.hpp>
#include <coinchase/session/WorkerStatus.hpp>

#include "support/SessionHarness.hpp"

#include <iostream>
#include <set>

using coinchase::core::Errc;
using coinchase::pool::SlotLease;
using coinchase::pool::WorkerPool;
using coinchase::session::WorkerStatus;

namespace {

bool countsAddUp(const WorkerPool &pool, const char *tag) {
    if (pool.availableCount() + pool.activeCount() != pool.capacity()) {
        std::cerr << "[" << tag << "] available=" << pool.availableCount()
                  << " active=" << pool.activeCount() << " capacity=" << pool.capacity() << "\n";
        return false;
    }
    return true;
}

bool test_pull_until_capacity() {
    testsupport::Harness h;
    WorkerPool pool(2, "127.0.0.1", 0, h.env);
    pool.start();

    if (pool.availableCount() != 2 || !countsAddUp(pool, "capacity")) {
        return false;
    }

    SlotLease a;
    SlotLease b;
    SlotLease c;
    if (pool.pull(a) || pool.pull(b)) {
        std::cerr << "[capacity] first two pulls should succeed\n";
        return false;
    }
    if (a.id == b.id || a.slot->port() == b.slot->port()) {
        std::cerr << "[capacity] pulled the same slot twice\n";
        return false;
    }
    if (a.slot->status() != WorkerStatus::PulledOut) {
        std::cerr << "[capacity] pulled slot status=" << coinchase::session::toString(a.slot->status())
                  << "\n";
        return false;
    }
    if (pool.pull(c) != Errc::Capacity) {
        std::cerr << "[capacity] third pull should be rejected\n";
        return false;
    }
    if (!countsAddUp(pool, "capacity")) {
        return false;
    }

    pool.put(a.id, a.slot);
    if (pool.availableCount() != 1 || pool.pull(c)) {
        std::cerr << "[capacity] slot should be reusable after put\n";
        return false;
    }
    return countsAddUp(pool, "capacity");
}

bool test_exclusive_ownership() {
    testsupport::Harness h;
    WorkerPool pool(2, "127.0.0.1", 0, h.env);
    pool.start();

    SlotLease a;
    SlotLease b;
    if (pool.pull(a) || pool.pull(b)) {
        return false;
    }

    if (a.slot->setClientInformation("alice", "127.0.0.1", 7000)) {
        std::cerr << "[owner] first claim failed\n";
        return false;
    }
    if (b.slot->setClientInformation("alice", "127.0.0.1", 7001) != Errc::DuplicateOwner) {
        std::cerr << "[owner] second slot must not own the same user\n";
        return false;
    }
    if (b.slot->status() != WorkerStatus::PulledOut || !b.slot->ownerUserId().empty()) {
        std::cerr << "[owner] rejected slot should be untouched\n";
        return false;
    }

    SlotLease found;
    if (pool.getByUserId("alice", found) || found.id != a.id) {
        std::cerr << "[owner] lookup mismatch\n";
        return false;
    }

    // 반납 후에는 다른 슬롯이 같은 userId 를 가질 수 있다
    pool.put(a.id, a.slot);
    if (pool.getByUserId("alice", found) != Errc::NotFound) {
        std::cerr << "[owner] released user still indexed\n";
        return false;
    }
    if (b.slot->setClientInformation("alice", "127.0.0.1", 7001)) {
        std::cerr << "[owner] claim after release failed\n";
        return false;
    }
    return b.slot->clientAddress().port == 7001;
}

bool test_out_of_state_calls() {
    testsupport::Harness h;
    WorkerPool pool(2, "127.0.0.1", 0, h.env);
    pool.start();

    SlotLease a;
    if (pool.pull(a)) {
        return false;
    }

    // PULLED_OUT 에서 바로 startSend: 거절 + force exit
    if (a.slot->startSendUserRelatedDataToClient() != Errc::InvalidState) {
        std::cerr << "[state] startSend from PULLED_OUT should fail\n";
        return false;
    }
    if (!testsupport::waitUntil([&] { return a.slot->status() == WorkerStatus::Terminated; })) {
        std::cerr << "[state] force exit did not terminate the slot\n";
        return false;
    }

    // TERMINATED 에서 setClientInformation: owner/address 는 그대로
    if (a.slot->setClientInformation("bob", "127.0.0.1", 7002) != Errc::InvalidState) {
        std::cerr << "[state] setClientInformation on TERMINATED should fail\n";
        return false;
    }
    if (!a.slot->ownerUserId().empty() || !a.slot->clientAddress().empty()) {
        std::cerr << "[state] owner/address changed on rejected call\n";
        return false;
    }

    pool.put(a.id, a.slot);
    if (a.slot->status() != WorkerStatus::Available || !a.slot->sessionAlive()) {
        std::cerr << "[state] put should re-arm the slot\n";
        return false;
    }
    return countsAddUp(pool, "state");
}

bool test_put_is_idempotent() {
    testsupport::Harness h;
    WorkerPool pool(3, "127.0.0.1", 0, h.env);
    pool.start();

    SlotLease a;
    if (pool.pull(a)) {
        return false;
    }
    if (a.slot->setClientInformation("carol", "127.0.0.1", 7003) ||
        a.slot->startSendUserRelatedDataToClient()) {
        std::cerr << "[put] login sequence failed\n";
        return false;
    }
    if (a.slot->status() != WorkerStatus::Working) {
        std::cerr << "[put] expected WORKING\n";
        return false;
    }
    if (!testsupport::waitUntil([&] { return h.link.dials.load() == 1; })) {
        std::cerr << "[put] sender never dialed\n";
        return false;
    }

    pool.put(a.id, a.slot);
    pool.put(a.id, a.slot);
    pool.put(a.id, pool.slotAt((a.id + 1) % 3)); // 잘못된 쌍은 무시

    if (pool.availableCount() != 3 || pool.activeCount() != 0) {
        std::cerr << "[put] available=" << pool.availableCount() << "\n";
        return false;
    }

    const auto ids = pool.availableIds();
    if (std::set<int>(ids.begin(), ids.end()).size() != 3) {
        std::cerr << "[put] duplicate slot in available set\n";
        return false;
    }
    return a.slot->ownerUserId().empty() && a.slot->clientAddress().empty();
}

bool test_stale_release_keeps_new_owner() {
    testsupport::Harness h;
    WorkerPool pool(1, "127.0.0.1", 0, h.env);
    pool.start();

    SlotLease first;
    if (pool.pull(first) || first.slot->setClientInformation("alice", "127.0.0.1", 7010)) {
        return false;
    }
    SlotLease stale;
    if (pool.getByUserId("alice", stale)) {
        return false;
    }

    // 회수된 슬롯이 다른 유저에게 다시 넘어간 뒤 옛 lease 로 반납 시도
    pool.put(first.id, first.slot);
    SlotLease second;
    if (pool.pull(second) || second.id != stale.id ||
        second.slot->setClientInformation("bob", "127.0.0.1", 7011)) {
        std::cerr << "[stale_put] slot was not re-issued\n";
        return false;
    }

    if (pool.putIfOwner(stale.id, stale.slot, "alice")) {
        std::cerr << "[stale_put] release with the previous owner went through\n";
        return false;
    }
    if (second.slot->ownerUserId() != "bob" ||
        second.slot->status() != WorkerStatus::InfoReceived || pool.activeCount() != 1) {
        std::cerr << "[stale_put] new owner's session was disturbed\n";
        return false;
    }

    if (!pool.putIfOwner(second.id, second.slot, "bob") || pool.availableCount() != 1) {
        std::cerr << "[stale_put] matching owner should release\n";
        return false;
    }
    return true;
}

bool test_stopped_pool_rejects() {
    testsupport::Harness h;
    WorkerPool pool(1, "127.0.0.1", 0, h.env);
    pool.start();
    pool.stop();

    SlotLease a;
    if (pool.pull(a) != Errc::Capacity) {
        std::cerr << "[stop] pull after stop should be rejected\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    bool ok = true;

    ok = ok && test_pull_until_capacity();
    ok = ok && test_exclusive_ownership();
    ok = ok && test_out_of_state_calls();
    ok = ok && test_put_is_idempotent();
    ok = ok && test_stale_release_keeps_new_owner();
    ok = ok && test_stopped_pool_rejects();

    if (!ok) {
        std::cerr << "WorkerPool tests FAILED\n";
        return 1;
    }

    std::cout << "WorkerPool tests PASSED\n";
    return 0;
}
