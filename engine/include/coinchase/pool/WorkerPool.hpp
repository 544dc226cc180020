#pragma once

#include <coinchase/session/SessionEnvironment.hpp>
#include <coinchase/session/SessionReaper.hpp>
#include <coinchase/session/SessionSlot.hpp>
#include <coinchase/util/NonCopyable.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <system_error>
#include <unordered_map>
#include <vector>

namespace coinchase::pool
{

/// pull 결과. slot 은 pool 이 소유하며 pool 보다 오래 쓰면 안 됩니다.
struct SlotLease
{
    int id{-1};
    session::SessionSlot *slot{nullptr};
};

/// 고정 크기 세션 슬롯 레지스트리입니다.
///
/// - 슬롯은 start() 에서 CAPACITY 개 만들어지고 프로세스 종료까지 유지됩니다.
/// - 어느 시점이든 available + inUse == CAPACITY 입니다.
///   put/revive 로 회수 중인 슬롯은 inUse 쪽에 남아 있다가 재무장이 끝나면 available 로 옮겨집니다.
/// - pull/put 은 락을 잡은 채 I/O(특히 세션 스레드 join)를 하지 않습니다.
///   회수된 세션의 join 은 reaper 스레드가 맡고, 슬롯은 join 을 기다리지 않고 재무장됩니다.
/// - userId -> slot 인덱스는 ownersMu_ 로 보호되는 leaf 락입니다.
///
/// 락 순서: mu_ -> SessionSlot::mu_ -> ownersMu_
class WorkerPool final : public session::IOwnerIndex, private coinchase::util::NonCopyable
{
  public:
    WorkerPool(std::uint32_t capacity, std::string slotAddress, std::uint16_t basePort,
               session::SessionEnvironment env);
    ~WorkerPool() override;

    /// 슬롯 생성 + 리스너 bind + 세션 arm. 실패 시 std::system_error / std::runtime_error.
    void start();

    /// 모든 세션을 취소하고 join 합니다. 이후 pull 은 항상 Capacity.
    void stop();

    /// AVAILABLE 슬롯 하나를 PULLED_OUT 으로. 없으면 Errc::Capacity (대기하지 않음).
    [[nodiscard]] std::error_code pull(SlotLease &out);

    /// 세션을 취소하고 owner/address 를 지운 뒤 AVAILABLE 로 되돌립니다.
    /// 이미 AVAILABLE 이거나 회수 중이면 no-op.
    void put(int id, session::SessionSlot *slot);

    /// put 과 같지만 슬롯의 현재 owner 가 expectedOwner 일 때만 회수합니다.
    /// lookup 뒤에 슬롯이 회수되어 다른 유저에게 넘어갔으면 false (아무것도 건드리지 않음).
    [[nodiscard]] bool putIfOwner(int id, session::SessionSlot *slot,
                                  const std::string &expectedOwner);

    /// userId 를 소유한 슬롯. 없으면 Errc::NotFound.
    [[nodiscard]] std::error_code getByUserId(const std::string &userId, SlotLease &out) const;

    /// AVAILABLE 상태에서 세션이 죽은 슬롯을 제자리에서 재무장합니다.
    /// @return 재무장 시도 여부 (이미 in-use 이거나 회수 중이면 false)
    bool reviveIdle(int id);

    [[nodiscard]] std::size_t availableCount() const;
    [[nodiscard]] std::size_t activeCount() const;
    [[nodiscard]] std::uint32_t capacity() const noexcept { return capacity_; }

    /// reaper 가 아직 join 하지 못한 이전 세션 수
    [[nodiscard]] std::size_t pendingReaps() const { return reaper_.pending(); }

    /// 인덱스 범위 밖이면 nullptr
    [[nodiscard]] session::SessionSlot *slotAt(int id) const noexcept;

    [[nodiscard]] std::vector<int> inUseIds() const;
    [[nodiscard]] std::vector<int> availableIds() const;

    [[nodiscard]] const session::SessionEnvironment &environment() const noexcept { return env_; }

    // ===== session::IOwnerIndex =====
    [[nodiscard]] bool claimOwner(const std::string &userId, int slotId) override;
    void releaseOwner(const std::string &userId, int slotId) noexcept override;

  private:
    bool release_(int id, session::SessionSlot *slot, const std::string *expectedOwner);

    /// mu_ 를 잡은 상태에서 호출. 세션을 떼어내고 회수 목록에 올립니다.
    [[nodiscard]] std::shared_ptr<session::SessionContext> beginReclaimLocked_(int id);
    /// 떼어낸 세션을 reaper 에 넘긴 뒤 호출. 재무장하고 available 로 옮깁니다.
    void finishReclaim_(int id, bool countRelease);

    const std::uint32_t capacity_;
    const std::string slotAddress_;
    const std::uint16_t basePort_;
    session::SessionEnvironment env_;

    std::vector<std::unique_ptr<session::SessionSlot>> slots_;
    session::SessionReaper reaper_;

    mutable std::mutex mu_;
    std::set<int> available_;
    std::set<int> inUse_;
    std::set<int> reclaiming_;
    bool stopped_{false};

    mutable std::mutex ownersMu_;
    std::unordered_map<std::string, int> owners_;
};

} // namespace coinchase::pool
