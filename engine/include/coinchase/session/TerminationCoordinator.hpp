#pragma once

#include <coinchase/util/NonCopyable.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string_view>

namespace coinchase::session
{

enum class TerminationReason : std::uint8_t
{
    None = 0,
    MutualTermination, // 세 태스크 중 하나가 실패/종료
    ForceExit,         // 잘못된 상태 전이 또는 monitor 강제 종료
    Reclaim,           // pool put / idle revive
    Shutdown,          // 프로세스 종료
};

[[nodiscard]] std::string_view toString(TerminationReason r) noexcept;

/// 세션 1개(receiver/sender/processor)가 공유하는 취소 토큰입니다.
///
/// - fire() 는 idempotent. 최초 호출만 reason 을 기록하고 true 를 반환합니다.
/// - 대기자는 두 가지 방법으로 깨어납니다.
///   - condition variable: waitFor()
///   - eventfd: wakeFd() 를 poll 에 함께 넣으면 fire 이후 계속 readable
class TerminationCoordinator : private coinchase::util::NonCopyable
{
  public:
    /// eventfd 생성 실패 시 std::system_error
    TerminationCoordinator();
    ~TerminationCoordinator() noexcept;

    bool fire(TerminationReason reason) noexcept;

    [[nodiscard]] bool fired() const noexcept { return fired_.load(std::memory_order_acquire); }
    [[nodiscard]] TerminationReason reason() const noexcept;

    /// fire 될 때까지 최대 timeout 대기. @return fired()
    bool waitFor(std::chrono::milliseconds timeout) const;

    [[nodiscard]] int wakeFd() const noexcept { return wakeFd_; }

  private:
    std::atomic_bool fired_{false};
    std::atomic<TerminationReason> reason_{TerminationReason::None};

    mutable std::mutex mu_;
    mutable std::condition_variable cv_;

    int wakeFd_{-1};
};

} // namespace coinchase::session
