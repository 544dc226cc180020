#pragma once

#include <coinchase/util/NonCopyable.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <thread>

namespace coinchase::session
{

/// 모든 sender 가 공유하는 브로드캐스트 tick 입니다.
///
/// - tick 마다 generation 이 1 증가하고 대기 중인 sender 가 모두 깨어납니다.
/// - sender 는 마지막으로 본 generation 을 넘겨 다음 tick 을 기다립니다.
///   여러 tick 을 놓쳐도 한 번만 깨어나며, 항상 최신 상태를 보냅니다.
class BroadcastClock : private coinchase::util::NonCopyable
{
  public:
    explicit BroadcastClock(std::chrono::milliseconds interval);
    ~BroadcastClock();

    void start();
    void stop();

    /// 수동 tick (테스트/외부 트리거)
    void tick();

    [[nodiscard]] std::uint64_t generation() const;

    /// generation 이 lastSeen 보다 커질 때까지 최대 timeout 대기.
    /// @return 새 generation, timeout 이면 nullopt
    [[nodiscard]] std::optional<std::uint64_t> waitNextTick(std::uint64_t lastSeen,
                                                            std::chrono::milliseconds timeout) const;

  private:
    void threadMain_();

    std::chrono::milliseconds interval_;

    mutable std::mutex mu_;
    mutable std::condition_variable cv_;
    std::uint64_t generation_{0};
    bool stopping_{false};

    std::thread th_;
};

} // namespace coinchase::session
