#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace coinchase::session
{

/// monitor -> 태스크 방향 ping / 태스크 -> monitor 방향 echo 한 쌍입니다.
///
/// - monitor 는 ping() 으로 받은 seq 를 awaitEcho(seq, timeout) 로 기다립니다.
/// - 태스크는 루프마다 pending() 을 보고 answer() 합니다. (poll slice 만큼 지연될 수 있음)
class LivenessProbe
{
  public:
    std::uint64_t ping() noexcept
    {
        return requested_.fetch_add(1, std::memory_order_acq_rel) + 1;
    }

    [[nodiscard]] bool pending() const noexcept
    {
        return requested_.load(std::memory_order_acquire) >
               answered_.load(std::memory_order_acquire);
    }

    void answer() noexcept
    {
        {
            std::lock_guard<std::mutex> lk(mu_);
            answered_.store(requested_.load(std::memory_order_acquire), std::memory_order_release);
        }
        cv_.notify_all();
    }

    /// seq 이상이 echo 되면 true, timeout 이면 false
    bool awaitEcho(std::uint64_t seq, std::chrono::steady_clock::time_point deadline)
    {
        std::unique_lock<std::mutex> lk(mu_);
        return cv_.wait_until(lk, deadline, [this, seq] {
            return answered_.load(std::memory_order_acquire) >= seq;
        });
    }

  private:
    std::atomic<std::uint64_t> requested_{0};
    std::atomic<std::uint64_t> answered_{0};
    std::mutex mu_;
    std::condition_variable cv_;
};

} // namespace coinchase::session
