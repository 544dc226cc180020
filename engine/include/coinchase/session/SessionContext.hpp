#pragma once

#include <coinchase/session/LivenessProbe.hpp>
#include <coinchase/session/TerminationCoordinator.hpp>
#include <coinchase/util/NonCopyable.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace coinchase::session
{

/// receiver -> processor 방향의 좁은 신호 (processor 는 coordinator 를 직접 보지 않는다)
struct ProcessorSignals
{
    std::atomic_bool terminate{false};
    std::atomic_bool forceExit{false};
};

/// 슬롯이 한 번 arm 될 때마다 새로 만들어지는 세션 실행 단위입니다.
///
/// - receiver/processor 는 arm 시점에, sender 는 startSend 시점에 시작됩니다.
/// - join() 은 세 스레드 중 어느 것에서도 호출하면 안 됩니다. (pool/monitor/shutdown 경로 전용)
/// - 소멸자는 Shutdown 으로 취소한 뒤 join 합니다.
class SessionContext : private coinchase::util::NonCopyable
{
  public:
    explicit SessionContext(std::uint64_t generation);
    ~SessionContext();

    [[nodiscard]] std::uint64_t generation() const noexcept { return generation_; }

    [[nodiscard]] TerminationCoordinator &termination() noexcept { return termination_; }
    [[nodiscard]] const TerminationCoordinator &termination() const noexcept
    {
        return termination_;
    }
    [[nodiscard]] LivenessProbe &receiverProbe() noexcept { return receiverProbe_; }
    [[nodiscard]] LivenessProbe &processorProbe() noexcept { return processorProbe_; }
    [[nodiscard]] ProcessorSignals &processorSignals() noexcept { return processorSignals_; }

    /// sender 만 멈추는 신호 (세션 teardown 없음)
    [[nodiscard]] bool stopSendRequested() const noexcept
    {
        return stopSend_.load(std::memory_order_acquire);
    }
    void requestStopSend() noexcept { stopSend_.store(true, std::memory_order_release); }

    /// 스레드 생성 실패 시 false (std::system_error 를 삼키지 않고 로그로 남긴다)
    [[nodiscard]] bool startReceiver(std::function<void()> body);
    [[nodiscard]] bool startProcessor(std::function<void()> body);
    [[nodiscard]] bool startSender(std::function<void()> body);

    [[nodiscard]] bool senderStarted() const noexcept { return senderThread_.joinable(); }

    /// stop-send + coordinator fire
    void cancel(TerminationReason reason) noexcept;

    void join() noexcept;

  private:
    bool spawn_(std::thread &th, const char *role, std::function<void()> body);

    std::uint64_t generation_;
    TerminationCoordinator termination_;
    LivenessProbe receiverProbe_;
    LivenessProbe processorProbe_;
    ProcessorSignals processorSignals_;
    std::atomic_bool stopSend_{false};

    std::mutex threadsMu_; // spawn/join 직렬화
    std::thread receiverThread_;
    std::thread processorThread_;
    std::thread senderThread_;
};

} // namespace coinchase::session
