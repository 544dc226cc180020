#pragma once

#include <coinchase/session/SessionContext.hpp>
#include <coinchase/util/NonCopyable.hpp>

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>

namespace coinchase::session
{

/// 취소된 SessionContext 를 넘겨받아 자기 스레드에서 join 합니다.
///
/// - 회수 경로(put/revive)는 submit 만 하고 바로 슬롯을 재무장합니다.
///   협력자 호출 안에서 멈춘 태스크가 있어도 monitor/lobby 스레드는 기다리지 않습니다.
/// - stop() 은 남은 context 를 전부 join 한 뒤 반환합니다.
/// - 실행 중이 아니면 submit 은 호출 스레드에서 바로 join 합니다.
class SessionReaper final : private coinchase::util::NonCopyable
{
  public:
    SessionReaper() = default;
    ~SessionReaper();

    void start();
    void stop();

    void submit(std::shared_ptr<SessionContext> ctx);

    /// 아직 join 되지 않은 context 수 (join 진행 중 포함)
    [[nodiscard]] std::size_t pending() const;

  private:
    void threadMain_();

    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::deque<std::shared_ptr<SessionContext>> q_;
    std::size_t inFlight_{0};
    bool running_{false};
    bool stopping_{false};
    std::thread th_;
};

} // namespace coinchase::session
