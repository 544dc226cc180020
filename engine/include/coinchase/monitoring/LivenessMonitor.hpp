#pragma once

#include <coinchase/ServerConfig.hpp>
#include <coinchase/util/NonCopyable.hpp>

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <thread>

namespace coinchase::pool
{
class WorkerPool;
}

namespace coinchase::monitoring
{

/// 주기적으로 in-use 슬롯을 probe 하고, 죽었거나 응답 없는 슬롯을 회수합니다.
///
/// - in-use 슬롯: TERMINATED 이거나 probe 에 응답하지 않으면 force exit -> put
/// - AVAILABLE 슬롯: 세션 태스크가 죽어 있으면 제자리에서 재무장
/// - probe 는 모든 슬롯에 먼저 ping 을 보낸 뒤 하나의 deadline 으로 기다립니다.
class LivenessMonitor final : private coinchase::util::NonCopyable
{
  public:
    struct RunReport
    {
        std::size_t probed = 0;
        std::size_t reclaimed = 0;
        std::size_t revivedIdle = 0;
    };

    LivenessMonitor(pool::WorkerPool &pool, LivenessOptions options);
    ~LivenessMonitor();

    /// pool 이 CAPACITY 개의 AVAILABLE 슬롯으로만 이루어져 있는지. 아니면 std::logic_error.
    void verifyInitialCapacity() const;

    void start();
    void stop();

    /// 한 주기 분량. (테스트에서 직접 호출)
    RunReport runOnce();

  private:
    void threadMain_();

    pool::WorkerPool &pool_;
    LivenessOptions options_;

    std::mutex mu_;
    std::condition_variable cv_;
    bool stopping_{false};
    std::thread th_;
};

} // namespace coinchase::monitoring
