#pragma once

#include <coinchase/ServerConfig.hpp>
#include <coinchase/game/GameInterfaces.hpp>
#include <coinchase/session/BroadcastClock.hpp>
#include <coinchase/session/InboundEventQueue.hpp>
#include <coinchase/session/OutboundLink.hpp>
#include <coinchase/util/NonCopyable.hpp>

#include <atomic>
#include <cstdint>
#include <memory>

namespace coinchase::pool
{
class WorkerPool;
}
namespace coinchase::monitoring
{
class LivenessMonitor;
}
namespace coinchase::lobby
{
class LobbyRoutes;
class LobbyHttpServer;
} // namespace coinchase::lobby

namespace coinchase
{

/// 세션 엔진 전체를 조립하고 수명을 관리합니다.
///
/// 시작 순서: pool(슬롯 arm = receiver/processor) -> 초기 용량 검증 -> clock -> monitor -> lobby
/// 종료 순서: lobby -> monitor -> clock -> pool(모든 세션)
class Server final : private coinchase::util::NonCopyable
{
  public:
    /// dialer 가 비어 있으면 TCP dialer 를 씁니다.
    Server(ServerConfig config, game::GameServices services, session::OutboundDialer dialer = {});
    ~Server();

    /// 실패 시 예외 (std::system_error / std::logic_error / std::runtime_error)
    void start();

    /// start() 후 SIGINT/SIGTERM 또는 stop() 까지 블록하고, 끝나면 shutdown().
    void run();

    /// 다른 스레드에서 run() 을 끝내도록 요청합니다.
    void stop() noexcept { stopRequested_.store(true, std::memory_order_release); }

    void shutdown() noexcept;

    [[nodiscard]] pool::WorkerPool &pool() noexcept { return *pool_; }
    [[nodiscard]] monitoring::LivenessMonitor &monitor() noexcept { return *monitor_; }
    [[nodiscard]] session::BroadcastClock &clock() noexcept { return clock_; }
    [[nodiscard]] std::uint16_t lobbyPort() const noexcept;

  private:
    ServerConfig config_;
    game::GameServices services_;

    session::InboundEventQueue events_;
    session::BroadcastClock clock_;

    std::unique_ptr<pool::WorkerPool> pool_;
    std::unique_ptr<monitoring::LivenessMonitor> monitor_;
    std::unique_ptr<lobby::LobbyRoutes> routes_;
    std::unique_ptr<lobby::LobbyHttpServer> lobby_;

    std::atomic_bool started_{false};
    std::atomic_bool stopRequested_{false};
};

} // namespace coinchase
