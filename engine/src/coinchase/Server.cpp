#include <coinchase/Server.hpp>

#include <coinchase/core/Logger.hpp>
#include <coinchase/core/SignalHandler.hpp>
#include <coinchase/lobby/LobbyHttpServer.hpp>
#include <coinchase/lobby/LobbyRoutes.hpp>
#include <coinchase/monitoring/LivenessMonitor.hpp>
#include <coinchase/net/TcpOutboundLink.hpp>
#include <coinchase/pool/WorkerPool.hpp>
#include <coinchase/session/SessionEnvironment.hpp>

#include <chrono>
#include <stdexcept>
#include <thread>
#include <utility>

namespace coinchase
{

namespace
{
constexpr auto kStopPollInterval = std::chrono::milliseconds(100);
}

Server::Server(ServerConfig config, game::GameServices services, session::OutboundDialer dialer)
    : config_(std::move(config)), services_(services),
      clock_(std::chrono::milliseconds(config_.session.broadcastIntervalMs))
{
    validateServerConfig(config_);
    if (!services_.complete())
    {
        throw std::invalid_argument("[Server] game services must all be provided");
    }

    session::SessionEnvironment env;
    env.events = &events_;
    env.clock = &clock_;
    env.services = services_;
    env.tuning = config_.session;
    env.dialer = dialer ? std::move(dialer) : net::makeTcpDialer();

    pool_ = std::make_unique<pool::WorkerPool>(config_.capacity, config_.slotAddress,
                                               config_.slotBasePort, std::move(env));
    monitor_ = std::make_unique<monitoring::LivenessMonitor>(*pool_, config_.liveness);
    routes_ = std::make_unique<lobby::LobbyRoutes>(*pool_, services_);
    lobby_ = std::make_unique<lobby::LobbyHttpServer>(config_.httpAddress, config_.httpPort,
                                                      *routes_);
}

Server::~Server()
{
    shutdown();
}

void Server::start()
{
    if (started_.exchange(true, std::memory_order_acq_rel))
    {
        return;
    }

    pool_->start();
    monitor_->verifyInitialCapacity();
    clock_.start();
    monitor_->start();
    lobby_->start();

    SLOG_INFO("Server", "Started", "capacity={} lobby={}:{} slots={}:{}+", config_.capacity,
              config_.httpAddress, lobby_->boundPort(), config_.slotAddress,
              config_.slotBasePort);
}

void Server::run()
{
    core::SignalHandler signals;
    start();

    int signo = 0;
    while (!stopRequested_.load(std::memory_order_acquire))
    {
        if (signals.consumeStopRequest(&signo))
        {
            SLOG_INFO("Server", "StopRequested", "signal={}", core::SignalHandler::signalName(signo));
            break;
        }
        std::this_thread::sleep_for(kStopPollInterval);
    }

    shutdown();
}

void Server::shutdown() noexcept
{
    if (!started_.exchange(false, std::memory_order_acq_rel))
    {
        return;
    }

    SLOG_INFO("Server", "ShuttingDown", "active={}", pool_->activeCount());
    lobby_->stopAndJoin();
    monitor_->stop();
    clock_.stop();
    pool_->stop();
    SLOG_INFO("Server", "Stopped");
}

std::uint16_t Server::lobbyPort() const noexcept
{
    return lobby_->boundPort();
}

} // namespace coinchase
