#include <coinchase/ServerConfig.hpp>

#include <stdexcept>
#include <string>

namespace coinchase
{

namespace
{
[[noreturn]] void throwConfigError(const std::string &detail)
{
    auto msg = "[ServerConfig] " + detail;
    SLOG_ERROR("ServerConfig", "ValidationError", "msg={}", msg);
    throw std::invalid_argument{msg};
}

constexpr std::uint32_t kMaxCapacity = 4096;
} // namespace

void validateServerConfig(const ServerConfig &config)
{
    if (config.capacity == 0)
    {
        throwConfigError("capacity must be >= 1");
    }
    if (config.capacity > kMaxCapacity)
    {
        throwConfigError("capacity must be <= " + std::to_string(kMaxCapacity));
    }

    if (config.httpAddress.empty())
    {
        throwConfigError("httpAddress must not be empty");
    }
    if (config.slotAddress.empty())
    {
        throwConfigError("slotAddress must not be empty");
    }

    // 고정 포트 모드: [base, base + capacity) 가 범위 안이고 http 포트와 겹치지 않아야 한다.
    if (config.slotBasePort != 0)
    {
        const std::uint32_t last =
            static_cast<std::uint32_t>(config.slotBasePort) + config.capacity - 1;
        if (last > 65535)
        {
            throwConfigError("slotBasePort + capacity exceeds 65535");
        }
        if (config.httpPort != 0 && config.httpPort >= config.slotBasePort &&
            config.httpPort <= last)
        {
            throwConfigError("httpPort must not overlap the slot port range");
        }
    }

    const auto &s = config.session;
    if (s.chunkSize < 64)
    {
        throwConfigError("session.chunkSize is too small (min 64 bytes)");
    }
    if (s.faultTolerance == 0)
    {
        throwConfigError("session.faultTolerance must be >= 1");
    }
    if (s.readIdleTimeoutMs == 0)
    {
        throwConfigError("session.readIdleTimeoutMs must be >= 1");
    }
    if (s.dialTimeoutMs == 0)
    {
        throwConfigError("session.dialTimeoutMs must be >= 1");
    }
    if (s.pollSliceMs == 0 || s.pollSliceMs > 1000)
    {
        throwConfigError("session.pollSliceMs must be in [1, 1000]");
    }
    if (s.broadcastIntervalMs == 0)
    {
        throwConfigError("session.broadcastIntervalMs must be >= 1");
    }

    const auto &l = config.liveness;
    if (l.intervalMs == 0 || l.probeTimeoutMs == 0)
    {
        throwConfigError("liveness intervalMs/probeTimeoutMs must be >= 1");
    }
    if (l.probeTimeoutMs >= l.intervalMs)
    {
        throwConfigError("liveness.probeTimeoutMs must be shorter than liveness.intervalMs");
    }
    if (l.probeTimeoutMs <= s.pollSliceMs)
    {
        throwConfigError("liveness.probeTimeoutMs must be longer than session.pollSliceMs");
    }

    const auto &g = config.game;
    if (g.mapSize < 2 || g.mapSize > 4096)
    {
        throwConfigError("game.mapSize must be in [2, 4096]");
    }
    const auto cells = static_cast<std::uint64_t>(g.mapSize) * static_cast<std::uint64_t>(g.mapSize);
    if (static_cast<std::uint64_t>(g.coinCount) + g.itemCount > cells)
    {
        throwConfigError("game.coinCount + game.itemCount exceeds the number of cells");
    }
    if (g.baseVisibility < 0)
    {
        throwConfigError("game.baseVisibility must be non-negative");
    }
}

} // namespace coinchase
