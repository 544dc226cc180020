#include <coinchase/lobby/LobbyRoutes.hpp>

#include <coinchase/core/Error.hpp>
#include <coinchase/core/Logger.hpp>
#include <coinchase/monitoring/Metrics.hpp>
#include <coinchase/net/Socket.hpp>
#include <coinchase/pool/WorkerPool.hpp>

#include <fmt/format.h>

#include <charconv>
#include <utility>
#include <vector>

namespace coinchase::lobby
{

namespace
{
HttpResponse textResponse(int code, std::string reason, std::string body)
{
    HttpResponse r;
    r.code = code;
    r.reason = std::move(reason);
    r.body = std::move(body);
    return r;
}

// "/a/b/c" -> {"a","b","c"}. 쿼리 문자열은 버린다.
std::vector<std::string_view> splitPath(std::string_view target)
{
    const auto q = target.find('?');
    if (q != std::string_view::npos)
    {
        target = target.substr(0, q);
    }

    std::vector<std::string_view> parts;
    std::size_t pos = 0;
    while (pos < target.size())
    {
        if (target[pos] == '/')
        {
            ++pos;
            continue;
        }
        const auto next = target.find('/', pos);
        const auto end = next == std::string_view::npos ? target.size() : next;
        parts.push_back(target.substr(pos, end - pos));
        pos = end;
    }
    return parts;
}

bool parsePort(std::string_view s, std::uint16_t &out) noexcept
{
    unsigned int v = 0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || ptr != s.data() + s.size() || v > 65535)
    {
        return false;
    }
    out = static_cast<std::uint16_t>(v);
    return true;
}

bool validUserId(std::string_view userId) noexcept
{
    if (userId.empty() || userId.size() > 64)
    {
        return false;
    }
    for (const char c : userId)
    {
        const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                        c == '-' || c == '_' || c == '.';
        if (!ok)
        {
            return false;
        }
    }
    return true;
}
} // namespace

LobbyRoutes::LobbyRoutes(pool::WorkerPool &pool, game::GameServices services)
    : pool_(pool), services_(services)
{
}

HttpResponse LobbyRoutes::handle(const HttpRequest &request)
{
    const auto parts = splitPath(request.target);

    if (parts.size() == 3 && parts[0] == "get-worker-port")
    {
        if (request.method != "GET")
        {
            return textResponse(405, "Method Not Allowed", "method not allowed");
        }
        return getWorkerPort_(parts[1], parts[2], request.peerIp);
    }

    if (parts.size() == 2 && parts[0] == "disconnect")
    {
        if (request.method != "PATCH")
        {
            return textResponse(405, "Method Not Allowed", "method not allowed");
        }
        return disconnect_(parts[1]);
    }

    if (parts.size() == 1 && parts[0] == "server-state")
    {
        if (request.method != "GET")
        {
            return textResponse(405, "Method Not Allowed", "method not allowed");
        }
        return serverState_();
    }

    if (parts.size() == 1 && parts[0] == "metrics")
    {
        if (request.method != "GET")
        {
            return textResponse(405, "Method Not Allowed", "method not allowed");
        }
        HttpResponse r = textResponse(200, "OK", monitoring::serverMetrics().toPrometheusText());
        r.contentType = "text/plain; version=0.0.4; charset=utf-8";
        return r;
    }

    return textResponse(404, "Not Found", "not found");
}

HttpResponse LobbyRoutes::getWorkerPort_(std::string_view userIdView, std::string_view clientPort,
                                         const std::string &peerIp)
{
    std::uint16_t port = 0;
    ::sockaddr_storage ss{};
    ::socklen_t slen = 0;
    if (!validUserId(userIdView) || !parsePort(clientPort, port) ||
        !net::makeIPv4Address(peerIp, port, ss, slen))
    {
        SLOG_INFO("Lobby", "BadLogin", "user='{}' client_port='{}' peer={}", userIdView,
                  clientPort, peerIp);
        return textResponse(400, "Bad Request", "client information invalid");
    }
    const std::string userId(userIdView);

    pool::SlotLease lease;
    if (pool_.pull(lease))
    {
        return textResponse(409, "Conflict", "worker currently not available");
    }

    if (const auto ec = lease.slot->setClientInformation(userId, peerIp, port))
    {
        pool_.put(lease.id, lease.slot);
        if (ec == core::Errc::DuplicateOwner)
        {
            return textResponse(409, "Conflict", "user already connected");
        }
        return textResponse(500, "Internal Server Error", ec.message());
    }

    if (const auto ec = lease.slot->startSendUserRelatedDataToClient())
    {
        pool_.put(lease.id, lease.slot);
        return textResponse(500, "Internal Server Error", ec.message());
    }

    services_.scoreboard->registerUser(userId);

    SLOG_INFO("Lobby", "Login", "user={} slot={} port={} client={}:{}", userId, lease.id,
              lease.slot->port(), peerIp, port);
    return textResponse(200, "OK", fmt::format("{}", lease.slot->port()));
}

HttpResponse LobbyRoutes::disconnect_(std::string_view userIdView)
{
    const std::string userId(userIdView);

    pool::SlotLease lease;
    if (pool_.getByUserId(userId, lease))
    {
        return textResponse(404, "Not Found", "worker not found");
    }

    // lookup 과 put 사이에 monitor 가 슬롯을 회수해 다른 유저에게 넘겼을 수 있다
    if (!pool_.putIfOwner(lease.id, lease.slot, userId))
    {
        return textResponse(404, "Not Found", "worker not found");
    }
    services_.deregister(userId);

    SLOG_INFO("Lobby", "Disconnect", "user={} slot={}", userId, lease.id);
    return textResponse(200, "OK", "worker successfully returned to pool");
}

HttpResponse LobbyRoutes::serverState_() const
{
    const auto summary = services_.gameState->summary();
    HttpResponse r = textResponse(
        200, "OK",
        fmt::format(R"({{"workerCount": {}, "activeCount": {}, "coinCount": {}, "itemCount": {}}})",
                    pool_.availableCount(), pool_.activeCount(), summary.coinCount,
                    summary.itemCount));
    r.contentType = "application/json";
    return r;
}

} // namespace coinchase::lobby
