#pragma once

#include <coinchase/game/GameInterfaces.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace coinchase::pool
{
class WorkerPool;
}

namespace coinchase::lobby
{

struct HttpRequest
{
    std::string method;
    std::string target;
    /// accept 한 소켓의 상대 IP (snapshot 을 돌려보낼 주소)
    std::string peerIp;
};

struct HttpResponse
{
    int code = 200;
    std::string reason = "OK";
    std::string contentType = "text/plain; charset=utf-8";
    std::string body;
};

/// 로비 HTTP 라우팅. 소켓과 무관하게 요청 -> 응답만 계산합니다.
///
/// - GET   /get-worker-port/{userId}/{clientPort}
/// - PATCH /disconnect/{userId}
/// - GET   /server-state
/// - GET   /metrics
class LobbyRoutes
{
  public:
    LobbyRoutes(pool::WorkerPool &pool, game::GameServices services);

    [[nodiscard]] HttpResponse handle(const HttpRequest &request);

  private:
    [[nodiscard]] HttpResponse getWorkerPort_(std::string_view userId, std::string_view clientPort,
                                              const std::string &peerIp);
    [[nodiscard]] HttpResponse disconnect_(std::string_view userId);
    [[nodiscard]] HttpResponse serverState_() const;

    pool::WorkerPool &pool_;
    game::GameServices services_;
};

} // namespace coinchase::lobby
