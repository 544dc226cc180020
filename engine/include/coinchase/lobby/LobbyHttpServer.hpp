#pragma once

#include <coinchase/lobby/LobbyRoutes.hpp>
#include <coinchase/net/Socket.hpp>
#include <coinchase/util/NonCopyable.hpp>

#include <array>
#include <atomic>
#include <cstdint>
#include <string>
#include <string_view>
#include <thread>

namespace coinchase::lobby
{

/// 별도 스레드에서 동작하는 로비 HTTP/1.1 서버.
/// - 요청 1개 = 연결 1개 (Connection: close)
/// - 라우팅은 LobbyRoutes 에 위임합니다.
/// - stop() 호출 시 wakeup pipe로 즉시 poll을 깨워 안전 종료
class LobbyHttpServer final : private coinchase::util::NonCopyable
{
  public:
    LobbyHttpServer(std::string bindIp, std::uint16_t port, LobbyRoutes &routes);
    ~LobbyHttpServer() noexcept;

    /// bind/listen 후 서버 스레드 시작. 실패 시 std::system_error.
    void start();

    /// 종료 요청 + join + 리소스 정리(안전, idempotent).
    void stopAndJoin() noexcept;

    /// 실제로 bind 된 포트 (port=0 으로 시작한 경우 확인용)
    [[nodiscard]] std::uint16_t boundPort() const noexcept { return port_; }

  private:
    void threadMain_() noexcept;
    void acceptLoop_() noexcept;
    void handleClient_(net::Socket &&conn, std::string peerIp) noexcept;

    static bool parseRequestLine_(std::string_view req, std::string_view &outMethod,
                                  std::string_view &outTarget) noexcept;

    static void sendAll_(net::Socket &sock, const char *data, std::size_t len) noexcept;
    static void sendResponse_(net::Socket &sock, const HttpResponse &response) noexcept;

    void closeWakeupPipe_() noexcept;

  private:
    std::string bindIp_;
    std::uint16_t port_{0};
    LobbyRoutes &routes_;

    std::atomic_bool started_{false};
    std::atomic_bool stopRequested_{false};

    net::Socket listenSock_{};

    // poll 깨우기용 pipe
    std::array<int, 2> wakeupPipe_{-1, -1}; // [0]=read, [1]=write

    std::thread th_{};
};

} // namespace coinchase::lobby
