#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <coinchase/net/Socket.hpp>
#include <coinchase/util/NonCopyable.hpp>

namespace coinchase::net {

struct PeerEndpoint {
    std::string ip;
    std::uint16_t port{0};
};

/// TCP 리스닝 소켓 하나를 소유합니다. (논블로킹, poll 로 readiness 확인 후 acceptOne)
///
/// - 세션 슬롯은 생성 시 Acceptor 하나를 만들어 프로세스가 끝날 때까지 유지합니다.
///   세션이 몇 번 재활용되더라도 슬롯의 port 는 바뀌지 않습니다.
/// - listenPort 가 0 이면 커널이 고른 포트를 getsockname 으로 다시 읽어 둡니다.
class Acceptor final : private coinchase::util::NonCopyable {
  public:
    /// 실패 시 std::system_error
    Acceptor(std::string listenAddress, std::uint16_t listenPort, int backlog = 16);
    ~Acceptor() = default;

    /// 대기 중인 연결 하나를 수락합니다. 없으면 isValid()==false (errno=EAGAIN)
    [[nodiscard]] Socket acceptOne(PeerEndpoint *outPeer = nullptr) noexcept;

    void close() noexcept { listenSocket_.close(); }
    [[nodiscard]] bool isValid() const noexcept { return listenSocket_.isValid(); }

    [[nodiscard]] std::string_view listenAddress() const noexcept { return listenAddress_; }
    [[nodiscard]] std::uint16_t listenPort() const noexcept { return listenPort_; }
    [[nodiscard]] int nativeHandle() const noexcept { return listenSocket_.nativeHandle(); }

  private:
    Socket listenSocket_;
    std::string listenAddress_;
    std::uint16_t listenPort_{0};

    void refreshBoundPort() noexcept;
};

/// sockaddr(IPv4/IPv6) 에서 ip/port 를 꺼냅니다. 알 수 없는 family 면 ip="unknown".
void fillPeerEndpoint(const ::sockaddr *sa, PeerEndpoint &out) noexcept;

} // namespace coinchase::net
