#pragma once

#include <coinchase/net/Socket.hpp>
#include <coinchase/session/OutboundLink.hpp>

#include <chrono>
#include <memory>
#include <system_error>

namespace coinchase::net
{

/// 클라이언트가 선언한 (ip, port) 로 다시 연결한 TCP 링크입니다.
///
/// - dial: 논블로킹 connect 후 {socket POLLOUT, cancelFd} 를 poll. timeout 또는 취소 시 포기.
/// - write: 전체 전송까지 반복. 버퍼가 차면 writeTimeout 까지만 기다립니다.
///   프레임 일부만 나간 뒤 실패하거나 소켓 오류가 나면 소켓을 닫고 broken 이 됩니다.
///   (잘린 압축 블록 뒤에 다음 프레임을 이어 붙이면 client 스트림이 복구되지 않음)
class TcpOutboundLink final : public session::IOutboundLink
{
  public:
    static constexpr std::chrono::milliseconds kDefaultWriteTimeout{2000};

    [[nodiscard]] static std::unique_ptr<TcpOutboundLink>
    dial(const session::DialRequest &request, std::error_code &ec,
         std::chrono::milliseconds writeTimeout = kDefaultWriteTimeout);

    TcpOutboundLink(Socket sock, int cancelFd, std::chrono::milliseconds writeTimeout) noexcept;

    [[nodiscard]] bool write(std::span<const std::byte> frame) override;
    [[nodiscard]] bool broken() const noexcept override { return !sock_.isValid(); }

  private:
    Socket sock_;
    int cancelFd_{-1};
    std::chrono::milliseconds writeTimeout_;
};

/// SessionEnvironment 에 넣는 기본 dialer
[[nodiscard]] session::OutboundDialer makeTcpDialer(
    std::chrono::milliseconds writeTimeout = TcpOutboundLink::kDefaultWriteTimeout);

} // namespace coinchase::net
