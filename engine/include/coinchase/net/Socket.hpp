#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include <sys/socket.h> // sockaddr, socklen_t
#include <sys/types.h>  // ssize_t
#include <sys/uio.h>    // iovec

#include <coinchase/util/NonCopyable.hpp>

namespace coinchase::net {

/// POSIX 소켓 fd 를 RAII 로 감싸는 move-only 래퍼입니다.
///
/// - 프로토콜이나 세션 상태는 모릅니다. 순수 OS 레벨 래퍼.
/// - poll 등에 넘길 때는 nativeHandle() 로 원시 fd 를 꺼냅니다.
class Socket : private coinchase::util::NonCopyable {
  public:
    using Handle = int;

    Socket() noexcept = default;
    explicit Socket(Handle fd) noexcept;
    ~Socket() noexcept;

    Socket(Socket &&other) noexcept;
    Socket &operator=(Socket &&other) noexcept;

    [[nodiscard]] bool isValid() const noexcept { return fd_ >= 0; }
    [[nodiscard]] Handle nativeHandle() const noexcept { return fd_; }

    /// TCP/IPv4 스트림 소켓 (CLOEXEC)
    [[nodiscard]] static Socket createTcpIPv4() noexcept;

    /// idempotent
    void close() noexcept;

    [[nodiscard]] bool setNonBlocking(bool enable) noexcept;
    [[nodiscard]] bool setReuseAddr(bool enable) noexcept;
    [[nodiscard]] bool setNoDelay(bool enable) noexcept;

    /// SO_KEEPALIVE 를 켜고, idleSec > 0 이면 TCP_KEEPIDLE 도 함께 설정합니다.
    [[nodiscard]] bool setKeepAlive(bool enable, int idleSec = 0) noexcept;

    [[nodiscard]] bool bind(const ::sockaddr *addr, ::socklen_t len) noexcept;

    /// IPv4 문자열 주소/포트로 bind 합니다. (예: "0.0.0.0", 9000)
    [[nodiscard]] bool bind(const std::string &ip, std::uint16_t port) noexcept;

    [[nodiscard]] bool listen(int backlog) noexcept;

    /// 실패 시 isValid()==false 인 Socket. 성공 시 NONBLOCK|CLOEXEC 로 받습니다.
    [[nodiscard]] Socket accept(::sockaddr *addr, ::socklen_t *len) noexcept;
    [[nodiscard]] Socket accept() noexcept;

    /// connect(2) thin 래퍼. 논블로킹 소켓이면 EINPROGRESS 로 false 가 나올 수 있습니다.
    [[nodiscard]] bool connect(const ::sockaddr *addr, ::socklen_t len) noexcept;

    /// SO_ERROR 를 읽어 돌려줍니다. getsockopt 자체가 실패하면 그 errno.
    [[nodiscard]] int pendingError() const noexcept;

    /// send(2)/recv(2)/readv(2) thin 래퍼. 실패 시 -1 + errno.
    [[nodiscard]] ::ssize_t send(const void *data, std::size_t len, int flags = 0) noexcept;
    [[nodiscard]] ::ssize_t recv(void *buffer, std::size_t len, int flags = 0) noexcept;
    [[nodiscard]] ::ssize_t readv(const ::iovec *iov, int iovcnt) noexcept;

  private:
    Handle fd_{-1};
};

/// "a.b.c.d" + port 를 sockaddr_in 으로 변환합니다. 주소 형식이 틀리면 false.
[[nodiscard]] bool makeIPv4Address(const std::string &ip, std::uint16_t port,
                                   ::sockaddr_storage &out, ::socklen_t &outLen) noexcept;

} // namespace coinchase::net
