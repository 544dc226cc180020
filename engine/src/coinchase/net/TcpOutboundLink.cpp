#include <coinchase/net/TcpOutboundLink.hpp>

#include <coinchase/core/Error.hpp>
#include <coinchase/core/Logger.hpp>

#include <cerrno>
#include <cstring>
#include <poll.h>

namespace coinchase::net
{

namespace
{
#ifdef MSG_NOSIGNAL
constexpr int kSendFlags = MSG_NOSIGNAL;
#else
constexpr int kSendFlags = 0;
#endif

enum class WaitResult
{
    Ready,
    Cancelled,
    TimedOut,
    Failed,
};

// fd 가 events 로 준비되거나, cancelFd 가 readable 이 되거나, deadline 이 지날 때까지 대기
WaitResult waitFd(int fd, short events, int cancelFd,
                  std::chrono::steady_clock::time_point deadline) noexcept
{
    for (;;)
    {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline)
        {
            return WaitResult::TimedOut;
        }
        const auto left =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();

        pollfd fds[2]{};
        fds[0].fd = fd;
        fds[0].events = events;
        fds[1].fd = cancelFd; // 음수면 poll 이 무시한다
        fds[1].events = POLLIN;

        const int rc = ::poll(fds, 2, static_cast<int>(left) + 1);
        if (rc < 0)
        {
            if (errno == EINTR)
                continue;
            return WaitResult::Failed;
        }
        if (fds[1].revents & POLLIN)
        {
            return WaitResult::Cancelled;
        }
        if (fds[0].revents != 0)
        {
            return WaitResult::Ready;
        }
    }
}
} // namespace

std::unique_ptr<TcpOutboundLink> TcpOutboundLink::dial(const session::DialRequest &request,
                                                       std::error_code &ec,
                                                       std::chrono::milliseconds writeTimeout)
{
    ec.clear();

    ::sockaddr_storage ss{};
    ::socklen_t slen = 0;
    if (!makeIPv4Address(request.address.ip, request.address.port, ss, slen))
    {
        SLOG_ERROR("TcpOutboundLink", "BadAddress", "ip={} port={}", request.address.ip,
                   request.address.port);
        ec = core::Errc::FatalIo;
        return nullptr;
    }

    Socket sock = Socket::createTcpIPv4();
    if (!sock.isValid() || !sock.setNonBlocking(true))
    {
        SLOG_ERROR("TcpOutboundLink", "SocketFailed", "errno={} msg='{}'", errno,
                   std::strerror(errno));
        ec = core::Errc::FatalIo;
        return nullptr;
    }

    if (!sock.connect(reinterpret_cast<const ::sockaddr *>(&ss), slen))
    {
        if (errno != EINPROGRESS)
        {
            SLOG_WARN("TcpOutboundLink", "ConnectFailed", "ip={} port={} errno={} msg='{}'",
                      request.address.ip, request.address.port, errno, std::strerror(errno));
            ec = core::Errc::FatalIo;
            return nullptr;
        }

        const auto deadline = std::chrono::steady_clock::now() + request.timeout;
        switch (waitFd(sock.nativeHandle(), POLLOUT, request.cancelFd, deadline))
        {
        case WaitResult::Ready:
            break;
        case WaitResult::Cancelled:
            ec = core::Errc::Cancelled;
            return nullptr;
        case WaitResult::TimedOut:
            SLOG_WARN("TcpOutboundLink", "ConnectTimeout", "ip={} port={} timeout_ms={}",
                      request.address.ip, request.address.port, request.timeout.count());
            ec = core::Errc::FatalIo;
            return nullptr;
        case WaitResult::Failed:
            ec = core::Errc::FatalIo;
            return nullptr;
        }

        const int soErr = sock.pendingError();
        if (soErr != 0)
        {
            SLOG_WARN("TcpOutboundLink", "ConnectFailed", "ip={} port={} errno={} msg='{}'",
                      request.address.ip, request.address.port, soErr, std::strerror(soErr));
            ec = core::Errc::FatalIo;
            return nullptr;
        }
    }

    (void)sock.setNoDelay(true);
    SLOG_INFO("TcpOutboundLink", "Connected", "ip={} port={}", request.address.ip,
              request.address.port);
    return std::make_unique<TcpOutboundLink>(std::move(sock), request.cancelFd, writeTimeout);
}

TcpOutboundLink::TcpOutboundLink(Socket sock, int cancelFd,
                                 std::chrono::milliseconds writeTimeout) noexcept
    : sock_(std::move(sock)), cancelFd_(cancelFd), writeTimeout_(writeTimeout)
{
}

bool TcpOutboundLink::write(std::span<const std::byte> frame)
{
    if (!sock_.isValid())
    {
        return false;
    }

    const auto deadline = std::chrono::steady_clock::now() + writeTimeout_;

    std::size_t off = 0;
    while (off < frame.size())
    {
        const ::ssize_t n = sock_.send(frame.data() + off, frame.size() - off, kSendFlags);
        if (n > 0)
        {
            off += static_cast<std::size_t>(n);
            continue;
        }

        if (n < 0 && errno == EINTR)
        {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
        {
            if (waitFd(sock_.nativeHandle(), POLLOUT, cancelFd_, deadline) != WaitResult::Ready)
            {
                if (off > 0)
                {
                    SLOG_WARN("TcpOutboundLink", "PartialFrame", "sent={} total={}", off,
                              frame.size());
                    sock_.close();
                }
                return false;
            }
            continue;
        }

        SLOG_DEBUG("TcpOutboundLink", "SendFailed", "errno={} msg='{}' sent={} total={}", errno,
                   std::strerror(errno), off, frame.size());
        sock_.close();
        return false;
    }
    return true;
}

session::OutboundDialer makeTcpDialer(std::chrono::milliseconds writeTimeout)
{
    return [writeTimeout](const session::DialRequest &request,
                          std::error_code &ec) -> std::unique_ptr<session::IOutboundLink> {
        return TcpOutboundLink::dial(request, ec, writeTimeout);
    };
}

} // namespace coinchase::net
