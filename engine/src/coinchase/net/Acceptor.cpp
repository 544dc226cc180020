#include <coinchase/net/Acceptor.hpp>

#include <coinchase/core/Logger.hpp>

#include <arpa/inet.h>
#include <cerrno>
#include <netinet/in.h>
#include <sys/socket.h>
#include <system_error>
#include <utility>

namespace coinchase::net
{

namespace
{
[[noreturn]] void throwSysError(const char *what)
{
    throw std::system_error(errno, std::generic_category(), what);
}
} // namespace

Acceptor::Acceptor(std::string listenAddress, std::uint16_t listenPort, int backlog)
    : listenAddress_(std::move(listenAddress)), listenPort_(listenPort)
{
    listenSocket_ = Socket::createTcpIPv4();
    if (!listenSocket_.isValid())
    {
        throwSysError("Acceptor: socket(AF_INET, SOCK_STREAM) failed");
    }

    if (!listenSocket_.setReuseAddr(true))
    {
        throwSysError("Acceptor: setsockopt(SO_REUSEADDR) failed");
    }

    if (!listenSocket_.bind(listenAddress_, listenPort_))
    {
        throwSysError("Acceptor: bind() failed");
    }

    refreshBoundPort();

    if (!listenSocket_.listen(backlog))
    {
        throwSysError("Acceptor: listen() failed");
    }

    if (!listenSocket_.setNonBlocking(true))
    {
        throwSysError("Acceptor: fcntl(O_NONBLOCK) failed");
    }

    SLOG_DEBUG("Acceptor", "Listening", "addr={} port={} backlog={}", listenAddress_, listenPort_,
               backlog);
}

Socket Acceptor::acceptOne(PeerEndpoint *outPeer) noexcept
{
    if (!listenSocket_.isValid())
    {
        errno = EBADF;
        return Socket{};
    }

    ::sockaddr_storage ss{};
    ::socklen_t slen = sizeof(ss);

    Socket client = listenSocket_.accept(reinterpret_cast<::sockaddr *>(&ss), &slen);
    if (!client.isValid())
    {
        return Socket{};
    }

    if (outPeer)
    {
        fillPeerEndpoint(reinterpret_cast<::sockaddr *>(&ss), *outPeer);
    }
    return client;
}

void Acceptor::refreshBoundPort() noexcept
{
    ::sockaddr_in addr{};
    ::socklen_t len = sizeof(addr);
    if (::getsockname(listenSocket_.nativeHandle(), reinterpret_cast<::sockaddr *>(&addr), &len) ==
        -1)
    {
        return;
    }

    if (addr.sin_family == AF_INET)
    {
        listenPort_ = ntohs(addr.sin_port);
    }
}

void fillPeerEndpoint(const ::sockaddr *sa, PeerEndpoint &out) noexcept
{
    out.ip = "unknown";
    out.port = 0;

    if (!sa)
    {
        return;
    }

    char buf[INET6_ADDRSTRLEN] = {};

    if (sa->sa_family == AF_INET)
    {
        const auto *in = reinterpret_cast<const ::sockaddr_in *>(sa);
        if (::inet_ntop(AF_INET, &in->sin_addr, buf, sizeof(buf)) != nullptr)
        {
            out.ip = buf;
        }
        out.port = ntohs(in->sin_port);
        return;
    }

    if (sa->sa_family == AF_INET6)
    {
        const auto *in6 = reinterpret_cast<const ::sockaddr_in6 *>(sa);
        if (::inet_ntop(AF_INET6, &in6->sin6_addr, buf, sizeof(buf)) != nullptr)
        {
            out.ip = buf;
        }
        out.port = ntohs(in6->sin6_port);
    }
}

} // namespace coinchase::net
