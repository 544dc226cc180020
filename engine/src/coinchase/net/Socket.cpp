#include <coinchase/net/Socket.hpp>

#include <arpa/inet.h>   // inet_pton
#include <cerrno>        // errno
#include <fcntl.h>       // fcntl, O_NONBLOCK
#include <netinet/in.h>  // sockaddr_in
#include <netinet/tcp.h> // TCP_NODELAY, TCP_KEEPIDLE
#include <unistd.h>      // close

namespace coinchase::net
{

Socket::Socket(Handle fd) noexcept : fd_(fd) {}

Socket::~Socket() noexcept
{
    close();
}

Socket::Socket(Socket &&other) noexcept : fd_(other.fd_)
{
    other.fd_ = -1;
}

Socket &Socket::operator=(Socket &&other) noexcept
{
    if (this != &other)
    {
        close();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

Socket Socket::createTcpIPv4() noexcept
{
    const int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0)
    {
        return Socket{};
    }
    return Socket{fd};
}

void Socket::close() noexcept
{
    if (fd_ >= 0)
    {
        ::close(fd_);
        fd_ = -1;
    }
}

bool Socket::setNonBlocking(bool enable) noexcept
{
    if (!isValid())
    {
        errno = EBADF;
        return false;
    }

    const int flags = ::fcntl(fd_, F_GETFL, 0);
    if (flags == -1)
    {
        return false;
    }

    const int newFlags = enable ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    return ::fcntl(fd_, F_SETFL, newFlags) != -1;
}

bool Socket::setReuseAddr(bool enable) noexcept
{
    if (!isValid())
    {
        errno = EBADF;
        return false;
    }

    const int opt = enable ? 1 : 0;
    return ::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) != -1;
}

bool Socket::setNoDelay(bool enable) noexcept
{
    if (!isValid())
    {
        errno = EBADF;
        return false;
    }

    const int opt = enable ? 1 : 0;
    return ::setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt)) != -1;
}

bool Socket::setKeepAlive(bool enable, int idleSec) noexcept
{
    if (!isValid())
    {
        errno = EBADF;
        return false;
    }

    const int opt = enable ? 1 : 0;
    if (::setsockopt(fd_, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt)) == -1)
    {
        return false;
    }

#ifdef TCP_KEEPIDLE
    if (enable && idleSec > 0)
    {
        if (::setsockopt(fd_, IPPROTO_TCP, TCP_KEEPIDLE, &idleSec, sizeof(idleSec)) == -1)
        {
            return false;
        }
    }
#else
    (void)idleSec;
#endif
    return true;
}

bool Socket::bind(const ::sockaddr *addr, ::socklen_t len) noexcept
{
    if (!isValid())
    {
        errno = EBADF;
        return false;
    }
    return ::bind(fd_, addr, len) != -1;
}

bool Socket::bind(const std::string &ip, std::uint16_t port) noexcept
{
    ::sockaddr_storage ss{};
    ::socklen_t len = 0;
    if (!makeIPv4Address(ip, port, ss, len))
    {
        errno = EINVAL;
        return false;
    }
    return bind(reinterpret_cast<const ::sockaddr *>(&ss), len);
}

bool Socket::listen(int backlog) noexcept
{
    if (!isValid())
    {
        errno = EBADF;
        return false;
    }
    return ::listen(fd_, backlog) != -1;
}

Socket Socket::accept(::sockaddr *addr, ::socklen_t *len) noexcept
{
    if (!isValid())
    {
        errno = EBADF;
        return Socket{};
    }

    const int newFd = ::accept4(fd_, addr, len, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (newFd < 0)
    {
        return Socket{};
    }
    return Socket{newFd};
}

Socket Socket::accept() noexcept
{
    return accept(nullptr, nullptr);
}

bool Socket::connect(const ::sockaddr *addr, ::socklen_t len) noexcept
{
    if (!isValid())
    {
        errno = EBADF;
        return false;
    }
    return ::connect(fd_, addr, len) != -1;
}

int Socket::pendingError() const noexcept
{
    if (!isValid())
    {
        return EBADF;
    }

    int err = 0;
    ::socklen_t len = sizeof(err);
    if (::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &err, &len) == -1)
    {
        return errno;
    }
    return err;
}

::ssize_t Socket::send(const void *data, std::size_t len, int flags) noexcept
{
    if (!isValid())
    {
        errno = EBADF;
        return -1;
    }
    return ::send(fd_, data, len, flags);
}

::ssize_t Socket::recv(void *buffer, std::size_t len, int flags) noexcept
{
    if (!isValid())
    {
        errno = EBADF;
        return -1;
    }
    return ::recv(fd_, buffer, len, flags);
}

::ssize_t Socket::readv(const ::iovec *iov, int iovcnt) noexcept
{
    if (!isValid())
    {
        errno = EBADF;
        return -1;
    }
    return ::readv(fd_, iov, iovcnt);
}

bool makeIPv4Address(const std::string &ip, std::uint16_t port, ::sockaddr_storage &out,
                     ::socklen_t &outLen) noexcept
{
    ::sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);

    // inet_pton 은 성공 시 1
    if (::inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1)
    {
        return false;
    }

    out = ::sockaddr_storage{};
    *reinterpret_cast<::sockaddr_in *>(&out) = addr;
    outLen = sizeof(addr);
    return true;
}

} // namespace coinchase::net
