#include <coinchase/lobby/LobbyHttpServer.hpp>

#include <coinchase/core/Logger.hpp>
#include <coinchase/core/ThreadContext.hpp>
#include <coinchase/net/Acceptor.hpp>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <exception>
#include <netinet/in.h>
#include <poll.h>
#include <string>
#include <system_error>
#include <unistd.h> // pipe, close, read, write
#include <utility>

namespace coinchase::lobby
{

namespace
{
#ifdef MSG_NOSIGNAL
constexpr int kSendFlags = MSG_NOSIGNAL;
#else
constexpr int kSendFlags = 0;
#endif

constexpr std::size_t kMaxRequestBytes = 8192;
constexpr int kReadBudgetMs = 500;

[[noreturn]] void throwErrno(const char *what)
{
    throw std::system_error(errno, std::generic_category(), what);
}
} // namespace

LobbyHttpServer::LobbyHttpServer(std::string bindIp, std::uint16_t port, LobbyRoutes &routes)
    : bindIp_(std::move(bindIp)), port_(port), routes_(routes)
{
}

LobbyHttpServer::~LobbyHttpServer() noexcept
{
    stopAndJoin();
}

void LobbyHttpServer::start()
{
    bool expected = false;
    if (!started_.compare_exchange_strong(expected, true))
    {
        return; // 이미 시작됨
    }

    stopRequested_.store(false, std::memory_order_release);

    listenSock_ = net::Socket::createTcpIPv4();
    if (!listenSock_.isValid())
    {
        started_.store(false, std::memory_order_release);
        throwErrno("[Lobby] socket");
    }
    (void)listenSock_.setReuseAddr(true);
    if (!listenSock_.setNonBlocking(true) || !listenSock_.bind(bindIp_, port_) ||
        !listenSock_.listen(64))
    {
        const int err = errno;
        listenSock_.close();
        started_.store(false, std::memory_order_release);
        SLOG_ERROR("Lobby", "ListenFailed", "addr={}:{} errno={} msg='{}'", bindIp_, port_, err,
                   std::strerror(err));
        throw std::system_error(err, std::generic_category(), "[Lobby] bind/listen");
    }

    if (port_ == 0)
    {
        ::sockaddr_in sin{};
        ::socklen_t len = sizeof(sin);
        if (::getsockname(listenSock_.nativeHandle(), reinterpret_cast<::sockaddr *>(&sin), &len) ==
            0)
        {
            port_ = ntohs(sin.sin_port);
        }
    }

    if (::pipe(wakeupPipe_.data()) != 0)
    {
        const int err = errno;
        listenSock_.close();
        started_.store(false, std::memory_order_release);
        throw std::system_error(err, std::generic_category(), "[Lobby] pipe");
    }

    th_ = std::thread([this] { threadMain_(); });
}

void LobbyHttpServer::stopAndJoin() noexcept
{
    if (started_.load(std::memory_order_acquire) &&
        !stopRequested_.exchange(true, std::memory_order_acq_rel) && wakeupPipe_[1] >= 0)
    {
        const unsigned char b = 1;
        // best-effort
        (void)::write(wakeupPipe_[1], &b, 1);
    }

    if (th_.joinable())
    {
        th_.join();
    }

    listenSock_.close();
    closeWakeupPipe_();

    started_.store(false, std::memory_order_release);
}

void LobbyHttpServer::closeWakeupPipe_() noexcept
{
    for (int &fd : wakeupPipe_)
    {
        if (fd >= 0)
        {
            ::close(fd);
            fd = -1;
        }
    }
}

void LobbyHttpServer::threadMain_() noexcept
{
    core::ThreadContext::setThreadName("lobby");
    SLOG_INFO("Lobby", "Listening", "url=http://{}:{}/", bindIp_, port_);

    pollfd fds[2]{};
    fds[0].fd = listenSock_.nativeHandle();
    fds[0].events = POLLIN;

    fds[1].fd = wakeupPipe_[0];
    fds[1].events = POLLIN;

    while (!stopRequested_.load(std::memory_order_acquire))
    {
        const int rc = ::poll(fds, 2, -1);
        if (rc < 0)
        {
            if (errno == EINTR)
                continue;

            SLOG_ERROR("Lobby", "PollFailed", "errno={} msg='{}'", errno, std::strerror(errno));
            break;
        }

        if (fds[1].revents & POLLIN)
        {
            // drain pipe
            unsigned char tmp[32];
            (void)::read(wakeupPipe_[0], tmp, sizeof(tmp));
            break;
        }

        if (fds[0].revents & POLLIN)
        {
            acceptLoop_();
        }
    }

    SLOG_INFO("Lobby", "Stopped");
}

void LobbyHttpServer::acceptLoop_() noexcept
{
    for (;;)
    {
        ::sockaddr_storage ss{};
        ::socklen_t slen = sizeof(ss);
        net::Socket conn = listenSock_.accept(reinterpret_cast<::sockaddr *>(&ss), &slen);
        if (!conn.isValid())
        {
            if (errno == EAGAIN || errno == EWOULDBLOCK)
            {
                return; // 더 없음
            }
            if (errno == EINTR || errno == ECONNABORTED)
            {
                continue;
            }

            SLOG_WARN("Lobby", "AcceptFailed", "errno={} msg='{}'", errno, std::strerror(errno));
            return;
        }

        net::PeerEndpoint peer;
        net::fillPeerEndpoint(reinterpret_cast<const ::sockaddr *>(&ss), peer);
        handleClient_(std::move(conn), std::move(peer.ip));
    }
}

bool LobbyHttpServer::parseRequestLine_(std::string_view req, std::string_view &outMethod,
                                        std::string_view &outTarget) noexcept
{
    // 첫 줄만 파싱: "GET /path HTTP/1.1"
    std::size_t eol = req.find("\r\n");
    if (eol == std::string_view::npos)
    {
        eol = req.find('\n');
        if (eol == std::string_view::npos)
            return false;
    }

    const std::string_view line = req.substr(0, eol);

    const std::size_t sp1 = line.find(' ');
    if (sp1 == std::string_view::npos)
        return false;

    const std::size_t sp2 = line.find(' ', sp1 + 1);
    if (sp2 == std::string_view::npos)
        return false;

    outMethod = line.substr(0, sp1);
    outTarget = line.substr(sp1 + 1, sp2 - (sp1 + 1));
    return !outTarget.empty() && outTarget.front() == '/';
}

void LobbyHttpServer::sendAll_(net::Socket &sock, const char *data, std::size_t len) noexcept
{
    std::size_t off = 0;
    while (off < len)
    {
        const ::ssize_t n = sock.send(data + off, len - off, kSendFlags);
        if (n > 0)
        {
            off += static_cast<std::size_t>(n);
            continue;
        }

        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR))
        {
            pollfd p{};
            p.fd = sock.nativeHandle();
            p.events = POLLOUT;
            if (::poll(&p, 1, 100) <= 0)
            {
                return;
            }
            continue;
        }

        return; // 실패/끊김
    }
}

void LobbyHttpServer::sendResponse_(net::Socket &sock, const HttpResponse &response) noexcept
{
    std::string header;
    header.reserve(256);

    header += "HTTP/1.1 ";
    header += std::to_string(response.code);
    header += " ";
    header += response.reason;
    header += "\r\n";

    header += "Content-Type: ";
    header += response.contentType;
    header += "\r\n";

    header += "Content-Length: ";
    header += std::to_string(response.body.size());
    header += "\r\n";

    header += "Connection: close\r\n\r\n";

    sendAll_(sock, header.data(), header.size());
    sendAll_(sock, response.body.data(), response.body.size());
}

void LobbyHttpServer::handleClient_(net::Socket &&conn, std::string peerIp) noexcept
{
    // 헤더 끝까지(또는 상한까지) 읽는다. 본문은 쓰지 않는다.
    std::string buf;
    buf.reserve(1024);
    const auto deadline =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(kReadBudgetMs);

    while (buf.find("\r\n\r\n") == std::string::npos && buf.size() < kMaxRequestBytes)
    {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                              deadline - std::chrono::steady_clock::now())
                              .count();
        if (left <= 0)
        {
            break;
        }

        pollfd p{};
        p.fd = conn.nativeHandle();
        p.events = POLLIN;
        const int rc = ::poll(&p, 1, static_cast<int>(left));
        if (rc < 0 && errno == EINTR)
        {
            continue;
        }
        if (rc <= 0 || !(p.revents & POLLIN))
        {
            break;
        }

        char chunk[2048];
        const ::ssize_t n = conn.recv(chunk, sizeof(chunk), 0);
        if (n <= 0)
        {
            break;
        }
        buf.append(chunk, static_cast<std::size_t>(n));
    }

    std::string_view method;
    std::string_view target;
    if (!parseRequestLine_(buf, method, target))
    {
        HttpResponse bad;
        bad.code = 400;
        bad.reason = "Bad Request";
        bad.body = "bad request\n";
        sendResponse_(conn, bad);
        return;
    }

    HttpResponse response;
    try
    {
        response = routes_.handle(HttpRequest{std::string(method), std::string(target), peerIp});
    }
    catch (const std::exception &e)
    {
        SLOG_ERROR("Lobby", "HandlerFailed", "method={} target={} what='{}'", method, target,
                   e.what());
        response = HttpResponse{};
        response.code = 500;
        response.reason = "Internal Server Error";
        response.body = "internal error";
    }

    SLOG_DEBUG("Lobby", "Request", "peer={} method={} target={} code={}", peerIp, method, target,
               response.code);
    sendResponse_(conn, response);
}

} // namespace coinchase::lobby
