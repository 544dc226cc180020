#include <coinchase/core/Error.hpp>
#include <coinchase/net/Acceptor.hpp>
#include <coinchase/net/TcpOutboundLink.hpp>

#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <poll.h>
#include <string>
#include <vector>

using namespace std::chrono_literals;
using coinchase::core::Errc;
using coinchase::net::Acceptor;
using coinchase::net::Socket;
using coinchase::session::DialRequest;

namespace {

Socket acceptWithin(Acceptor &acceptor, int timeoutMs) {
    pollfd p{};
    p.fd = acceptor.nativeHandle();
    p.events = POLLIN;
    if (::poll(&p, 1, timeoutMs) != 1) {
        return Socket{};
    }
    return acceptor.acceptOne();
}

bool test_idle_acceptor_does_not_block() {
    Acceptor acceptor("127.0.0.1", 0);
    if (acceptor.listenPort() == 0) {
        std::cerr << "[acceptor] ephemeral port not resolved\n";
        return false;
    }

    Socket none = acceptor.acceptOne();
    if (none.isValid() || (errno != EAGAIN && errno != EWOULDBLOCK)) {
        std::cerr << "[acceptor] expected EAGAIN with nothing pending, errno=" << errno << "\n";
        return false;
    }
    return true;
}

bool test_dial_and_write() {
    Acceptor acceptor("127.0.0.1", 0);

    std::error_code ec;
    auto link = coinchase::net::TcpOutboundLink::dial(
        DialRequest{{"127.0.0.1", acceptor.listenPort()}, 500ms, -1}, ec);
    if (!link || ec) {
        std::cerr << "[dial] loopback dial failed: " << ec.message() << "\n";
        return false;
    }

    Socket peer = acceptWithin(acceptor, 1000);
    if (!peer.isValid()) {
        std::cerr << "[dial] listener never saw the connection\n";
        return false;
    }

    const std::string payload = "snapshot-bytes";
    if (!link->write({reinterpret_cast<const std::byte *>(payload.data()), payload.size()})) {
        std::cerr << "[dial] write failed\n";
        return false;
    }

    std::string got;
    const auto deadline = std::chrono::steady_clock::now() + 1s;
    while (got.size() < payload.size() && std::chrono::steady_clock::now() < deadline) {
        pollfd p{};
        p.fd = peer.nativeHandle();
        p.events = POLLIN;
        if (::poll(&p, 1, 100) != 1) {
            continue;
        }
        char buf[64];
        const auto n = peer.recv(buf, sizeof(buf));
        if (n <= 0) {
            break;
        }
        got.append(buf, static_cast<std::size_t>(n));
    }
    if (got != payload) {
        std::cerr << "[dial] peer received '" << got << "'\n";
        return false;
    }
    return true;
}

bool test_partial_write_closes_link() {
    Acceptor acceptor("127.0.0.1", 0);

    std::error_code ec;
    auto link = coinchase::net::TcpOutboundLink::dial(
        DialRequest{{"127.0.0.1", acceptor.listenPort()}, 500ms, -1}, ec, 200ms);
    if (!link || ec) {
        std::cerr << "[partial] loopback dial failed: " << ec.message() << "\n";
        return false;
    }

    // peer 는 받기만 하고 읽지 않는다. 소켓 버퍼보다 큰 프레임은 일부만 나간다.
    Socket peer = acceptWithin(acceptor, 1000);
    if (!peer.isValid()) {
        std::cerr << "[partial] listener never saw the connection\n";
        return false;
    }

    const std::vector<std::byte> big(32u * 1024u * 1024u, std::byte{0x41});
    if (link->write(big)) {
        std::cerr << "[partial] 32MB write to a stalled peer should time out\n";
        return false;
    }
    if (!link->broken()) {
        std::cerr << "[partial] link should be closed after a partial frame\n";
        return false;
    }

    const std::string small = "next-tick";
    if (link->write({reinterpret_cast<const std::byte *>(small.data()), small.size()})) {
        std::cerr << "[partial] write after a partial frame must fail\n";
        return false;
    }
    return true;
}

bool test_dial_failures() {
    std::error_code ec;
    if (coinchase::net::TcpOutboundLink::dial(DialRequest{{"not.an.ip", 7000}, 100ms, -1}, ec) ||
        ec != Errc::FatalIo) {
        std::cerr << "[dial_fail] malformed address should be FatalIo\n";
        return false;
    }

    // 방금 닫은 포트로 dial: 연결 거부
    std::uint16_t closedPort = 0;
    {
        Acceptor tmp("127.0.0.1", 0);
        closedPort = tmp.listenPort();
    }
    auto dialer = coinchase::net::makeTcpDialer();
    if (dialer(DialRequest{{"127.0.0.1", closedPort}, 500ms, -1}, ec) || ec != Errc::FatalIo) {
        std::cerr << "[dial_fail] refused connection should be FatalIo, got " << ec.message()
                  << "\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    bool ok = true;

    ok = ok && test_idle_acceptor_does_not_block();
    ok = ok && test_dial_and_write();
    ok = ok && test_partial_write_closes_link();
    ok = ok && test_dial_failures();

    if (!ok) {
        std::cerr << "OutboundLink tests FAILED\n";
        return 1;
    }

    std::cout << "OutboundLink tests PASSED\n";
    return 0;
}
