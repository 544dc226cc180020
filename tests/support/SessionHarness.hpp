#pragma once

#include <coinchase/ServerConfig.hpp>
#include <coinchase/core/Error.hpp>
#include <coinchase/net/Socket.hpp>
#include <coinchase/session/BroadcastClock.hpp>
#include <coinchase/session/InboundEventQueue.hpp>
#include <coinchase/session/OutboundLink.hpp>
#include <coinchase/session/SessionEnvironment.hpp>
#include <coingame/GameWorld.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <span>
#include <thread>
#include <vector>

#include <sys/socket.h>

namespace testsupport {

/// 쓰기 결과를 테스트가 조절하는 가짜 outbound 링크
struct LinkControl {
    std::atomic_bool failWrites{false};
    std::atomic_bool breakLink{false}; // 실패한 쓰기가 링크를 broken 으로 만든다
    std::atomic<int> writes{0};
    std::atomic<int> failures{0};
    std::atomic<int> dials{0};
    std::atomic_bool refuseDial{false};

    std::mutex mu;
    std::vector<std::vector<std::byte>> frames;
};

class FakeLink final : public coinchase::session::IOutboundLink {
  public:
    explicit FakeLink(LinkControl &control) : control_(control) {}

    bool write(std::span<const std::byte> frame) override {
        if (broken_) {
            control_.failures.fetch_add(1);
            return false;
        }
        if (control_.failWrites.load()) {
            control_.failures.fetch_add(1);
            broken_ = control_.breakLink.load();
            return false;
        }
        {
            std::scoped_lock lk(control_.mu);
            control_.frames.emplace_back(frame.begin(), frame.end());
        }
        control_.writes.fetch_add(1);
        return true;
    }

    bool broken() const noexcept override { return broken_; }

  private:
    LinkControl &control_;
    bool broken_{false};
};

inline coinchase::session::OutboundDialer makeFakeDialer(LinkControl &control) {
    return [&control](const coinchase::session::DialRequest &,
                      std::error_code &ec) -> std::unique_ptr<coinchase::session::IOutboundLink> {
        control.dials.fetch_add(1);
        if (control.refuseDial.load()) {
            ec = coinchase::core::Errc::FatalIo;
            return nullptr;
        }
        ec.clear();
        return std::make_unique<FakeLink>(control);
    };
}

/// 테스트용으로 짧게 줄인 튜닝 값
inline coinchase::SessionTuning fastTuning() {
    coinchase::SessionTuning t;
    t.readIdleTimeoutMs = 5'000;
    t.dialTimeoutMs = 500;
    t.chunkSize = 256;
    t.faultTolerance = 3;
    t.pollSliceMs = 10;
    t.broadcastIntervalMs = 10;
    return t;
}

inline coinchase::GameOptions smallGame() {
    coinchase::GameOptions g;
    g.mapSize = 16;
    g.coinCount = 0;
    g.itemCount = 0;
    g.baseVisibility = 2;
    g.seed = 7;
    return g;
}

/// 세션 슬롯이 공유하는 의존성 한 벌 (큐/clock/게임 월드/가짜 dialer)
struct Harness {
    coinchase::session::InboundEventQueue events;
    coinchase::session::BroadcastClock clock;
    coingame::GameWorld world;
    LinkControl link;
    coinchase::session::SessionEnvironment env;

    explicit Harness(coinchase::SessionTuning tuning = fastTuning(),
                     coinchase::GameOptions game = smallGame())
        : clock(std::chrono::milliseconds(tuning.broadcastIntervalMs)), world(game) {
        env.events = &events;
        env.clock = &clock;
        env.services = world.services();
        env.tuning = tuning;
        env.dialer = makeFakeDialer(link);
    }
};

/// pred 가 참이 될 때까지 polling. timeout 이면 false.
inline bool waitUntil(const std::function<bool()> &pred,
                      std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

/// 127.0.0.1:port 로 블로킹 connect. 실패 시 invalid Socket.
inline coinchase::net::Socket connectLoopback(std::uint16_t port) {
    coinchase::net::Socket s = coinchase::net::Socket::createTcpIPv4();
    if (!s.isValid()) {
        return s;
    }
    ::sockaddr_storage ss{};
    ::socklen_t len = 0;
    if (!coinchase::net::makeIPv4Address("127.0.0.1", port, ss, len) ||
        !s.connect(reinterpret_cast<const ::sockaddr *>(&ss), len)) {
        s.close();
    }
    return s;
}

inline bool sendAll(coinchase::net::Socket &s, std::span<const std::byte> bytes) {
    std::size_t off = 0;
    while (off < bytes.size()) {
        const auto n = s.send(bytes.data() + off, bytes.size() - off, MSG_NOSIGNAL);
        if (n <= 0) {
            return false;
        }
        off += static_cast<std::size_t>(n);
    }
    return true;
}

} // namespace testsupport
