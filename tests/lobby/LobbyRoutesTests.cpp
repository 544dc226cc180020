#include <coinchase/lobby/LobbyHttpServer.hpp>
#include <coinchase/lobby/LobbyRoutes.hpp>
#include <coinchase/pool/WorkerPool.hpp>
#include <coinchase/session/WorkerStatus.hpp>

#include "support/SessionHarness.hpp"

#include <chrono>
#include <iostream>
#include <string>
#include <thread>

using coinchase::lobby::HttpRequest;
using coinchase::lobby::HttpResponse;
using coinchase::lobby::LobbyRoutes;
using coinchase::pool::SlotLease;
using coinchase::pool::WorkerPool;

namespace {

HttpResponse get(LobbyRoutes &routes, const std::string &target) {
    return routes.handle(HttpRequest{"GET", target, "127.0.0.1"});
}

bool expect(const HttpResponse &r, int code, const std::string &body, const char *tag) {
    if (r.code != code || (!body.empty() && r.body != body)) {
        std::cerr << "[" << tag << "] code=" << r.code << " body='" << r.body << "' expected "
                  << code << " '" << body << "'\n";
        return false;
    }
    return true;
}

bool test_login_and_disconnect() {
    testsupport::Harness h;
    WorkerPool pool(2, "127.0.0.1", 0, h.env);
    pool.start();
    LobbyRoutes routes(pool, h.env.services);

    const auto r = get(routes, "/get-worker-port/alice/7300");
    if (!expect(r, 200, "", "login")) {
        return false;
    }

    SlotLease lease;
    if (pool.getByUserId("alice", lease) || r.body != std::to_string(lease.slot->port())) {
        std::cerr << "[login] returned port does not match the owning slot\n";
        return false;
    }
    if (lease.slot->status() != coinchase::session::WorkerStatus::Working ||
        lease.slot->clientAddress().port != 7300 || lease.slot->clientAddress().ip != "127.0.0.1") {
        std::cerr << "[login] slot not WORKING with the declared client address\n";
        return false;
    }
    if (h.world.copiedBoard().count("alice") != 1) {
        std::cerr << "[login] user not on the scoreboard\n";
        return false;
    }
    if (!testsupport::waitUntil([&] { return h.link.dials.load() == 1; })) {
        std::cerr << "[login] sender did not dial back\n";
        return false;
    }

    // 같은 유저의 두 번째 로그인은 거절되고 슬롯은 풀로 돌아간다
    if (!expect(get(routes, "/get-worker-port/alice/7301"), 409, "user already connected",
                "duplicate")) {
        return false;
    }
    if (pool.availableCount() != 1) {
        std::cerr << "[duplicate] rejected login leaked a slot\n";
        return false;
    }

    const auto d = routes.handle(HttpRequest{"PATCH", "/disconnect/alice", "127.0.0.1"});
    if (!expect(d, 200, "worker successfully returned to pool", "disconnect")) {
        return false;
    }
    if (pool.availableCount() != 2 || h.world.copiedBoard().count("alice") != 0) {
        std::cerr << "[disconnect] slot or scoreboard not cleaned up\n";
        return false;
    }
    return expect(routes.handle(HttpRequest{"PATCH", "/disconnect/alice", "127.0.0.1"}), 404,
                  "worker not found", "disconnect_again");
}

bool test_queued_events_after_disconnect() {
    testsupport::Harness h;
    WorkerPool pool(2, "127.0.0.1", 0, h.env);
    pool.start();
    LobbyRoutes routes(pool, h.env.services);

    if (!expect(get(routes, "/get-worker-port/gina/7310"), 200, "", "login")) {
        return false;
    }
    h.world.registerUser("marker");

    if (!expect(routes.handle(HttpRequest{"PATCH", "/disconnect/gina", "127.0.0.1"}), 200, "",
                "disconnect")) {
        return false;
    }

    // 로그아웃 전에 큐에 들어간 이벤트를 다른 processor 가 늦게 꺼내는 경우
    h.events.push(coinchase::game::StatusEvent{"gina", {6, 6}});
    h.events.push(coinchase::game::StatusEvent{"marker", {1, 1}});
    if (!testsupport::waitUntil([&] { return h.world.userStatus("marker").has_value(); })) {
        std::cerr << "[stale_event] processors did not drain the queue\n";
        return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    if (h.world.userStatus("gina") || h.world.cellAt({6, 6})->occupied ||
        h.world.copiedBoard().count("gina") != 0) {
        std::cerr << "[stale_event] disconnected user reappeared in the world\n";
        return false;
    }
    return true;
}

bool test_capacity_and_validation() {
    testsupport::Harness h;
    WorkerPool pool(1, "127.0.0.1", 0, h.env);
    pool.start();
    LobbyRoutes routes(pool, h.env.services);

    if (!expect(get(routes, "/get-worker-port/bad%20id/7000"), 400, "client information invalid",
                "bad_user") ||
        !expect(get(routes, "/get-worker-port/bob/70000"), 400, "client information invalid",
                "bad_port") ||
        !expect(get(routes, "/get-worker-port/bob/abc"), 400, "client information invalid",
                "nan_port") ||
        !expect(routes.handle(HttpRequest{"GET", "/get-worker-port/bob/7000", "not-an-ip"}), 400,
                "client information invalid", "bad_peer")) {
        return false;
    }
    if (pool.availableCount() != 1) {
        std::cerr << "[validation] invalid request consumed a slot\n";
        return false;
    }

    if (!expect(get(routes, "/get-worker-port/bob/7000"), 200, "", "first") ||
        !expect(get(routes, "/get-worker-port/carol/7001"), 409, "worker currently not available",
                "full")) {
        return false;
    }
    return true;
}

bool test_state_metrics_and_unknown_routes() {
    coinchase::GameOptions g = testsupport::smallGame();
    g.coinCount = 3;
    g.itemCount = 2;
    testsupport::Harness h(testsupport::fastTuning(), g);
    WorkerPool pool(2, "127.0.0.1", 0, h.env);
    pool.start();
    LobbyRoutes routes(pool, h.env.services);

    SlotLease lease;
    if (pool.pull(lease)) {
        return false;
    }

    const auto s = get(routes, "/server-state");
    if (!expect(s, 200,
                R"({"workerCount": 1, "activeCount": 1, "coinCount": 3, "itemCount": 2})",
                "state") ||
        s.contentType != "application/json") {
        return false;
    }

    const auto m = get(routes, "/metrics");
    if (m.code != 200 || m.body.find("coinchase_active_sessions") == std::string::npos) {
        std::cerr << "[metrics] exposition missing\n";
        return false;
    }

    return expect(get(routes, "/disconnect/alice"), 405, "", "wrong_method") &&
           expect(routes.handle(HttpRequest{"POST", "/server-state", "127.0.0.1"}), 405, "",
                  "post_state") &&
           expect(get(routes, "/nope"), 404, "not found", "unknown");
}

bool test_http_server_roundtrip() {
    testsupport::Harness h;
    WorkerPool pool(1, "127.0.0.1", 0, h.env);
    pool.start();
    LobbyRoutes routes(pool, h.env.services);

    coinchase::lobby::LobbyHttpServer server("127.0.0.1", 0, routes);
    server.start();
    if (server.boundPort() == 0) {
        std::cerr << "[http] no bound port\n";
        return false;
    }

    auto client = testsupport::connectLoopback(server.boundPort());
    const std::string req = "GET /get-worker-port/dave/7400 HTTP/1.1\r\nHost: x\r\n\r\n";
    if (!client.isValid() ||
        !testsupport::sendAll(client, std::span<const std::byte>(
                                          reinterpret_cast<const std::byte *>(req.data()),
                                          req.size()))) {
        std::cerr << "[http] request not sent\n";
        return false;
    }

    std::string resp;
    char buf[512];
    for (;;) {
        const auto n = client.recv(buf, sizeof(buf));
        if (n <= 0) {
            break;
        }
        resp.append(buf, static_cast<std::size_t>(n));
    }
    server.stopAndJoin();

    SlotLease lease;
    if (pool.getByUserId("dave", lease)) {
        std::cerr << "[http] login not applied\n";
        return false;
    }
    const std::string expectedBody = "\r\n\r\n" + std::to_string(lease.slot->port());
    if (resp.rfind("HTTP/1.1 200 OK\r\n", 0) != 0 ||
        resp.size() < expectedBody.size() ||
        resp.compare(resp.size() - expectedBody.size(), expectedBody.size(), expectedBody) != 0) {
        std::cerr << "[http] unexpected response: " << resp << "\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    bool ok = true;

    ok = ok && test_login_and_disconnect();
    ok = ok && test_queued_events_after_disconnect();
    ok = ok && test_capacity_and_validation();
    ok = ok && test_state_metrics_and_unknown_routes();
    ok = ok && test_http_server_roundtrip();

    if (!ok) {
        std::cerr << "LobbyRoutes tests FAILED\n";
        return 1;
    }

    std::cout << "LobbyRoutes tests PASSED\n";
    return 0;
}
