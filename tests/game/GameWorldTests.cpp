#include <coingame/GameWorld.hpp>

#include <climits>
#include <iostream>
#include <stdexcept>

using coinchase::GameOptions;
using coinchase::game::AttackEvent;
using coinchase::game::CellKind;
using coinchase::game::Position;
using coinchase::game::StatusEvent;
using coingame::GameWorld;

namespace {

GameOptions blank(std::int32_t size = 10) {
    GameOptions g;
    g.mapSize = size;
    g.coinCount = 0;
    g.itemCount = 0;
    g.baseVisibility = 1;
    g.seed = 3;
    return g;
}

bool test_scatter_counts() {
    GameOptions g = blank(8);
    g.coinCount = 20;
    g.itemCount = 10;
    GameWorld world(g);

    if (world.coinCount() != 20 || world.itemCount() != 10) {
        std::cerr << "[scatter] coins=" << world.coinCount() << " items=" << world.itemCount()
                  << "\n";
        return false;
    }

    std::uint32_t coins = 0;
    std::uint32_t items = 0;
    for (int y = 0; y < 8; ++y) {
        for (int x = 0; x < 8; ++x) {
            const auto cell = world.cellAt(Position{x, y});
            coins += cell->kind == CellKind::Coin ? 1 : 0;
            items += cell->kind == CellKind::Item ? 1 : 0;
        }
    }
    if (coins != 20 || items != 10) {
        std::cerr << "[scatter] map holds coins=" << coins << " items=" << items << "\n";
        return false;
    }
    return !world.cellAt(Position{8, 0}) && !world.cellAt(Position{-1, 3});
}

bool test_invalid_options_throw() {
    GameOptions g = blank(2);
    g.coinCount = 5;
    try {
        GameWorld world(g);
        std::cerr << "[options] overfull map accepted\n";
        return false;
    } catch (const std::invalid_argument &) {
    }

    try {
        GameWorld world(blank(1));
        std::cerr << "[options] 1x1 map accepted\n";
        return false;
    } catch (const std::invalid_argument &) {
    }
    return true;
}

bool test_pickups_and_movement() {
    GameWorld world(blank());
    world.registerUser("alice");
    (void)world.placeAt(Position{2, 2}, CellKind::Coin);
    (void)world.placeAt(Position{3, 2}, CellKind::Item);

    world.updateUserPosition(StatusEvent{"alice", Position{2, 2}});
    world.updateUserPosition(StatusEvent{"alice", Position{3, 2}});

    const auto status = world.userStatus("alice");
    if (!status || status->itemEffect != 1 || world.copiedBoard().at("alice") != 1) {
        std::cerr << "[pickup] score/effect not applied\n";
        return false;
    }
    if (world.coinCount() != 0 || world.itemCount() != 0) {
        std::cerr << "[pickup] picked cells not cleared\n";
        return false;
    }

    // 이전 칸은 비고 새 칸만 점유
    if (world.cellAt(Position{2, 2})->occupied || !world.cellAt(Position{3, 2})->occupied) {
        std::cerr << "[pickup] occupancy not moved\n";
        return false;
    }

    // 범위 밖 좌표는 가장자리로 잘린다
    world.updateUserPosition(StatusEvent{"alice", Position{99, -4}});
    return world.userStatus("alice")->position == Position{9, 0};
}

bool test_attack_rules() {
    GameWorld world(blank());
    world.registerUser("att");
    world.registerUser("vic");
    (void)world.placeAt(Position{5, 5}, CellKind::Coin);

    world.updateUserPosition(StatusEvent{"vic", Position{5, 5}}); // vic 1점
    world.updateUserPosition(StatusEvent{"att", Position{2, 2}});

    // 인접하지 않으면 무효
    world.applyAttack(AttackEvent{"att", Position{2, 2}, Position{5, 5}});
    if (world.copiedBoard().at("vic") != 1) {
        std::cerr << "[attack] distant attack landed\n";
        return false;
    }

    world.updateUserPosition(StatusEvent{"att", Position{4, 4}});
    world.applyAttack(AttackEvent{"att", Position{4, 4}, Position{5, 5}});
    auto board = world.copiedBoard();
    if (board.at("vic") != 0 || board.at("att") != 1) {
        std::cerr << "[attack] adjacent attack did not transfer a point\n";
        return false;
    }

    // 점수 0 인 상대는 더 잃지 않는다
    world.applyAttack(AttackEvent{"att", Position{4, 4}, Position{5, 5}});
    board = world.copiedBoard();
    return board.at("vic") == 0 && board.at("att") == 1;
}

bool test_visibility_and_removal() {
    GameWorld world(blank());
    world.registerUser("u");
    (void)world.placeAt(Position{6, 5}, CellKind::Coin);
    (void)world.placeAt(Position{7, 5}, CellKind::Coin);
    world.updateUserPosition(StatusEvent{"u", Position{5, 5}});

    // 반경 1: 자기 칸 + (6,5)
    if (world.relatedPositions(Position{5, 5}, 0).size() != 2) {
        std::cerr << "[visibility] radius 1 mismatch\n";
        return false;
    }
    // 아이템 효과 +1 이면 (7,5) 도 보인다
    if (world.relatedPositions(Position{5, 5}, 1).size() != 3) {
        std::cerr << "[visibility] radius 2 mismatch\n";
        return false;
    }
    // 음수 보정은 0 으로 잘림
    if (world.relatedPositions(Position{5, 5}, -5).size() != 1) {
        std::cerr << "[visibility] clamped radius mismatch\n";
        return false;
    }

    world.services().deregister("u");
    if (world.userStatus("u") || world.copiedBoard().count("u") != 0 ||
        world.cellAt(Position{5, 5})->occupied) {
        std::cerr << "[removal] user left traces\n";
        return false;
    }
    return world.services().gameState->summary().coinCount == 2;
}

bool test_events_after_deregister_are_ignored() {
    GameWorld world(blank());
    world.registerUser("gone");
    world.registerUser("stay");
    world.updateUserPosition(StatusEvent{"gone", Position{1, 1}});
    world.updateUserPosition(StatusEvent{"stay", Position{2, 1}});

    world.services().deregister("gone");

    // 로그아웃 전에 큐에 들어간 이벤트가 뒤늦게 적용되는 경우
    world.updateUserPosition(StatusEvent{"gone", Position{4, 4}});
    world.applyAttack(AttackEvent{"gone", Position{4, 4}, Position{2, 1}});

    if (world.userStatus("gone") || world.copiedBoard().count("gone") != 0) {
        std::cerr << "[stale] deregistered user came back\n";
        return false;
    }
    if (world.cellAt(Position{4, 4})->occupied || world.cellAt(Position{1, 1})->occupied) {
        std::cerr << "[stale] ghost occupancy left on the map\n";
        return false;
    }
    return world.userStatus("stay") && world.cellAt(Position{2, 1})->owner == "stay";
}

bool test_attack_from_unplaced_attacker_is_clamped() {
    GameWorld world(blank());
    world.registerUser("att");
    world.registerUser("vic");
    (void)world.placeAt(Position{0, 0}, CellKind::Coin);
    world.updateUserPosition(StatusEvent{"vic", Position{0, 0}}); // vic 1점

    // 아직 위치 보고가 없는 공격자: 보고된 좌표를 격자 안으로 잘라 (0,1) 로 본다
    world.applyAttack(AttackEvent{"att", Position{INT_MIN, 1}, Position{0, 0}});
    auto board = world.copiedBoard();
    if (board.at("vic") != 0 || board.at("att") != 1) {
        std::cerr << "[clamp] attack from clamped position did not land\n";
        return false;
    }

    world.applyAttack(AttackEvent{"att", Position{INT_MAX, INT_MIN}, Position{0, 0}});
    board = world.copiedBoard();
    return board.at("vic") == 0 && board.at("att") == 1;
}

} // namespace

int main() {
    bool ok = true;

    ok = ok && test_scatter_counts();
    ok = ok && test_invalid_options_throw();
    ok = ok && test_pickups_and_movement();
    ok = ok && test_attack_rules();
    ok = ok && test_visibility_and_removal();
    ok = ok && test_events_after_deregister_are_ignored();
    ok = ok && test_attack_from_unplaced_attacker_is_clamped();

    if (!ok) {
        std::cerr << "GameWorld tests FAILED\n";
        return 1;
    }

    std::cout << "GameWorld tests PASSED\n";
    return 0;
}
