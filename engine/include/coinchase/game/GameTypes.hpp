#pragma once

#include <cstdint>
#include <string>
#include <variant>

namespace coinchase::game
{

struct Position
{
    std::int32_t x{0};
    std::int32_t y{0};

    friend bool operator==(const Position &, const Position &) = default;
};

enum class CellKind : std::int32_t
{
    Ground = 0,
    Coin = 1,
    Item = 2,
};

/// 맵 한 칸. owner 는 occupied 일 때만 의미가 있습니다.
struct Cell
{
    bool occupied{false};
    std::string owner;
    CellKind kind{CellKind::Ground};
};

struct RelatedPosition
{
    Cell cell;
    Position position;
};

/// 유저별 상태. itemEffect 는 시야 반경 보정치입니다.
struct UserStatus
{
    Position position;
    std::int32_t itemEffect{0};
};

// ===== Inbound events (프레임 1개 = 이벤트 1개) =====

struct StatusEvent
{
    std::string userId;
    Position position;
};

struct AttackEvent
{
    std::string userId;
    Position userPosition;
    Position attackPosition;
};

using InboundEvent = std::variant<StatusEvent, AttackEvent>;

/// 클라이언트가 스냅샷을 받겠다고 선언한 주소
struct ClientAddress
{
    std::string ip;
    std::uint16_t port{0};

    [[nodiscard]] bool empty() const noexcept { return ip.empty() && port == 0; }
};

} // namespace coinchase::game
