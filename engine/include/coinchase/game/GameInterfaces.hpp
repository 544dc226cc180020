#pragma once

#include <coinchase/game/GameTypes.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace coinchase::game
{

/// 공유 게임 상태 (맵/코인/아이템/점유)
///
/// 스레딩 규약:
/// - processor 스레드들(쓰기)과 sender 스레드들(읽기)이 동시에 호출합니다.
/// - 동시성 제어는 구현체 책임입니다.
/// - 공유 큐에는 이미 로그아웃한 유저의 이벤트가 남아 있을 수 있습니다.
///   scoreboard 에 등록되지 않은 유저의 이벤트는 무시해야 합니다.
class IGameState
{
  public:
    struct Summary
    {
        std::uint32_t coinCount{0};
        std::uint32_t itemCount{0};
    };

    virtual ~IGameState() = default;

    virtual void updateUserPosition(const StatusEvent &event) = 0;
    virtual void applyAttack(const AttackEvent &event) = 0;

    /// position 주변 시야(기본 반경 + modifier) 안의 비어 있지 않은 칸들
    [[nodiscard]] virtual std::vector<RelatedPosition>
    getRelatedPositions(const Position &position, std::int32_t visibilityModifier) const = 0;

    virtual void removeUser(const std::string &userId) = 0;

    [[nodiscard]] virtual Summary summary() const = 0;
};

class IUserStatuses
{
  public:
    virtual ~IUserStatuses() = default;

    [[nodiscard]] virtual std::optional<UserStatus> getUserStatus(const std::string &userId) const = 0;
    virtual void removeUser(const std::string &userId) = 0;
};

class IScoreboard
{
  public:
    virtual ~IScoreboard() = default;

    /// 호출 시점 스냅샷 복사본 (userId -> score)
    [[nodiscard]] virtual std::map<std::string, std::int32_t> getCopiedBoard() const = 0;

    /// 로그인 시 score 0 으로 등록 (이미 있으면 0 으로 리셋)
    virtual void registerUser(const std::string &userId) = 0;
    virtual void removeUser(const std::string &userId) = 0;
};

/// 세션 엔진이 사용하는 외부 협력자 묶음 (소유권 없음)
struct GameServices
{
    IGameState *gameState{nullptr};
    IUserStatuses *userStatuses{nullptr};
    IScoreboard *scoreboard{nullptr};

    [[nodiscard]] bool complete() const noexcept
    {
        return gameState && userStatuses && scoreboard;
    }

    /// 세 협력자 모두에서 userId 를 제거합니다.
    /// 등록 해제(scoreboard)가 먼저여야 늦게 도착한 이벤트가 유저를 되살리지 못합니다.
    void deregister(const std::string &userId) const
    {
        scoreboard->removeUser(userId);
        gameState->removeUser(userId);
        userStatuses->removeUser(userId);
    }
};

} // namespace coinchase::game
