#pragma once

#include <coinchase/ServerConfig.hpp>
#include <coinchase/game/GameInterfaces.hpp>
#include <coinchase/game/GameTypes.hpp>
#include <coinchase/util/NonCopyable.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <random>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace coingame
{

using coinchase::game::AttackEvent;
using coinchase::game::Cell;
using coinchase::game::CellKind;
using coinchase::game::Position;
using coinchase::game::RelatedPosition;
using coinchase::game::StatusEvent;
using coinchase::game::UserStatus;

/// 정사각형 격자 위의 in-memory 게임 월드입니다.
///
/// - 시작 시 시드 기반으로 코인/아이템을 흩뿌립니다.
/// - 코인을 밟으면 +1 점, 아이템을 밟으면 시야 반경 +1.
/// - 인접 칸의 다른 유저를 공격하면 상대 점수 1점을 가져옵니다. (상대 점수가 0 이면 무효)
/// - 점수판에 등록되지 않은 유저의 이동/공격은 무시합니다.
/// - processor(쓰기)/sender(읽기) 스레드에서 동시에 호출되므로 reader/writer 락으로 보호합니다.
///
/// 엔진에는 gameState()/userStatuses()/scoreboard() 세 인터페이스로만 노출됩니다.
class GameWorld final : private coinchase::util::NonCopyable
{
  public:
    /// coin+item 이 칸 수보다 많거나 mapSize 가 2 미만이면 std::invalid_argument
    explicit GameWorld(const coinchase::GameOptions &options);

    [[nodiscard]] coinchase::game::IGameState &gameState() noexcept { return stateFacet_; }
    [[nodiscard]] coinchase::game::IUserStatuses &userStatuses() noexcept { return statusFacet_; }
    [[nodiscard]] coinchase::game::IScoreboard &scoreboard() noexcept { return scoreFacet_; }

    [[nodiscard]] coinchase::game::GameServices services() noexcept;

    // ===== 맵 =====
    void updateUserPosition(const StatusEvent &event);
    void applyAttack(const AttackEvent &event);
    [[nodiscard]] std::vector<RelatedPosition> relatedPositions(const Position &position,
                                                                std::int32_t modifier) const;
    void removeFromMap(const std::string &userId);

    [[nodiscard]] std::uint32_t coinCount() const;
    [[nodiscard]] std::uint32_t itemCount() const;
    [[nodiscard]] std::int32_t mapSize() const noexcept { return size_; }

    /// 테스트용. 범위 밖이면 nullopt.
    [[nodiscard]] std::optional<Cell> cellAt(const Position &position) const;
    /// 테스트용. 빈 칸에 코인/아이템을 놓습니다. 이미 무언가 있으면 false.
    bool placeAt(const Position &position, CellKind kind);

    // ===== 유저 상태 =====
    [[nodiscard]] std::optional<UserStatus> userStatus(const std::string &userId) const;
    void removeStatus(const std::string &userId);

    // ===== 점수판 =====
    [[nodiscard]] std::map<std::string, std::int32_t> copiedBoard() const;
    void registerUser(const std::string &userId);
    void removeScore(const std::string &userId);

  private:
    class StateFacet final : public coinchase::game::IGameState
    {
      public:
        explicit StateFacet(GameWorld &w) : w_(w) {}
        void updateUserPosition(const StatusEvent &event) override { w_.updateUserPosition(event); }
        void applyAttack(const AttackEvent &event) override { w_.applyAttack(event); }
        [[nodiscard]] std::vector<RelatedPosition>
        getRelatedPositions(const Position &position, std::int32_t modifier) const override
        {
            return w_.relatedPositions(position, modifier);
        }
        void removeUser(const std::string &userId) override { w_.removeFromMap(userId); }
        [[nodiscard]] Summary summary() const override
        {
            return Summary{w_.coinCount(), w_.itemCount()};
        }

      private:
        GameWorld &w_;
    };

    class StatusFacet final : public coinchase::game::IUserStatuses
    {
      public:
        explicit StatusFacet(GameWorld &w) : w_(w) {}
        [[nodiscard]] std::optional<UserStatus> getUserStatus(const std::string &userId) const override
        {
            return w_.userStatus(userId);
        }
        void removeUser(const std::string &userId) override { w_.removeStatus(userId); }

      private:
        GameWorld &w_;
    };

    class ScoreFacet final : public coinchase::game::IScoreboard
    {
      public:
        explicit ScoreFacet(GameWorld &w) : w_(w) {}
        [[nodiscard]] std::map<std::string, std::int32_t> getCopiedBoard() const override
        {
            return w_.copiedBoard();
        }
        void registerUser(const std::string &userId) override { w_.registerUser(userId); }
        void removeUser(const std::string &userId) override { w_.removeScore(userId); }

      private:
        GameWorld &w_;
    };

    [[nodiscard]] bool inside_(const Position &p) const noexcept;
    [[nodiscard]] Position clamp_(const Position &p) const noexcept;
    [[nodiscard]] std::size_t index_(const Position &p) const noexcept;
    void scatter_(CellKind kind, std::uint32_t count, std::mt19937_64 &rng);
    void vacateLocked_(const std::string &userId);

    const std::int32_t size_;
    const std::int32_t baseVisibility_;

    mutable std::shared_mutex mu_;
    std::vector<Cell> cells_;
    std::uint32_t coins_{0};
    std::uint32_t items_{0};
    std::unordered_map<std::string, UserStatus> users_;
    std::map<std::string, std::int32_t> scores_;

    StateFacet stateFacet_{*this};
    StatusFacet statusFacet_{*this};
    ScoreFacet scoreFacet_{*this};
};

} // namespace coingame
