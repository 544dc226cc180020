#include <coingame/GameWorld.hpp>

#include <coinchase/core/Logger.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cstdlib>
#include <mutex>
#include <stdexcept>

namespace coingame
{

GameWorld::GameWorld(const coinchase::GameOptions &options)
    : size_(options.mapSize), baseVisibility_(options.baseVisibility)
{
    if (size_ < 2)
    {
        throw std::invalid_argument(fmt::format("[GameWorld] map_size too small: {}", size_));
    }
    const auto cellCount = static_cast<std::uint64_t>(size_) * static_cast<std::uint64_t>(size_);
    if (static_cast<std::uint64_t>(options.coinCount) + options.itemCount > cellCount)
    {
        throw std::invalid_argument(fmt::format(
            "[GameWorld] coins({}) + items({}) exceed cells({})", options.coinCount,
            options.itemCount, cellCount));
    }

    cells_.resize(static_cast<std::size_t>(cellCount));

    std::uint64_t seed = options.seed;
    if (seed == 0)
    {
        std::random_device rd;
        seed = (static_cast<std::uint64_t>(rd()) << 32) ^ rd();
    }
    std::mt19937_64 rng(seed);
    scatter_(CellKind::Coin, options.coinCount, rng);
    scatter_(CellKind::Item, options.itemCount, rng);

    SLOG_INFO("GameWorld", "Created", "size={} coins={} items={} visibility={} seed={}", size_,
              coins_, items_, baseVisibility_, seed);
}

coinchase::game::GameServices GameWorld::services() noexcept
{
    return coinchase::game::GameServices{&stateFacet_, &statusFacet_, &scoreFacet_};
}

bool GameWorld::inside_(const Position &p) const noexcept
{
    return p.x >= 0 && p.y >= 0 && p.x < size_ && p.y < size_;
}

Position GameWorld::clamp_(const Position &p) const noexcept
{
    return Position{std::clamp(p.x, 0, size_ - 1), std::clamp(p.y, 0, size_ - 1)};
}

std::size_t GameWorld::index_(const Position &p) const noexcept
{
    return static_cast<std::size_t>(p.y) * static_cast<std::size_t>(size_) +
           static_cast<std::size_t>(p.x);
}

void GameWorld::scatter_(CellKind kind, std::uint32_t count, std::mt19937_64 &rng)
{
    std::uniform_int_distribution<std::int32_t> dist(0, size_ - 1);
    std::uint32_t placed = 0;
    while (placed < count)
    {
        Cell &cell = cells_[index_(Position{dist(rng), dist(rng)})];
        if (cell.kind != CellKind::Ground)
        {
            continue;
        }
        cell.kind = kind;
        ++placed;
    }

    if (kind == CellKind::Coin)
    {
        coins_ += placed;
    }
    else
    {
        items_ += placed;
    }
}

void GameWorld::vacateLocked_(const std::string &userId)
{
    const auto it = users_.find(userId);
    if (it == users_.end())
    {
        return;
    }
    Cell &old = cells_[index_(it->second.position)];
    if (old.occupied && old.owner == userId)
    {
        old.occupied = false;
        old.owner.clear();
    }
}

void GameWorld::updateUserPosition(const StatusEvent &event)
{
    const Position pos = clamp_(event.position);

    std::unique_lock lk(mu_);
    if (scores_.count(event.userId) == 0)
    {
        SLOG_DEBUG("GameWorld", "UnregisteredMove", "user={}", event.userId);
        return;
    }
    vacateLocked_(event.userId);

    UserStatus &status = users_[event.userId];
    status.position = pos;

    Cell &cell = cells_[index_(pos)];
    switch (cell.kind)
    {
    case CellKind::Coin:
        scores_[event.userId] += 1;
        --coins_;
        break;
    case CellKind::Item:
        status.itemEffect += 1;
        --items_;
        break;
    case CellKind::Ground:
        break;
    }
    cell.kind = CellKind::Ground;
    cell.occupied = true;
    cell.owner = event.userId;
}

void GameWorld::applyAttack(const AttackEvent &event)
{
    if (!inside_(event.attackPosition))
    {
        return;
    }

    std::unique_lock lk(mu_);
    if (scores_.count(event.userId) == 0)
    {
        SLOG_DEBUG("GameWorld", "UnregisteredAttack", "user={}", event.userId);
        return;
    }
    const auto attacker = users_.find(event.userId);
    const Position from =
        attacker != users_.end() ? attacker->second.position : clamp_(event.userPosition);

    const bool adjacent = std::abs(from.x - event.attackPosition.x) <= 1 &&
                          std::abs(from.y - event.attackPosition.y) <= 1 &&
                          !(from == event.attackPosition);
    if (!adjacent)
    {
        return;
    }

    const Cell &target = cells_[index_(event.attackPosition)];
    if (!target.occupied || target.owner == event.userId)
    {
        return;
    }

    const auto victim = scores_.find(target.owner);
    if (victim == scores_.end() || victim->second <= 0)
    {
        return;
    }
    victim->second -= 1;
    scores_[event.userId] += 1;
    SLOG_DEBUG("GameWorld", "Hit", "attacker={} victim={}", event.userId, target.owner);
}

std::vector<RelatedPosition> GameWorld::relatedPositions(const Position &position,
                                                         std::int32_t modifier) const
{
    const std::int32_t radius = std::max(0, baseVisibility_ + modifier);
    const Position center = clamp_(position);
    const std::int32_t x0 = std::max(0, center.x - radius);
    const std::int32_t x1 = std::min(size_ - 1, center.x + radius);
    const std::int32_t y0 = std::max(0, center.y - radius);
    const std::int32_t y1 = std::min(size_ - 1, center.y + radius);

    std::vector<RelatedPosition> out;
    std::shared_lock lk(mu_);
    for (std::int32_t y = y0; y <= y1; ++y)
    {
        for (std::int32_t x = x0; x <= x1; ++x)
        {
            const Position p{x, y};
            const Cell &cell = cells_[index_(p)];
            if (cell.occupied || cell.kind != CellKind::Ground)
            {
                out.push_back(RelatedPosition{cell, p});
            }
        }
    }
    return out;
}

void GameWorld::removeFromMap(const std::string &userId)
{
    std::unique_lock lk(mu_);
    vacateLocked_(userId);
}

std::uint32_t GameWorld::coinCount() const
{
    std::shared_lock lk(mu_);
    return coins_;
}

std::uint32_t GameWorld::itemCount() const
{
    std::shared_lock lk(mu_);
    return items_;
}

std::optional<Cell> GameWorld::cellAt(const Position &position) const
{
    if (!inside_(position))
    {
        return std::nullopt;
    }
    std::shared_lock lk(mu_);
    return cells_[index_(position)];
}

bool GameWorld::placeAt(const Position &position, CellKind kind)
{
    if (!inside_(position) || kind == CellKind::Ground)
    {
        return false;
    }
    std::unique_lock lk(mu_);
    Cell &cell = cells_[index_(position)];
    if (cell.kind != CellKind::Ground || cell.occupied)
    {
        return false;
    }
    cell.kind = kind;
    if (kind == CellKind::Coin)
    {
        ++coins_;
    }
    else
    {
        ++items_;
    }
    return true;
}

std::optional<UserStatus> GameWorld::userStatus(const std::string &userId) const
{
    std::shared_lock lk(mu_);
    const auto it = users_.find(userId);
    if (it == users_.end())
    {
        return std::nullopt;
    }
    return it->second;
}

void GameWorld::removeStatus(const std::string &userId)
{
    std::unique_lock lk(mu_);
    vacateLocked_(userId);
    users_.erase(userId);
}

std::map<std::string, std::int32_t> GameWorld::copiedBoard() const
{
    std::shared_lock lk(mu_);
    return scores_;
}

void GameWorld::registerUser(const std::string &userId)
{
    std::unique_lock lk(mu_);
    scores_[userId] = 0;
}

void GameWorld::removeScore(const std::string &userId)
{
    std::unique_lock lk(mu_);
    scores_.erase(userId);
}

} // namespace coingame
