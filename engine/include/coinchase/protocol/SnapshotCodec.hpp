#pragma once

#include <coinchase/game/GameInterfaces.hpp>
#include <coinchase/game/GameTypes.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace coinchase::protocol
{

/// 한 tick 동안만 쓰이는 유저별 outbound 스냅샷
struct Snapshot
{
    game::Position userPosition;
    std::vector<game::RelatedPosition> relatedPositions;
    std::map<std::string, std::int32_t> scoreboard;
};

/// userId 의 현재 상태로 스냅샷을 만듭니다. 상태가 없으면 nullopt (이번 tick 은 건너뜀).
[[nodiscard]] std::optional<Snapshot> buildSnapshot(const game::GameServices &services,
                                                    const std::string &userId);

/// 직렬화 + escape + '$' 부착 + 블록 압축. 실패 시 false.
[[nodiscard]] bool encodeSnapshotFrame(const Snapshot &snapshot, std::vector<std::byte> &out);

/// encodeSnapshotFrame 의 역. 구분자 누락/잘못된 escape/파싱 실패 시 false.
[[nodiscard]] bool decodeSnapshotFrame(std::span<const std::byte> compressed, Snapshot &out);

} // namespace coinchase::protocol
