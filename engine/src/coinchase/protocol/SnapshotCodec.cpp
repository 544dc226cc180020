#include <coinchase/protocol/SnapshotCodec.hpp>

#include <coinchase/core/Logger.hpp>
#include <coinchase/protocol/BlockCompressor.hpp>
#include <coinchase/protocol/WireFormat.hpp>

#include "coinchase_wire.pb.h"

namespace coinchase::protocol
{

std::optional<Snapshot> buildSnapshot(const game::GameServices &services, const std::string &userId)
{
    const auto status = services.userStatuses->getUserStatus(userId);
    if (!status)
    {
        return std::nullopt;
    }

    Snapshot snap;
    snap.userPosition = status->position;
    snap.relatedPositions =
        services.gameState->getRelatedPositions(status->position, status->itemEffect);
    snap.scoreboard = services.scoreboard->getCopiedBoard();
    return snap;
}

bool encodeSnapshotFrame(const Snapshot &snapshot, std::vector<std::byte> &out)
{
    coinchase::wire::RelatedPositions msg;
    msg.mutable_user_position()->set_x(snapshot.userPosition.x);
    msg.mutable_user_position()->set_y(snapshot.userPosition.y);

    for (const auto &rp : snapshot.relatedPositions)
    {
        auto *item = msg.add_related_positions();
        auto *cell = item->mutable_cell();
        cell->set_occupied(rp.cell.occupied);
        cell->set_owner(rp.cell.owner);
        cell->set_kind(static_cast<std::int32_t>(rp.cell.kind));
        item->mutable_position()->set_x(rp.position.x);
        item->mutable_position()->set_y(rp.position.y);
    }

    auto &board = *msg.mutable_scoreboard();
    for (const auto &[user, score] : snapshot.scoreboard)
    {
        board[user] = score;
    }

    std::string raw;
    if (!msg.SerializeToString(&raw))
    {
        SLOG_ERROR("SnapshotCodec", "SerializeFailed", "related={}", snapshot.relatedPositions.size());
        return false;
    }
    std::vector<std::byte> framed;
    framed.reserve(raw.size() + raw.size() / 8 + 1);
    wire::appendEscaped(
        std::span<const std::byte>(reinterpret_cast<const std::byte *>(raw.data()), raw.size()),
        framed);
    framed.push_back(wire::kDelimiter);

    return compressBlock(framed, out);
}

bool decodeSnapshotFrame(std::span<const std::byte> compressed, Snapshot &out)
{
    std::vector<std::byte> raw;
    if (!decompressBlock(compressed, raw))
    {
        return false;
    }
    if (raw.empty() || raw.back() != wire::kDelimiter)
    {
        return false;
    }
    raw.pop_back();
    if (!wire::unescapeInPlace(raw))
    {
        return false;
    }

    coinchase::wire::RelatedPositions msg;
    if (!msg.ParseFromArray(raw.data(), static_cast<int>(raw.size())))
    {
        return false;
    }

    out = Snapshot{};
    out.userPosition = game::Position{msg.user_position().x(), msg.user_position().y()};
    out.relatedPositions.reserve(static_cast<std::size_t>(msg.related_positions_size()));
    for (const auto &item : msg.related_positions())
    {
        game::RelatedPosition rp;
        rp.cell.occupied = item.cell().occupied();
        rp.cell.owner = item.cell().owner();
        rp.cell.kind = static_cast<game::CellKind>(item.cell().kind());
        rp.position = game::Position{item.position().x(), item.position().y()};
        out.relatedPositions.push_back(std::move(rp));
    }
    for (const auto &kv : msg.scoreboard())
    {
        out.scoreboard.emplace(kv.first, kv.second);
    }
    return true;
}

} // namespace coinchase::protocol
