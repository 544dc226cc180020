#include <coinchase/protocol/InboundCodec.hpp>

#include <coinchase/core/Error.hpp>
#include <coinchase/core/Logger.hpp>
#include <coinchase/protocol/WireFormat.hpp>

#include "coinchase_wire.pb.h"

#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <type_traits>
#include <variant>

namespace coinchase::protocol
{

namespace
{
game::Position fromWire(const coinchase::wire::Position &p)
{
    return game::Position{p.x(), p.y()};
}

void toWire(const game::Position &p, coinchase::wire::Position *out)
{
    out->set_x(p.x);
    out->set_y(p.y);
}

bool appendFrame(std::uint8_t type, const google::protobuf::MessageLite &msg,
                 std::vector<std::byte> &out)
{
    std::string payload;
    if (!msg.SerializeToString(&payload))
    {
        return false;
    }

    out.clear();
    out.reserve(payload.size() + payload.size() / 8 + 2);
    const std::byte tag{type};
    wire::appendEscaped(std::span<const std::byte>(&tag, 1), out);
    wire::appendEscaped(std::span<const std::byte>(
                            reinterpret_cast<const std::byte *>(payload.data()), payload.size()),
                        out);
    out.push_back(wire::kDelimiter);
    return true;
}
} // namespace

std::error_code decodeInbound(const MessageView &frame, game::InboundEvent &out)
{
    if (frame.empty())
    {
        SLOG_WARN("InboundCodec", "EmptyFrame");
        return core::Errc::ProtocolViolation;
    }

    const auto type = static_cast<std::uint8_t>(frame.data()[0]);
    const void *payload = frame.data() + 1;
    const int payloadLen = static_cast<int>(frame.size() - 1);

    switch (type)
    {
    case wire::kTypeStatus:
    {
        coinchase::wire::Status msg;
        if (!msg.ParseFromArray(payload, payloadLen))
        {
            SLOG_WARN("InboundCodec", "DecodeFailed", "type=status len={}", payloadLen);
            return core::Errc::ProtocolViolation;
        }
        out = game::StatusEvent{msg.id(), fromWire(msg.current_position())};
        return {};
    }
    case wire::kTypeAttack:
    {
        coinchase::wire::Attack msg;
        if (!msg.ParseFromArray(payload, payloadLen))
        {
            SLOG_WARN("InboundCodec", "DecodeFailed", "type=attack len={}", payloadLen);
            return core::Errc::ProtocolViolation;
        }
        out = game::AttackEvent{msg.user_id(), fromWire(msg.user_position()),
                                fromWire(msg.attack_position())};
        return {};
    }
    default:
        SLOG_WARN("InboundCodec", "UnknownType", "type={}", type);
        return core::Errc::ProtocolViolation;
    }
}

bool encodeInbound(const game::InboundEvent &event, std::vector<std::byte> &out)
{
    return std::visit(
        [&out](const auto &ev) -> bool {
            using T = std::decay_t<decltype(ev)>;
            if constexpr (std::is_same_v<T, game::StatusEvent>)
            {
                coinchase::wire::Status msg;
                msg.set_id(ev.userId);
                toWire(ev.position, msg.mutable_current_position());
                return appendFrame(wire::kTypeStatus, msg, out);
            }
            else
            {
                coinchase::wire::Attack msg;
                msg.set_user_id(ev.userId);
                toWire(ev.userPosition, msg.mutable_user_position());
                toWire(ev.attackPosition, msg.mutable_attack_position());
                return appendFrame(wire::kTypeAttack, msg, out);
            }
        },
        event);
}

} // namespace coinchase::protocol
