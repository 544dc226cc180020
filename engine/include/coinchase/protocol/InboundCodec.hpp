#pragma once

#include <coinchase/game/GameTypes.hpp>
#include <coinchase/protocol/MessageView.hpp>

#include <string>
#include <system_error>
#include <vector>

namespace coinchase::protocol
{

/// 프레임 하나(escape 가 풀린 type + payload)를 InboundEvent 로 디코드합니다.
///
/// - 빈 프레임, 알 수 없는 type tag, protobuf 파싱 실패는 Errc::ProtocolViolation.
/// - 성공 시 out 을 채우고 빈 error_code.
[[nodiscard]] std::error_code decodeInbound(const MessageView &frame, game::InboundEvent &out);

/// 이벤트를 와이어 프레임(escape([type][payload]) + '$')으로 인코드합니다. 클라이언트/테스트 측 경로.
/// - protobuf 직렬화 실패 시 false.
[[nodiscard]] bool encodeInbound(const game::InboundEvent &event, std::vector<std::byte> &out);

} // namespace coinchase::protocol
