#pragma once

#include <cstdint>

#include <coinchase/protocol/MessageView.hpp>

namespace coinchase::buffer {
class RingBuffer; // forward
}

namespace coinchase::protocol {

/// - NeedMore: 아직 프레임이 완성되지 않음 (입력 소비 없음)
/// - Framed:   out 에 프레임 본문을 채워 반환 (구분자까지 소비)
/// - Invalid:  프레임 규칙 위반. 세션 종료는 호출자가 결정합니다.
enum class FrameResult : std::uint8_t {
    NeedMore = 0,
    Framed = 1,
    Invalid = 2,
};

/// 바이트 스트림(RingBuffer)에서 프레임 경계를 잡는 인터페이스입니다.
/// - per-session 으로 쓰며 스레드 안전하지 않습니다.
class IFramer {
  public:
    virtual ~IFramer() = default;

    /// 입력에서 프레임을 0..1개 추출합니다. Framed 일 때만 입력을 소비합니다.
    virtual FrameResult tryFrame(buffer::RingBuffer &in, MessageView &out) = 0;
};

} // namespace coinchase::protocol
