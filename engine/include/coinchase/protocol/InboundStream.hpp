#pragma once

#include <coinchase/buffer/RingBuffer.hpp>
#include <coinchase/game/GameTypes.hpp>
#include <coinchase/protocol/DelimiterFramer.hpp>

#include <cstddef>
#include <functional>
#include <span>
#include <system_error>

namespace coinchase::protocol
{

/// 세션 하나의 수신 누적 버퍼 + 프레이머 + 디코더 묶음입니다.
///
/// - 읽은 바이트를 buffer() 로 직접 받거나(feed 없이 readv) feed() 로 밀어 넣습니다.
/// - drain() 은 완성된 프레임을 순서대로 디코드해 sink 로 넘깁니다.
/// - 위반이 나오면 그 시점에서 멈추고 ProtocolViolation 을 반환합니다.
///   이미 sink 로 넘어간 앞 프레임들은 그대로 유효합니다. 위반 프레임은 부분 디코드되지 않습니다.
class InboundStream
{
  public:
    using Sink = std::function<void(game::InboundEvent &&)>;

    explicit InboundStream(std::size_t maxFrameLen = wire::kDefaultChunkSize);

    /// readv 용. drain 후에는 항상 maxFrameLen 이상의 빈 공간이 남습니다.
    [[nodiscard]] buffer::RingBuffer &buffer() noexcept { return ring_; }

    [[nodiscard]] std::error_code drain(const Sink &sink);

    /// bytes 를 전부 밀어 넣으면서 중간중간 drain 합니다.
    [[nodiscard]] std::error_code feed(std::span<const std::byte> bytes, const Sink &sink);

    [[nodiscard]] std::size_t pendingBytes() const noexcept { return ring_.size(); }
    [[nodiscard]] std::size_t framesDecoded() const noexcept { return framesDecoded_; }

    void reset() noexcept { ring_.clear(); }

  private:
    DelimiterFramer framer_;
    buffer::RingBuffer ring_;
    std::size_t framesDecoded_{0};
};

} // namespace coinchase::protocol
