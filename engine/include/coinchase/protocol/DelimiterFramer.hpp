#pragma once

#include <cstddef>
#include <vector>

#include <coinchase/buffer/RingBuffer.hpp>
#include <coinchase/core/Logger.hpp>
#include <coinchase/protocol/IFramer.hpp>
#include <coinchase/protocol/MessageView.hpp>
#include <coinchase/protocol/WireFormat.hpp>

namespace coinchase::protocol
{

/**
 * @brief '$'(0x24) 구분자로 프레임을 자르는 프레이머입니다.
 *
 * [Wire Format]
 * - [0]      : type tag
 * - [1..N]   : serialized payload
 * - [N+1]    : '$'
 * - type+payload 는 escape 되어 있어 본문에 '$' 가 없습니다. (wire::appendEscaped)
 *
 * [크기 정책]
 * - 구분자 앞 본문이 maxFrameLen 이상이거나,
 *   구분자 없이 maxFrameLen 바이트 이상 쌓이면 Invalid 입니다.
 * - 크기 제한은 escape 된 길이 기준입니다.
 * - 본문은 scratch 버퍼로 복사해 escape 를 푼 뒤 연속 메모리로 노출합니다. (링 wrap-around 무관)
 * - 잘못된 escape 시퀀스는 Invalid 입니다.
 */
class DelimiterFramer final : public IFramer
{
  public:
    explicit DelimiterFramer(std::size_t maxFrameLen = wire::kDefaultChunkSize)
        : maxFrameLen_(maxFrameLen)
    {
        scratch_.reserve(maxFrameLen_);
    }

    [[nodiscard]] std::size_t maxFrameLen() const noexcept { return maxFrameLen_; }
    [[nodiscard]] const char *lastErrorReason() const noexcept { return lastErrorReason_; }

    FrameResult tryFrame(buffer::RingBuffer &in, MessageView &out) override
    {
        lastErrorReason_ = nullptr;
        out = MessageView{};

        const std::size_t pos = in.find(wire::kDelimiter);
        if (pos == buffer::RingBuffer::npos)
        {
            if (in.size() >= maxFrameLen_)
            {
                lastErrorReason_ = "no_delimiter_within_max_frame";
                SLOG_WARN("DelimiterFramer", "Oversized", "pending={} max={}", in.size(),
                          maxFrameLen_);
                return FrameResult::Invalid;
            }
            return FrameResult::NeedMore;
        }

        if (pos >= maxFrameLen_)
        {
            lastErrorReason_ = "frame_exceeds_max";
            SLOG_WARN("DelimiterFramer", "Oversized", "frame_len={} max={}", pos, maxFrameLen_);
            return FrameResult::Invalid;
        }

        scratch_.resize(pos);
        if (pos > 0 && in.read(scratch_.data(), pos) != pos)
        {
            lastErrorReason_ = "ringbuffer_read_short";
            return FrameResult::Invalid;
        }
        in.discard(1); // delimiter

        if (!wire::unescapeInPlace(scratch_))
        {
            lastErrorReason_ = "bad_escape_sequence";
            SLOG_WARN("DelimiterFramer", "BadEscape", "frame_len={}", pos);
            return FrameResult::Invalid;
        }

        out = MessageView{scratch_.data(), scratch_.size()};
        return FrameResult::Framed;
    }

  private:
    std::size_t maxFrameLen_;
    std::vector<std::byte> scratch_;
    const char *lastErrorReason_{nullptr};
};

} // namespace coinchase::protocol
