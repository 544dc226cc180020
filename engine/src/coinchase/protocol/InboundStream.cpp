#include <coinchase/protocol/InboundStream.hpp>

#include <coinchase/core/Error.hpp>
#include <coinchase/protocol/InboundCodec.hpp>

namespace coinchase::protocol
{

// 미완성 프레임은 최대 maxFrameLen-1 바이트까지 남으므로, 그 뒤에 한 chunk 를 더 받을 공간을 잡는다.
InboundStream::InboundStream(std::size_t maxFrameLen)
    : framer_(maxFrameLen), ring_(maxFrameLen * 2)
{
}

std::error_code InboundStream::drain(const Sink &sink)
{
    for (;;)
    {
        MessageView frame;
        const FrameResult r = framer_.tryFrame(ring_, frame);
        if (r == FrameResult::NeedMore)
        {
            return {};
        }
        if (r == FrameResult::Invalid)
        {
            return core::Errc::ProtocolViolation;
        }

        game::InboundEvent ev;
        if (auto ec = decodeInbound(frame, ev))
        {
            return ec;
        }

        ++framesDecoded_;
        sink(std::move(ev));
    }
}

std::error_code InboundStream::feed(std::span<const std::byte> bytes, const Sink &sink)
{
    while (!bytes.empty())
    {
        const std::size_t n = ring_.write(bytes);
        bytes = bytes.subspan(n);

        if (auto ec = drain(sink))
        {
            return ec;
        }
    }
    return {};
}

} // namespace coinchase::protocol
