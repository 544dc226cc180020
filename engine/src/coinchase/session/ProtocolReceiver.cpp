#include <coinchase/session/ProtocolReceiver.hpp>

#include <coinchase/core/Error.hpp>
#include <coinchase/core/Logger.hpp>
#include <coinchase/core/ThreadContext.hpp>
#include <coinchase/monitoring/Metrics.hpp>
#include <coinchase/session/InboundEventQueue.hpp>

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <poll.h>
#include <sys/uio.h>

namespace coinchase::session
{

ProtocolReceiver::ProtocolReceiver(int slotId, net::Acceptor &listener, SessionContext &context,
                                   const SessionEnvironment &env)
    : slotId_(slotId), listener_(listener), ctx_(context), env_(env),
      stream_(env.tuning.chunkSize)
{
}

void ProtocolReceiver::run()
{
    core::ThreadContext::setSessionTask('r', slotId_);
    SLOG_DEBUG("ProtocolReceiver", "Start", "slot={} port={} gen={}", slotId_,
               listener_.listenPort(), ctx_.generation());

    std::error_code ec = acceptClient_();
    if (!ec)
    {
        ec = readLoop_();
    }
    conn_.close();

    if (ec && ec != core::Errc::Cancelled)
    {
        SLOG_WARN("ProtocolReceiver", "SessionFailed", "slot={} gen={} err={} frames={}", slotId_,
                  ctx_.generation(), ec.message(), stream_.framesDecoded());
    }
    else
    {
        SLOG_DEBUG("ProtocolReceiver", "Stop", "slot={} gen={} frames={}", slotId_,
                   ctx_.generation(), stream_.framesDecoded());
    }

    ctx_.processorSignals().terminate.store(true, std::memory_order_release);
    (void)ctx_.termination().fire(TerminationReason::MutualTermination);
}

std::error_code ProtocolReceiver::acceptClient_()
{
    for (;;)
    {
        switch (waitReadable_(listener_.nativeHandle(), true))
        {
        case WaitResult::Ready:
            break;
        case WaitResult::Cancelled:
            return core::Errc::Cancelled;
        case WaitResult::Idle:
            continue; // accept 대기에는 idle deadline 이 없다
        case WaitResult::Failed:
            return core::Errc::FatalIo;
        }

        net::PeerEndpoint peer;
        conn_ = listener_.acceptOne(&peer);
        if (!conn_.isValid())
        {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR ||
                errno == ECONNABORTED)
            {
                continue;
            }
            SLOG_ERROR("ProtocolReceiver", "AcceptFailed", "slot={} errno={} msg='{}'", slotId_,
                       errno, std::strerror(errno));
            return core::Errc::FatalIo;
        }

        const int idleSec = static_cast<int>(
            std::max<std::int64_t>(1, env_.tuning.readIdleTimeoutMs / 1000));
        if (!conn_.setKeepAlive(true, idleSec) || !conn_.setNoDelay(true))
        {
            SLOG_WARN("ProtocolReceiver", "SockOptFailed", "slot={} errno={} msg='{}'", slotId_,
                      errno, std::strerror(errno));
        }

        extendIdleDeadline_();
        SLOG_INFO("ProtocolReceiver", "Accepted", "slot={} peer={}:{}", slotId_, peer.ip,
                  peer.port);
        return {};
    }
}

std::error_code ProtocolReceiver::readLoop_()
{
    bool eof = false;
    for (;;)
    {
        // EOF 이후에는 소켓을 더 보지 않고 취소/idle 만 기다린다
        switch (waitReadable_(conn_.nativeHandle(), !eof))
        {
        case WaitResult::Ready:
            break;
        case WaitResult::Cancelled:
            return core::Errc::Cancelled;
        case WaitResult::Idle:
            if (std::chrono::steady_clock::now() >= idleDeadline_)
            {
                SLOG_WARN("ProtocolReceiver", "IdleTimeout", "slot={} timeout_ms={} eof={}",
                          slotId_, env_.tuning.readIdleTimeoutMs, eof);
                return core::Errc::FatalIo;
            }
            continue;
        case WaitResult::Failed:
            return core::Errc::FatalIo;
        }

        if (auto ec = readOnce_(eof))
        {
            return ec;
        }
    }
}

ProtocolReceiver::WaitResult ProtocolReceiver::waitReadable_(int fd, bool watchFd)
{
    if (ctx_.receiverProbe().pending())
    {
        ctx_.receiverProbe().answer();
    }
    if (ctx_.termination().fired())
    {
        return WaitResult::Cancelled;
    }

    pollfd fds[2]{};
    fds[0].fd = watchFd ? fd : -1;
    fds[0].events = POLLIN;
    fds[1].fd = ctx_.termination().wakeFd();
    fds[1].events = POLLIN;

    const int rc = ::poll(fds, 2, static_cast<int>(env_.tuning.pollSliceMs));
    if (rc < 0)
    {
        if (errno == EINTR)
        {
            return WaitResult::Idle;
        }
        SLOG_ERROR("ProtocolReceiver", "PollFailed", "slot={} errno={} msg='{}'", slotId_, errno,
                   std::strerror(errno));
        return WaitResult::Failed;
    }
    if (fds[1].revents & POLLIN)
    {
        return WaitResult::Cancelled;
    }
    if (rc == 0 || fds[0].revents == 0)
    {
        return WaitResult::Idle;
    }
    return WaitResult::Ready;
}

std::error_code ProtocolReceiver::readOnce_(bool &eof)
{
    buffer::RingBuffer &ring = stream_.buffer();

    ::iovec iov[2]{};
    const int iovcnt = ring.writeIov(iov, env_.tuning.chunkSize);
    if (iovcnt == 0)
    {
        // drain 이 항상 chunk 하나 이상의 공간을 남기므로 여기 오면 프레이머 규약 위반
        SLOG_ERROR("ProtocolReceiver", "BufferFull", "slot={} pending={}", slotId_,
                   stream_.pendingBytes());
        monitoring::serverMetrics().onProtocolViolation();
        return core::Errc::ProtocolViolation;
    }

    const ::ssize_t n = conn_.readv(iov, iovcnt);
    if (n > 0)
    {
        ring.commitWrite(static_cast<std::size_t>(n));
        extendIdleDeadline_();

        auto &events = *env_.events;
        const auto ec = stream_.drain([&events](game::InboundEvent &&ev) {
            monitoring::serverMetrics().onInboundFrame();
            events.push(std::move(ev));
        });
        if (ec)
        {
            SLOG_WARN("ProtocolReceiver", "ProtocolViolation", "slot={} pending={} frames={}",
                      slotId_, stream_.pendingBytes(), stream_.framesDecoded());
            monitoring::serverMetrics().onProtocolViolation();
            return ec;
        }
        return {};
    }

    if (n == 0)
    {
        SLOG_INFO("ProtocolReceiver", "PeerClosed", "slot={} pending={}", slotId_,
                  stream_.pendingBytes());
        eof = true;
        return {};
    }

    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
    {
        return {};
    }

    SLOG_WARN("ProtocolReceiver", "ReadFailed", "slot={} errno={} msg='{}'", slotId_, errno,
              std::strerror(errno));
    return core::Errc::FatalIo;
}

void ProtocolReceiver::extendIdleDeadline_() noexcept
{
    idleDeadline_ =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(env_.tuning.readIdleTimeoutMs);
}

} // namespace coinchase::session
