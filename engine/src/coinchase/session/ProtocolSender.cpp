#include <coinchase/session/ProtocolSender.hpp>

#include <coinchase/core/Error.hpp>
#include <coinchase/core/Logger.hpp>
#include <coinchase/core/ThreadContext.hpp>
#include <coinchase/monitoring/Metrics.hpp>
#include <coinchase/protocol/SnapshotCodec.hpp>
#include <coinchase/session/BroadcastClock.hpp>

#include <chrono>
#include <exception>
#include <utility>
#include <vector>

namespace coinchase::session
{

ProtocolSender::ProtocolSender(int slotId, std::string userId, game::ClientAddress address,
                               SessionContext &context, const SessionEnvironment &env)
    : slotId_(slotId), userId_(std::move(userId)), address_(std::move(address)), ctx_(context),
      env_(env), budget_(env.tuning.faultTolerance)
{
}

void ProtocolSender::run()
{
    core::ThreadContext::setSessionTask('s', slotId_);

    const DialRequest request{address_, std::chrono::milliseconds(env_.tuning.dialTimeoutMs),
                              ctx_.termination().wakeFd()};

    std::error_code ec;
    std::unique_ptr<IOutboundLink> link = env_.dialer(request, ec);
    if (!link)
    {
        if (ec == core::Errc::Cancelled)
        {
            SLOG_DEBUG("ProtocolSender", "DialCancelled", "slot={} user={}", slotId_, userId_);
            return;
        }
        monitoring::serverMetrics().onDialFailure();
        SLOG_WARN("ProtocolSender", "DialFailed", "slot={} user={} client={}:{} err={}", slotId_,
                  userId_, address_.ip, address_.port, ec ? ec.message() : "no link");
        (void)ctx_.termination().fire(TerminationReason::MutualTermination);
        return;
    }

    SLOG_INFO("ProtocolSender", "Start", "slot={} user={} client={}:{}", slotId_, userId_,
              address_.ip, address_.port);

    try
    {
        ec = sendLoop_(*link);
    }
    catch (const std::exception &e)
    {
        SLOG_ERROR("ProtocolSender", "Exception", "slot={} user={} what='{}'", slotId_, userId_,
                   e.what());
        ec = core::Errc::FatalIo;
    }

    if (!ec || ec == core::Errc::Cancelled)
    {
        SLOG_DEBUG("ProtocolSender", "Stop", "slot={} user={} budget={}", slotId_, userId_,
                   budget_);
        return;
    }

    SLOG_WARN("ProtocolSender", "SessionFailed", "slot={} user={} err={}", slotId_, userId_,
              ec.message());
    (void)ctx_.termination().fire(TerminationReason::MutualTermination);
}

std::error_code ProtocolSender::sendLoop_(IOutboundLink &link)
{
    const auto slice = std::chrono::milliseconds(env_.tuning.pollSliceMs);
    std::uint64_t lastTick = env_.clock->generation();
    std::vector<std::byte> frame;

    for (;;)
    {
        if (ctx_.termination().fired())
        {
            return core::Errc::Cancelled;
        }
        if (ctx_.stopSendRequested())
        {
            return {};
        }

        const auto tick = env_.clock->waitNextTick(lastTick, slice);
        if (!tick)
        {
            continue;
        }
        lastTick = *tick;

        if (!sendOneTick_(link, frame))
        {
            if (budget_ == 0)
            {
                deregisterOnce_();
                return core::Errc::FatalIo;
            }
        }
    }
}

bool ProtocolSender::sendOneTick_(IOutboundLink &link, std::vector<std::byte> &frame)
{
    const auto snapshot = protocol::buildSnapshot(env_.services, userId_);
    if (!snapshot)
    {
        return true; // 아직 위치 보고 전
    }

    if (!protocol::encodeSnapshotFrame(*snapshot, frame))
    {
        SLOG_ERROR("ProtocolSender", "EncodeFailed", "slot={} user={}", slotId_, userId_);
        --budget_;
        return false;
    }

    if (!link.write(frame))
    {
        monitoring::serverMetrics().onWriteFailure();
        if (link.broken())
        {
            // 스트림이 끊겼으면 남은 budget 을 기다리지 않는다
            SLOG_WARN("ProtocolSender", "LinkBroken", "slot={} user={}", slotId_, userId_);
            budget_ = 0;
            return false;
        }
        --budget_;
        SLOG_DEBUG("ProtocolSender", "WriteFailed", "slot={} user={} budget={}", slotId_, userId_,
                   budget_);
        return false;
    }

    monitoring::serverMetrics().onOutboundSnapshot();
    budget_ = env_.tuning.faultTolerance;
    return true;
}

void ProtocolSender::deregisterOnce_()
{
    if (deregistered_)
    {
        return;
    }
    deregistered_ = true;

    SLOG_WARN("ProtocolSender", "FaultBudgetExhausted", "slot={} user={} tolerance={}", slotId_,
              userId_, env_.tuning.faultTolerance);
    env_.services.deregister(userId_);
}

} // namespace coinchase::session
