#include <coinchase/session/SessionSlot.hpp>

#include <coinchase/core/Error.hpp>
#include <coinchase/core/Logger.hpp>
#include <coinchase/session/EventProcessor.hpp>
#include <coinchase/session/ProtocolReceiver.hpp>
#include <coinchase/session/ProtocolSender.hpp>

#include <system_error>
#include <utility>

namespace coinchase::session
{

SessionSlot::SessionSlot(int id, std::unique_ptr<net::Acceptor> listener,
                         const SessionEnvironment &env, IOwnerIndex &owners)
    : id_(id), listener_(std::move(listener)), port_(listener_->listenPort()), env_(env),
      owners_(owners)
{
}

SessionSlot::~SessionSlot()
{
    shutdown();
}

WorkerStatus SessionSlot::status() const
{
    std::scoped_lock lk(mu_);
    return status_;
}

std::string SessionSlot::ownerUserId() const
{
    std::scoped_lock lk(mu_);
    return ownerUserId_;
}

game::ClientAddress SessionSlot::clientAddress() const
{
    std::scoped_lock lk(mu_);
    return clientAddress_;
}

std::error_code SessionSlot::setClientInformation(const std::string &userId,
                                                  const std::string &ip, std::uint16_t port)
{
    std::scoped_lock lk(mu_);
    if (status_ != WorkerStatus::PulledOut)
    {
        SLOG_WARN("SessionSlot", "InvalidState", "slot={} op=setClientInformation status={}", id_,
                  toString(status_));
        forceExitLocked();
        return core::Errc::InvalidState;
    }
    if (userId.empty())
    {
        return core::Errc::InvalidState;
    }
    if (!owners_.claimOwner(userId, id_))
    {
        SLOG_WARN("SessionSlot", "DuplicateOwner", "slot={} user={}", id_, userId);
        return core::Errc::DuplicateOwner;
    }

    ownerUserId_ = userId;
    clientAddress_ = game::ClientAddress{ip, port};
    status_ = WorkerStatus::InfoReceived;
    SLOG_INFO("SessionSlot", "InfoReceived", "slot={} user={} client={}:{}", id_, userId, ip,
              port);
    return {};
}

std::error_code SessionSlot::startSendUserRelatedDataToClient()
{
    std::scoped_lock lk(mu_);
    if (status_ != WorkerStatus::InfoReceived || !env_.dialer || !context_)
    {
        SLOG_WARN("SessionSlot", "InvalidState",
                  "slot={} op=startSend status={} dialer={} session={}", id_, toString(status_),
                  static_cast<bool>(env_.dialer), static_cast<bool>(context_));
        forceExitLocked();
        return core::Errc::InvalidState;
    }

    status_ = WorkerStatus::Working;

    SessionContext *ctx = context_.get();
    auto body = [this, ctx, userId = ownerUserId_, address = clientAddress_] {
        ProtocolSender sender(id_, userId, address, *ctx, env_);
        sender.run();
    };
    if (!ctx->startSender(std::move(body)))
    {
        (void)ctx->termination().fire(TerminationReason::MutualTermination);
        return core::Errc::FatalIo;
    }
    return {};
}

void SessionSlot::forceExit() noexcept
{
    std::scoped_lock lk(mu_);
    forceExitLocked();
}

void SessionSlot::forceExitLocked() noexcept
{
    if (context_)
    {
        context_->processorSignals().forceExit.store(true, std::memory_order_release);
    }
}

bool SessionSlot::sessionAlive() const
{
    std::scoped_lock lk(mu_);
    return context_ && !context_->termination().fired();
}

std::optional<ProbeTicket> SessionSlot::beginProbe()
{
    std::shared_ptr<SessionContext> ctx;
    {
        std::scoped_lock lk(mu_);
        ctx = context_;
    }
    if (!ctx)
    {
        return std::nullopt;
    }

    ProbeTicket ticket;
    ticket.receiverSeq = ctx->receiverProbe().ping();
    ticket.processorSeq = ctx->processorProbe().ping();
    ticket.context = std::move(ctx);
    return ticket;
}

bool SessionSlot::awaitProbe(const ProbeTicket &ticket,
                             std::chrono::steady_clock::time_point deadline)
{
    if (!ticket.context)
    {
        return false;
    }
    const bool receiverOk = ticket.context->receiverProbe().awaitEcho(ticket.receiverSeq, deadline);
    const bool processorOk =
        ticket.context->processorProbe().awaitEcho(ticket.processorSeq, deadline);
    return receiverOk && processorOk;
}

bool SessionSlot::probeLiveness(std::chrono::milliseconds timeout)
{
    const auto ticket = beginProbe();
    if (!ticket)
    {
        return false;
    }
    return awaitProbe(*ticket, std::chrono::steady_clock::now() + timeout);
}

void SessionSlot::markTerminated(std::uint64_t generation) noexcept
{
    std::scoped_lock lk(mu_);
    if (!context_ || context_->generation() != generation || !isInUse(status_))
    {
        return;
    }
    status_ = WorkerStatus::Terminated;
    SLOG_INFO("SessionSlot", "Terminated", "slot={} user={} gen={} reason={}", id_, ownerUserId_,
              generation, toString(context_->termination().reason()));
}

void SessionSlot::markPulledOutLocked()
{
    status_ = WorkerStatus::PulledOut;
}

std::shared_ptr<SessionContext> SessionSlot::detachSessionLocked(TerminationReason reason)
{
    std::shared_ptr<SessionContext> ctx = std::move(context_);
    context_.reset();
    if (ctx)
    {
        ctx->cancel(reason);
    }
    return ctx;
}

std::string SessionSlot::resetToAvailableLocked()
{
    std::string owner = std::move(ownerUserId_);
    ownerUserId_.clear();
    if (!owner.empty())
    {
        owners_.releaseOwner(owner, id_);
    }
    clientAddress_ = game::ClientAddress{};
    status_ = WorkerStatus::Available;
    return owner;
}

bool SessionSlot::armLocked()
{
    if (context_)
    {
        SLOG_ERROR("SessionSlot", "AlreadyArmed", "slot={} gen={}", id_, context_->generation());
        return false;
    }

    drainStaleConnections_();

    std::shared_ptr<SessionContext> ctx;
    try
    {
        ctx = std::make_shared<SessionContext>(++generation_);
    }
    catch (const std::system_error &e)
    {
        SLOG_ERROR("SessionSlot", "ArmFailed", "slot={} what='{}'", id_, e.what());
        return false;
    }

    SessionContext *raw = ctx.get();
    const bool receiverStarted = raw->startReceiver([this, raw] {
        ProtocolReceiver receiver(id_, *listener_, *raw, env_);
        receiver.run();
    });
    // processor 는 receiver 뒤에 띄운다. 실패 경로의 join 이 슬롯 락을 다시 잡지 않게 하기 위함.
    const bool processorStarted = receiverStarted && raw->startProcessor([this, raw] {
        EventProcessor processor(*this, *raw, env_);
        processor.run();
    });

    if (!processorStarted)
    {
        raw->cancel(TerminationReason::Shutdown);
        raw->join();
        SLOG_ERROR("SessionSlot", "ArmFailed", "slot={} gen={}", id_, raw->generation());
        return false;
    }

    context_ = std::move(ctx);
    SLOG_DEBUG("SessionSlot", "Armed", "slot={} port={} gen={}", id_, port_, generation_);
    return true;
}

void SessionSlot::shutdown()
{
    std::shared_ptr<SessionContext> ctx;
    {
        std::scoped_lock lk(mu_);
        ctx = detachSessionLocked(TerminationReason::Shutdown);
    }
    if (ctx)
    {
        ctx->join();
    }
}

void SessionSlot::drainStaleConnections_() noexcept
{
    // 이전 세션이 끝난 뒤 도착한 연결은 새 세션의 client 가 아니다
    int dropped = 0;
    for (;;)
    {
        net::Socket stale = listener_->acceptOne();
        if (!stale.isValid())
        {
            break;
        }
        ++dropped;
    }
    if (dropped > 0)
    {
        SLOG_INFO("SessionSlot", "StaleAcceptDropped", "slot={} count={}", id_, dropped);
    }
}

} // namespace coinchase::session
