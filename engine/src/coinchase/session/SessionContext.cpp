#include <coinchase/session/SessionContext.hpp>

#include <coinchase/core/Logger.hpp>

#include <system_error>

namespace coinchase::session
{

SessionContext::SessionContext(std::uint64_t generation) : generation_(generation) {}

SessionContext::~SessionContext()
{
    cancel(TerminationReason::Shutdown);
    join();
}

bool SessionContext::startReceiver(std::function<void()> body)
{
    return spawn_(receiverThread_, "receiver", std::move(body));
}

bool SessionContext::startProcessor(std::function<void()> body)
{
    return spawn_(processorThread_, "processor", std::move(body));
}

bool SessionContext::startSender(std::function<void()> body)
{
    return spawn_(senderThread_, "sender", std::move(body));
}

bool SessionContext::spawn_(std::thread &th, const char *role, std::function<void()> body)
{
    std::scoped_lock lk(threadsMu_);
    if (th.joinable())
    {
        SLOG_ERROR("SessionContext", "AlreadyStarted", "role={} gen={}", role, generation_);
        return false;
    }

    try
    {
        th = std::thread(std::move(body));
    }
    catch (const std::system_error &e)
    {
        SLOG_ERROR("SessionContext", "SpawnFailed", "role={} gen={} what='{}'", role, generation_,
                   e.what());
        return false;
    }
    return true;
}

void SessionContext::cancel(TerminationReason reason) noexcept
{
    requestStopSend();
    (void)termination_.fire(reason);
}

void SessionContext::join() noexcept
{
    std::scoped_lock lk(threadsMu_);
    for (std::thread *th : {&receiverThread_, &processorThread_, &senderThread_})
    {
        if (th->joinable())
        {
            th->join();
        }
    }
}

} // namespace coinchase::session
