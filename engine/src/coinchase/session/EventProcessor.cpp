#include <coinchase/session/EventProcessor.hpp>

#include <coinchase/core/Logger.hpp>
#include <coinchase/core/ThreadContext.hpp>
#include <coinchase/session/InboundEventQueue.hpp>
#include <coinchase/session/SessionSlot.hpp>

#include <chrono>
#include <exception>
#include <type_traits>
#include <variant>

namespace coinchase::session
{

EventProcessor::EventProcessor(SessionSlot &slot, SessionContext &context,
                               const SessionEnvironment &env)
    : slot_(slot), ctx_(context), env_(env)
{
}

void EventProcessor::apply(game::IGameState &state, const game::InboundEvent &event)
{
    std::visit(
        [&state](const auto &ev) {
            using T = std::decay_t<decltype(ev)>;
            if constexpr (std::is_same_v<T, game::StatusEvent>)
            {
                state.updateUserPosition(ev);
            }
            else
            {
                state.applyAttack(ev);
            }
        },
        event);
}

void EventProcessor::run()
{
    core::ThreadContext::setSessionTask('p', slot_.id());
    const auto gen = ctx_.generation();
    const auto slice = std::chrono::milliseconds(env_.tuning.pollSliceMs);
    ProcessorSignals &signals = ctx_.processorSignals();

    std::uint64_t applied = 0;
    for (;;)
    {
        if (signals.forceExit.exchange(false, std::memory_order_acq_rel))
        {
            SLOG_WARN("EventProcessor", "ForceExit", "slot={} gen={} applied={}", slot_.id(), gen,
                      applied);
            (void)ctx_.termination().fire(TerminationReason::ForceExit);
            slot_.markTerminated(gen);
            return;
        }
        if (signals.terminate.load(std::memory_order_acquire))
        {
            SLOG_DEBUG("EventProcessor", "Stop", "slot={} gen={} applied={}", slot_.id(), gen,
                       applied);
            slot_.markTerminated(gen);
            return;
        }

        if (ctx_.processorProbe().pending())
        {
            ctx_.processorProbe().answer();
        }

        auto event = env_.events->popFor(slice);
        if (!event)
        {
            continue;
        }

        try
        {
            apply(*env_.services.gameState, *event);
            ++applied;
        }
        catch (const std::exception &e)
        {
            SLOG_ERROR("EventProcessor", "ApplyFailed", "slot={} gen={} what='{}'", slot_.id(), gen,
                       e.what());
            (void)ctx_.termination().fire(TerminationReason::MutualTermination);
            slot_.markTerminated(gen);
            return;
        }
    }
}

} // namespace coinchase::session
