#include <coinchase/session/InboundEventQueue.hpp>

namespace coinchase::session
{

void InboundEventQueue::push(game::InboundEvent &&event)
{
    {
        std::scoped_lock lk(mu_);
        q_.push_back(std::move(event));
    }
    cv_.notify_one();
}

std::optional<game::InboundEvent> InboundEventQueue::popFor(std::chrono::milliseconds timeout)
{
    std::unique_lock lk(mu_);
    if (!cv_.wait_for(lk, timeout, [&] { return !q_.empty(); }))
    {
        return std::nullopt;
    }

    game::InboundEvent ev = std::move(q_.front());
    q_.pop_front();
    return ev;
}

std::size_t InboundEventQueue::size() const
{
    std::scoped_lock lk(mu_);
    return q_.size();
}

} // namespace coinchase::session
