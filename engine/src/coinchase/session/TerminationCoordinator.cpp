#include <coinchase/session/TerminationCoordinator.hpp>

#include <cerrno>
#include <cstdint>
#include <sys/eventfd.h>
#include <system_error>
#include <unistd.h>

namespace coinchase::session
{

std::string_view toString(TerminationReason r) noexcept
{
    switch (r)
    {
    case TerminationReason::None:
        return "none";
    case TerminationReason::MutualTermination:
        return "mutual_termination";
    case TerminationReason::ForceExit:
        return "force_exit";
    case TerminationReason::Reclaim:
        return "reclaim";
    case TerminationReason::Shutdown:
        return "shutdown";
    }
    return "unknown";
}

TerminationCoordinator::TerminationCoordinator()
{
    wakeFd_ = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wakeFd_ < 0)
    {
        throw std::system_error(errno, std::generic_category(),
                                "TerminationCoordinator: eventfd failed");
    }
}

TerminationCoordinator::~TerminationCoordinator() noexcept
{
    if (wakeFd_ >= 0)
    {
        ::close(wakeFd_);
        wakeFd_ = -1;
    }
}

bool TerminationCoordinator::fire(TerminationReason reason) noexcept
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (fired_.load(std::memory_order_relaxed))
        {
            return false;
        }
        reason_.store(reason, std::memory_order_relaxed);
        fired_.store(true, std::memory_order_release);
    }
    cv_.notify_all();

    // 아무도 read 하지 않으므로 이후로 계속 readable 상태가 유지된다.
    const std::uint64_t one = 1;
    (void)::write(wakeFd_, &one, sizeof(one));
    return true;
}

TerminationReason TerminationCoordinator::reason() const noexcept
{
    return reason_.load(std::memory_order_acquire);
}

bool TerminationCoordinator::waitFor(std::chrono::milliseconds timeout) const
{
    std::unique_lock<std::mutex> lk(mu_);
    return cv_.wait_for(lk, timeout, [this] { return fired_.load(std::memory_order_acquire); });
}

} // namespace coinchase::session
