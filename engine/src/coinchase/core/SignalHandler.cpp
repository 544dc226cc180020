#include <coinchase/core/SignalHandler.hpp>

#include <system_error>

#include <errno.h>

namespace coinchase::core {

namespace {

// 핸들러 안에서는 sig_atomic_t 플래그만 건드린다.
volatile std::sig_atomic_t g_stopRequested = 0;
volatile std::sig_atomic_t g_lastSignal = 0;

} // namespace

SignalHandler::SignalHandler() { installOrThrow(); }

SignalHandler::~SignalHandler() noexcept { uninstall(); }

void SignalHandler::installOrThrow() {
    if (installed_) {
        return;
    }

    // SA_RESTART 없음: poll 이 EINTR 로 깨어나 플래그를 바로 본다.
    struct sigaction sa{};
    sa.sa_handler = &SignalHandler::handleSignal;
    ::sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;

    for (std::size_t i = 0; i < kSignals.size(); ++i) {
        if (::sigaction(kSignals[i], &sa, &oldActions_[i]) != 0) {
            const int err = errno;
            for (std::size_t j = 0; j < i; ++j) {
                (void)::sigaction(kSignals[j], &oldActions_[j], nullptr);
            }
            throw std::system_error(err, std::generic_category(),
                                    "SignalHandler: sigaction failed");
        }
    }

    struct sigaction ignore{};
    ignore.sa_handler = SIG_IGN;
    ::sigemptyset(&ignore.sa_mask);
    if (::sigaction(SIGPIPE, &ignore, &oldPipeAction_) != 0) {
        const int err = errno;
        for (std::size_t i = 0; i < kSignals.size(); ++i) {
            (void)::sigaction(kSignals[i], &oldActions_[i], nullptr);
        }
        throw std::system_error(err, std::generic_category(),
                                "SignalHandler: SIGPIPE ignore failed");
    }

    installed_ = true;
}

void SignalHandler::uninstall() noexcept {
    if (!installed_) {
        return;
    }

    for (std::size_t i = 0; i < kSignals.size(); ++i) {
        (void)::sigaction(kSignals[i], &oldActions_[i], nullptr);
    }
    (void)::sigaction(SIGPIPE, &oldPipeAction_, nullptr);

    installed_ = false;
}

void SignalHandler::handleSignal(int signo) noexcept {
    g_stopRequested = 1;
    g_lastSignal = signo;
}

bool SignalHandler::isStopRequested() const noexcept { return g_stopRequested != 0; }

bool SignalHandler::consumeStopRequest(int *outSignal) noexcept {
    if (g_stopRequested == 0) {
        return false;
    }

    g_stopRequested = 0;
    const int signo = static_cast<int>(g_lastSignal);
    g_lastSignal = 0;

    if (outSignal) {
        *outSignal = signo;
    }
    return true;
}

void SignalHandler::reset() noexcept {
    g_stopRequested = 0;
    g_lastSignal = 0;
}

std::string_view SignalHandler::signalName(int signo) noexcept {
    switch (signo) {
    case SIGINT:
        return "SIGINT";
    case SIGTERM:
        return "SIGTERM";
    default:
        return "UNKNOWN";
    }
}

} // namespace coinchase::core
