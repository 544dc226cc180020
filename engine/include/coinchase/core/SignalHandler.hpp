#pragma once

#include <coinchase/util/NonCopyable.hpp>

#include <array>
#include <csignal> // std::sig_atomic_t
#include <string_view>

#include <signal.h> // sigaction, SIGINT, SIGTERM, SIGPIPE

namespace coinchase::core
{

/// SIGINT/SIGTERM 을 받아 종료 플래그만 올리는 프로세스 전역 핸들러입니다.
///
/// - 설치 실패 시 std::system_error 를 던집니다.
/// - SIGPIPE 는 무시로 바꿔 둡니다 (끊긴 클라이언트에 대한 write 가 프로세스를 죽이지 않도록).
/// - Server::run() 이 플래그를 폴링해 종료 순서를 진행합니다.
class SignalHandler : private coinchase::util::NonCopyable
{
  public:
    SignalHandler();
    ~SignalHandler() noexcept;

    SignalHandler(SignalHandler &&) = delete;
    SignalHandler &operator=(SignalHandler &&) = delete;

    [[nodiscard]] bool isStopRequested() const noexcept;

    /// 요청이 있었다면 플래그를 내리고 true. outSignal 로 마지막 신호 번호를 돌려준다.
    bool consumeStopRequest(int *outSignal = nullptr) noexcept;

    void reset() noexcept;

    [[nodiscard]] static std::string_view signalName(int signo) noexcept;

  private:
    static void handleSignal(int signo) noexcept;

    static constexpr std::array<int, 2> kSignals = {SIGINT, SIGTERM};

    std::array<struct sigaction, kSignals.size()> oldActions_{};
    struct sigaction oldPipeAction_{};
    bool installed_{false};

    void installOrThrow();
    void uninstall() noexcept;
};

} // namespace coinchase::core
