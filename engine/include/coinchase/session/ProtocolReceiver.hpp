#pragma once

#include <coinchase/net/Acceptor.hpp>
#include <coinchase/net/Socket.hpp>
#include <coinchase/protocol/InboundStream.hpp>
#include <coinchase/session/SessionContext.hpp>
#include <coinchase/session/SessionEnvironment.hpp>
#include <coinchase/util/NonCopyable.hpp>

#include <chrono>
#include <system_error>

namespace coinchase::session
{

/// 세션 하나의 inbound 태스크입니다. (슬롯 리스너에서 accept -> 프레이밍 -> 디코드 -> 공유 큐)
///
/// - 모든 대기는 {소켓, coordinator wakeFd} poll 을 pollSlice 단위로 나눠서 합니다.
///   slice 사이마다 liveness probe 에 echo 합니다.
/// - 정상 EOF 는 실패가 아닙니다. 이후에는 취소나 idle deadline 만 기다립니다.
/// - run() 이 끝나면 항상 paired processor 에 terminate 를 넘기고 coordinator 를 fire 합니다.
class ProtocolReceiver : private coinchase::util::NonCopyable
{
  public:
    ProtocolReceiver(int slotId, net::Acceptor &listener, SessionContext &context,
                     const SessionEnvironment &env);

    void run();

  private:
    enum class WaitResult
    {
        Ready,
        Cancelled,
        Idle,
        Failed,
    };

    /// 연결을 받을 때까지. 성공 시 conn_ 이 유효.
    [[nodiscard]] std::error_code acceptClient_();
    [[nodiscard]] std::error_code readLoop_();
    [[nodiscard]] WaitResult waitReadable_(int fd, bool watchFd);
    [[nodiscard]] std::error_code readOnce_(bool &eof);

    void extendIdleDeadline_() noexcept;

    const int slotId_;
    net::Acceptor &listener_;
    SessionContext &ctx_;
    const SessionEnvironment &env_;

    net::Socket conn_;
    protocol::InboundStream stream_;
    std::chrono::steady_clock::time_point idleDeadline_{};
};

} // namespace coinchase::session
