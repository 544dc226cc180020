#pragma once

#include <coinchase/game/GameTypes.hpp>
#include <coinchase/session/SessionContext.hpp>
#include <coinchase/session/SessionEnvironment.hpp>
#include <coinchase/util/NonCopyable.hpp>

namespace coinchase::session
{

class SessionSlot;

/// 공유 inbound 큐를 소비해 게임 상태에 반영하는 태스크입니다.
///
/// - 어느 세션의 이벤트든 처리합니다. slot 과의 짝은 liveness/종료 용도뿐입니다.
/// - coordinator 는 보지 않고 ProcessorSignals 만 봅니다.
///   - terminate: 슬롯을 TERMINATED 로 표시하고 종료
///   - forceExit: coordinator 를 ForceExit 로 fire 한 뒤 종료
class EventProcessor : private coinchase::util::NonCopyable
{
  public:
    EventProcessor(SessionSlot &slot, SessionContext &context, const SessionEnvironment &env);

    void run();

    /// 이벤트 하나를 게임 상태에 적용합니다. (큐 없이 직접 호출 가능)
    static void apply(game::IGameState &state, const game::InboundEvent &event);

  private:
    SessionSlot &slot_;
    SessionContext &ctx_;
    const SessionEnvironment &env_;
};

} // namespace coinchase::session
