#pragma once

#include <coinchase/ServerConfig.hpp>
#include <coinchase/game/GameInterfaces.hpp>
#include <coinchase/session/OutboundLink.hpp>

namespace coinchase::session
{

class InboundEventQueue;
class BroadcastClock;

/// 모든 세션 슬롯이 공유하는 의존성 묶음 (소유권 없음, Server 가 수명 관리)
struct SessionEnvironment
{
    InboundEventQueue *events{nullptr};
    BroadcastClock *clock{nullptr};
    game::GameServices services{};
    SessionTuning tuning{};

    /// 비어 있으면 startSend 가 InvalidState 로 거절됩니다.
    OutboundDialer dialer{};
};

} // namespace coinchase::session
