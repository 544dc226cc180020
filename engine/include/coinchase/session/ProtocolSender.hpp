#pragma once

#include <coinchase/game/GameTypes.hpp>
#include <coinchase/session/OutboundLink.hpp>
#include <coinchase/session/SessionContext.hpp>
#include <coinchase/session/SessionEnvironment.hpp>
#include <coinchase/util/NonCopyable.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace coinchase::session
{

/// 유저별 outbound 태스크입니다.
///
/// - client 가 선언한 주소로 dial 한 뒤, broadcast tick 마다 최신 스냅샷을 압축해 보냅니다.
/// - 쓰기 실패는 fault budget 을 1 깎고, 성공하면 budget 이 다시 가득 찹니다.
///   링크가 broken 이면 budget 을 바로 소진한 것으로 봅니다.
/// - budget 이 0 이 되면 게임 협력자들에서 유저를 한 번만 제거하고 세션을 종료시킵니다.
/// - stop-send 는 sender 만 멈춥니다. (coordinator 는 fire 하지 않음)
class ProtocolSender : private coinchase::util::NonCopyable
{
  public:
    ProtocolSender(int slotId, std::string userId, game::ClientAddress address,
                   SessionContext &context, const SessionEnvironment &env);

    void run();

    [[nodiscard]] std::uint32_t remainingBudget() const noexcept { return budget_; }

  private:
    [[nodiscard]] std::error_code sendLoop_(IOutboundLink &link);
    [[nodiscard]] bool sendOneTick_(IOutboundLink &link, std::vector<std::byte> &frame);
    void deregisterOnce_();

    const int slotId_;
    const std::string userId_;
    const game::ClientAddress address_;
    SessionContext &ctx_;
    const SessionEnvironment &env_;

    std::uint32_t budget_;
    bool deregistered_{false};
};

} // namespace coinchase::session
