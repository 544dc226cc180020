#pragma once

#include <coinchase/game/GameTypes.hpp>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace coinchase::session
{

/// 모든 receiver 가 push 하고 모든 processor 가 pop 하는 공유 이벤트 큐입니다.
/// - 이벤트는 정확히 한 processor 가 한 번 소비합니다.
class InboundEventQueue
{
  public:
    void push(game::InboundEvent &&event);

    /// 최대 timeout 동안 기다렸다가 하나를 꺼냅니다. 없으면 nullopt.
    [[nodiscard]] std::optional<game::InboundEvent> popFor(std::chrono::milliseconds timeout);

    [[nodiscard]] std::size_t size() const;

  private:
    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::deque<game::InboundEvent> q_;
};

} // namespace coinchase::session
