#pragma once

#include <atomic>
#include <cstdint>
#include <string>

namespace coinchase::monitoring
{

struct ServerMetricsSnapshot
{
    std::uint64_t activeSessions = 0;
    std::uint64_t inboundFramesTotal = 0;
    std::uint64_t outboundSnapshotsTotal = 0;
    std::uint64_t protocolViolationsTotal = 0;
    std::uint64_t writeFailuresTotal = 0;
    std::uint64_t dialFailuresTotal = 0;
    std::uint64_t revivedSlotsTotal = 0;
    std::uint64_t capacityRejectionsTotal = 0;
};

/// 프로세스 전역 카운터. 모든 스레드에서 relaxed 로 갱신합니다.
class ServerMetrics
{
  public:
    ServerMetrics() = default;
    ServerMetrics(const ServerMetrics &) = delete;
    ServerMetrics &operator=(const ServerMetrics &) = delete;

    void reset() noexcept
    {
        activeSessions_.store(0, std::memory_order_relaxed);
        inboundFramesTotal_.store(0, std::memory_order_relaxed);
        outboundSnapshotsTotal_.store(0, std::memory_order_relaxed);
        protocolViolationsTotal_.store(0, std::memory_order_relaxed);
        writeFailuresTotal_.store(0, std::memory_order_relaxed);
        dialFailuresTotal_.store(0, std::memory_order_relaxed);
        revivedSlotsTotal_.store(0, std::memory_order_relaxed);
        capacityRejectionsTotal_.store(0, std::memory_order_relaxed);
    }

    void onSessionAcquired() noexcept { activeSessions_.fetch_add(1, std::memory_order_relaxed); }
    void onSessionReleased() noexcept { activeSessions_.fetch_sub(1, std::memory_order_relaxed); }
    void onInboundFrame() noexcept { inboundFramesTotal_.fetch_add(1, std::memory_order_relaxed); }
    void onOutboundSnapshot() noexcept
    {
        outboundSnapshotsTotal_.fetch_add(1, std::memory_order_relaxed);
    }
    void onProtocolViolation() noexcept
    {
        protocolViolationsTotal_.fetch_add(1, std::memory_order_relaxed);
    }
    void onWriteFailure() noexcept { writeFailuresTotal_.fetch_add(1, std::memory_order_relaxed); }
    void onDialFailure() noexcept { dialFailuresTotal_.fetch_add(1, std::memory_order_relaxed); }
    void onSlotRevived() noexcept { revivedSlotsTotal_.fetch_add(1, std::memory_order_relaxed); }
    void onCapacityRejection() noexcept
    {
        capacityRejectionsTotal_.fetch_add(1, std::memory_order_relaxed);
    }

    ServerMetricsSnapshot snapshot() const noexcept;
    std::string toPrometheusText() const;

  private:
    std::atomic<std::int64_t> activeSessions_{0};
    std::atomic<std::uint64_t> inboundFramesTotal_{0};
    std::atomic<std::uint64_t> outboundSnapshotsTotal_{0};
    std::atomic<std::uint64_t> protocolViolationsTotal_{0};
    std::atomic<std::uint64_t> writeFailuresTotal_{0};
    std::atomic<std::uint64_t> dialFailuresTotal_{0};
    std::atomic<std::uint64_t> revivedSlotsTotal_{0};
    std::atomic<std::uint64_t> capacityRejectionsTotal_{0};
};

ServerMetrics &serverMetrics() noexcept;

} // namespace coinchase::monitoring
