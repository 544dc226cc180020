#include <coinchase/monitoring/Metrics.hpp>

#include <algorithm>
#include <sstream>

namespace coinchase::monitoring
{
namespace
{
constexpr const char *kMActiveSessions = "coinchase_active_sessions";
constexpr const char *kMInboundFramesTotal = "coinchase_inbound_frames_total";
constexpr const char *kMOutboundSnapshotsTotal = "coinchase_outbound_snapshots_total";
constexpr const char *kMProtocolViolationsTotal = "coinchase_protocol_violations_total";
constexpr const char *kMWriteFailuresTotal = "coinchase_write_failures_total";
constexpr const char *kMDialFailuresTotal = "coinchase_dial_failures_total";
constexpr const char *kMRevivedSlotsTotal = "coinchase_revived_slots_total";
constexpr const char *kMCapacityRejectionsTotal = "coinchase_capacity_rejections_total";

inline void appendMetric(std::ostringstream &os, const char *name, const char *type,
                         const char *help, std::uint64_t value)
{
    os << "# HELP " << name << " " << help << "\n";
    os << "# TYPE " << name << " " << type << "\n";
    os << name << " " << value << "\n";
}
} // namespace

ServerMetricsSnapshot ServerMetrics::snapshot() const noexcept
{
    ServerMetricsSnapshot s{};
    s.activeSessions = static_cast<std::uint64_t>(
        std::max<std::int64_t>(0, activeSessions_.load(std::memory_order_relaxed)));
    s.inboundFramesTotal = inboundFramesTotal_.load(std::memory_order_relaxed);
    s.outboundSnapshotsTotal = outboundSnapshotsTotal_.load(std::memory_order_relaxed);
    s.protocolViolationsTotal = protocolViolationsTotal_.load(std::memory_order_relaxed);
    s.writeFailuresTotal = writeFailuresTotal_.load(std::memory_order_relaxed);
    s.dialFailuresTotal = dialFailuresTotal_.load(std::memory_order_relaxed);
    s.revivedSlotsTotal = revivedSlotsTotal_.load(std::memory_order_relaxed);
    s.capacityRejectionsTotal = capacityRejectionsTotal_.load(std::memory_order_relaxed);
    return s;
}

std::string ServerMetrics::toPrometheusText() const
{
    const ServerMetricsSnapshot s = snapshot();

    std::ostringstream os;
    appendMetric(os, kMActiveSessions, "gauge", "Session slots currently handed out.",
                 s.activeSessions);
    appendMetric(os, kMInboundFramesTotal, "counter", "Total inbound frames decoded.",
                 s.inboundFramesTotal);
    appendMetric(os, kMOutboundSnapshotsTotal, "counter", "Total snapshots written to clients.",
                 s.outboundSnapshotsTotal);
    appendMetric(os, kMProtocolViolationsTotal, "counter",
                 "Sessions terminated by a wire protocol violation.", s.protocolViolationsTotal);
    appendMetric(os, kMWriteFailuresTotal, "counter", "Total failed snapshot writes.",
                 s.writeFailuresTotal);
    appendMetric(os, kMDialFailuresTotal, "counter", "Total failed dials back to clients.",
                 s.dialFailuresTotal);
    appendMetric(os, kMRevivedSlotsTotal, "counter",
                 "Slots reclaimed or re-armed by the liveness monitor.", s.revivedSlotsTotal);
    appendMetric(os, kMCapacityRejectionsTotal, "counter",
                 "Logins rejected because no slot was available.", s.capacityRejectionsTotal);

    return os.str();
}

ServerMetrics &serverMetrics() noexcept
{
    static ServerMetrics g;
    return g;
}

} // namespace coinchase::monitoring
