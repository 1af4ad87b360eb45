#include <castlink/monitoring/Metrics.hpp>

#include <algorithm>
#include <sstream>

namespace castlink::monitoring
{
namespace
{
constexpr const char *kMPeersDiscoveredTotal = "castlink_discovery_peers_total";
constexpr const char *kMSessionLossesTotal = "castlink_session_losses_total";

constexpr const char *kMCommandsSentTotal = "castlink_commands_sent_total";
constexpr const char *kMCommandsSucceededTotal = "castlink_commands_succeeded_total";
constexpr const char *kMCommandsFailedTotal = "castlink_commands_failed_total";
constexpr const char *kMCommandsTimedOutTotal = "castlink_commands_timed_out_total";
constexpr const char *kMCommandsPending = "castlink_commands_pending";

constexpr const char *kMSubsEstablishedTotal = "castlink_subscriptions_established_total";
constexpr const char *kMSubsActive = "castlink_subscriptions_active";
constexpr const char *kMReportsDeliveredTotal = "castlink_reports_delivered_total";

constexpr const char *kMDecodeErrorsTotal = "castlink_decode_errors_total";
constexpr const char *kMSendFailuresTotal = "castlink_send_failures_total";

inline std::uint64_t clampNonNegative(std::int64_t v) noexcept
{
    return static_cast<std::uint64_t>(std::max<std::int64_t>(0, v));
}

inline void appendMetric(std::ostringstream &os, const char *name, const char *type,
                         const char *help, std::uint64_t value)
{
    os << "# HELP " << name << " " << help << "\n";
    os << "# TYPE " << name << " " << type << "\n";
    os << name << " " << value << "\n";
}
} // namespace

EngineMetricsSnapshot EngineMetrics::snapshot() const noexcept
{
    constexpr auto r = std::memory_order_relaxed;

    EngineMetricsSnapshot s{};
    s.peersDiscoveredTotal = peersDiscoveredTotal_.load(r);
    s.sessionLossesTotal = sessionLossesTotal_.load(r);

    s.commandsSentTotal = commandsSentTotal_.load(r);
    s.commandsSucceededTotal = commandsSucceededTotal_.load(r);
    s.commandsFailedTotal = commandsFailedTotal_.load(r);
    s.commandsTimedOutTotal = commandsTimedOutTotal_.load(r);
    s.commandsPending = clampNonNegative(commandsPending_.load(r));

    s.subscriptionsEstablishedTotal = subscriptionsEstablishedTotal_.load(r);
    s.subscriptionsActive = clampNonNegative(subscriptionsActive_.load(r));
    s.reportsDeliveredTotal = reportsDeliveredTotal_.load(r);

    s.decodeErrorsTotal = decodeErrorsTotal_.load(r);
    s.sendFailuresTotal = sendFailuresTotal_.load(r);
    return s;
}

std::string EngineMetrics::toPrometheusText() const
{
    const EngineMetricsSnapshot s = snapshot();

    std::ostringstream os;
    appendMetric(os, kMPeersDiscoveredTotal, "counter", "Peers accepted into the registry.",
                 s.peersDiscoveredTotal);
    appendMetric(os, kMSessionLossesTotal, "counter", "Secure sessions lost or closed.",
                 s.sessionLossesTotal);

    // Commands
    appendMetric(os, kMCommandsSentTotal, "counter", "Commands transmitted to the peer.",
                 s.commandsSentTotal);
    appendMetric(os, kMCommandsSucceededTotal, "counter", "Commands completed successfully.",
                 s.commandsSucceededTotal);
    appendMetric(os, kMCommandsFailedTotal, "counter",
                 "Commands failed after send (including timeouts).", s.commandsFailedTotal);
    appendMetric(os, kMCommandsTimedOutTotal, "counter", "Commands that timed out.",
                 s.commandsTimedOutTotal);
    appendMetric(os, kMCommandsPending, "gauge", "Commands awaiting a response.",
                 s.commandsPending);

    // Subscriptions
    appendMetric(os, kMSubsEstablishedTotal, "counter", "Subscriptions established.",
                 s.subscriptionsEstablishedTotal);
    appendMetric(os, kMSubsActive, "gauge", "Subscriptions not yet terminated.",
                 s.subscriptionsActive);
    appendMetric(os, kMReportsDeliveredTotal, "counter", "Attribute reports delivered.",
                 s.reportsDeliveredTotal);

    appendMetric(os, kMDecodeErrorsTotal, "counter", "Malformed responses or reports.",
                 s.decodeErrorsTotal);
    appendMetric(os, kMSendFailuresTotal, "counter", "Synchronous transport send failures.",
                 s.sendFailuresTotal);

    return os.str();
}

} // namespace castlink::monitoring
