#include <castlink/interaction/SubscriptionTable.hpp>

#include <castlink/core/Logger.hpp>

#include <algorithm>
#include <format>
#include <utility>

namespace castlink::interaction
{

namespace
{
std::string pathLabel(const AttributePath &p)
{
    return std::format("attribute {}/0x{:04X}/0x{:04X}", p.endpoint, p.clusterId, p.attributeId);
}
} // namespace

SubscriptionTable::SubscriptionTable(core::DispatchQueue &dq, monitoring::EngineMetrics &metrics,
                                     Limits limits)
    : dq_(dq), metrics_(metrics), limits_(limits)
{
}

SubscriptionTable::~SubscriptionTable()
{
    if (!records_.empty())
    {
        CASTLINK_LOG_WARN("Subscriptions", "DestroyedWithActive", "active={}", records_.size());
    }
}

bool SubscriptionTable::add(SubscriptionId id, AttributePath path, std::uint16_t minIntervalS,
                            std::uint16_t maxIntervalS, std::chrono::milliseconds establishTimeout,
                            ReportHandler onReport, core::Continuation<Error> onFailure,
                            core::Continuation<> onEstablished)
{
    if (id == kInvalidCorrelationId || records_.contains(id) || minIntervalS > maxIntervalS)
    {
        CASTLINK_LOG_ERROR("Subscriptions", "AddRejected", "id={} min={} max={}", id, minIntervalS,
                           maxIntervalS);
        return false;
    }

    SubscriptionRecord rec;
    rec.id = id;
    rec.path = path;
    rec.minIntervalS = minIntervalS;
    rec.maxIntervalS = maxIntervalS;
    rec.onReport = std::move(onReport);
    rec.onFailure = std::move(onFailure);
    rec.onEstablished = std::move(onEstablished);
    rec.establishTimer = dq_.addTimer(establishTimeout, [this, id]() { onEstablishTimeout_(id); });

    records_.emplace(id, std::move(rec));
    metrics_.onSubscriptionRegistered();

    CASTLINK_LOG_DEBUG("Subscriptions", "Requested", "id={} path={} min={} max={}", id,
                       pathLabel(path), minIntervalS, maxIntervalS);
    return true;
}

bool SubscriptionTable::onSubscribeResponse(const protocol::SubscribeResponseFrame &frame)
{
    auto it = records_.find(frame.correlationId);
    if (it == records_.end())
        return false;

    auto &rec = it->second;
    if (rec.state != SubscriptionState::Requested)
    {
        CASTLINK_LOG_WARN("Subscriptions", "DuplicateEstablish", "id={}", rec.id);
        return true;
    }

    if (rec.establishTimer != core::TimerWheel::kInvalidTimerId)
    {
        dq_.cancelTimer(rec.establishTimer);
        rec.establishTimer = core::TimerWheel::kInvalidTimerId;
    }

    rec.state = SubscriptionState::Established;
    // 상대가 0 을 주면 요청한 max 를 그대로 쓴다.
    rec.negotiatedMaxIntervalS = frame.maxIntervalS != 0 ? frame.maxIntervalS : rec.maxIntervalS;
    metrics_.onSubscriptionEstablished();

    CASTLINK_LOG_INFO("Subscriptions", "Established", "id={} path={} negotiated_max_s={} primed={}",
                      rec.id, pathLabel(rec.path), rec.negotiatedMaxIntervalS, rec.primed.size());

    rec.onEstablished.deliver();

    auto primed = std::move(rec.primed);
    rec.primed.clear();
    for (const auto &bytes : primed)
        deliverReport_(rec, protocol::MessageView(bytes));

    armLiveness_(rec);
    return true;
}

bool SubscriptionTable::onReport(const protocol::ReportDataFrame &frame)
{
    auto it = records_.find(frame.correlationId);
    if (it == records_.end())
        return false;

    auto &rec = it->second;
    if (frame.clusterId != rec.path.clusterId || frame.attributeId != rec.path.attributeId)
    {
        metrics_.onDecodeError();
        CASTLINK_LOG_WARN("Subscriptions", "PathMismatch",
                          "id={} expected={} got_cluster=0x{:04X} got_attribute=0x{:04X}", rec.id,
                          pathLabel(rec.path), frame.clusterId, frame.attributeId);
        rec.onFailure.deliver(Error(ErrorCode::DecodeError, "report path mismatch for " +
                                                                pathLabel(rec.path)));
        return true;
    }

    if (rec.state == SubscriptionState::Requested)
    {
        if (rec.primed.size() >= limits_.maxPrimedReports)
        {
            CASTLINK_LOG_WARN("Subscriptions", "PrimedDropped", "id={} limit={}", rec.id,
                              limits_.maxPrimedReports);
            return true;
        }
        rec.primed.push_back(frame.payload.toBytes());
        return true;
    }

    deliverReport_(rec, frame.payload);
    armLiveness_(rec);
    return true;
}

void SubscriptionTable::deliverReport_(SubscriptionRecord &rec, const protocol::MessageView &payload)
{
    if (rec.onReport && rec.onReport(payload))
    {
        metrics_.onReportDelivered();
        return;
    }

    metrics_.onDecodeError();
    CASTLINK_LOG_WARN("Subscriptions", "DecodeError", "id={} path={} bytes={}", rec.id,
                      pathLabel(rec.path), payload.size());
    rec.onFailure.deliver(Error(ErrorCode::DecodeError, pathLabel(rec.path)));
}

bool SubscriptionTable::onStatusResponse(const protocol::StatusResponseFrame &frame)
{
    auto it = records_.find(frame.correlationId);
    if (it == records_.end())
        return false;

    if (frame.isSuccess())
        return true;

    const std::string label = pathLabel(it->second.path);
    terminate_(frame.correlationId,
               Error(ErrorCode::Rejected,
                     label + (frame.message.empty() ? std::string{} : ": " + frame.message),
                     frame.status),
               "Rejected");
    return true;
}

void SubscriptionTable::armLiveness_(SubscriptionRecord &rec)
{
    if (limits_.livenessMargin.count() <= 0 || rec.state != SubscriptionState::Established)
        return;

    if (rec.livenessTimer != core::TimerWheel::kInvalidTimerId)
        dq_.cancelTimer(rec.livenessTimer);

    const auto window = std::chrono::milliseconds(
                            static_cast<std::int64_t>(rec.negotiatedMaxIntervalS) * 1000) +
                        limits_.livenessMargin;
    const SubscriptionId id = rec.id;
    const std::uint64_t gen = ++rec.livenessGen;
    rec.livenessTimer = dq_.addTimer(window, [this, id, gen]() { onLivenessTimeout_(id, gen); });
}

void SubscriptionTable::cancelTimers_(SubscriptionRecord &rec)
{
    if (rec.establishTimer != core::TimerWheel::kInvalidTimerId)
        dq_.cancelTimer(rec.establishTimer);
    if (rec.livenessTimer != core::TimerWheel::kInvalidTimerId)
        dq_.cancelTimer(rec.livenessTimer);
    rec.establishTimer = core::TimerWheel::kInvalidTimerId;
    rec.livenessTimer = core::TimerWheel::kInvalidTimerId;
}

void SubscriptionTable::terminate_(SubscriptionId id, std::optional<Error> error,
                                   const char *reason)
{
    auto it = records_.find(id);
    if (it == records_.end())
        return;

    SubscriptionRecord rec = std::move(it->second);
    records_.erase(it);

    cancelTimers_(rec);
    rec.state = SubscriptionState::Terminated;
    metrics_.onSubscriptionTerminated();

    CASTLINK_LOG_INFO("Subscriptions", "Terminated", "id={} path={} reason={}", rec.id,
                      pathLabel(rec.path), reason);

    if (error)
        rec.onFailure.deliver(std::move(*error));
}

void SubscriptionTable::onEstablishTimeout_(SubscriptionId id)
{
    auto it = records_.find(id);
    if (it == records_.end() || it->second.state != SubscriptionState::Requested)
        return;

    it->second.establishTimer = core::TimerWheel::kInvalidTimerId;
    terminate_(id, Error(ErrorCode::Timeout, "subscribe " + pathLabel(it->second.path)),
               "EstablishTimeout");
}

void SubscriptionTable::onLivenessTimeout_(SubscriptionId id, std::uint64_t gen)
{
    auto it = records_.find(id);
    if (it == records_.end() || it->second.livenessGen != gen)
        return; // 그 사이 report 가 와서 다시 무장됨

    it->second.livenessTimer = core::TimerWheel::kInvalidTimerId;
    terminate_(id, Error(ErrorCode::Timeout, "liveness " + pathLabel(it->second.path)),
               "LivenessTimeout");
}

bool SubscriptionTable::remove(SubscriptionId id)
{
    if (!records_.contains(id))
        return false;
    terminate_(id, std::nullopt, "Unsubscribed");
    return true;
}

std::size_t SubscriptionTable::terminateAll(const Error &error)
{
    if (records_.empty())
        return 0;

    std::vector<SubscriptionId> ids;
    ids.reserve(records_.size());
    for (const auto &[id, _] : records_)
        ids.push_back(id);
    std::sort(ids.begin(), ids.end());

    for (SubscriptionId id : ids)
        terminate_(id, error, toString(error.code()));

    return ids.size();
}

bool SubscriptionTable::contains(SubscriptionId id) const noexcept
{
    return records_.contains(id);
}

std::optional<SubscriptionState> SubscriptionTable::stateOf(SubscriptionId id) const noexcept
{
    auto it = records_.find(id);
    if (it == records_.end())
        return std::nullopt;
    return it->second.state;
}

} // namespace castlink::interaction
