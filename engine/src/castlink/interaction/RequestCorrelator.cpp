#include <castlink/interaction/RequestCorrelator.hpp>

#include <castlink/core/Logger.hpp>

#include <algorithm>
#include <format>
#include <utility>
#include <vector>

namespace castlink::interaction
{

namespace
{
std::string commandLabel(std::uint32_t clusterId, std::uint32_t commandId)
{
    return std::format("command 0x{:04X}/0x{:04X}", clusterId, commandId);
}
} // namespace

RequestCorrelator::RequestCorrelator(core::DispatchQueue &dq, monitoring::EngineMetrics &metrics)
    : dq_(dq), metrics_(metrics)
{
}

RequestCorrelator::~RequestCorrelator()
{
    if (!pending_.empty())
    {
        CASTLINK_LOG_WARN("Correlator", "DestroyedWithPending", "pending={}", pending_.size());
    }
}

bool RequestCorrelator::track(RequestId id, std::uint32_t clusterId, std::uint32_t commandId,
                              std::chrono::milliseconds timeout, ResponseHandler onResponse,
                              core::Continuation<Error> onFailure)
{
    if (id == kInvalidCorrelationId || pending_.contains(id))
    {
        CASTLINK_LOG_ERROR("Correlator", "TrackRejected", "id={} reason={}", id,
                           id == kInvalidCorrelationId ? "InvalidId" : "Duplicate");
        return false;
    }

    PendingRequest req;
    req.id = id;
    req.clusterId = clusterId;
    req.commandId = commandId;
    req.createdAt = Clock::now();
    req.deadline = req.createdAt + timeout;
    req.onResponse = std::move(onResponse);
    req.onFailure = std::move(onFailure);
    req.timerId = dq_.addTimer(timeout, [this, id]() { onTimeout_(id); });

    pending_.emplace(id, std::move(req));
    metrics_.onCommandSent();

    CASTLINK_LOG_DEBUG("Correlator", "Tracked", "id={} cluster=0x{:04X} command=0x{:04X} "
                       "timeout_ms={} pending={}",
                       id, clusterId, commandId, timeout.count(), pending_.size());
    return true;
}

bool RequestCorrelator::extract_(RequestId id, PendingRequest &out)
{
    auto it = pending_.find(id);
    if (it == pending_.end())
        return false;

    out = std::move(it->second);
    pending_.erase(it);

    if (out.timerId != core::TimerWheel::kInvalidTimerId)
        dq_.cancelTimer(out.timerId);
    return true;
}

bool RequestCorrelator::onInvokeResponse(const protocol::InvokeResponseFrame &frame)
{
    PendingRequest req;
    if (!extract_(frame.correlationId, req))
        return false;

    complete_(req, frame.payload, ResponseKind::Payload);
    return true;
}

bool RequestCorrelator::onStatusResponse(const protocol::StatusResponseFrame &frame)
{
    PendingRequest req;
    if (!extract_(frame.correlationId, req))
        return false;

    if (frame.isSuccess())
    {
        complete_(req, protocol::MessageView{}, ResponseKind::StatusOnly);
        return true;
    }

    CASTLINK_LOG_INFO("Correlator", "Rejected", "id={} status=0x{:02X} message='{}'", req.id,
                      frame.status, frame.message);
    fail_(req, Error(ErrorCode::Rejected,
                     commandLabel(req.clusterId, req.commandId) +
                         (frame.message.empty() ? std::string{} : ": " + frame.message),
                     frame.status));
    return true;
}

void RequestCorrelator::complete_(PendingRequest &req, const protocol::MessageView &payload,
                                  ResponseKind kind)
{
    const auto elapsed =
        std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - req.createdAt);

    if (!req.onResponse || !req.onResponse(payload, kind))
    {
        metrics_.onDecodeError();
        CASTLINK_LOG_WARN("Correlator", "DecodeError", "id={} cluster=0x{:04X} command=0x{:04X} "
                          "bytes={}",
                          req.id, req.clusterId, req.commandId, payload.size());
        fail_(req, Error(ErrorCode::DecodeError, commandLabel(req.clusterId, req.commandId)));
        return;
    }

    metrics_.onCommandSucceeded();
    CASTLINK_LOG_DEBUG("Correlator", "Completed", "id={} kind={} elapsed_us={}", req.id,
                       kind == ResponseKind::Payload ? "payload" : "status", elapsed.count());
}

void RequestCorrelator::fail_(PendingRequest &req, Error error)
{
    metrics_.onCommandFailed();
    req.onFailure.deliver(std::move(error));
}

void RequestCorrelator::onTimeout_(RequestId id)
{
    auto it = pending_.find(id);
    if (it == pending_.end())
        return; // 이미 응답/세션 종료로 정리됨

    PendingRequest req = std::move(it->second);
    pending_.erase(it);

    CASTLINK_LOG_WARN("Correlator", "Timeout", "id={} cluster=0x{:04X} command=0x{:04X}", req.id,
                      req.clusterId, req.commandId);

    metrics_.onCommandTimedOut();
    req.onFailure.deliver(Error(ErrorCode::Timeout, commandLabel(req.clusterId, req.commandId)));
}

std::size_t RequestCorrelator::failAll(const Error &error)
{
    if (pending_.empty())
        return 0;

    // id 순서(= 전송 순서)로 실패를 전달한다.
    std::vector<RequestId> ids;
    ids.reserve(pending_.size());
    for (const auto &[id, _] : pending_)
        ids.push_back(id);
    std::sort(ids.begin(), ids.end());

    for (RequestId id : ids)
    {
        PendingRequest req;
        if (!extract_(id, req))
            continue;
        fail_(req, error);
    }

    CASTLINK_LOG_INFO("Correlator", "FailedAll", "count={} code={}", ids.size(),
                      toString(error.code()));
    return ids.size();
}

bool RequestCorrelator::contains(RequestId id) const noexcept
{
    return pending_.contains(id);
}

} // namespace castlink::interaction
