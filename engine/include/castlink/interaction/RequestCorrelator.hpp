#pragma once

#include <castlink/Error.hpp>
#include <castlink/core/Continuation.hpp>
#include <castlink/core/DispatchQueue.hpp>
#include <castlink/interaction/Types.hpp>
#include <castlink/monitoring/Metrics.hpp>
#include <castlink/protocol/InteractionFrames.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <unordered_map>

namespace castlink::interaction
{

enum class ResponseKind : std::uint8_t
{
    Payload,    // InvokeResponse 의 payload 를 디코딩
    StatusOnly, // 성공 StatusResponse: 빈 Response
};

/// 전송이 끝난 커맨드(PendingRequest)를 correlation id 로 추적합니다.
///
/// - 레코드는 전송 성공 후에만 만들어집니다.
/// - 종료 경로(응답 / 타임아웃 / 세션 종료) 어느 쪽이든 레코드를 먼저 지운 뒤 콜백을 전달하므로
///   결과는 정확히 한 번만 나갑니다.
/// - DispatchQueue owner 스레드 전용
class RequestCorrelator
{
  public:
    /// 응답 디코딩 + onSuccess 전달. false 면 DecodeError 로 처리합니다.
    using ResponseHandler = std::function<bool(const protocol::MessageView &, ResponseKind)>;
    using Clock = std::chrono::steady_clock;

    RequestCorrelator(core::DispatchQueue &dq, monitoring::EngineMetrics &metrics);
    ~RequestCorrelator();

    RequestCorrelator(const RequestCorrelator &) = delete;
    RequestCorrelator &operator=(const RequestCorrelator &) = delete;

    /// @return 이미 같은 id 가 있으면 false (레코드 생성 안 함)
    bool track(RequestId id, std::uint32_t clusterId, std::uint32_t commandId,
               std::chrono::milliseconds timeout, ResponseHandler onResponse,
               core::Continuation<Error> onFailure);

    /// @return id 가 대기 중인 커맨드였으면 true
    bool onInvokeResponse(const protocol::InvokeResponseFrame &frame);
    bool onStatusResponse(const protocol::StatusResponseFrame &frame);

    /// 세션 종료 cascade: 모든 대기 커맨드에 error 를 1회씩 전달
    std::size_t failAll(const Error &error);

    [[nodiscard]] bool contains(RequestId id) const noexcept;
    [[nodiscard]] std::size_t pendingCount() const noexcept { return pending_.size(); }

  private:
    struct PendingRequest
    {
        RequestId id{kInvalidCorrelationId};
        std::uint32_t clusterId{0};
        std::uint32_t commandId{0};
        Clock::time_point createdAt{};
        Clock::time_point deadline{};
        core::TimerWheel::TimerId timerId{core::TimerWheel::kInvalidTimerId};
        ResponseHandler onResponse;
        core::Continuation<Error> onFailure;
    };

    bool extract_(RequestId id, PendingRequest &out);
    void onTimeout_(RequestId id);
    void complete_(PendingRequest &req, const protocol::MessageView &payload, ResponseKind kind);
    void fail_(PendingRequest &req, Error error);

    core::DispatchQueue &dq_;
    monitoring::EngineMetrics &metrics_;
    std::unordered_map<RequestId, PendingRequest> pending_;
};

} // namespace castlink::interaction
