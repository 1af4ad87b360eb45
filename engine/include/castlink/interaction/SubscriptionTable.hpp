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
#include <optional>
#include <unordered_map>
#include <vector>

namespace castlink::interaction
{

/// 장기 속성 구독 테이블 (Requested -> Established -> Terminated)
///
/// - Terminated 가 되는 순간 레코드를 지웁니다. 이후 같은 id 로 오는 프레임은 무시합니다.
/// - 확립 전에 먼저 도착한 report(priming)는 복사해 두었다가 onEstablished 직후 순서대로 흘립니다.
/// - report 디코딩 실패는 DecodeError 를 전달하지만 구독은 유지합니다.
/// - DispatchQueue owner 스레드 전용
class SubscriptionTable
{
  public:
    /// report payload 디코딩 + onReport 전달. false 면 DecodeError.
    using ReportHandler = std::function<bool(const protocol::MessageView &)>;

    struct Limits
    {
        std::chrono::milliseconds livenessMargin{0}; // 0 이면 liveness 검사 안 함
        std::size_t maxPrimedReports{8};
    };

    SubscriptionTable(core::DispatchQueue &dq, monitoring::EngineMetrics &metrics, Limits limits);
    ~SubscriptionTable();

    SubscriptionTable(const SubscriptionTable &) = delete;
    SubscriptionTable &operator=(const SubscriptionTable &) = delete;

    /// SubscribeRequest 전송 성공 후 호출합니다.
    bool add(SubscriptionId id, AttributePath path, std::uint16_t minIntervalS,
             std::uint16_t maxIntervalS, std::chrono::milliseconds establishTimeout,
             ReportHandler onReport, core::Continuation<Error> onFailure,
             core::Continuation<> onEstablished);

    bool onSubscribeResponse(const protocol::SubscribeResponseFrame &frame);
    bool onReport(const protocol::ReportDataFrame &frame);

    /// 실패 상태면 Rejected 로 종료. 성공 상태는 무시합니다. (SubscribeResponse 가 확립 신호)
    bool onStatusResponse(const protocol::StatusResponseFrame &frame);

    /// 호출자 요청에 의한 종료. 콜백은 더 이상 나가지 않습니다.
    /// @return 알 수 없는 id 면 false
    bool remove(SubscriptionId id);

    /// 세션 종료 cascade: 종료되지 않은 모든 구독에 error 를 1회씩 전달
    std::size_t terminateAll(const Error &error);

    [[nodiscard]] bool contains(SubscriptionId id) const noexcept;
    [[nodiscard]] std::optional<SubscriptionState> stateOf(SubscriptionId id) const noexcept;
    [[nodiscard]] std::size_t activeCount() const noexcept { return records_.size(); }

  private:
    struct SubscriptionRecord
    {
        SubscriptionId id{kInvalidCorrelationId};
        AttributePath path{};
        std::uint16_t minIntervalS{0};
        std::uint16_t maxIntervalS{0};
        std::uint16_t negotiatedMaxIntervalS{0};
        SubscriptionState state{SubscriptionState::Requested};

        core::TimerWheel::TimerId establishTimer{core::TimerWheel::kInvalidTimerId};
        core::TimerWheel::TimerId livenessTimer{core::TimerWheel::kInvalidTimerId};
        std::uint64_t livenessGen{0};

        std::vector<std::vector<std::uint8_t>> primed;

        ReportHandler onReport;
        core::Continuation<Error> onFailure;
        core::Continuation<> onEstablished;
    };

    void deliverReport_(SubscriptionRecord &rec, const protocol::MessageView &payload);
    void armLiveness_(SubscriptionRecord &rec);
    void cancelTimers_(SubscriptionRecord &rec);
    void terminate_(SubscriptionId id, std::optional<Error> error, const char *reason);
    void onEstablishTimeout_(SubscriptionId id);
    void onLivenessTimeout_(SubscriptionId id, std::uint64_t gen);

    core::DispatchQueue &dq_;
    monitoring::EngineMetrics &metrics_;
    Limits limits_;
    std::unordered_map<SubscriptionId, SubscriptionRecord> records_;
};

} // namespace castlink::interaction
