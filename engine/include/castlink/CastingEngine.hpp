#pragma once

#include <castlink/EngineConfig.hpp>
#include <castlink/Error.hpp>
#include <castlink/core/Continuation.hpp>
#include <castlink/discovery/PeerRecord.hpp>
#include <castlink/interaction/ClusterConcepts.hpp>
#include <castlink/interaction/RequestCorrelator.hpp>
#include <castlink/interaction/SubscriptionTable.hpp>
#include <castlink/interaction/Types.hpp>
#include <castlink/session/OnboardingPayload.hpp>
#include <castlink/session/SessionState.hpp>
#include <castlink/transport/IDiscoveryTransport.hpp>
#include <castlink/transport/ISessionTransport.hpp>
#include <castlink/util/NonCopyable.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace castlink::core
{
class DispatchQueue;
}

namespace castlink::monitoring
{
class EngineMetrics;
}

namespace castlink
{

enum class RunMode : std::uint8_t
{
    Threaded, // DispatchQueue 전용 스레드
    Manual,   // 호출 스레드가 dispatchQueue()->drain()/advanceTicks() 로 직접 구동
};

/// 캐스팅 클라이언트 엔진 (명시적으로 생성/소유되는 인스턴스, 전역 인스턴스 없음)
///
/// ===== 수명 =====
/// - 생성: 설정 검증 + 온보딩 페이로드 계산 (잘못된 값이면 std::invalid_argument)
/// - start(mode): 디스패치 큐 구동 시작. 이후에만 요청이 처리됩니다.
/// - shutdown(): 남은 커맨드/구독을 SessionClosed 로 정리하고 큐를 멈춥니다. (소멸자도 호출)
///
/// ===== 호출 규약 =====
/// - 모든 요청 함수는 논블로킹입니다. 큐에 넣고 바로 반환합니다.
/// - onSent 는 "요청이 전송됐는가"만 알려 줍니다. 동기 검증 오류(NotConnected, InvalidArgument,
///   InvalidState, NotFound)와 SendFailure 는 onSent 로만 오고, 결과 콜백은 호출되지 않습니다.
/// - 전송 이후의 오류는 onFailure 로만 옵니다.
/// - 모든 콜백은 CallContext 의 executor 에서 실행됩니다.
/// - 같은 스레드에서 제출한 요청의 onSent 순서는 제출 순서와 같습니다.
class CastingEngine : private castlink::util::NonMovable
{
  public:
    using SentFn = std::function<void(Error)>;
    using FailureFn = std::function<void(Error)>;
    using PeerFn = std::function<void(Error, std::optional<discovery::PeerRecord>)>;
    using StateFn = std::function<void(session::SessionState)>;

    CastingEngine(EngineConfig config,
                  std::shared_ptr<transport::IDiscoveryTransport> discoveryTransport,
                  std::shared_ptr<transport::ISessionTransport> sessionTransport);
    ~CastingEngine();

    void start(RunMode mode = RunMode::Threaded);
    void shutdown();
    [[nodiscard]] bool isRunning() const noexcept;

    /// 엔진 내부 큐. 수동 구동(테스트)과, 결과를 큐 스레드에서 받고 싶을 때 사용합니다.
    [[nodiscard]] std::shared_ptr<core::DispatchQueue> dispatchQueue() const noexcept;

    [[nodiscard]] const EngineConfig &config() const noexcept;
    [[nodiscard]] const session::OnboardingPayload &onboardingPayload() const noexcept;
    [[nodiscard]] const monitoring::EngineMetrics &metrics() const noexcept;

    // ===== Discovery =====
    void discoverCommissioners(const core::CallContext &ctx, SentFn onSent);
    void getDiscoveredCommissioner(std::size_t index, const core::CallContext &ctx, PeerFn handler);

    // ===== Commissioning =====
    void sendUserDirectedCommissioningRequest(transport::UdcTarget target,
                                              const core::CallContext &ctx, SentFn onSent);
    /// 탐색된 피어 index 로 UDC 대상을 고릅니다. (없으면 NotFound)
    void sendUserDirectedCommissioningRequest(std::size_t peerIndex, const core::CallContext &ctx,
                                              SentFn onSent);
    void openBasicCommissioningWindow(const core::CallContext &ctx,
                                      std::function<void(Error)> onComplete, SentFn onRequested);
    void closeSession(const core::CallContext &ctx, SentFn onSent);
    void reinitialize(const core::CallContext &ctx, SentFn onSent);
    void querySessionState(const core::CallContext &ctx, StateFn handler);

    // ===== Commands =====
    template <interaction::ClusterCommand C>
    interaction::RequestId invoke(const C &command, const core::CallContext &ctx, SentFn onSent,
                                  std::function<void(typename C::Response)> onSuccess,
                                  FailureFn onFailure, interaction::InvokeOptions options = {});

    // ===== Subscriptions =====
    template <interaction::ClusterAttribute A>
    interaction::SubscriptionId subscribe(const interaction::SubscribeParams &params,
                                          const core::CallContext &ctx, SentFn onSent,
                                          std::function<void(typename A::Value)> onReport,
                                          FailureFn onFailure,
                                          std::function<void()> onEstablished = {});

    void unsubscribe(interaction::SubscriptionId id, const core::CallContext &ctx, SentFn onSent);

  private:
    struct CommandSubmission
    {
        interaction::RequestId id{interaction::kInvalidCorrelationId};
        std::optional<std::uint16_t> endpoint;
        std::uint32_t clusterId{0};
        std::uint32_t commandId{0};
        bool encoded{false};
        std::vector<std::uint8_t> payload;
        std::chrono::milliseconds timeout{0};
        interaction::RequestCorrelator::ResponseHandler onResponse;
        core::Continuation<Error> onSent;
        core::Continuation<Error> onFailure;
    };

    struct SubscribeSubmission
    {
        interaction::SubscriptionId id{interaction::kInvalidCorrelationId};
        std::optional<std::uint16_t> endpoint;
        std::uint32_t clusterId{0};
        std::uint32_t attributeId{0};
        std::uint16_t minIntervalS{0};
        std::uint16_t maxIntervalS{0};
        interaction::SubscriptionTable::ReportHandler onReport;
        core::Continuation<Error> onSent;
        core::Continuation<Error> onFailure;
        core::Continuation<> onEstablished;
    };

    static void requireContext_(const core::CallContext &ctx, const char *api);
    [[nodiscard]] interaction::CorrelationId nextCorrelationId_() noexcept;
    void submitCommand_(CommandSubmission &&submission);
    void submitSubscribe_(SubscribeSubmission &&submission);

    class Impl;
    std::unique_ptr<Impl> impl_;
};

// =============================================================================
// Template implementation
//   caller 스레드: id 발급 + payload 인코딩 + continuation 생성
//   큐 스레드   : 상태 검사 + 전송 + 추적 (submit*_)
// =============================================================================
template <interaction::ClusterCommand C>
interaction::RequestId CastingEngine::invoke(const C &command, const core::CallContext &ctx,
                                             SentFn onSent,
                                             std::function<void(typename C::Response)> onSuccess,
                                             FailureFn onFailure,
                                             interaction::InvokeOptions options)
{
    using Response = typename C::Response;
    requireContext_(ctx, "invoke");

    CommandSubmission sub;
    sub.id = nextCorrelationId_();
    sub.endpoint = options.endpoint;
    sub.clusterId = static_cast<std::uint32_t>(C::kClusterId);
    sub.commandId = static_cast<std::uint32_t>(C::kCommandId);
    sub.timeout = options.timeout;

    protocol::PacketWriter w;
    sub.encoded = command.write(w);
    sub.payload = w.take();

    sub.onSent = core::Continuation<Error>(ctx, std::move(onSent));
    sub.onFailure = core::Continuation<Error>(ctx, std::move(onFailure));

    core::Continuation<Response> success(ctx, std::move(onSuccess));
    sub.onResponse = [success](const protocol::MessageView &payload,
                               interaction::ResponseKind kind) -> bool
    {
        Response response{};
        if (kind == interaction::ResponseKind::Payload)
        {
            protocol::PacketReader r(payload);
            if (!response.read(r) || !r.expectEnd())
                return false;
        }
        success.deliver(std::move(response));
        return true;
    };

    const interaction::RequestId id = sub.id;
    submitCommand_(std::move(sub));
    return id;
}

template <interaction::ClusterAttribute A>
interaction::SubscriptionId
CastingEngine::subscribe(const interaction::SubscribeParams &params, const core::CallContext &ctx,
                         SentFn onSent, std::function<void(typename A::Value)> onReport,
                         FailureFn onFailure, std::function<void()> onEstablished)
{
    using Value = typename A::Value;
    requireContext_(ctx, "subscribe");

    SubscribeSubmission sub;
    sub.id = nextCorrelationId_();
    sub.endpoint = params.endpoint;
    sub.clusterId = static_cast<std::uint32_t>(A::kClusterId);
    sub.attributeId = static_cast<std::uint32_t>(A::kAttributeId);
    sub.minIntervalS = params.minIntervalS;
    sub.maxIntervalS = params.maxIntervalS;
    sub.onSent = core::Continuation<Error>(ctx, std::move(onSent));
    sub.onFailure = core::Continuation<Error>(ctx, std::move(onFailure));
    sub.onEstablished = core::Continuation<>(ctx, std::move(onEstablished));

    core::Continuation<Value> report(ctx, std::move(onReport));
    sub.onReport = [report](const protocol::MessageView &payload) -> bool
    {
        Value value{};
        protocol::PacketReader r(payload);
        if (!A::read(r, value) || !r.expectEnd())
            return false;
        report.deliver(std::move(value));
        return true;
    };

    const interaction::SubscriptionId id = sub.id;
    submitSubscribe_(std::move(sub));
    return id;
}

} // namespace castlink
