#pragma once

#include <castlink/Error.hpp>
#include <castlink/core/Continuation.hpp>
#include <castlink/core/DispatchQueue.hpp>
#include <castlink/monitoring/Metrics.hpp>
#include <castlink/session/SessionStateMachine.hpp>
#include <castlink/transport/EventGateway.hpp>
#include <castlink/transport/ISessionTransport.hpp>
#include <castlink/util/NonCopyable.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace castlink::session
{

/// 단일 세션과 커미셔닝 상태 기계를 소유합니다.
///
/// - 모든 public 메서드는 DispatchQueue owner 스레드에서 호출됩니다.
/// - 호출자가 시작한 전이는 onSent(요청 전송 확인)로 먼저 응답하고,
///   커미셔닝 결과는 별도의 onComplete 로 전달합니다.
/// - Commissioned 세션이 끝나면 SessionEndedHandler 로 cascade 를 요청합니다.
class SessionManager : private castlink::util::NonMovable
{
  public:
    /// 세션 종료 cascade 훅 (대기 커맨드/구독 실패 처리)
    using SessionEndedHandler = std::function<void(const Error &)>;

    SessionManager(core::DispatchQueue &dq, std::shared_ptr<transport::ISessionTransport> transport,
                   std::shared_ptr<transport::EventGateway> gateway,
                   std::chrono::seconds windowTimeout, std::uint32_t sendRetries,
                   monitoring::EngineMetrics &metrics);
    ~SessionManager();

    void setSessionEndedHandler(SessionEndedHandler handler) { onSessionEnded_ = std::move(handler); }

    [[nodiscard]] SessionState state() const noexcept { return fsm_.state(); }
    [[nodiscard]] bool isCommissioned() const noexcept { return fsm_.is(SessionState::Commissioned); }

    /// 탐색 시작 알림. Idle 일 때만 Discovering 으로 바꿉니다.
    void noteDiscoveryStarted();

    /// Idle/Discovering -> ConnectingUDC, 전송 완료 후 Idle
    void sendUserDirectedCommissioningRequest(const transport::UdcTarget &target,
                                              core::Continuation<Error> onSent);

    /// Idle/Discovering/ConnectingUDC -> AwaitingCommissioning
    void openBasicCommissioningWindow(core::Continuation<Error> onComplete,
                                      core::Continuation<Error> onRequested);

    /// Closed 를 제외한 모든 상태 -> Closed
    void closeSession(core::Continuation<Error> onSent);

    /// Failed/Closed -> Idle (Idle 이면 아무것도 하지 않고 성공)
    void reinitialize(core::Continuation<Error> onSent);

    /// 인터랙션 프레임 전송. Commissioned 가 아니면 NotConnected.
    /// 동기 전송 실패는 sendRetries 만큼 다시 보낸 뒤 SendFailure.
    Error sendFrame(const protocol::MessageView &frame);

    // ===== 전송 이벤트 (EventGateway 를 거쳐 DispatchQueue 에서 호출) =====
    void handleCommissioningComplete(const Error &result);
    void handleSessionLost(const std::string &reason);

  private:
    void onUdcSent_(std::uint64_t attempt, bool sent, core::Continuation<Error> onSent);
    void onWindowExpired_(std::uint64_t window);
    void cancelWindowTimer_();
    void finishCommissioning_(Error result);
    void endCommissionedSession_(const Error &error);

    core::DispatchQueue &dq_;
    std::shared_ptr<transport::ISessionTransport> transport_;
    std::shared_ptr<transport::EventGateway> gateway_;
    std::chrono::seconds windowTimeout_;
    std::uint32_t sendRetries_;
    monitoring::EngineMetrics &metrics_;

    SessionStateMachine fsm_;
    SessionEndedHandler onSessionEnded_;

    core::Continuation<Error> onCommissioningComplete_;
    core::TimerWheel::TimerId windowTimer_{core::TimerWheel::kInvalidTimerId};
    std::uint64_t windowSeq_{0};
    std::uint64_t udcSeq_{0};
};

} // namespace castlink::session
