#include "../support/Check.hpp"
#include "../support/FakeTransports.hpp"

#include <castlink/core/DispatchQueue.hpp>
#include <castlink/core/ExecutionContext.hpp>
#include <castlink/monitoring/Metrics.hpp>
#include <castlink/session/SessionManager.hpp>
#include <castlink/transport/EventGateway.hpp>

#include <chrono>
#include <memory>
#include <vector>

using namespace castlink;
using namespace std::chrono_literals;
using session::SessionState;

namespace
{

/// 수동 구동 큐 위의 SessionManager 1개
struct Fixture
{
    explicit Fixture(std::uint32_t sendRetries = 0)
        : dq(std::make_shared<core::DispatchQueue>(10ms, 64, "dq")),
          transport(std::make_shared<test::FakeSessionTransport>()),
          gateway(std::make_shared<transport::EventGateway>(dq)),
          ctx(core::CallContext::on(std::make_shared<core::InlineExecutor>())),
          sm(*dq, transport, gateway, 2s, sendRetries, metrics)
    {
        dq->bindToCurrentThread();
        sm.setSessionEndedHandler([this](const Error &e) { ended.push_back(e); });
    }

    core::Continuation<Error> capture(Error &out)
    {
        return core::Continuation<Error>(ctx, [&out](Error e) { out = std::move(e); });
    }

    void commission()
    {
        Error complete(ErrorCode::Timeout);
        Error requested(ErrorCode::Timeout);
        sm.openBasicCommissioningWindow(capture(complete), capture(requested));
        sm.handleCommissioningComplete(Error::success());
        CHECK(requested.ok() && complete.ok());
    }

    std::shared_ptr<core::DispatchQueue> dq;
    std::shared_ptr<test::FakeSessionTransport> transport;
    std::shared_ptr<transport::EventGateway> gateway;
    monitoring::EngineMetrics metrics;
    core::CallContext ctx;
    session::SessionManager sm;
    std::vector<Error> ended;
};

transport::UdcTarget target()
{
    return transport::UdcTarget{"10.0.0.2", 5540, 2};
}

void test_udc_returns_to_idle_after_send()
{
    Fixture f;
    Error sent(ErrorCode::Timeout);
    f.sm.sendUserDirectedCommissioningRequest(target(), f.capture(sent));
    CHECK(f.sm.state() == SessionState::ConnectingUDC);
    CHECK(f.transport->udcTargets.size() == 1);
    CHECK(f.transport->udcTargets[0].interfaceId == 2);
    CHECK(sent == ErrorCode::Timeout); // 아직 전송 완료 전

    // 전송 완료 통지는 게이트웨이를 거쳐 큐에서 처리된다
    f.transport->completeUdc(true);
    CHECK(f.sm.state() == SessionState::ConnectingUDC);
    f.dq->drain();
    CHECK(sent.ok());
    CHECK(f.sm.state() == SessionState::Idle);
}

void test_udc_validation()
{
    Fixture f;
    Error sent;
    f.sm.sendUserDirectedCommissioningRequest(transport::UdcTarget{"", 5540, 0}, f.capture(sent));
    CHECK(sent == ErrorCode::InvalidArgument);
    f.sm.sendUserDirectedCommissioningRequest(transport::UdcTarget{"10.0.0.2", 0, 0},
                                              f.capture(sent));
    CHECK(sent == ErrorCode::InvalidArgument);
    CHECK(f.transport->udcTargets.empty());
    CHECK(f.sm.state() == SessionState::Idle);

    f.commission();
    f.sm.sendUserDirectedCommissioningRequest(target(), f.capture(sent));
    CHECK(sent == ErrorCode::InvalidState);
}

void test_udc_transport_refusal_is_send_failure()
{
    Fixture f;
    f.transport->acceptUdc = false;
    Error sent;
    f.sm.sendUserDirectedCommissioningRequest(target(), f.capture(sent));
    CHECK(sent == ErrorCode::SendFailure);
    CHECK(f.sm.state() == SessionState::Idle);
    CHECK(f.metrics.snapshot().sendFailuresTotal == 1);

    f.transport->acceptUdc = true;
    f.sm.sendUserDirectedCommissioningRequest(target(), f.capture(sent));
    f.transport->completeUdc(false);
    f.dq->drain();
    CHECK(sent == ErrorCode::SendFailure);
    CHECK(f.sm.state() == SessionState::Idle);
}

/// UDC 완료 전에 윈도우를 열었으면 늦은 완료 통지가 상태를 되돌리지 않는다.
void test_late_udc_completion_keeps_window_state()
{
    Fixture f;
    Error sent;
    Error complete;
    Error requested;
    f.sm.sendUserDirectedCommissioningRequest(target(), f.capture(sent));
    f.sm.openBasicCommissioningWindow(f.capture(complete), f.capture(requested));
    CHECK(requested.ok());
    CHECK(f.sm.state() == SessionState::AwaitingCommissioning);

    f.transport->completeUdc(true);
    f.dq->drain();
    CHECK(sent.ok());
    CHECK(f.sm.state() == SessionState::AwaitingCommissioning);
}

void test_window_expiry_fails_commissioning()
{
    Fixture f;
    Error complete(ErrorCode::None);
    Error requested(ErrorCode::Timeout);
    f.sm.openBasicCommissioningWindow(f.capture(complete), f.capture(requested));
    CHECK(requested.ok());
    CHECK(f.transport->lastWindowTimeout == 2s);

    f.dq->advanceBy(1900ms);
    CHECK(f.sm.state() == SessionState::AwaitingCommissioning);
    f.dq->advanceBy(200ms);
    CHECK(f.sm.state() == SessionState::Failed);
    CHECK(complete == ErrorCode::CommissioningFailed);

    // 만료 뒤의 완료 통지는 무시
    f.sm.handleCommissioningComplete(Error::success());
    CHECK(f.sm.state() == SessionState::Failed);
}

void test_window_refused_by_transport()
{
    Fixture f;
    f.transport->acceptWindow = false;
    Error complete;
    Error requested;
    f.sm.openBasicCommissioningWindow(f.capture(complete), f.capture(requested));
    CHECK(requested == ErrorCode::SendFailure);
    CHECK(f.sm.state() == SessionState::Idle);
    CHECK(f.dq->pendingTimers() == 0);
}

void test_commissioning_error_result()
{
    Fixture f;
    Error complete;
    Error requested;
    f.sm.openBasicCommissioningWindow(f.capture(complete), f.capture(requested));
    f.sm.handleCommissioningComplete(Error(ErrorCode::Timeout, "PASE timeout"));
    CHECK(f.sm.state() == SessionState::Failed);
    CHECK(complete == ErrorCode::CommissioningFailed);
    CHECK(complete.message() == "PASE timeout");

    // 윈도우 타이머는 취소되어 있어야 한다
    f.dq->advanceBy(3s);
    CHECK(f.sm.state() == SessionState::Failed);
}

void test_session_lost_cascades()
{
    Fixture f;
    f.commission();
    CHECK(f.sm.isCommissioned());

    f.sm.handleSessionLost("link down");
    CHECK(f.sm.state() == SessionState::Closed);
    CHECK(f.ended.size() == 1);
    CHECK(f.ended[0] == ErrorCode::SessionClosed);
    CHECK(f.ended[0].message() == "session lost: link down");
    CHECK(f.metrics.snapshot().sessionLossesTotal == 1);

    // 이미 닫힌 세션의 손실 통지는 무시
    f.sm.handleSessionLost("again");
    CHECK(f.ended.size() == 1);
}

void test_session_lost_while_awaiting()
{
    Fixture f;
    Error complete;
    Error requested;
    f.sm.openBasicCommissioningWindow(f.capture(complete), f.capture(requested));
    f.sm.handleSessionLost("reset");
    CHECK(f.sm.state() == SessionState::Failed);
    CHECK(complete == ErrorCode::CommissioningFailed);
    CHECK(f.ended.empty());
}

void test_close_session()
{
    Fixture f;
    Error complete;
    Error requested;
    Error closed(ErrorCode::Timeout);
    f.sm.openBasicCommissioningWindow(f.capture(complete), f.capture(requested));
    f.sm.closeSession(f.capture(closed));
    CHECK(closed.ok());
    CHECK(complete == ErrorCode::CommissioningFailed);
    CHECK(f.sm.state() == SessionState::Closed);
    CHECK(f.transport->closes == 1);

    f.sm.closeSession(f.capture(closed));
    CHECK(closed == ErrorCode::InvalidState);
    CHECK(f.transport->closes == 1);
}

void test_close_commissioned_session_cascades()
{
    Fixture f;
    f.commission();
    Error closed(ErrorCode::Timeout);
    f.sm.closeSession(f.capture(closed));
    CHECK(closed.ok());
    CHECK(f.ended.size() == 1);
    CHECK(f.ended[0].message() == "session closed by caller");
}

void test_reinitialize()
{
    Fixture f;
    Error r(ErrorCode::Timeout);
    f.sm.reinitialize(f.capture(r));
    CHECK(r.ok());

    f.commission();
    f.sm.reinitialize(f.capture(r));
    CHECK(r == ErrorCode::InvalidState);

    f.sm.handleSessionLost("gone");
    f.sm.reinitialize(f.capture(r));
    CHECK(r.ok());
    CHECK(f.sm.state() == SessionState::Idle);
}

void test_send_frame_retries()
{
    Fixture f(2);
    const std::vector<std::uint8_t> frame{0x01, 0x01, 0, 0, 0, 1};
    const protocol::MessageView view(frame);

    CHECK(f.sm.sendFrame(view) == ErrorCode::NotConnected);
    CHECK(f.transport->sendAttempts == 0);

    f.commission();
    f.transport->failNextSends = 2;
    CHECK(f.sm.sendFrame(view).ok());
    CHECK(f.transport->sendAttempts == 3);
    CHECK(f.transport->sent.size() == 1);

    f.transport->failNextSends = 3;
    CHECK(f.sm.sendFrame(view) == ErrorCode::SendFailure);
    CHECK(f.transport->sendAttempts == 6);
    CHECK(f.metrics.snapshot().sendFailuresTotal == 5);
}

void test_discovery_note()
{
    Fixture f;
    f.sm.noteDiscoveryStarted();
    CHECK(f.sm.state() == SessionState::Discovering);
    f.sm.noteDiscoveryStarted();
    CHECK(f.sm.state() == SessionState::Discovering);
}

} // namespace

int main()
{
    test_udc_returns_to_idle_after_send();
    test_udc_validation();
    test_udc_transport_refusal_is_send_failure();
    test_late_udc_completion_keeps_window_state();
    test_window_expiry_fails_commissioning();
    test_window_refused_by_transport();
    test_commissioning_error_result();
    test_session_lost_cascades();
    test_session_lost_while_awaiting();
    test_close_session();
    test_close_commissioned_session_cascades();
    test_reinitialize();
    test_send_frame_retries();
    test_discovery_note();
    return castlink::test::finish("session.session_manager");
}
