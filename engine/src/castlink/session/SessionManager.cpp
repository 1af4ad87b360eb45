#include <castlink/session/SessionManager.hpp>

#include <castlink/core/Logger.hpp>

#include <stdexcept>
#include <utility>

namespace castlink::session
{

namespace
{
constexpr std::uint32_t kUdcAllowed = stateBit(SessionState::Idle) |
                                      stateBit(SessionState::Discovering);

constexpr std::uint32_t kWindowAllowed = stateBit(SessionState::Idle) |
                                         stateBit(SessionState::Discovering) |
                                         stateBit(SessionState::ConnectingUDC);

Error invalidState(const char *op, SessionState s)
{
    return Error(ErrorCode::InvalidState, std::string(op) + " not allowed in state " + toString(s));
}
} // namespace

SessionManager::SessionManager(core::DispatchQueue &dq,
                               std::shared_ptr<transport::ISessionTransport> transport,
                               std::shared_ptr<transport::EventGateway> gateway,
                               std::chrono::seconds windowTimeout, std::uint32_t sendRetries,
                               monitoring::EngineMetrics &metrics)
    : dq_(dq), transport_(std::move(transport)), gateway_(std::move(gateway)),
      windowTimeout_(windowTimeout), sendRetries_(sendRetries), metrics_(metrics)
{
    if (!transport_)
        throw std::invalid_argument("SessionManager: session transport is null");
    if (!gateway_)
        throw std::invalid_argument("SessionManager: event gateway is null");
}

SessionManager::~SessionManager() = default;

void SessionManager::noteDiscoveryStarted()
{
    if (fsm_.is(SessionState::Idle))
        fsm_.transition(SessionState::Discovering, "DiscoveryStarted");
}

void SessionManager::sendUserDirectedCommissioningRequest(const transport::UdcTarget &target,
                                                          core::Continuation<Error> onSent)
{
    if (!fsm_.isAnyOf(kUdcAllowed))
    {
        onSent.deliver(invalidState("sendUserDirectedCommissioningRequest", fsm_.state()));
        return;
    }
    if (target.address.empty() || target.port == 0)
    {
        onSent.deliver(Error(ErrorCode::InvalidArgument, "UDC target requires address and port"));
        return;
    }

    const std::uint64_t attempt = ++udcSeq_;
    fsm_.transition(SessionState::ConnectingUDC, "UdcRequested");

    CASTLINK_LOG_INFO("Session", "UdcSend", "attempt={} addr={} port={} if={}", attempt,
                      target.address, target.port, target.interfaceId);

    std::weak_ptr<transport::EventGateway> weakGateway = gateway_;
    const bool started = transport_->sendUserDirectedCommissioningRequest(
        target,
        [this, weakGateway, attempt, onSent](bool sent)
        {
            // 전송 스레드 -> DispatchQueue
            auto gw = weakGateway.lock();
            if (!gw)
                return;
            if (!gw->post([this, attempt, sent, onSent]() { onUdcSent_(attempt, sent, onSent); }))
                CASTLINK_LOG_DEBUG("Session", "UdcDoneDropped", "attempt={}", attempt);
        });

    if (!started)
        onUdcSent_(attempt, false, std::move(onSent));
}

void SessionManager::onUdcSent_(std::uint64_t attempt, bool sent, core::Continuation<Error> onSent)
{
    // fire-and-forget: 그 사이 윈도우를 열었거나 세션이 끝났으면 상태는 건드리지 않는다.
    if (attempt == udcSeq_ && fsm_.is(SessionState::ConnectingUDC))
        fsm_.transition(SessionState::Idle, sent ? "UdcSent" : "UdcSendFailed");

    if (!sent)
    {
        metrics_.onSendFailure();
        CASTLINK_LOG_WARN("Session", "UdcSendFailed", "attempt={}", attempt);
        onSent.deliver(Error(ErrorCode::SendFailure, "user directed commissioning request"));
        return;
    }
    onSent.deliver(Error::success());
}

void SessionManager::openBasicCommissioningWindow(core::Continuation<Error> onComplete,
                                                  core::Continuation<Error> onRequested)
{
    if (!fsm_.isAnyOf(kWindowAllowed))
    {
        onRequested.deliver(invalidState("openBasicCommissioningWindow", fsm_.state()));
        return;
    }

    if (!transport_->openCommissioningWindow(windowTimeout_))
    {
        metrics_.onSendFailure();
        CASTLINK_LOG_WARN("Session", "WindowOpenFailed", "state={}", toString(fsm_.state()));
        onRequested.deliver(Error(ErrorCode::SendFailure, "open commissioning window"));
        return;
    }

    fsm_.transition(SessionState::AwaitingCommissioning, "WindowOpened");
    onCommissioningComplete_ = std::move(onComplete);

    const std::uint64_t window = ++windowSeq_;
    windowTimer_ = dq_.addTimer(std::chrono::duration_cast<std::chrono::milliseconds>(windowTimeout_),
                                [this, window]() { onWindowExpired_(window); });

    CASTLINK_LOG_INFO("Session", "WindowOpened", "window={} timeout_s={}", window,
                      windowTimeout_.count());
    onRequested.deliver(Error::success());
}

void SessionManager::onWindowExpired_(std::uint64_t window)
{
    if (window != windowSeq_ || !fsm_.is(SessionState::AwaitingCommissioning))
        return;

    windowTimer_ = core::TimerWheel::kInvalidTimerId;
    CASTLINK_LOG_WARN("Session", "WindowExpired", "window={}", window);
    fsm_.transition(SessionState::Failed, "WindowExpired");
    finishCommissioning_(Error(ErrorCode::CommissioningFailed, "commissioning window expired"));
}

void SessionManager::cancelWindowTimer_()
{
    if (windowTimer_ != core::TimerWheel::kInvalidTimerId)
    {
        dq_.cancelTimer(windowTimer_);
        windowTimer_ = core::TimerWheel::kInvalidTimerId;
    }
}

void SessionManager::finishCommissioning_(Error result)
{
    auto onComplete = std::exchange(onCommissioningComplete_, core::Continuation<Error>{});
    onComplete.deliver(std::move(result));
}

void SessionManager::handleCommissioningComplete(const Error &result)
{
    if (!fsm_.is(SessionState::AwaitingCommissioning))
    {
        CASTLINK_LOG_WARN("Session", "UnexpectedCommissioningComplete", "state={} result={}",
                          toString(fsm_.state()), result.toString());
        return;
    }

    cancelWindowTimer_();

    if (result.ok())
    {
        fsm_.transition(SessionState::Commissioned, "CommissioningComplete");
        finishCommissioning_(Error::success());
        return;
    }

    fsm_.transition(SessionState::Failed, "CommissioningError");
    finishCommissioning_(Error(ErrorCode::CommissioningFailed, result.message()));
}

void SessionManager::handleSessionLost(const std::string &reason)
{
    switch (fsm_.state())
    {
    case SessionState::Commissioned:
        metrics_.onSessionLost();
        fsm_.transition(SessionState::Closed, "SessionLost");
        endCommissionedSession_(Error(ErrorCode::SessionClosed, "session lost: " + reason));
        break;

    case SessionState::AwaitingCommissioning:
        cancelWindowTimer_();
        fsm_.transition(SessionState::Failed, "TransportLost");
        finishCommissioning_(Error(ErrorCode::CommissioningFailed, "transport lost: " + reason));
        break;

    default:
        CASTLINK_LOG_DEBUG("Session", "LossIgnored", "state={} reason={}", toString(fsm_.state()),
                           reason);
        break;
    }
}

void SessionManager::endCommissionedSession_(const Error &error)
{
    if (onSessionEnded_)
        onSessionEnded_(error);
}

void SessionManager::closeSession(core::Continuation<Error> onSent)
{
    const SessionState from = fsm_.state();
    if (from == SessionState::Closed)
    {
        onSent.deliver(invalidState("closeSession", from));
        return;
    }

    cancelWindowTimer_();
    fsm_.transition(SessionState::Closed, "CloseRequested");

    if (from == SessionState::Commissioned)
    {
        metrics_.onSessionLost();
        endCommissionedSession_(Error(ErrorCode::SessionClosed, "session closed by caller"));
    }
    else if (from == SessionState::AwaitingCommissioning)
    {
        finishCommissioning_(Error(ErrorCode::CommissioningFailed, "session closed by caller"));
    }

    transport_->close();
    onSent.deliver(Error::success());
}

void SessionManager::reinitialize(core::Continuation<Error> onSent)
{
    if (fsm_.is(SessionState::Idle))
    {
        onSent.deliver(Error::success());
        return;
    }
    if (!fsm_.isAnyOf(stateBit(SessionState::Failed) | stateBit(SessionState::Closed)))
    {
        onSent.deliver(invalidState("reinitialize", fsm_.state()));
        return;
    }

    fsm_.transition(SessionState::Idle, "Reinitialize");
    onSent.deliver(Error::success());
}

Error SessionManager::sendFrame(const protocol::MessageView &frame)
{
    if (!isCommissioned())
        return Error(ErrorCode::NotConnected, std::string("session is ") + toString(fsm_.state()));

    for (std::uint32_t attempt = 0; attempt <= sendRetries_; ++attempt)
    {
        if (transport_->send(frame))
            return Error::success();

        metrics_.onSendFailure();
        CASTLINK_LOG_WARN("Session", "SendFailed", "attempt={} retries={} bytes={}", attempt,
                          sendRetries_, frame.size());
    }
    return Error(ErrorCode::SendFailure, "transport send failed");
}

} // namespace castlink::session
