#include <castlink/CastingEngine.hpp>

#include <castlink/core/Defaults.hpp>
#include <castlink/core/DispatchQueue.hpp>
#include <castlink/core/Logger.hpp>
#include <castlink/discovery/PeerRegistry.hpp>
#include <castlink/monitoring/Metrics.hpp>
#include <castlink/protocol/Dispatcher.hpp>
#include <castlink/protocol/InteractionFrames.hpp>
#include <castlink/session/SessionManager.hpp>
#include <castlink/transport/EventGateway.hpp>

#include <atomic>
#include <exception>
#include <format>
#include <string>
#include <utility>

namespace castlink
{

namespace
{
/// 탐색 run 1회분 sink. 늦게 도착한 이전 run 의 레코드는 generation 으로 걸러집니다.
class DiscoveryRunSink final : public transport::IDiscoverySink
{
  public:
    using OnPeer = std::function<void(std::uint64_t generation, discovery::PeerRecord)>;

    DiscoveryRunSink(std::uint64_t generation, std::weak_ptr<transport::EventGateway> gateway,
                     OnPeer onPeer)
        : generation_(generation), gateway_(std::move(gateway)), onPeer_(std::move(onPeer))
    {
    }

    void onPeerDiscovered(discovery::PeerRecord record) override
    {
        auto gw = gateway_.lock();
        if (!gw)
            return;
        const std::string instance = record.instanceName;
        if (!gw->post([gen = generation_, onPeer = onPeer_, rec = std::move(record)]() mutable
                      { onPeer(gen, std::move(rec)); }))
        {
            CASTLINK_LOG_DEBUG("Engine", "PeerDropped", "instance='{}' reason=GatewayClosed",
                               instance);
        }
    }

  private:
    std::uint64_t generation_;
    std::weak_ptr<transport::EventGateway> gateway_;
    OnPeer onPeer_;
};

/// 세션 전송 이벤트 -> DispatchQueue
class SessionEventRelay final : public transport::ISessionEventSink
{
  public:
    struct Handlers
    {
        std::function<void(const Error &)> onCommissioningComplete;
        std::function<void(std::vector<std::uint8_t>)> onFrame;
        std::function<void(const std::string &)> onSessionLost;
    };

    SessionEventRelay(std::weak_ptr<transport::EventGateway> gateway, Handlers handlers)
        : gateway_(std::move(gateway)), handlers_(std::move(handlers))
    {
    }

    void onCommissioningComplete(Error result) override
    {
        post_([h = handlers_.onCommissioningComplete, r = std::move(result)]() { h(r); });
    }

    void onFrameReceived(std::vector<std::uint8_t> frame) override
    {
        post_([h = handlers_.onFrame, f = std::move(frame)]() mutable { h(std::move(f)); });
    }

    void onSessionLost(std::string reason) override
    {
        post_([h = handlers_.onSessionLost, r = std::move(reason)]() { h(r); });
    }

  private:
    void post_(transport::EventGateway::Task task)
    {
        auto gw = gateway_.lock();
        if (!gw || !gw->post(std::move(task)))
        {
            CASTLINK_LOG_DEBUG("Engine", "SessionEventDropped", "reason=GatewayClosed");
        }
    }

    std::weak_ptr<transport::EventGateway> gateway_;
    Handlers handlers_;
};
} // namespace

// =============================================================================
// Impl
// =============================================================================
class CastingEngine::Impl
{
  public:
    Impl(EngineConfig cfg, std::shared_ptr<transport::IDiscoveryTransport> disc,
         std::shared_ptr<transport::ISessionTransport> sess)
        : config(std::move(cfg)), onboarding(session::OnboardingPayload::fromConfig(config.commissioning)),
          discoveryTransport(std::move(disc)), sessionTransport(std::move(sess)),
          dq(std::make_shared<core::DispatchQueue>(
              std::chrono::milliseconds(effectiveTickResolutionMs(config)),
              effectiveTimerSlots(config), "dq")),
          gateway(std::make_shared<transport::EventGateway>(dq)),
          registry(effectiveMaxPeers(config)),
          session(*dq, sessionTransport, gateway,
                  std::chrono::seconds(effectiveWindowTimeoutS(config)),
                  config.interaction.sendRetries, metrics),
          correlator(*dq, metrics),
          subscriptions(*dq, metrics,
                        interaction::SubscriptionTable::Limits{
                            std::chrono::milliseconds(config.interaction.livenessMarginMs),
                            effectiveMaxPrimedReports(config)})
    {
        session.setSessionEndedHandler([this](const Error &e) { cascadeSessionEnded(e); });
        registerFrameHandlers();

        relay = std::make_shared<SessionEventRelay>(
            gateway,
            SessionEventRelay::Handlers{
                [this](const Error &r) { session.handleCommissioningComplete(r); },
                [this](std::vector<std::uint8_t> f) { onFrame(std::move(f)); },
                [this](const std::string &reason) { session.handleSessionLost(reason); }});
        sessionTransport->setEventSink(relay);
    }

    // ----- frame routing -----
    void registerFrameHandlers()
    {
        using namespace protocol;

        frames.registerHandler(kOpInvokeResponse,
                               [this](const MessageView &body)
                               {
                                   InvokeResponseFrame f;
                                   if (!decodeBody(body, f))
                                       return malformed(kOpInvokeResponse, body);
                                   if (!correlator.onInvokeResponse(f))
                                       unmatched(kOpInvokeResponse, f.correlationId);
                               });

        frames.registerHandler(kOpStatusResponse,
                               [this](const MessageView &body)
                               {
                                   StatusResponseFrame f;
                                   if (!decodeBody(body, f))
                                       return malformed(kOpStatusResponse, body);
                                   // id 공간이 하나이므로 커맨드가 아니면 구독 쪽이다.
                                   if (!correlator.onStatusResponse(f) &&
                                       !subscriptions.onStatusResponse(f))
                                       unmatched(kOpStatusResponse, f.correlationId);
                               });

        frames.registerHandler(kOpSubscribeResponse,
                               [this](const MessageView &body)
                               {
                                   SubscribeResponseFrame f;
                                   if (!decodeBody(body, f))
                                       return malformed(kOpSubscribeResponse, body);
                                   if (!subscriptions.onSubscribeResponse(f))
                                       unmatched(kOpSubscribeResponse, f.correlationId);
                               });

        frames.registerHandler(kOpReportData,
                               [this](const MessageView &body)
                               {
                                   ReportDataFrame f;
                                   if (!decodeBody(body, f))
                                       return malformed(kOpReportData, body);
                                   if (!subscriptions.onReport(f))
                                       unmatched(kOpReportData, f.correlationId);
                               });
    }

    void onFrame(std::vector<std::uint8_t> bytes)
    {
        if (!session.isCommissioned())
        {
            CASTLINK_LOG_DEBUG("Engine", "FrameIgnored", "state={} bytes={}",
                               session::toString(session.state()), bytes.size());
            return;
        }

        std::uint16_t opcode = 0;
        protocol::MessageView body;
        if (!protocol::splitFrame(protocol::MessageView(bytes), opcode, body))
            return malformed(0, protocol::MessageView(bytes));

        if (!frames.dispatch(opcode, body))
        {
            CASTLINK_LOG_WARN("Engine", "UnknownOpcode", "opcode=0x{:04X} bytes={}", opcode,
                              bytes.size());
        }
    }

    void malformed(std::uint16_t opcode, const protocol::MessageView &body)
    {
        metrics.onDecodeError();
        CASTLINK_LOG_WARN("Engine", "MalformedFrame", "opcode=0x{:04X} body_bytes={}", opcode,
                          body.size());
    }

    static void unmatched(std::uint16_t opcode, interaction::CorrelationId id)
    {
        // 타임아웃/해지 뒤에 늦게 온 응답
        CASTLINK_LOG_DEBUG("Engine", "UnmatchedFrame", "opcode=0x{:04X} id={}", opcode, id);
    }

    // ----- session end cascade -----
    void cascadeSessionEnded(const Error &error)
    {
        const std::size_t commands = correlator.failAll(error);
        const std::size_t subs = subscriptions.terminateAll(error);
        CASTLINK_LOG_INFO("Engine", "SessionCascade", "code={} commands={} subscriptions={}",
                          toString(error.code()), commands, subs);
    }

    // ----- discovery -----
    void startDiscovery(core::Continuation<Error> onSent)
    {
        discoveryTransport->stopBrowse();
        const std::uint64_t gen = registry.reset();
        session.noteDiscoveryStarted();

        discoverySink = std::make_shared<DiscoveryRunSink>(
            gen, gateway,
            [this](std::uint64_t g, discovery::PeerRecord rec) { onPeer(g, std::move(rec)); });

        if (!discoveryTransport->browse(discoverySink))
        {
            metrics.onSendFailure();
            CASTLINK_LOG_WARN("Discovery", "BrowseFailed", "generation={}", gen);
            onSent.deliver(Error(ErrorCode::SendFailure, "discovery browse request"));
            return;
        }

        CASTLINK_LOG_INFO("Discovery", "BrowseStarted", "generation={} max_peers={}", gen,
                          registry.maxPeers());
        onSent.deliver(Error::success());
    }

    void onPeer(std::uint64_t generation, discovery::PeerRecord rec)
    {
        const std::string name = rec.instanceName;
        const auto result = registry.append(generation, std::move(rec));
        if (result == discovery::AppendResult::Added)
        {
            metrics.onPeerDiscovered();
            CASTLINK_LOG_INFO("Discovery", "PeerAdded", "index={} instance={}",
                              registry.size() - 1, name);
            return;
        }
        CASTLINK_LOG_DEBUG("Discovery", "PeerDropped", "instance={} result={}", name,
                           discovery::toString(result));
    }

    // ----- submissions (queue thread) -----
    std::uint16_t endpointOr(const std::optional<std::uint16_t> &ep) const noexcept
    {
        return ep ? *ep : config.interaction.targetEndpoint;
    }

    // ----- shutdown (queue thread) -----
    void shutdownOnQueue()
    {
        discoveryTransport->stopBrowse();
        discoverySink.reset();

        // 세션 상태와 무관하게 남은 커맨드/구독을 먼저 정리한다.
        cascadeSessionEnded(Error(ErrorCode::SessionClosed, "engine shutdown"));

        // Idle/Failed 도 Closed 로 보낸다. 이후 큐에 남은 요청은 postOrReject 가 거절한다.
        if (session.state() != session::SessionState::Closed)
            session.closeSession(core::Continuation<Error>{});
        gateway->close();
    }

    EngineConfig config;
    session::OnboardingPayload onboarding;
    monitoring::EngineMetrics metrics;
    interaction::CorrelationIdAllocator ids;

    std::shared_ptr<transport::IDiscoveryTransport> discoveryTransport;
    std::shared_ptr<transport::ISessionTransport> sessionTransport;

    std::shared_ptr<core::DispatchQueue> dq;
    std::shared_ptr<transport::EventGateway> gateway;

    discovery::PeerRegistry registry;
    session::SessionManager session;
    interaction::RequestCorrelator correlator;
    interaction::SubscriptionTable subscriptions;
    protocol::Dispatcher frames;

    std::shared_ptr<SessionEventRelay> relay;
    std::shared_ptr<DiscoveryRunSink> discoverySink;

    std::atomic_bool started{false};
    std::atomic_bool stopped{false};
    RunMode mode{RunMode::Threaded};
};

// =============================================================================
// CastingEngine
// =============================================================================
namespace
{
EngineConfig validated(EngineConfig config)
{
    validateEngineConfig(config);
    return config;
}
} // namespace

CastingEngine::CastingEngine(EngineConfig config,
                             std::shared_ptr<transport::IDiscoveryTransport> discoveryTransport,
                             std::shared_ptr<transport::ISessionTransport> sessionTransport)
{
    if (!discoveryTransport || !sessionTransport)
        throw std::invalid_argument("CastingEngine: transports must not be null");

    impl_ = std::make_unique<Impl>(validated(std::move(config)), std::move(discoveryTransport),
                                   std::move(sessionTransport));

    CASTLINK_LOG_INFO("Engine", "Created",
                      "tick_ms={} max_peers={} window_s={} cmd_timeout_ms={} manual_code={}",
                      effectiveTickResolutionMs(impl_->config), effectiveMaxPeers(impl_->config),
                      effectiveWindowTimeoutS(impl_->config),
                      effectiveCommandTimeoutMs(impl_->config),
                      impl_->onboarding.manualPairingCode());
}

CastingEngine::~CastingEngine()
{
    try
    {
        shutdown();
    }
    catch (const std::exception &e)
    {
        CASTLINK_LOG_ERROR("Engine", "ShutdownFailed", "what='{}'", e.what());
    }
}

void CastingEngine::start(RunMode mode)
{
    if (impl_->stopped.load(std::memory_order_acquire))
        throw std::logic_error("CastingEngine::start: engine already shut down");
    if (impl_->started.exchange(true, std::memory_order_acq_rel))
        throw std::logic_error("CastingEngine::start: engine already started");

    impl_->mode = mode;
    if (mode == RunMode::Threaded)
        impl_->dq->start();
    else
        impl_->dq->bindToCurrentThread();

    CASTLINK_LOG_INFO("Engine", "Started", "mode={}",
                      mode == RunMode::Threaded ? "threaded" : "manual");
}

void CastingEngine::shutdown()
{
    if (impl_->stopped.exchange(true, std::memory_order_acq_rel))
        return;

    if (!impl_->started.load(std::memory_order_acquire))
    {
        // 큐를 돌린 적이 없으면 정리할 세션 작업도 없다.
        impl_->gateway->close();
        impl_->discoveryTransport->stopBrowse();
        impl_->dq->stop();
        CASTLINK_LOG_INFO("Engine", "Stopped", "started=false");
        return;
    }

    Impl *impl = impl_.get();
    if (impl_->mode == RunMode::Manual)
    {
        impl_->shutdownOnQueue();
        impl_->dq->stop();
    }
    else
    {
        if (!impl_->dq->post([impl]() { impl->shutdownOnQueue(); }))
            impl_->gateway->close();
        impl_->dq->stop();
    }

    impl_->sessionTransport->setEventSink({});
    const auto snap = impl_->metrics.snapshot();
    CASTLINK_LOG_INFO("Engine", "Stopped", "commands_sent={} reports={} session_losses={}",
                      snap.commandsSentTotal, snap.reportsDeliveredTotal,
                      snap.sessionLossesTotal);
}

bool CastingEngine::isRunning() const noexcept
{
    return impl_->started.load(std::memory_order_acquire) &&
           !impl_->stopped.load(std::memory_order_acquire);
}

std::shared_ptr<core::DispatchQueue> CastingEngine::dispatchQueue() const noexcept
{
    return impl_->dq;
}

const EngineConfig &CastingEngine::config() const noexcept
{
    return impl_->config;
}

const session::OnboardingPayload &CastingEngine::onboardingPayload() const noexcept
{
    return impl_->onboarding;
}

const monitoring::EngineMetrics &CastingEngine::metrics() const noexcept
{
    return impl_->metrics;
}

void CastingEngine::requireContext_(const core::CallContext &ctx, const char *api)
{
    if (!ctx.isValid())
        throw std::invalid_argument(std::string("CastingEngine::") + api +
                                    ": CallContext has no executor");
}

interaction::CorrelationId CastingEngine::nextCorrelationId_() noexcept
{
    return impl_->ids.next();
}

namespace
{
void rejectNotRunning(const char *api, const core::Continuation<Error> &onSent)
{
    CASTLINK_LOG_WARN("Engine", "RequestRejected", "api={} reason=EngineNotRunning", api);
    onSent.deliver(Error(ErrorCode::NotConnected, "engine is not running"));
}

/// 엔진 큐에 넣지 못한 요청은 호출자 컨텍스트로 바로 NotConnected 를 돌려준다.
/// shutdown() 이 시작된 뒤 큐에서 꺼내진 요청도 실행하지 않고 같은 오류로 끝낸다.
template <typename Fn>
void postOrReject(core::DispatchQueue &dq, const std::atomic_bool &stopped, const char *api,
                  const core::Continuation<Error> &onSent, Fn &&fn)
{
    if (stopped.load(std::memory_order_acquire))
    {
        rejectNotRunning(api, onSent);
        return;
    }

    auto guarded = [&stopped, api, onSent, fn = std::forward<Fn>(fn)]() mutable
    {
        if (stopped.load(std::memory_order_acquire))
        {
            rejectNotRunning(api, onSent);
            return;
        }
        fn();
    };
    if (!dq.post(std::move(guarded)))
        rejectNotRunning(api, onSent);
}
} // namespace

// ===== Discovery =====

void CastingEngine::discoverCommissioners(const core::CallContext &ctx, SentFn onSent)
{
    requireContext_(ctx, "discoverCommissioners");
    core::Continuation<Error> sent(ctx, std::move(onSent));
    Impl *impl = impl_.get();
    postOrReject(*impl_->dq, impl_->stopped, "discoverCommissioners", sent,
                 [impl, sent]() { impl->startDiscovery(sent); });
}

void CastingEngine::getDiscoveredCommissioner(std::size_t index, const core::CallContext &ctx,
                                              PeerFn handler)
{
    requireContext_(ctx, "getDiscoveredCommissioner");
    core::Continuation<Error, std::optional<discovery::PeerRecord>> out(ctx, std::move(handler));
    Impl *impl = impl_.get();

    const bool posted = impl_->dq->post(
        [impl, index, out]()
        {
            const discovery::PeerRecord *rec = impl->registry.find(index);
            if (!rec)
            {
                out.deliver(Error(ErrorCode::NotFound,
                                  std::format("peer index {} (size {})", index,
                                              impl->registry.size())),
                            std::nullopt);
                return;
            }
            out.deliver(Error::success(), *rec);
        });

    if (!posted)
        out.deliver(Error(ErrorCode::NotConnected, "engine is not running"), std::nullopt);
}

// ===== Commissioning =====

void CastingEngine::sendUserDirectedCommissioningRequest(transport::UdcTarget target,
                                                         const core::CallContext &ctx,
                                                         SentFn onSent)
{
    requireContext_(ctx, "sendUserDirectedCommissioningRequest");
    core::Continuation<Error> sent(ctx, std::move(onSent));
    Impl *impl = impl_.get();
    postOrReject(*impl_->dq, impl_->stopped, "sendUserDirectedCommissioningRequest", sent,
                 [impl, sent, target = std::move(target)]()
                 { impl->session.sendUserDirectedCommissioningRequest(target, sent); });
}

void CastingEngine::sendUserDirectedCommissioningRequest(std::size_t peerIndex,
                                                         const core::CallContext &ctx,
                                                         SentFn onSent)
{
    requireContext_(ctx, "sendUserDirectedCommissioningRequest");
    core::Continuation<Error> sent(ctx, std::move(onSent));
    Impl *impl = impl_.get();
    postOrReject(*impl_->dq, impl_->stopped, "sendUserDirectedCommissioningRequest", sent,
                 [impl, sent, peerIndex]()
                 {
                     const discovery::PeerRecord *rec = impl->registry.find(peerIndex);
                     if (!rec)
                     {
                         sent.deliver(Error(ErrorCode::NotFound,
                                            std::format("peer index {}", peerIndex)));
                         return;
                     }
                     if (!rec->hasAddress())
                     {
                         sent.deliver(Error(ErrorCode::InvalidArgument,
                                            "peer " + rec->instanceName + " has no address"));
                         return;
                     }
                     impl->session.sendUserDirectedCommissioningRequest(
                         transport::UdcTarget{rec->primaryAddress(), rec->port, rec->interfaceId},
                         sent);
                 });
}

void CastingEngine::openBasicCommissioningWindow(const core::CallContext &ctx,
                                                 std::function<void(Error)> onComplete,
                                                 SentFn onRequested)
{
    requireContext_(ctx, "openBasicCommissioningWindow");
    core::Continuation<Error> complete(ctx, std::move(onComplete));
    core::Continuation<Error> requested(ctx, std::move(onRequested));
    Impl *impl = impl_.get();
    postOrReject(*impl_->dq, impl_->stopped, "openBasicCommissioningWindow", requested,
                 [impl, complete, requested]()
                 { impl->session.openBasicCommissioningWindow(complete, requested); });
}

void CastingEngine::closeSession(const core::CallContext &ctx, SentFn onSent)
{
    requireContext_(ctx, "closeSession");
    core::Continuation<Error> sent(ctx, std::move(onSent));
    Impl *impl = impl_.get();
    postOrReject(*impl_->dq, impl_->stopped, "closeSession", sent,
                 [impl, sent]() { impl->session.closeSession(sent); });
}

void CastingEngine::reinitialize(const core::CallContext &ctx, SentFn onSent)
{
    requireContext_(ctx, "reinitialize");
    core::Continuation<Error> sent(ctx, std::move(onSent));
    Impl *impl = impl_.get();
    postOrReject(*impl_->dq, impl_->stopped, "reinitialize", sent,
                 [impl, sent]() { impl->session.reinitialize(sent); });
}

void CastingEngine::querySessionState(const core::CallContext &ctx, StateFn handler)
{
    requireContext_(ctx, "querySessionState");
    core::Continuation<session::SessionState> out(ctx, std::move(handler));
    Impl *impl = impl_.get();
    if (!impl_->dq->post([impl, out]() { out.deliver(impl->session.state()); }))
        out.deliver(session::SessionState::Closed);
}

// ===== Commands / Subscriptions (queue side) =====

void CastingEngine::submitCommand_(CommandSubmission &&submission)
{
    Impl *impl = impl_.get();
    auto sub = std::make_shared<CommandSubmission>(std::move(submission));

    postOrReject(
        *impl_->dq, impl_->stopped, "invoke", sub->onSent,
        [impl, sub]()
        {
            if (!sub->encoded)
            {
                sub->onSent.deliver(Error(ErrorCode::InvalidArgument,
                                          std::format("command 0x{:04X}/0x{:04X} encode failed",
                                                      sub->clusterId, sub->commandId)));
                return;
            }

            protocol::InvokeRequestFrame frame;
            frame.correlationId = sub->id;
            frame.endpoint = impl->endpointOr(sub->endpoint);
            frame.clusterId = sub->clusterId;
            frame.commandId = sub->commandId;
            frame.payload = protocol::MessageView(sub->payload);
            const auto bytes = protocol::encodeFrame(frame);

            const Error sendResult = impl->session.sendFrame(protocol::MessageView(bytes));
            if (!sendResult.ok())
            {
                CASTLINK_LOG_DEBUG("Engine", "InvokeNotSent", "id={} error={}", sub->id,
                                   sendResult.toString());
                sub->onSent.deliver(sendResult);
                return;
            }

            const auto timeout = sub->timeout.count() > 0
                                     ? sub->timeout
                                     : std::chrono::milliseconds(
                                           effectiveCommandTimeoutMs(impl->config));
            if (!impl->correlator.track(sub->id, sub->clusterId, sub->commandId, timeout,
                                        std::move(sub->onResponse), sub->onFailure))
            {
                sub->onSent.deliver(Error(ErrorCode::InvalidState, "duplicate correlation id"));
                return;
            }
            sub->onSent.deliver(Error::success());
        });
}

void CastingEngine::submitSubscribe_(SubscribeSubmission &&submission)
{
    Impl *impl = impl_.get();
    auto sub = std::make_shared<SubscribeSubmission>(std::move(submission));

    postOrReject(
        *impl_->dq, impl_->stopped, "subscribe", sub->onSent,
        [impl, sub]()
        {
            if (sub->minIntervalS > sub->maxIntervalS)
            {
                sub->onSent.deliver(Error(ErrorCode::InvalidArgument,
                                          std::format("minInterval {} > maxInterval {}",
                                                      sub->minIntervalS, sub->maxIntervalS)));
                return;
            }

            protocol::SubscribeRequestFrame frame;
            frame.correlationId = sub->id;
            frame.endpoint = impl->endpointOr(sub->endpoint);
            frame.clusterId = sub->clusterId;
            frame.attributeId = sub->attributeId;
            frame.minIntervalS = sub->minIntervalS;
            frame.maxIntervalS = sub->maxIntervalS;
            const auto bytes = protocol::encodeFrame(frame);

            const Error sendResult = impl->session.sendFrame(protocol::MessageView(bytes));
            if (!sendResult.ok())
            {
                sub->onSent.deliver(sendResult);
                return;
            }

            const interaction::AttributePath path{frame.endpoint, sub->clusterId,
                                                  sub->attributeId};
            const auto timeout =
                std::chrono::milliseconds(effectiveSubscribeTimeoutMs(impl->config));
            if (!impl->subscriptions.add(sub->id, path, sub->minIntervalS, sub->maxIntervalS,
                                         timeout, std::move(sub->onReport), sub->onFailure,
                                         sub->onEstablished))
            {
                sub->onSent.deliver(Error(ErrorCode::InvalidState, "duplicate correlation id"));
                return;
            }
            sub->onSent.deliver(Error::success());
        });
}

void CastingEngine::unsubscribe(interaction::SubscriptionId id, const core::CallContext &ctx,
                                SentFn onSent)
{
    requireContext_(ctx, "unsubscribe");
    core::Continuation<Error> sent(ctx, std::move(onSent));
    Impl *impl = impl_.get();

    postOrReject(*impl_->dq, impl_->stopped, "unsubscribe", sent,
                 [impl, id, sent]()
                 {
                     if (!impl->subscriptions.remove(id))
                     {
                         sent.deliver(Error(ErrorCode::NotFound,
                                            std::format("subscription {}", id)));
                         return;
                     }

                     // 상대 쪽 해지는 best-effort
                     if (impl->session.isCommissioned())
                     {
                         const auto bytes =
                             protocol::encodeFrame(protocol::SubscriptionCancelFrame{id});
                         const Error r = impl->session.sendFrame(protocol::MessageView(bytes));
                         if (!r.ok())
                         {
                             CASTLINK_LOG_WARN("Engine", "CancelNotSent", "id={} error={}", id,
                                               r.toString());
                         }
                     }
                     sent.deliver(Error::success());
                 });
}

} // namespace castlink
