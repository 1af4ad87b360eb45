#include "CastClientApplication.hpp"

#include <casting/Clusters.hpp>

#include <castlink/core/Logger.hpp>
#include <castlink/monitoring/Metrics.hpp>

#include <future>
#include <optional>
#include <string>
#include <thread>
#include <utility>

namespace cast_client
{

namespace cl = casting::clusters;
using castlink::Error;
using castlink::ErrorCode;

namespace
{
constexpr auto kStepTimeout = std::chrono::seconds(5);

template <typename T> std::optional<T> waitFor(std::future<T> &f, std::chrono::milliseconds timeout)
{
    if (f.wait_for(timeout) != std::future_status::ready)
        return std::nullopt;
    return f.get();
}

std::string levelText(const std::optional<std::uint8_t> &v)
{
    return v ? std::to_string(*v) : std::string("null");
}
} // namespace

CastClientApplication::CastClientApplication(const castlink::core::GlobalConfig &cfg)
    : cfg_(cfg), exec_(std::make_shared<castlink::core::ThreadExecutor>("exec")),
      sim_(std::make_shared<casting::sim::SimulatedCommissioner>(cfg.sim)),
      engine_(std::make_unique<castlink::CastingEngine>(cfg.engine, sim_, sim_))
{
}

CastClientApplication::~CastClientApplication() = default;

int CastClientApplication::run()
{
    exec_->start();
    sim_->start();
    engine_->start(castlink::RunMode::Threaded);

    // 앱이 먼저 사라지면 늦게 도착한 결과는 버려진다.
    ctx_ = castlink::core::CallContext::on(exec_).guardedBy(shared_from_this());

    const auto &payload = engine_->onboardingPayload();
    CASTLINK_LOG_INFO("App", "Onboarding", "manual_code={} vid=0x{:04X} pid=0x{:04X}",
                      payload.manualPairingCode(), payload.vendorId(), payload.productId());

    const bool ok = runScenario_();

    engine_->shutdown();
    sim_->stop();
    exec_->stop();

    const auto snap = engine_->metrics().snapshot();
    CASTLINK_LOG_INFO("App", "Done",
                      "ok={} commands_sent={} succeeded={} failed={} reports={} udc={} frames={}",
                      ok, snap.commandsSentTotal, snap.commandsSucceededTotal,
                      snap.commandsFailedTotal, snap.reportsDeliveredTotal, sim_->udcRequests(),
                      sim_->framesReceived());
    CASTLINK_LOG_DEBUG("App", "Metrics", "\n{}", engine_->metrics().toPrometheusText());
    return ok ? 0 : 1;
}

bool CastClientApplication::runScenario_()
{
    return discover_() && commission_() && subscribeAll_() && sendCommands_() && teardown_();
}

Error CastClientApplication::awaitSent_(const char *step,
                                        const std::function<void(SentFn)> &request)
{
    auto done = std::make_shared<std::promise<Error>>();
    auto fut = done->get_future();
    request([done](Error e) { done->set_value(std::move(e)); });

    auto res = waitFor(fut, kStepTimeout);
    if (!res)
    {
        CASTLINK_LOG_ERROR("App", "StepTimeout", "step={}", step);
        return Error(ErrorCode::Timeout, step);
    }
    if (!res->ok())
        CASTLINK_LOG_WARN("App", "StepFailed", "step={} err={}", step, res->toString());
    else
        CASTLINK_LOG_INFO("App", "StepSent", "step={}", step);
    return *res;
}

template <typename C> bool CastClientApplication::awaitInvoke_(const char *step, const C &command)
{
    auto result = std::make_shared<std::promise<Error>>();
    auto fut = result->get_future();

    engine_->invoke(
        command, ctx_,
        [result, step](Error e)
        {
            if (!e.ok())
                result->set_value(std::move(e));
            else
                CASTLINK_LOG_DEBUG("App", "CommandSent", "step={}", step);
        },
        [result](typename C::Response) { result->set_value(Error::success()); },
        [result](Error e) { result->set_value(std::move(e)); });

    auto res = waitFor(fut, kStepTimeout);
    if (!res)
    {
        CASTLINK_LOG_ERROR("App", "CommandTimeout", "step={}", step);
        return false;
    }
    if (!res->ok())
    {
        CASTLINK_LOG_WARN("App", "CommandFailed", "step={} err={}", step, res->toString());
        return false;
    }
    CASTLINK_LOG_INFO("App", "CommandOk", "step={}", step);
    return true;
}

bool CastClientApplication::discover_()
{
    if (!awaitSent_("discover", [this](SentFn fn) { engine_->discoverCommissioners(ctx_, fn); })
             .ok())
        return false;

    // 광고가 올 때까지 index 0 을 폴링
    const auto deadline = std::chrono::steady_clock::now() + kStepTimeout;
    std::optional<castlink::discovery::PeerRecord> first;
    while (!first && std::chrono::steady_clock::now() < deadline)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(cfg_.sim.advertiseDelayMs + 10));

        auto p = std::make_shared<std::promise<std::optional<castlink::discovery::PeerRecord>>>();
        auto fut = p->get_future();
        engine_->getDiscoveredCommissioner(
            0, ctx_, [p](Error, std::optional<castlink::discovery::PeerRecord> rec)
            { p->set_value(std::move(rec)); });
        if (auto got = waitFor(fut, kStepTimeout))
            first = std::move(*got);
    }
    if (!first)
    {
        CASTLINK_LOG_ERROR("App", "NoCommissioner");
        return false;
    }
    CASTLINK_LOG_INFO("App", "Commissioner", "name='{}' instance={} addr={} port={}",
                      first->deviceName, first->instanceName,
                      first->hasAddress() ? first->primaryAddress() : std::string("-"),
                      first->port);

    // 범위 밖 index 는 NotFound
    auto probe = std::make_shared<std::promise<Error>>();
    auto probeFut = probe->get_future();
    engine_->getDiscoveredCommissioner(5, ctx_,
                                       [probe](Error e, std::optional<castlink::discovery::PeerRecord>)
                                       { probe->set_value(std::move(e)); });
    if (auto e = waitFor(probeFut, kStepTimeout))
        CASTLINK_LOG_INFO("App", "ProbeIndex", "index=5 result={}", e->toString());
    return true;
}

bool CastClientApplication::commission_()
{
    if (!awaitSent_("udc", [this](SentFn fn)
                    { engine_->sendUserDirectedCommissioningRequest(std::size_t{0}, ctx_, fn); })
             .ok())
        return false;

    auto complete = std::make_shared<std::promise<Error>>();
    auto completeFut = complete->get_future();

    const Error requested = awaitSent_(
        "commissioning_window",
        [this, complete](SentFn fn)
        {
            engine_->openBasicCommissioningWindow(
                ctx_, [complete](Error e) { complete->set_value(std::move(e)); }, fn);
        });
    if (!requested.ok())
        return false;

    auto res = waitFor(completeFut, std::chrono::milliseconds(cfg_.sim.commissioningDelayMs) +
                                        kStepTimeout);
    if (!res || !res->ok())
    {
        CASTLINK_LOG_ERROR("App", "CommissioningFailed", "err={}",
                           res ? res->toString() : std::string("timeout"));
        return false;
    }
    CASTLINK_LOG_INFO("App", "Commissioned");
    return true;
}

bool CastClientApplication::subscribeAll_()
{
    auto established = std::make_shared<std::promise<void>>();
    auto establishedFut = established->get_future();

    const auto onFailure = [](Error e)
    { CASTLINK_LOG_WARN("App", "SubscriptionEnded", "err={}", e.toString()); };

    subscriptions_.push_back(engine_->subscribe<cl::level_control::CurrentLevel>(
        {1, 2}, ctx_, [](Error e)
        {
            if (!e.ok())
                CASTLINK_LOG_WARN("App", "SubscribeNotSent", "attr=CurrentLevel err={}",
                                  e.toString());
        },
        [](std::optional<std::uint8_t> level)
        { CASTLINK_LOG_INFO("App", "Report", "attr=CurrentLevel value={}", levelText(level)); },
        onFailure, [established]() { established->set_value(); }));

    subscriptions_.push_back(engine_->subscribe<cl::media_playback::CurrentState>(
        {0, 5}, ctx_, {},
        [](cl::media_playback::PlaybackState s)
        {
            CASTLINK_LOG_INFO("App", "Report", "attr=CurrentState value={}",
                              static_cast<int>(s));
        },
        onFailure));

    subscriptions_.push_back(engine_->subscribe<cl::target_navigator::TargetList>(
        {0, 10}, ctx_, {},
        [](std::vector<cl::target_navigator::TargetInfo> targets)
        { CASTLINK_LOG_INFO("App", "Report", "attr=TargetList count={}", targets.size()); },
        onFailure));

    subscriptions_.push_back(engine_->subscribe<cl::application_basic::ApplicationName>(
        {0, 30}, ctx_, {},
        [](std::string name)
        { CASTLINK_LOG_INFO("App", "Report", "attr=ApplicationName value='{}'", name); },
        onFailure));

    if (establishedFut.wait_for(kStepTimeout) != std::future_status::ready)
    {
        CASTLINK_LOG_ERROR("App", "SubscribeTimeout", "attr=CurrentLevel");
        return false;
    }
    CASTLINK_LOG_INFO("App", "Subscribed", "count={}", subscriptions_.size());
    return true;
}

bool CastClientApplication::sendCommands_()
{
    bool ok = true;

    for (std::uint8_t level : {5, 7, 8})
    {
        cl::level_control::MoveToLevel cmd;
        cmd.level = level;
        ok = awaitInvoke_("MoveToLevel", cmd) && ok;
    }

    cl::content_launcher::LaunchURL url;
    url.contentUrl = "https://www.example.com/videos/demo";
    url.displayString = "Demo";
    ok = awaitInvoke_("LaunchURL", url) && ok;

    ok = awaitInvoke_("Play", cl::media_playback::Play{}) && ok;

    cl::media_playback::Seek seek;
    seek.positionMs = 10'000;
    ok = awaitInvoke_("Seek", seek) && ok;

    cl::target_navigator::NavigateTarget nav;
    nav.target = 1;
    ok = awaitInvoke_("NavigateTarget", nav) && ok;

    ok = awaitInvoke_("SendKey", cl::keypad_input::SendKey(cl::keypad_input::KeyCode::Select)) && ok;

    cl::application_launcher::LaunchApp app;
    app.application.catalogVendorId = 123;
    app.application.applicationId = "exampleid";
    ok = awaitInvoke_("LaunchApp", app) && ok;

    // 잠깐 report 를 받아 본다.
    std::this_thread::sleep_for(std::chrono::milliseconds(cfg_.sim.responseDelayMs * 4 + 50));
    return ok;
}

bool CastClientApplication::teardown_()
{
    bool ok = true;
    for (auto id : subscriptions_)
    {
        if (!awaitSent_("unsubscribe", [this, id](SentFn fn) { engine_->unsubscribe(id, ctx_, fn); })
                 .ok())
            ok = false;
    }
    subscriptions_.clear();

    auto state = std::make_shared<std::promise<castlink::session::SessionState>>();
    auto stateFut = state->get_future();
    engine_->querySessionState(ctx_, [state](castlink::session::SessionState s)
                               { state->set_value(s); });
    if (auto s = waitFor(stateFut, kStepTimeout))
        CASTLINK_LOG_INFO("App", "SessionState", "state={}", castlink::session::toString(*s));

    return awaitSent_("close_session", [this](SentFn fn) { engine_->closeSession(ctx_, fn); }).ok() &&
           ok;
}

} // namespace cast_client
