#include "../support/Check.hpp"

#include <casting/Clusters.hpp>
#include <casting/sim/SimulatedCommissioner.hpp>
#include <castlink/CastingEngine.hpp>
#include <castlink/core/ExecutionContext.hpp>
#include <castlink/interaction/ClusterConcepts.hpp>
#include <castlink/monitoring/Metrics.hpp>

#include <chrono>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace castlink;
using namespace casting::clusters;
using namespace std::chrono_literals;

namespace
{

constexpr auto kWait = 3s;

/// 1회성 결과를 다른 스레드(exec)에서 받아 기다립니다.
template <typename T> struct Once
{
    std::shared_ptr<std::promise<T>> promise = std::make_shared<std::promise<T>>();
    std::future<T> future = promise->get_future();

    std::function<void(T)> fn()
    {
        auto p = promise;
        return [p](T v) { p->set_value(std::move(v)); };
    }

    std::optional<T> wait()
    {
        if (future.wait_for(kWait) != std::future_status::ready)
            return std::nullopt;
        return future.get();
    }
};

/// report 값 누적 + 조건 대기
class LevelLog
{
  public:
    void push(int v)
    {
        {
            std::lock_guard<std::mutex> lock(mu_);
            values_.push_back(v);
        }
        cv_.notify_all();
    }

    bool waitFor(int v)
    {
        std::unique_lock<std::mutex> lock(mu_);
        return cv_.wait_for(lock, kWait,
                            [&]()
                            {
                                for (int x : values_)
                                    if (x == v)
                                        return true;
                                return false;
                            });
    }

  private:
    std::mutex mu_;
    std::condition_variable cv_;
    std::vector<int> values_;
};

struct Rig
{
    Rig()
    {
        core::SimulatorConfig sc;
        sc.advertiseDelayMs = 10;
        sc.commissioningDelayMs = 20;
        sc.responseDelayMs = 5;
        sc.peerCount = 2;

        exec = std::make_shared<core::ThreadExecutor>("exec");
        sim = std::make_shared<casting::sim::SimulatedCommissioner>(sc);
        engine = std::make_unique<CastingEngine>(EngineConfig{}, sim, sim);
        ctx = core::CallContext::on(exec);

        exec->start();
        sim->start();
        engine->start(RunMode::Threaded);
    }

    ~Rig()
    {
        engine->shutdown();
        sim->stop();
        exec->stop();
    }

    std::optional<discovery::PeerRecord> peer(std::size_t index, Error &err)
    {
        using Result = std::pair<Error, std::optional<discovery::PeerRecord>>;
        Once<Result> once;
        auto fn = once.fn();
        engine->getDiscoveredCommissioner(index, ctx,
                                          [fn](Error e, std::optional<discovery::PeerRecord> r)
                                          { fn(Result{std::move(e), std::move(r)}); });
        auto got = once.wait();
        if (!got)
        {
            err = Error(ErrorCode::Timeout, "no answer");
            return std::nullopt;
        }
        err = got->first;
        return got->second;
    }

    std::shared_ptr<core::ThreadExecutor> exec;
    std::shared_ptr<casting::sim::SimulatedCommissioner> sim;
    std::unique_ptr<CastingEngine> engine;
    core::CallContext ctx;
};

bool discoverAndCommission(Rig &rig)
{
    Once<Error> browse;
    rig.engine->discoverCommissioners(rig.ctx, browse.fn());
    const auto browsed = browse.wait();
    CHECK(browsed && browsed->ok());

    // 광고가 도착할 때까지 폴링
    Error err;
    std::optional<discovery::PeerRecord> first;
    for (int i = 0; i < 100 && !first; ++i)
    {
        first = rig.peer(1, err);
        if (!first)
            std::this_thread::sleep_for(10ms);
    }
    CHECK(first.has_value());
    CHECK(rig.peer(0, err).has_value());
    CHECK(!rig.peer(2, err).has_value());
    CHECK(err == ErrorCode::NotFound);

    Once<Error> udc;
    rig.engine->sendUserDirectedCommissioningRequest(std::size_t{0}, rig.ctx, udc.fn());
    const auto udcSent = udc.wait();
    CHECK(udcSent && udcSent->ok());
    CHECK(rig.sim->udcRequests() == 1);

    Once<Error> requested;
    Once<Error> complete;
    rig.engine->openBasicCommissioningWindow(rig.ctx, complete.fn(), requested.fn());
    const auto req = requested.wait();
    const auto done = complete.wait();
    CHECK(req && req->ok());
    CHECK(done && done->ok());
    return done && done->ok();
}

void test_end_to_end_against_simulator()
{
    Rig rig;
    if (!discoverAndCommission(rig))
        return;

    // ----- subscribe -> command -> report -----
    LevelLog levels;
    Once<Error> subSent;
    auto established = std::make_shared<std::promise<void>>();
    auto establishedFuture = established->get_future();
    auto subFailures = std::make_shared<std::vector<Error>>();
    auto subMu = std::make_shared<std::mutex>();

    const auto subId = rig.engine->subscribe<level_control::CurrentLevel>(
        interaction::SubscribeParams{0, 5, std::nullopt}, rig.ctx, subSent.fn(),
        [&levels](level_control::CurrentLevel::Value v) { levels.push(v ? *v : -1); },
        [subFailures, subMu](Error e)
        {
            std::lock_guard<std::mutex> lock(*subMu);
            subFailures->push_back(std::move(e));
        },
        [established]() { established->set_value(); });

    const auto sent = subSent.wait();
    CHECK(sent && sent->ok());
    CHECK(establishedFuture.wait_for(kWait) == std::future_status::ready);
    CHECK(levels.waitFor(128)); // priming report

    Once<Error> moveSent;
    Once<interaction::NoResponse> moved;
    level_control::MoveToLevel move;
    move.level = 42;
    rig.engine->invoke(move, rig.ctx, moveSent.fn(), moved.fn(), [](Error) {});
    CHECK(moveSent.wait().has_value());
    CHECK(moved.wait().has_value());
    CHECK(levels.waitFor(42));

    // ----- payload 응답 -----
    Once<target_navigator::NavigateTargetResponse> nav;
    target_navigator::NavigateTarget bad;
    bad.target = 9;
    rig.engine->invoke(bad, rig.ctx, [](Error) {}, nav.fn(), [](Error) {});
    const auto navResp = nav.wait();
    CHECK(navResp && navResp->status == 1);

    Once<content_launcher::LauncherResponse> launch;
    content_launcher::LaunchURL url;
    url.contentUrl = "https://www.example.com/videos/123";
    rig.engine->invoke(url, rig.ctx, [](Error) {}, launch.fn(), [](Error) {});
    const auto launched = launch.wait();
    CHECK(launched && launched->data && *launched->data == "launched " + url.contentUrl);

    // ----- 세션 단절 cascade -----
    rig.sim->dropSession("integration");
    bool cascaded = false;
    for (int i = 0; i < 300 && !cascaded; ++i)
    {
        {
            std::lock_guard<std::mutex> lock(*subMu);
            cascaded = !subFailures->empty();
        }
        if (!cascaded)
            std::this_thread::sleep_for(10ms);
    }
    CHECK(cascaded);
    {
        std::lock_guard<std::mutex> lock(*subMu);
        CHECK(subFailures->size() == 1);
        CHECK(!subFailures->empty() && (*subFailures)[0] == ErrorCode::SessionClosed);
    }

    Once<session::SessionState> state;
    rig.engine->querySessionState(rig.ctx, state.fn());
    const auto st = state.wait();
    CHECK(st && *st == session::SessionState::Closed);

    Once<Error> after;
    rig.engine->unsubscribe(subId, rig.ctx, after.fn());
    const auto unsub = after.wait();
    CHECK(unsub && *unsub == ErrorCode::NotFound);

    const auto snap = rig.engine->metrics().snapshot();
    CHECK(snap.sessionLossesTotal == 1);
    CHECK(snap.commandsSucceededTotal == 3);

    const std::string text = rig.engine->metrics().toPrometheusText();
    CHECK(text.find("# TYPE castlink_commands_succeeded_total counter") != std::string::npos);
    CHECK(text.find("castlink_commands_succeeded_total 3\n") != std::string::npos);
}

} // namespace

int main()
{
    test_end_to_end_against_simulator();
    return castlink::test::finish("engine.simulator_integration");
}
