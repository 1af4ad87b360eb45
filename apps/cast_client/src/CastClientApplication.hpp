#pragma once

#include <castlink/CastingEngine.hpp>
#include <castlink/core/ExecutionContext.hpp>
#include <castlink/core/GlobalConfig.hpp>

#include <casting/sim/SimulatedCommissioner.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <vector>

namespace cast_client
{

/// 엔진 + 인-프로세스 시뮬레이터를 묶어서 캐스팅 시나리오 1회를 돌리는 데모 앱.
///
/// 결과 콜백은 전용 "exec" 스레드에서 받고, main 스레드는 단계별로 future 를 기다립니다.
class CastClientApplication final : public std::enable_shared_from_this<CastClientApplication>
{
  public:
    explicit CastClientApplication(const castlink::core::GlobalConfig &cfg);
    ~CastClientApplication();

    CastClientApplication(const CastClientApplication &) = delete;
    CastClientApplication &operator=(const CastClientApplication &) = delete;

    /// @return 프로세스 종료 코드 (0 = 모든 단계 성공)
    int run();

  private:
    using SentFn = castlink::CastingEngine::SentFn;

    bool runScenario_();
    bool discover_();
    bool commission_();
    bool subscribeAll_();
    bool sendCommands_();
    bool teardown_();

    /// request(onSent) 를 호출하고 onSent 결과를 기다립니다.
    castlink::Error awaitSent_(const char *step, const std::function<void(SentFn)> &request);

    template <typename C> bool awaitInvoke_(const char *step, const C &command);

    castlink::core::GlobalConfig cfg_;
    std::shared_ptr<castlink::core::ThreadExecutor> exec_;
    std::shared_ptr<casting::sim::SimulatedCommissioner> sim_;
    std::unique_ptr<castlink::CastingEngine> engine_;
    castlink::core::CallContext ctx_;

    std::vector<castlink::interaction::SubscriptionId> subscriptions_;
};

} // namespace cast_client
