#pragma once

#include "FakeTransports.hpp"

#include <castlink/CastingEngine.hpp>
#include <castlink/core/DispatchQueue.hpp>
#include <castlink/core/ExecutionContext.hpp>

#include <memory>

namespace castlink::test
{

/// 수동 구동 엔진 + 가짜 전송. 결과는 InlineExecutor 로 큐 스레드(= 테스트 스레드)에서 받습니다.
struct EngineHarness
{
    explicit EngineHarness(EngineConfig cfg = {})
        : discovery(std::make_shared<FakeDiscoveryTransport>()),
          session(std::make_shared<FakeSessionTransport>()),
          exec(std::make_shared<core::InlineExecutor>()),
          ctx(core::CallContext::on(exec)),
          engine(std::make_unique<CastingEngine>(std::move(cfg), discovery, session))
    {
        engine->start(RunMode::Manual);
    }

    core::DispatchQueue &dq() { return *engine->dispatchQueue(); }
    void drain() { dq().drain(); }

    session::SessionState state()
    {
        session::SessionState out = session::SessionState::Idle;
        engine->querySessionState(ctx, [&out](session::SessionState s) { out = s; });
        drain();
        return out;
    }

    /// 윈도우 열기 -> 커미셔닝 완료
    bool commission()
    {
        Error requested(ErrorCode::Timeout);
        Error complete(ErrorCode::Timeout);
        engine->openBasicCommissioningWindow(
            ctx, [&complete](Error e) { complete = std::move(e); },
            [&requested](Error e) { requested = std::move(e); });
        drain();
        session->commissioningComplete();
        drain();
        return requested.ok() && complete.ok() && state() == session::SessionState::Commissioned;
    }

    std::shared_ptr<FakeDiscoveryTransport> discovery;
    std::shared_ptr<FakeSessionTransport> session;
    std::shared_ptr<core::InlineExecutor> exec;
    core::CallContext ctx;
    std::unique_ptr<CastingEngine> engine;
};

} // namespace castlink::test
