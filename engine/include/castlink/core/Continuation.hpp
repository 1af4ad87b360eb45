#pragma once

#include <castlink/core/ExecutionContext.hpp>
#include <castlink/core/Logger.hpp>

#include <functional>
#include <memory>
#include <utility>

namespace castlink::core
{

/// 호출 1건에 대한 결과 전달 규칙입니다.
///
/// - executor : 결과 콜백이 실행될 컨텍스트 (필수)
/// - lifetime : 호출자 측 소유 객체. 전달 시점에 이미 소멸했으면 콜백을 건너뜁니다.
///              (호출자 상태에 대한 use-after-free 방지)
struct CallContext
{
    std::shared_ptr<IExecutionContext> executor;
    std::weak_ptr<const void> lifetime;
    bool guarded{false};

    static CallContext on(std::shared_ptr<IExecutionContext> ex)
    {
        CallContext c;
        c.executor = std::move(ex);
        return c;
    }

    template <typename T> [[nodiscard]] CallContext guardedBy(const std::shared_ptr<T> &owner) const
    {
        CallContext c = *this;
        c.lifetime = std::static_pointer_cast<const void>(owner);
        c.guarded = true;
        return c;
    }

    [[nodiscard]] bool isValid() const noexcept { return executor != nullptr; }
};

/// 호출자 컨텍스트로 결과를 전달하는 1급 continuation 입니다.
///
/// - 복사 가능(콜백 본체는 shared_ptr 로 공유). 구독 report 처럼 여러 번 전달할 수 있습니다.
/// - "최대 1회" 보장은 소유자(Correlator/SubscriptionTable)가 레코드를 먼저 지우는 방식으로 지킵니다.
/// - 콜백이 비어 있으면 deliver 는 아무것도 하지 않습니다. (선택 콜백)
template <typename... Args> class Continuation
{
  public:
    using Fn = std::function<void(Args...)>;

    Continuation() = default;

    Continuation(const CallContext &ctx, Fn fn)
        : executor_(ctx.executor), lifetime_(ctx.lifetime), guarded_(ctx.guarded)
    {
        if (fn)
            fn_ = std::make_shared<const Fn>(std::move(fn));
    }

    [[nodiscard]] bool hasTarget() const noexcept { return fn_ != nullptr && executor_ != nullptr; }

    /// @return false 면 전달하지 않음 (콜백 없음 / 컨텍스트 닫힘)
    bool deliver(Args... args) const
    {
        if (!hasTarget())
            return false;

        const bool posted = executor_->post(
            [fn = fn_, lifetime = lifetime_, guarded = guarded_,
             ... captured = std::move(args)]() mutable
            {
                if (guarded)
                {
                    auto keepAlive = lifetime.lock();
                    if (!keepAlive)
                        return; // 호출자 측 소유 객체가 이미 소멸
                    (*fn)(std::move(captured)...);
                    return;
                }
                (*fn)(std::move(captured)...);
            });

        if (!posted)
        {
            CASTLINK_LOG_WARN("Continuation", "DeliveryDropped", "ctx={} reason=ContextClosed",
                              executor_->name());
        }
        return posted;
    }

  private:
    std::shared_ptr<IExecutionContext> executor_;
    std::shared_ptr<const Fn> fn_;
    std::weak_ptr<const void> lifetime_;
    bool guarded_{false};
};

} // namespace castlink::core
