#include "../support/Check.hpp"

#include <castlink/core/Continuation.hpp>
#include <castlink/core/ExecutionContext.hpp>

#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>

using castlink::core::CallContext;
using castlink::core::Continuation;
using castlink::core::InlineExecutor;
using castlink::core::ThreadExecutor;
using namespace std::chrono_literals;

namespace
{

void test_inline_delivery_runs_immediately()
{
    auto exec = std::make_shared<InlineExecutor>();
    int got = 0;
    Continuation<int> c(CallContext::on(exec), [&got](int v) { got = v; });
    CHECK(c.hasTarget());
    CHECK(c.deliver(42));
    CHECK(got == 42);
}

/// 콜백이 없으면 전달하지 않습니다.
void test_empty_continuation_is_noop()
{
    auto exec = std::make_shared<InlineExecutor>();
    Continuation<int> empty(CallContext::on(exec), {});
    CHECK(!empty.hasTarget());
    CHECK(!empty.deliver(1));

    Continuation<> unset;
    CHECK(!unset.deliver());
}

/// 소유 객체가 사라진 뒤의 결과는 건너뜁니다.
void test_guarded_delivery_skips_expired_owner()
{
    auto exec = std::make_shared<InlineExecutor>();
    auto owner = std::make_shared<int>(0);

    int calls = 0;
    Continuation<std::string> c(CallContext::on(exec).guardedBy(owner),
                                [&calls](std::string) { ++calls; });

    c.deliver("first");
    CHECK(calls == 1);

    owner.reset();
    c.deliver("second");
    CHECK(calls == 1);
}

/// ThreadExecutor 로 전달하면 호출 스레드가 아닌 전용 스레드에서 실행됩니다.
void test_thread_executor_delivery()
{
    auto exec = std::make_shared<ThreadExecutor>("exec");
    exec->start();

    std::promise<bool> onExec;
    auto fut = onExec.get_future();
    Continuation<> c(CallContext::on(exec), [&]() { onExec.set_value(exec->isCurrentThread()); });
    CHECK(c.deliver());
    CHECK(fut.wait_for(2s) == std::future_status::ready);
    CHECK(fut.get());

    exec->stop();
    // 닫힌 컨텍스트로는 전달하지 못한다.
    CHECK(!c.deliver());
}

/// 마지막 참조가 자기 작업 안에서 풀려 워커 스레드에서 소멸되어도 종료(terminate)되지 않고,
/// 이미 큐에 들어간 작업은 끝까지 실행됩니다.
void test_thread_executor_destroyed_on_own_thread()
{
    auto exec = std::make_shared<ThreadExecutor>("exec");
    exec->start();

    std::promise<void> gate;
    auto gateFuture = gate.get_future().share();
    std::promise<bool> tail;
    auto tailFuture = tail.get_future();

    std::shared_ptr<ThreadExecutor> self = exec;
    CHECK(exec->post(
        [self, gateFuture]() mutable
        {
            gateFuture.wait();
            self.reset(); // 여기서 ~ThreadExecutor -> stop() (자기 스레드)
        }));
    CHECK(exec->post([&tail]() { tail.set_value(true); }));

    self.reset();
    exec.reset();
    gate.set_value();

    CHECK(tailFuture.wait_for(2s) == std::future_status::ready);
    CHECK(tailFuture.get());
}

/// 복사본끼리 같은 콜백 본체를 공유합니다. (구독 report 처럼 여러 번 전달)
void test_copies_share_callback()
{
    auto exec = std::make_shared<InlineExecutor>();
    int sum = 0;
    Continuation<int> a(CallContext::on(exec), [&sum](int v) { sum += v; });
    Continuation<int> b = a;
    a.deliver(1);
    b.deliver(2);
    a.deliver(3);
    CHECK(sum == 6);
}

} // namespace

int main()
{
    test_inline_delivery_runs_immediately();
    test_empty_continuation_is_noop();
    test_guarded_delivery_skips_expired_owner();
    test_thread_executor_delivery();
    test_thread_executor_destroyed_on_own_thread();
    test_copies_share_callback();
    return castlink::test::finish("core.continuation");
}
