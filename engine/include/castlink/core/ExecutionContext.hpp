#pragma once

#include <castlink/util/NonCopyable.hpp>

#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

namespace castlink::core
{

/// 결과(continuation)를 실행할 호출자 측 실행 컨텍스트입니다.
///
/// - 엔진은 모든 결과를 호출마다 지정된 컨텍스트로 post 합니다.
/// - 엔진 자신의 DispatchQueue 와 같다고 가정하지 않습니다.
class IExecutionContext
{
  public:
    using Task = std::function<void()>;

    virtual ~IExecutionContext() = default;

    /// @return false 면 컨텍스트가 이미 닫혀서 task 를 버렸음
    virtual bool post(Task task) = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

/// post 한 스레드에서 즉시 실행합니다.
/// - 엔진이 결과를 post 하는 곳은 항상 DispatchQueue 스레드이므로,
///   결과가 디스패치 스레드에서 실행됩니다. (테스트/단순 앱용)
class InlineExecutor final : public IExecutionContext
{
  public:
    bool post(Task task) override;
    [[nodiscard]] std::string_view name() const noexcept override { return "inline"; }
};

/// 전용 스레드 1개로 결과를 순서대로 실행합니다.
///
/// - 큐 상태는 워커 스레드와 공유(shared_ptr)합니다. 자기 결과 콜백 안에서 stop()/소멸되어도
///   워커는 남은 작업을 끝내고 스스로 종료합니다. (이 경우 join 대신 detach)
class ThreadExecutor final : public IExecutionContext, private castlink::util::NonMovable
{
  public:
    explicit ThreadExecutor(std::string name = "exec");
    ~ThreadExecutor() override;

    void start();

    /// 남은 작업을 모두 실행한 뒤 스레드를 join 합니다. 이후 post 는 false.
    /// 워커 스레드 자신이 부르면 join 하지 않고 detach 합니다.
    void stop();

    bool post(Task task) override;
    [[nodiscard]] std::string_view name() const noexcept override { return name_; }

    [[nodiscard]] bool isCurrentThread() const noexcept;

  private:
    struct State
    {
        std::mutex mu;
        std::condition_variable cv;
        std::deque<Task> q;
        bool stopping{false};
    };

    static void workerLoop_(std::shared_ptr<State> state, std::string name);

    std::string name_;
    std::shared_ptr<State> state_;
    bool started_{false}; // state_->mu 보호
    std::thread thread_;
    std::thread::id workerId_;
};

} // namespace castlink::core
