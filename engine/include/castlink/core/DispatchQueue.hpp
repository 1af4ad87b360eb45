#pragma once

#include <castlink/core/ExecutionContext.hpp>
#include <castlink/core/TaskQueue.hpp>
#include <castlink/core/TimerWheel.hpp>
#include <castlink/util/NonCopyable.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <thread>

namespace castlink::core
{

/// 엔진 상태 변경을 직렬화하는 단일 실행 컨텍스트입니다.
///
/// 구성: TaskQueue(다중 생산자) + TimerWheel + eventfd 깨우기.
/// 엔진의 PeerRegistry / SessionManager / RequestCorrelator / SubscriptionTable 은
/// 모두 이 큐의 owner 스레드에서만 만져집니다.
///
/// 구동 방식은 두 가지입니다.
/// - start()               : 전용 스레드를 만들어 루프를 돌린다. (운영)
/// - bindToCurrentThread() : 현재 스레드를 owner 로 등록하고 drain()/advanceTicks() 로
///                           직접 구동한다. (결정적 테스트)
class DispatchQueue final : public IExecutionContext, private castlink::util::NonMovable
{
  public:
    using Duration = TimerWheel::Duration;
    using TimerId = TimerWheel::TimerId;

    DispatchQueue(Duration tickResolution, std::size_t timerSlots, std::string name = "dq");
    ~DispatchQueue() override;

    /// 전용 스레드 시작. 이미 owner 가 정해져 있으면 std::logic_error.
    void start();

    /// 루프 종료. 남아 있는 작업은 모두 실행한 뒤 닫힙니다. 대기 중인 타이머는 버립니다.
    /// - 전용 스레드 모드: join 까지 수행 (owner 스레드에서 부르면 std::logic_error)
    /// - 수동 모드: owner 스레드에서 호출해야 하며, 그 자리에서 drain 후 닫습니다.
    void stop();

    /// 현재 스레드를 owner 로 등록 (수동 구동 모드)
    void bindToCurrentThread();
    [[nodiscard]] bool isInOwnerThread() const noexcept;
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(std::memory_order_acquire); }

    bool post(Task task) override;
    [[nodiscard]] std::string_view name() const noexcept override { return name_; }

    /// owner 스레드 전용. 다른 스레드에서 호출하면 std::logic_error.
    TimerId addTimer(Duration delay, TimerWheel::Callback cb);
    bool cancelTimer(TimerId id);

    /// 1회 루프: 작업 drain -> 타이머 tick(실시간) -> 최대 waitMs 대기 -> tick -> drain
    /// @return 실행한 작업 수
    std::size_t runOnce(int waitMs);

    /// 큐가 빌 때까지 작업을 실행합니다. (실행 중 새로 들어온 작업 포함)
    std::size_t drain();

    /// 논리 tick 을 n 번 진행합니다. tick 마다 drain 합니다. (테스트용 가상 시간)
    void advanceTicks(std::uint64_t n);

    /// delay 를 tick 수로 올림 변환해서 advanceTicks 합니다.
    void advanceBy(Duration delay);

    [[nodiscard]] Duration tickResolution() const noexcept { return timerWheel_.tickResolution(); }
    [[nodiscard]] std::size_t pendingTimers() const noexcept { return timerWheel_.pendingTimers(); }
    [[nodiscard]] std::size_t pendingTasks() const noexcept { return taskQueue_.size(); }

  private:
    void requireOwnerThread_(const char *apiName) const;
    void threadMain_();
    void runTask_(Task &task) noexcept;
    void signalWakeup_() noexcept;
    void waitForWakeup_(int waitMs) noexcept;
    void drainWakeupFd_() noexcept;

    std::string name_;
    TaskQueue taskQueue_;
    TimerWheel timerWheel_;
    std::deque<Task> batch_;

    std::atomic_bool ownerBound_{false};
    std::thread::id ownerThread_{};
    std::atomic_bool running_{false};
    bool threaded_{false};
    std::thread thread_;

    int wakeupFd_{-1};
};

} // namespace castlink::core
