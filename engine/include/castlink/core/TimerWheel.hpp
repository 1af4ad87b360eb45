#pragma once

#include <castlink/util/NonCopyable.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <unordered_set>
#include <vector>

namespace castlink::core
{

/// coarse-grained 타이머 휠입니다.
///
/// - 단일 스레드(DispatchQueue owner)에서만 사용합니다.
/// - delay 는 tick 해상도 단위로 올림(ceil)되며, 최소 1 tick 뒤에 실행됩니다.
/// - one-shot 타이머만 지원합니다. 주기 실행이 필요하면 콜백 안에서 다시 등록합니다.
/// - cancelTimer() 는 lazy 방식입니다. 취소된 id 를 기록해 두었다가
///   해당 슬롯을 처리할 때 콜백 없이 버립니다.
///
/// 콜백 쪽에서도 "만료 시점에 대상이 아직 유효한가"를 id/세대 값으로 다시 확인하는 것이
/// 엔진 전체의 규약입니다. (취소와 만료가 같은 tick 에 겹치는 경우 대비)
class TimerWheel : private castlink::util::NonCopyable
{
  public:
    using Clock = std::chrono::steady_clock;
    using Duration = std::chrono::milliseconds;
    using Callback = std::function<void()>;
    using TimerId = std::uint64_t;

    static constexpr TimerId kInvalidTimerId = 0;

    /// @throws std::invalid_argument tickResolution <= 0 또는 slotCount == 0
    TimerWheel(Duration tickResolution, std::size_t slotCount);

    [[nodiscard]] Duration tickResolution() const noexcept { return tickResolution_; }
    [[nodiscard]] std::size_t slotCount() const noexcept { return slotCount_; }
    [[nodiscard]] std::uint64_t currentTick() const noexcept { return currentTick_; }

    /// 아직 실행/취소되지 않은 타이머 개수
    [[nodiscard]] std::size_t pendingTimers() const noexcept { return activeTimers_; }

    /// @throws std::invalid_argument callback 이 비어 있을 때
    TimerId addTimer(Duration delay, Callback callback);

    /// @return true 면 아직 실행 전이던 타이머를 취소함
    bool cancelTimer(TimerId id);

    /// 논리 tick 한 번 진행 (테스트/수동 구동용)
    void tick();

    /// 마지막 tick 이후 경과한 실제 시간만큼 tick 을 진행합니다.
    void tick(Clock::time_point now);

  private:
    struct Timer
    {
        TimerId id{};
        std::uint64_t expirationTick{};
        Callback callback;
    };

    [[nodiscard]] std::uint64_t durationToTicks(Duration delay) const noexcept;
    [[nodiscard]] TimerId nextTimerId() noexcept;
    void processCurrentTick();

    Duration tickResolution_;
    std::size_t slotCount_{0};
    std::vector<std::vector<Timer>> slots_;

    Clock::time_point lastTickTime_{};
    std::uint64_t currentTick_{0};
    TimerId nextId_{1};
    std::size_t activeTimers_{0};

    // 취소되었지만 아직 슬롯에서 빠지지 않은 타이머
    std::unordered_set<TimerId> cancelled_;
    // 살아있는 타이머 id (cancel 대상 판별용)
    std::unordered_set<TimerId> live_;

    // 콜백 실행 중 addTimer() 가 같은 슬롯을 건드려도 안전하도록 분리한 임시 버퍼
    std::vector<Timer> scratch_;
};

} // namespace castlink::core
