#include <castlink/core/TimerWheel.hpp>

#include <stdexcept>
#include <utility>

namespace castlink::core
{

TimerWheel::TimerWheel(Duration tickResolution, std::size_t slotCount)
    : tickResolution_(tickResolution), slotCount_(slotCount), slots_(slotCount),
      lastTickTime_(Clock::now())
{
    if (tickResolution_ <= Duration::zero())
        throw std::invalid_argument("TimerWheel tickResolution must be > 0");
    if (slotCount_ == 0)
        throw std::invalid_argument("TimerWheel slotCount must be > 0");
}

TimerWheel::TimerId TimerWheel::addTimer(Duration delay, Callback callback)
{
    if (!callback)
        throw std::invalid_argument("TimerWheel::addTimer requires a valid callback");

    const auto ticks = durationToTicks(delay);
    const std::uint64_t delayTicks = (ticks == 0) ? 1 : ticks;

    const auto expirationTick = currentTick_ + delayTicks;
    const auto slotIndex = static_cast<std::size_t>(expirationTick % slotCount_);

    const TimerId id = nextTimerId();
    slots_[slotIndex].push_back(Timer{id, expirationTick, std::move(callback)});
    live_.insert(id);
    ++activeTimers_;

    return id;
}

bool TimerWheel::cancelTimer(TimerId id)
{
    if (id == kInvalidTimerId)
        return false;

    if (live_.erase(id) == 0)
        return false; // 이미 실행되었거나 취소됨

    cancelled_.insert(id);
    if (activeTimers_ > 0)
        --activeTimers_;
    return true;
}

void TimerWheel::tick()
{
    ++currentTick_;
    processCurrentTick();
}

void TimerWheel::tick(Clock::time_point now)
{
    if (now <= lastTickTime_)
        return;

    const auto elapsedMs = std::chrono::duration_cast<Duration>(now - lastTickTime_);
    if (elapsedMs < tickResolution_)
        return;

    const auto ticksToAdvance = static_cast<std::uint64_t>(elapsedMs.count()) /
                                static_cast<std::uint64_t>(tickResolution_.count());

    for (std::uint64_t i = 0; i < ticksToAdvance; ++i)
        tick();

    // 나머지(ms 미만 단위)는 다음 호출로 이월해서 누적 오차를 줄인다.
    lastTickTime_ += tickResolution_ * static_cast<std::int64_t>(ticksToAdvance);
}

std::uint64_t TimerWheel::durationToTicks(Duration delay) const noexcept
{
    if (delay <= Duration::zero())
        return 0;

    const auto delayMs = static_cast<std::uint64_t>(delay.count());
    const auto tickMs = static_cast<std::uint64_t>(tickResolution_.count());
    return (delayMs + tickMs - 1) / tickMs;
}

TimerWheel::TimerId TimerWheel::nextTimerId() noexcept
{
    TimerId id = nextId_++;
    if (nextId_ == kInvalidTimerId)
        nextId_ = 1;
    return id;
}

void TimerWheel::processCurrentTick()
{
    const auto slotIndex = static_cast<std::size_t>(currentTick_ % slotCount_);
    auto &bucket = slots_[slotIndex];
    if (bucket.empty())
        return;

    scratch_.clear();
    scratch_.swap(bucket);

    // scratch_ 는 콜백 안에서 다시 processCurrentTick 이 불리지 않는 한 안전하다.
    // (tick 은 owner 스레드의 루프에서만 호출)
    std::vector<Timer> work;
    work.swap(scratch_);

    for (auto &timer : work)
    {
        if (cancelled_.erase(timer.id) != 0)
            continue;

        if (timer.expirationTick <= currentTick_)
        {
            live_.erase(timer.id);
            if (activeTimers_ > 0)
                --activeTimers_;

            timer.callback();
        }
        else
        {
            const auto idx = static_cast<std::size_t>(timer.expirationTick % slotCount_);
            slots_[idx].push_back(std::move(timer));
        }
    }

    work.clear();
    scratch_.swap(work); // 버퍼 용량 재사용
}

} // namespace castlink::core
