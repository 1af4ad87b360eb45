#pragma once

#include <atomic>
#include <thread>

namespace castlink::util
{

/// 짧은 크리티컬 섹션(큐 push/pop) 전용 스핀락입니다.
///
/// - 잠금 구간 안에서는 I/O, 로그, 콜백 호출을 하지 않습니다.
/// - 경합이 길어지면 kSpinBeforeYield 회 이후부터 yield 합니다.
///   (디스패치 스레드와 전송 스레드가 같은 코어에 묶여 있어도 진행이 보장되도록)
class SpinLock
{
  public:
    static constexpr int kSpinBeforeYield = 64;

    SpinLock() noexcept = default;

    SpinLock(const SpinLock &) = delete;
    SpinLock &operator=(const SpinLock &) = delete;

    void lock() noexcept
    {
        int spins = 0;
        while (flag_.test_and_set(std::memory_order_acquire))
        {
            if (++spins >= kSpinBeforeYield)
            {
                std::this_thread::yield();
                spins = 0;
            }
        }
    }

    bool try_lock() noexcept { return !flag_.test_and_set(std::memory_order_acquire); }

    void unlock() noexcept { flag_.clear(std::memory_order_release); }

  private:
    std::atomic_flag flag_ = ATOMIC_FLAG_INIT;
};

class SpinLockGuard
{
  public:
    explicit SpinLockGuard(SpinLock &lock) noexcept : lock_(lock) { lock_.lock(); }
    ~SpinLockGuard() { lock_.unlock(); }

    SpinLockGuard(const SpinLockGuard &) = delete;
    SpinLockGuard &operator=(const SpinLockGuard &) = delete;

  private:
    SpinLock &lock_;
};

} // namespace castlink::util
