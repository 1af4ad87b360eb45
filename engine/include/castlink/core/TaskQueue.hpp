#pragma once

#include <castlink/util/NonCopyable.hpp>
#include <castlink/util/SpinLock.hpp>

#include <cstddef>
#include <deque>
#include <functional>

namespace castlink::core
{

/// 다중 생산자 / 단일 소비자 작업 큐입니다.
///
/// - 생산자: 호출자 스레드, 전송(transport) 콜백 스레드, 타이머
/// - 소비자: DispatchQueue 의 owner 스레드 하나
/// - close() 이후 push 는 false 를 반환하고 작업을 버립니다.
class TaskQueue : private castlink::util::NonMovable
{
  public:
    using Task = std::function<void()>;

    TaskQueue() = default;
    ~TaskQueue() = default;

    /// @return false if the queue has been closed
    bool push(Task &&task);

    bool tryPop(Task &outTask);

    /// 현재 쌓인 작업을 한 번에 out 으로 옮깁니다. (잠금 1회)
    /// @return 옮긴 작업 수
    std::size_t popAll(std::deque<Task> &out);

    void close() noexcept;
    [[nodiscard]] bool isClosed() const noexcept;
    [[nodiscard]] std::size_t size() const noexcept;

  private:
    mutable castlink::util::SpinLock lock_;
    std::deque<Task> queue_;
    bool closed_{false};
};

} // namespace castlink::core
