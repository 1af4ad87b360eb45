#include <castlink/core/TaskQueue.hpp>

#include <utility>

namespace castlink::core
{

bool TaskQueue::push(Task &&task)
{
    castlink::util::SpinLockGuard guard(lock_);
    if (closed_)
        return false;

    queue_.push_back(std::move(task));
    return true;
}

bool TaskQueue::tryPop(Task &outTask)
{
    castlink::util::SpinLockGuard guard(lock_);

    if (queue_.empty())
        return false;

    outTask = std::move(queue_.front());
    queue_.pop_front();
    return true;
}

std::size_t TaskQueue::popAll(std::deque<Task> &out)
{
    castlink::util::SpinLockGuard guard(lock_);

    const std::size_t n = queue_.size();
    if (n == 0)
        return 0;

    if (out.empty())
    {
        out.swap(queue_);
    }
    else
    {
        for (auto &t : queue_)
            out.push_back(std::move(t));
        queue_.clear();
    }
    return n;
}

void TaskQueue::close() noexcept
{
    castlink::util::SpinLockGuard guard(lock_);
    closed_ = true;
}

bool TaskQueue::isClosed() const noexcept
{
    castlink::util::SpinLockGuard guard(lock_);
    return closed_;
}

std::size_t TaskQueue::size() const noexcept
{
    castlink::util::SpinLockGuard guard(lock_);
    return queue_.size();
}

} // namespace castlink::core
