#include <castlink/core/DispatchQueue.hpp>

#include <castlink/core/Logger.hpp>
#include <castlink/core/ThreadContext.hpp>

#include <cerrno>
#include <cstring>
#include <exception>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <poll.h>
#include <sys/eventfd.h>
#include <unistd.h>

namespace castlink::core
{

DispatchQueue::DispatchQueue(Duration tickResolution, std::size_t timerSlots, std::string name)
    : name_(std::move(name)), timerWheel_(tickResolution, timerSlots)
{
    wakeupFd_ = ::eventfd(/*initval=*/0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wakeupFd_ < 0)
        throw std::system_error(errno, std::generic_category(), "DispatchQueue: eventfd failed");

    CASTLINK_LOG_DEBUG("DispatchQueue", "Created", "name={} tick_ms={} timer_slots={} wakeup_fd={}",
                       name_, timerWheel_.tickResolution().count(), timerWheel_.slotCount(),
                       wakeupFd_);
}

DispatchQueue::~DispatchQueue()
{
    if (threaded_ && thread_.joinable())
    {
        running_.store(false, std::memory_order_release);
        signalWakeup_();
        if (thread_.get_id() != std::this_thread::get_id())
            thread_.join();
        else
            thread_.detach();
    }

    if (wakeupFd_ >= 0)
    {
        ::close(wakeupFd_);
        wakeupFd_ = -1;
    }
}

void DispatchQueue::start()
{
    if (ownerBound_.load(std::memory_order_acquire))
        throw std::logic_error("DispatchQueue::start: owner thread already bound (" + name_ + ")");

    running_.store(true, std::memory_order_release);
    threaded_ = true;

    // owner 등록은 새 스레드 안에서 수행한다. 그 전까지 들어온 post 는 eventfd 로 깨운다.
    thread_ = std::thread([this] { threadMain_(); });
}

void DispatchQueue::bindToCurrentThread()
{
    const auto thisThread = std::this_thread::get_id();
    if (ownerBound_.load(std::memory_order_acquire))
    {
        if (thisThread != ownerThread_)
            throw std::logic_error("DispatchQueue::bindToCurrentThread: already bound to another "
                                   "thread (" + name_ + ")");
        return;
    }

    ownerThread_ = thisThread;
    ownerBound_.store(true, std::memory_order_release);
    running_.store(true, std::memory_order_release);

    CASTLINK_LOG_DEBUG("DispatchQueue", "Bound", "name={} mode={}", name_,
                       threaded_ ? "thread" : "manual");
}

bool DispatchQueue::isInOwnerThread() const noexcept
{
    if (!ownerBound_.load(std::memory_order_acquire))
        return false;
    return std::this_thread::get_id() == ownerThread_;
}

void DispatchQueue::requireOwnerThread_(const char *apiName) const
{
    if (!isInOwnerThread())
    {
        CASTLINK_LOG_ERROR("DispatchQueue", "ApiWrongThread", "name={} api={} tid={}", name_,
                           apiName, core::tid());
        throw std::logic_error(std::string("DispatchQueue::") + apiName +
                               " must be called on the owner thread");
    }
}

bool DispatchQueue::post(Task task)
{
    if (!task)
        return false;

    if (!taskQueue_.push(std::move(task)))
    {
        CASTLINK_LOG_DEBUG("DispatchQueue", "PostRejected", "name={} reason=Closed", name_);
        return false;
    }

    if (!isInOwnerThread())
        signalWakeup_();
    return true;
}

DispatchQueue::TimerId DispatchQueue::addTimer(Duration delay, TimerWheel::Callback cb)
{
    requireOwnerThread_("addTimer");
    if (!cb)
        throw std::invalid_argument("DispatchQueue::addTimer requires a valid callback");

    // 타이머 콜백 예외가 휠 처리 루프를 깨지 않도록 감싼다.
    return timerWheel_.addTimer(delay,
                                [this, cb = std::move(cb)]() mutable
                                {
                                    try
                                    {
                                        cb();
                                    }
                                    catch (const std::exception &e)
                                    {
                                        CASTLINK_LOG_ERROR("DispatchQueue", "TimerException",
                                                           "name={} what='{}'", name_, e.what());
                                    }
                                });
}

bool DispatchQueue::cancelTimer(TimerId id)
{
    requireOwnerThread_("cancelTimer");
    return timerWheel_.cancelTimer(id);
}

void DispatchQueue::runTask_(Task &task) noexcept
{
    try
    {
        task();
    }
    catch (const std::exception &e)
    {
        CASTLINK_LOG_ERROR("DispatchQueue", "TaskException", "name={} what='{}'", name_, e.what());
    }
}

std::size_t DispatchQueue::drain()
{
    requireOwnerThread_("drain");

    std::size_t executed = 0;
    while (taskQueue_.popAll(batch_) > 0)
    {
        while (!batch_.empty())
        {
            Task task = std::move(batch_.front());
            batch_.pop_front();
            if (!task)
                continue;
            runTask_(task);
            ++executed;
        }
    }
    return executed;
}

std::size_t DispatchQueue::runOnce(int waitMs)
{
    requireOwnerThread_("runOnce");

    std::size_t executed = drain();
    timerWheel_.tick(TimerWheel::Clock::now());
    executed += drain();

    if (executed == 0 && taskQueue_.size() == 0)
        waitForWakeup_(waitMs);

    timerWheel_.tick(TimerWheel::Clock::now());
    executed += drain();
    return executed;
}

void DispatchQueue::advanceTicks(std::uint64_t n)
{
    requireOwnerThread_("advanceTicks");
    drain();
    for (std::uint64_t i = 0; i < n; ++i)
    {
        timerWheel_.tick();
        drain();
    }
}

void DispatchQueue::advanceBy(Duration delay)
{
    const auto tickMs = timerWheel_.tickResolution().count();
    const auto ms = delay.count();
    if (ms <= 0)
    {
        drain();
        return;
    }
    advanceTicks(static_cast<std::uint64_t>((ms + tickMs - 1) / tickMs));
}

void DispatchQueue::stop()
{
    if (threaded_)
    {
        if (isInOwnerThread())
            throw std::logic_error("DispatchQueue::stop: cannot join from the owner thread");

        running_.store(false, std::memory_order_release);
        signalWakeup_();
        if (thread_.joinable())
            thread_.join();
        return;
    }

    if (!ownerBound_.load(std::memory_order_acquire))
    {
        taskQueue_.close();
        return;
    }

    requireOwnerThread_("stop");
    running_.store(false, std::memory_order_release);
    drain();
    taskQueue_.close();
    drain();
}

void DispatchQueue::threadMain_()
{
    ThreadContext::setCurrentThreadTag(name_);
    bindToCurrentThread();

    const int waitMs = static_cast<int>(timerWheel_.tickResolution().count());
    CASTLINK_LOG_INFO("DispatchQueue", "LoopStart", "name={} wait_ms={}", name_, waitMs);

    while (running_.load(std::memory_order_acquire))
        (void)runOnce(waitMs);

    // 종료: 이미 들어온 작업(실패 cascade 포함)은 끝까지 실행한 뒤 닫는다.
    drain();
    taskQueue_.close();
    const std::size_t tail = drain();

    CASTLINK_LOG_INFO("DispatchQueue", "LoopStop", "name={} tail_tasks={} dropped_timers={}",
                      name_, tail, timerWheel_.pendingTimers());
}

void DispatchQueue::signalWakeup_() noexcept
{
    if (wakeupFd_ < 0)
        return;

    const std::uint64_t one = 1;
    for (;;)
    {
        const ::ssize_t n = ::write(wakeupFd_, &one, sizeof(one));
        if (n == static_cast<::ssize_t>(sizeof(one)))
            return;
        if (n < 0 && errno == EINTR)
            continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
            return; // 카운터 포화: 이미 깨워질 예정
        CASTLINK_LOG_ERROR("DispatchQueue", "WakeupWriteFailed", "fd={} errno={} msg='{}'",
                           wakeupFd_, errno, std::strerror(errno));
        return;
    }
}

void DispatchQueue::waitForWakeup_(int waitMs) noexcept
{
    if (wakeupFd_ < 0)
        return;

    ::pollfd pfd{};
    pfd.fd = wakeupFd_;
    pfd.events = POLLIN;

    const int n = ::poll(&pfd, 1, waitMs);
    if (n > 0 && (pfd.revents & POLLIN))
    {
        drainWakeupFd_();
    }
    else if (n < 0 && errno != EINTR)
    {
        CASTLINK_LOG_WARN("DispatchQueue", "PollError", "errno={} msg='{}'", errno,
                          std::strerror(errno));
    }
}

void DispatchQueue::drainWakeupFd_() noexcept
{
    for (;;)
    {
        std::uint64_t value = 0;
        const ::ssize_t n = ::read(wakeupFd_, &value, sizeof(value));
        if (n == static_cast<::ssize_t>(sizeof(value)))
            continue;
        if (n < 0 && errno == EINTR)
            continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
            return;

        CASTLINK_LOG_ERROR("DispatchQueue", "WakeupReadFailed", "fd={} errno={} msg='{}'",
                           wakeupFd_, errno, std::strerror(errno));
        return;
    }
}

} // namespace castlink::core
