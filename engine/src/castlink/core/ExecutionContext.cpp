#include <castlink/core/ExecutionContext.hpp>

#include <castlink/core/Logger.hpp>
#include <castlink/core/ThreadContext.hpp>

#include <exception>
#include <utility>

namespace castlink::core
{

namespace
{
void runGuarded(const char *ctxName, IExecutionContext::Task &task) noexcept
{
    try
    {
        task();
    }
    catch (const std::exception &e)
    {
        CASTLINK_LOG_ERROR("Executor", "TaskException", "ctx={} what='{}'", ctxName, e.what());
    }
}
} // namespace

bool InlineExecutor::post(Task task)
{
    if (!task)
        return false;
    runGuarded("inline", task);
    return true;
}

ThreadExecutor::ThreadExecutor(std::string name)
    : name_(std::move(name)), state_(std::make_shared<State>())
{
}

ThreadExecutor::~ThreadExecutor()
{
    stop();
}

void ThreadExecutor::start()
{
    std::scoped_lock lk(state_->mu);
    if (started_)
        return;
    started_ = true;
    state_->stopping = false;
    thread_ = std::thread([state = state_, name = name_]() mutable
                          { workerLoop_(std::move(state), std::move(name)); });
    workerId_ = thread_.get_id();
}

void ThreadExecutor::stop()
{
    {
        std::scoped_lock lk(state_->mu);
        if (!started_)
            return;
        started_ = false;
        state_->stopping = true;
    }
    state_->cv.notify_all();

    if (!thread_.joinable())
        return;

    if (thread_.get_id() == std::this_thread::get_id())
    {
        // 자기 결과 콜백 안에서 stop()/소멸: 워커는 공유 상태로 남은 작업을 끝내고 종료한다.
        CASTLINK_LOG_WARN("Executor", "StopFromOwnThread", "ctx={}", name_);
        thread_.detach();
        return;
    }
    thread_.join();
}

bool ThreadExecutor::post(Task task)
{
    if (!task)
        return false;
    {
        std::scoped_lock lk(state_->mu);
        if (state_->stopping)
            return false;
        state_->q.push_back(std::move(task));
    }
    state_->cv.notify_one();
    return true;
}

bool ThreadExecutor::isCurrentThread() const noexcept
{
    return workerId_ == std::this_thread::get_id();
}

void ThreadExecutor::workerLoop_(std::shared_ptr<State> state, std::string name)
{
    ThreadContext::setCurrentThreadTag(name);
    CASTLINK_LOG_DEBUG("Executor", "Started", "ctx={}", name);

    for (;;)
    {
        Task task;
        {
            std::unique_lock lk(state->mu);
            state->cv.wait(lk, [&] { return state->stopping || !state->q.empty(); });
            if (state->stopping && state->q.empty())
                break;
            task = std::move(state->q.front());
            state->q.pop_front();
        }
        runGuarded(name.c_str(), task);
    }

    CASTLINK_LOG_DEBUG("Executor", "Stopped", "ctx={}", name);
}

} // namespace castlink::core
