#include <castlink/core/Logger.hpp>
#include <castlink/core/ThreadContext.hpp>

#include <chrono>
#include <condition_variable>
#include <ctime>
#include <format>
#include <iostream>
#include <mutex>
#include <thread>
#include <unistd.h> // isatty, fileno
#include <vector>

namespace castlink::core
{

namespace detail
{
std::atomic<int> &fastMinLevel()
{
    static std::atomic<int> level{static_cast<int>(LogLevel::Info)};
    return level;
}
} // namespace detail

const char *toString(LogLevel level) noexcept
{
    switch (level)
    {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Fatal:
        return "FATAL";
    }
    return "INFO";
}

namespace
{
struct LogEvent
{
    LogLevel level{};
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::string threadTag;
    long threadId{};
};

const char *levelColor(LogLevel level) noexcept
{
    switch (level)
    {
    case LogLevel::Trace:
        return "\x1b[90m"; // gray
    case LogLevel::Debug:
        return "\x1b[36m"; // cyan
    case LogLevel::Info:
        return "\x1b[32m"; // green
    case LogLevel::Warn:
        return "\x1b[33m"; // yellow
    case LogLevel::Error:
    case LogLevel::Fatal:
        return "\x1b[31m"; // red
    }
    return "";
}
} // namespace

class Logger::Impl
{
  public:
    Impl(std::ostream &os, LogLevel minLevel) : os_(os), minLevel_(minLevel)
    {
        if (&os == &std::cout)
            useColor_ = (::isatty(::fileno(stdout)) != 0);
        else if (&os == &std::clog || &os == &std::cerr)
            useColor_ = (::isatty(::fileno(stderr)) != 0);

        worker_ = std::thread([this]() { processQueue(); });
    }

    ~Impl() { stop(); }

    void stop()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_ = true;
        }
        cv_.notify_all();
        if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id())
            worker_.join();
    }

    void log(LogLevel level, std::string_view msg)
    {
        if (level < minLevel_.load(std::memory_order_relaxed))
            return;

        // 시간/스레드 메타는 호출 시점에 캡처
        LogEvent ev{level, std::string(msg), std::chrono::system_clock::now(),
                    std::string(core::ttag()), core::tid()};
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stop_)
                return;
            pending_.push_back(std::move(ev));
        }
        cv_.notify_one();
    }

    void setMinLevel(LogLevel level) noexcept
    {
        minLevel_.store(level, std::memory_order_relaxed);
        detail::fastMinLevel().store(static_cast<int>(level), std::memory_order_relaxed);
    }

    LogLevel minLevel() const noexcept { return minLevel_.load(std::memory_order_relaxed); }

  private:
    void processQueue()
    {
        std::vector<LogEvent> batch;
        for (;;)
        {
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this]() { return stop_ || !pending_.empty(); });

                if (stop_ && pending_.empty())
                    return;

                batch.swap(pending_);
            }

            for (const auto &ev : batch)
                writeLog(ev);
            batch.clear();
            os_.flush();
        }
    }

    void writeLog(const LogEvent &ev)
    {
        using namespace std::chrono;

        const auto t = system_clock::to_time_t(ev.timestamp);
        std::tm tm{};
        localtime_r(&t, &tm);
        const auto us = duration_cast<microseconds>(ev.timestamp.time_since_epoch()) % seconds(1);

        const char *c1 = useColor_ ? levelColor(ev.level) : "";
        const char *c2 = useColor_ ? "\x1b[0m" : "";

        os_ << std::format("{:02d}:{:02d}:{:02d}.{:06d} | {} tid={} | {}{:<5}{} | {}\n",
                           tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(us.count()),
                           ev.threadTag, ev.threadId, c1, toString(ev.level), c2, ev.message);
    }

    std::ostream &os_;
    std::thread worker_;
    std::vector<LogEvent> pending_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_{false};
    std::atomic<LogLevel> minLevel_{LogLevel::Info};
    bool useColor_{false};
};

Logger::Logger(std::ostream &os, LogLevel minLevel) : impl_(std::make_unique<Impl>(os, minLevel))
{
}
Logger::~Logger() = default;

void Logger::log(LogLevel level, std::string_view message)
{
    impl_->log(level, message);
}
void Logger::setMinLevel(LogLevel level) noexcept
{
    impl_->setMinLevel(level);
}
LogLevel Logger::minLevel() const noexcept
{
    return impl_->minLevel();
}
void Logger::stopAndJoin()
{
    impl_->stop();
}

// ===== Global Instance Management =====

namespace
{
std::mutex &globalLoggerMutex()
{
    static std::mutex mu;
    return mu;
}

std::shared_ptr<ILogger> &globalLoggerStorage()
{
    static std::shared_ptr<ILogger> logger = std::make_shared<Logger>();
    return logger;
}
} // namespace

std::shared_ptr<ILogger> currentLogger() noexcept
{
    std::lock_guard<std::mutex> lock(globalLoggerMutex());
    return globalLoggerStorage();
}

void setLogger(std::shared_ptr<ILogger> logger) noexcept
{
    const LogLevel lvl = logger ? logger->minLevel() : LogLevel::Info;
    detail::fastMinLevel().store(static_cast<int>(lvl), std::memory_order_relaxed);

    std::shared_ptr<ILogger> old;
    {
        std::lock_guard<std::mutex> lock(globalLoggerMutex());
        old = std::exchange(globalLoggerStorage(), std::move(logger));
    }
    // 교체된 로거의 잔여 로그는 여기서 플러시한다.
    if (old)
        old->shutdown();
}

void shutdownLogger() noexcept
{
    std::shared_ptr<ILogger> instance;
    {
        std::lock_guard<std::mutex> lock(globalLoggerMutex());
        instance = std::move(globalLoggerStorage());
        globalLoggerStorage() = nullptr;
    }
    if (instance)
        instance->shutdown();
}

} // namespace castlink::core
