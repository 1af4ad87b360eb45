#pragma once

#include <castlink/util/NonCopyable.hpp>

#include <atomic>
#include <format>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace castlink::core
{

enum class LogLevel : int
{
    Trace = 0,
    Debug,
    Info,
    Warn,
    Error,
    Fatal
};

[[nodiscard]] const char *toString(LogLevel level) noexcept;

namespace detail
{
// 레벨 필터 fast path (Logger.cpp에서 정의)
std::atomic<int> &fastMinLevel();
} // namespace detail

inline bool fastEnabled(LogLevel level) noexcept
{
    return static_cast<int>(level) >= detail::fastMinLevel().load(std::memory_order_relaxed);
}

class ILogger : private castlink::util::NonCopyable
{
  public:
    virtual ~ILogger() = default;

    [[nodiscard]] virtual LogLevel minLevel() const noexcept { return LogLevel::Trace; }
    virtual void shutdown() noexcept {}

    // message 는 "comp | evt | key=value..." 형태로 완성된 상태로 들어온다.
    virtual void log(LogLevel level, std::string_view message) = 0;
};

/// 비동기 스트림 Logger.
/// - 호출 스레드는 큐에 넣기만 하고, 포맷팅/출력은 전용 writer 스레드가 한다.
/// - 디스패치 큐 스레드가 로그 I/O 때문에 멈추지 않도록 하기 위함.
class Logger final : public ILogger
{
  public:
    explicit Logger(std::ostream &os = std::clog, LogLevel minLevel = LogLevel::Info);
    ~Logger() override;

    void log(LogLevel level, std::string_view message) override;

    void setMinLevel(LogLevel level) noexcept;
    [[nodiscard]] LogLevel minLevel() const noexcept override;

    // 스레드 조인 + 잔여 로그 플러시
    void stopAndJoin();
    void shutdown() noexcept override { stopAndJoin(); }

  private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

// 교체/종료와 경합하지 않도록 핸들로 잡아서 쓴다. shutdownLogger() 이후에는 nullptr.
std::shared_ptr<ILogger> currentLogger() noexcept;
void setLogger(std::shared_ptr<ILogger> logger) noexcept;
void shutdownLogger() noexcept;

// =============================================================================
// Structured Logging Frontend
//   최종 라인: "HH:MM:SS.uuuuuu | dq tid=123 | INFO  | comp | evt | k=v ..."
// =============================================================================
namespace slog
{
inline std::string build(std::string_view comp, std::string_view evt, std::string_view details)
{
    if (details.empty())
        return std::format("{} | {}", comp, evt);
    return std::format("{} | {} | {}", comp, evt, details);
}

inline void emit(LogLevel lvl, std::string_view comp, std::string_view evt)
{
    if (!fastEnabled(lvl))
        return;
    if (auto logger = currentLogger())
        logger->log(lvl, build(comp, evt, {}));
}

template <typename... Args>
inline void emit(LogLevel lvl, std::string_view comp, std::string_view evt,
                 std::format_string<Args...> fmt, Args &&...args)
{
    if (!fastEnabled(lvl))
        return;
    auto logger = currentLogger();
    if (!logger)
        return;
    std::string details = std::format(fmt, std::forward<Args>(args)...);
    logger->log(lvl, build(comp, evt, details));
}
} // namespace slog

#define CASTLINK_LOG_TRACE(comp, evt, ...)                                                         \
    ::castlink::core::slog::emit(::castlink::core::LogLevel::Trace, (comp),                        \
                                 (evt)__VA_OPT__(, ) __VA_ARGS__)
#define CASTLINK_LOG_DEBUG(comp, evt, ...)                                                         \
    ::castlink::core::slog::emit(::castlink::core::LogLevel::Debug, (comp),                        \
                                 (evt)__VA_OPT__(, ) __VA_ARGS__)
#define CASTLINK_LOG_INFO(comp, evt, ...)                                                          \
    ::castlink::core::slog::emit(::castlink::core::LogLevel::Info, (comp),                         \
                                 (evt)__VA_OPT__(, ) __VA_ARGS__)
#define CASTLINK_LOG_WARN(comp, evt, ...)                                                          \
    ::castlink::core::slog::emit(::castlink::core::LogLevel::Warn, (comp),                         \
                                 (evt)__VA_OPT__(, ) __VA_ARGS__)
#define CASTLINK_LOG_ERROR(comp, evt, ...)                                                         \
    ::castlink::core::slog::emit(::castlink::core::LogLevel::Error, (comp),                        \
                                 (evt)__VA_OPT__(, ) __VA_ARGS__)
#define CASTLINK_LOG_FATAL(comp, evt, ...)                                                         \
    ::castlink::core::slog::emit(::castlink::core::LogLevel::Fatal, (comp),                        \
                                 (evt)__VA_OPT__(, ) __VA_ARGS__)

} // namespace castlink::core
