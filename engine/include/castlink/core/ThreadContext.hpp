#pragma once

#include <array>
#include <cstdio>
#include <string_view>

#if defined(__linux__)
#include <sys/syscall.h> // SYS_gettid
#include <unistd.h>      // syscall
#endif

namespace castlink::core
{

/// 스레드별 로그 태그/tid 캐시입니다.
///
/// - 엔진이 만드는 스레드는 시작 지점에서 setCurrentThreadTag()를 1회 호출합니다.
///   ("dq" = 디스패치 큐, "exec" = 결과 전달 스레드, "sim" = 시뮬레이터)
/// - 태그를 지정하지 않은 스레드는 "main" 으로 찍힙니다.
class ThreadContext
{
  public:
    static constexpr std::size_t kMaxTagLen = 15;

    static void setCurrentThreadTag(std::string_view tag) noexcept
    {
        auto &buf = tagBuf_();
        const std::size_t n = (tag.size() < kMaxTagLen) ? tag.size() : kMaxTagLen;
        for (std::size_t i = 0; i < n; ++i)
            buf[i] = tag[i];
        buf[n] = '\0';
        (void)currentTid();
    }

    // 같은 이름의 스레드가 여러 개일 때: "exec0", "exec1" ...
    static void setCurrentThreadTag(std::string_view prefix, int index) noexcept
    {
        std::array<char, kMaxTagLen + 1> tmp{};
        std::snprintf(tmp.data(), tmp.size(), "%.*s%d", static_cast<int>(prefix.size()),
                      prefix.data(), index);
        setCurrentThreadTag(std::string_view{tmp.data()});
    }

    // syscall 매번 호출하지 않도록 thread_local 캐시
    [[nodiscard]] static long currentTid() noexcept { return cachedTid_(); }

    [[nodiscard]] static std::string_view currentThreadTag() noexcept
    {
        auto &buf = tagBuf_();
        if (buf[0] == '\0')
            return "main";
        return std::string_view{buf.data()};
    }

  private:
    static long computeTid_() noexcept
    {
#if defined(__linux__)
        return static_cast<long>(::syscall(SYS_gettid));
#else
        return 0;
#endif
    }

    static long &cachedTid_() noexcept
    {
        thread_local long tid = computeTid_();
        return tid;
    }

    static std::array<char, kMaxTagLen + 1> &tagBuf_() noexcept
    {
        thread_local std::array<char, kMaxTagLen + 1> buf{};
        return buf;
    }
};

[[nodiscard]] inline long tid() noexcept
{
    return ThreadContext::currentTid();
}
[[nodiscard]] inline std::string_view ttag() noexcept
{
    return ThreadContext::currentThreadTag();
}

} // namespace castlink::core
