#pragma once
#include <cstddef>
#include <cstdint>

namespace castlink::session
{
enum class SessionState : std::uint8_t
{
    Idle = 0,
    Discovering = 1,
    ConnectingUDC = 2,         // UDC 요청 전송 중
    AwaitingCommissioning = 3, // commissioning window 열림, 커미셔너 대기
    Commissioned = 4,          // 보안 세션 사용 가능
    Failed = 5,
    Closed = 6,
};

inline constexpr std::size_t kSessionStateCount = 7;

inline constexpr std::uint32_t stateBit(SessionState s) noexcept
{
    return 1u << static_cast<std::uint32_t>(s);
}

inline constexpr std::uint32_t kAnyStateMask = (1u << kSessionStateCount) - 1u;

[[nodiscard]] const char *toString(SessionState s) noexcept;

} // namespace castlink::session
