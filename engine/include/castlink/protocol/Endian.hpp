#pragma once

#include <bit>
#include <concepts>
#include <cstddef>
#include <cstdint>

namespace castlink::protocol
{
// 인터랙션 프레임의 정수 필드는 전부 big-endian (network order)

template <std::unsigned_integral T> constexpr void storeBe(T v, std::uint8_t *out) noexcept
{
    for (std::size_t i = 0; i < sizeof(T); ++i)
        out[i] = static_cast<std::uint8_t>(v >> (8 * (sizeof(T) - 1 - i)));
}

template <std::unsigned_integral T> [[nodiscard]] constexpr T loadBe(const std::uint8_t *p) noexcept
{
    T v = 0;
    for (std::size_t i = 0; i < sizeof(T); ++i)
        v = static_cast<T>((v << 8) | static_cast<T>(p[i]));
    return v;
}

// float 는 IEEE-754 비트 패턴을 u32 로 실어 보낸다. (PlaybackSpeed)
inline std::uint32_t floatToBits(float f) noexcept
{
    return std::bit_cast<std::uint32_t>(f);
}
inline float floatFromBits(std::uint32_t bits) noexcept
{
    return std::bit_cast<float>(bits);
}

} // namespace castlink::protocol
