#pragma once

#include <casting/clusters/Codec.hpp>

#include <cstdint>

namespace casting::clusters::keypad_input
{

inline constexpr std::uint32_t kClusterId = 0x0509;

// 자주 쓰는 키 코드 일부
enum class KeyCode : std::uint8_t
{
    Select = 0x00,
    Up = 0x01,
    Down = 0x02,
    Left = 0x03,
    Right = 0x04,
    RootMenu = 0x09,
    Exit = 0x0D,
    Play = 0x44,
    Pause = 0x46,
};

enum class KeypadStatus : std::uint8_t
{
    Success = 0,
    UnsupportedKey = 1,
    InvalidKeyInCurrentState = 2,
};

struct SendKeyResponse
{
    KeypadStatus status{KeypadStatus::Success};

    bool read(PacketReader &r)
    {
        std::uint8_t s = 0;
        if (!r.readU8(s) || s > static_cast<std::uint8_t>(KeypadStatus::InvalidKeyInCurrentState))
            return false;
        status = static_cast<KeypadStatus>(s);
        return true;
    }
    bool write(PacketWriter &w) const
    {
        w.writeU8(static_cast<std::uint8_t>(status));
        return true;
    }
};

struct SendKey
{
    static constexpr std::uint32_t kClusterId = keypad_input::kClusterId;
    static constexpr std::uint32_t kCommandId = 0x00;
    using Response = SendKeyResponse;

    std::uint8_t keyCode{0};

    SendKey() = default;
    explicit SendKey(std::uint8_t code) : keyCode(code) {}
    explicit SendKey(KeyCode code) : keyCode(static_cast<std::uint8_t>(code)) {}

    bool write(PacketWriter &w) const
    {
        w.writeU8(keyCode);
        return true;
    }
    bool read(PacketReader &r) { return r.readU8(keyCode); }
};

static_assert(castlink::interaction::ClusterCommand<SendKey>);

} // namespace casting::clusters::keypad_input
