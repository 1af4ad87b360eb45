#pragma once

#include <casting/clusters/Codec.hpp>

#include <cstdint>

namespace casting::clusters::level_control
{

inline constexpr std::uint32_t kClusterId = 0x0008;

enum class StepMode : std::uint8_t
{
    Up = 0,
    Down = 1,
};

// 두 커맨드 모두 상태 응답만 온다.
struct MoveToLevel
{
    static constexpr std::uint32_t kClusterId = level_control::kClusterId;
    static constexpr std::uint32_t kCommandId = 0x00;
    using Response = NoResponse;

    std::uint8_t level{0};
    std::uint16_t transitionTime{0}; // 1/10 s
    std::uint8_t optionMask{0};
    std::uint8_t optionOverride{0};

    bool write(PacketWriter &w) const
    {
        if (level == 0xFF)
            return false; // 255 는 null 예약값
        w.writeU8(level);
        w.writeU16Be(transitionTime);
        w.writeU8(optionMask);
        w.writeU8(optionOverride);
        return true;
    }

    bool read(PacketReader &r)
    {
        return r.readU8(level) && r.readU16Be(transitionTime) && r.readU8(optionMask) &&
               r.readU8(optionOverride);
    }
};

struct Step
{
    static constexpr std::uint32_t kClusterId = level_control::kClusterId;
    static constexpr std::uint32_t kCommandId = 0x02;
    using Response = NoResponse;

    StepMode stepMode{StepMode::Up};
    std::uint8_t stepSize{1};
    std::uint16_t transitionTime{0};
    std::uint8_t optionMask{0};
    std::uint8_t optionOverride{0};

    bool write(PacketWriter &w) const
    {
        if (stepMode != StepMode::Up && stepMode != StepMode::Down)
            return false;
        w.writeU8(static_cast<std::uint8_t>(stepMode));
        w.writeU8(stepSize);
        w.writeU16Be(transitionTime);
        w.writeU8(optionMask);
        w.writeU8(optionOverride);
        return true;
    }

    bool read(PacketReader &r)
    {
        std::uint8_t mode = 0;
        if (!r.readU8(mode) || mode > 1)
            return false;
        stepMode = static_cast<StepMode>(mode);
        return r.readU8(stepSize) && r.readU16Be(transitionTime) && r.readU8(optionMask) &&
               r.readU8(optionOverride);
    }
};

struct CurrentLevel : NullableAttribute<kClusterId, 0x0000, std::uint8_t>
{
};
struct MinLevel : ScalarAttribute<kClusterId, 0x0002, std::uint8_t>
{
};
struct MaxLevel : ScalarAttribute<kClusterId, 0x0003, std::uint8_t>
{
};

static_assert(castlink::interaction::ClusterCommand<MoveToLevel>);
static_assert(castlink::interaction::ClusterCommand<Step>);
static_assert(castlink::interaction::ClusterAttribute<CurrentLevel>);

} // namespace casting::clusters::level_control
