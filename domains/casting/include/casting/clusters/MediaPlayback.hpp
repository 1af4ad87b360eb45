#pragma once

#include <casting/clusters/Codec.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace casting::clusters::media_playback
{

inline constexpr std::uint32_t kClusterId = 0x0506;

enum class PlaybackState : std::uint8_t
{
    Playing = 0,
    Paused = 1,
    NotPlaying = 2,
    Buffering = 3,
};

struct PlaybackResponse : StatusDataResponse
{
};

/// payload 없는 재생 제어 커맨드 공통
template <std::uint32_t CommandId> struct TransportCommand
{
    static constexpr std::uint32_t kClusterId = media_playback::kClusterId;
    static constexpr std::uint32_t kCommandId = CommandId;
    using Response = PlaybackResponse;

    bool write(PacketWriter &) const { return true; }
    bool read(PacketReader &) { return true; }
};

struct Play : TransportCommand<0x00>
{
};
struct Pause : TransportCommand<0x01>
{
};
struct StopPlayback : TransportCommand<0x02>
{
};
struct Next : TransportCommand<0x05>
{
};

/// delta 만큼 앞으로
struct SkipForward
{
    static constexpr std::uint32_t kClusterId = media_playback::kClusterId;
    static constexpr std::uint32_t kCommandId = 0x08;
    using Response = PlaybackResponse;

    std::uint64_t deltaPositionMs{0};

    bool write(PacketWriter &w) const
    {
        w.writeU64Be(deltaPositionMs);
        return true;
    }
    bool read(PacketReader &r) { return r.readU64Be(deltaPositionMs); }
};

struct SkipBackward
{
    static constexpr std::uint32_t kClusterId = media_playback::kClusterId;
    static constexpr std::uint32_t kCommandId = 0x09;
    using Response = PlaybackResponse;

    std::uint64_t deltaPositionMs{0};

    bool write(PacketWriter &w) const
    {
        w.writeU64Be(deltaPositionMs);
        return true;
    }
    bool read(PacketReader &r) { return r.readU64Be(deltaPositionMs); }
};

struct Seek
{
    static constexpr std::uint32_t kClusterId = media_playback::kClusterId;
    static constexpr std::uint32_t kCommandId = 0x0B;
    using Response = PlaybackResponse;

    std::uint64_t positionMs{0};

    bool write(PacketWriter &w) const
    {
        w.writeU64Be(positionMs);
        return true;
    }
    bool read(PacketReader &r) { return r.readU64Be(positionMs); }
};

// ----- attributes -----

struct CurrentState
{
    static constexpr std::uint32_t kClusterId = media_playback::kClusterId;
    static constexpr std::uint32_t kAttributeId = 0x0000;
    using Value = PlaybackState;

    static bool read(PacketReader &r, Value &out)
    {
        std::uint8_t v = 0;
        if (!r.readU8(v) || v > static_cast<std::uint8_t>(PlaybackState::Buffering))
            return false;
        out = static_cast<PlaybackState>(v);
        return true;
    }
    static bool write(PacketWriter &w, const Value &v)
    {
        w.writeU8(static_cast<std::uint8_t>(v));
        return true;
    }
};

struct StartTime : NullableAttribute<kClusterId, 0x0001, std::uint64_t>
{
};
struct Duration : NullableAttribute<kClusterId, 0x0002, std::uint64_t>
{
};

struct PlaybackPosition
{
    std::uint64_t updatedAt{0};
    std::optional<std::uint64_t> position;
};

struct SampledPosition
{
    static constexpr std::uint32_t kClusterId = media_playback::kClusterId;
    static constexpr std::uint32_t kAttributeId = 0x0003;
    using Value = std::optional<PlaybackPosition>;

    static bool read(PacketReader &r, Value &out)
    {
        std::uint8_t present = 0;
        if (!r.readU8(present) || present > 1)
            return false;
        if (present == 0)
        {
            out.reset();
            return true;
        }
        PlaybackPosition p;
        if (!r.readU64Be(p.updatedAt) || !codec::readNullable(r, p.position))
            return false;
        out = p;
        return true;
    }
    static bool write(PacketWriter &w, const Value &v)
    {
        w.writeU8(v ? 1 : 0);
        if (!v)
            return true;
        w.writeU64Be(v->updatedAt);
        return codec::writeNullable(w, v->position);
    }
};

struct PlaybackSpeed : ScalarAttribute<kClusterId, 0x0004, float>
{
};
struct SeekRangeEnd : NullableAttribute<kClusterId, 0x0005, std::uint64_t>
{
};
struct SeekRangeStart : NullableAttribute<kClusterId, 0x0006, std::uint64_t>
{
};

static_assert(castlink::interaction::ClusterCommand<Play>);
static_assert(castlink::interaction::ClusterCommand<Seek>);
static_assert(castlink::interaction::ClusterAttribute<CurrentState>);
static_assert(castlink::interaction::ClusterAttribute<SampledPosition>);

} // namespace casting::clusters::media_playback
