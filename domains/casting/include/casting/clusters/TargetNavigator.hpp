#pragma once

#include <casting/clusters/Codec.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace casting::clusters::target_navigator
{

inline constexpr std::uint32_t kClusterId = 0x0505;

struct NavigateTargetResponse : StatusDataResponse
{
};

struct NavigateTarget
{
    static constexpr std::uint32_t kClusterId = target_navigator::kClusterId;
    static constexpr std::uint32_t kCommandId = 0x00;
    using Response = NavigateTargetResponse;

    std::uint8_t target{0};
    std::optional<std::string> data;

    bool write(PacketWriter &w) const
    {
        w.writeU8(target);
        return codec::writeNullable(w, data);
    }
    bool read(PacketReader &r) { return r.readU8(target) && codec::readNullable(r, data); }
};

struct TargetInfo
{
    std::uint8_t identifier{0};
    std::string name;
};

struct TargetList
{
    static constexpr std::uint32_t kClusterId = target_navigator::kClusterId;
    static constexpr std::uint32_t kAttributeId = 0x0000;
    using Value = std::vector<TargetInfo>;

    static bool read(PacketReader &r, Value &out)
    {
        return codec::readList(r, out,
                               [](PacketReader &pr, TargetInfo &t)
                               { return pr.readU8(t.identifier) && pr.readStringU16(t.name); });
    }

    static bool write(PacketWriter &w, const Value &v)
    {
        return codec::writeList(w, v,
                                [](PacketWriter &pw, const TargetInfo &t)
                                {
                                    pw.writeU8(t.identifier);
                                    return pw.writeStringU16Checked(t.name);
                                });
    }
};

struct CurrentTarget : NullableAttribute<kClusterId, 0x0001, std::uint8_t>
{
};

static_assert(castlink::interaction::ClusterCommand<NavigateTarget>);
static_assert(castlink::interaction::ClusterAttribute<TargetList>);

} // namespace casting::clusters::target_navigator
