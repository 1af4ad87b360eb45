#pragma once

#include <casting/clusters/Codec.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace casting::clusters::content_launcher
{

inline constexpr std::uint32_t kClusterId = 0x050A;

enum class ParameterType : std::uint8_t
{
    Actor = 0x00,
    Channel = 0x01,
    Character = 0x02,
    Director = 0x03,
    Event = 0x04,
    Franchise = 0x05,
    Genre = 0x06,
    League = 0x07,
    Popularity = 0x08,
    Provider = 0x09,
    Sport = 0x0A,
    SportsTeam = 0x0B,
    Type = 0x0C,
    Video = 0x0D,
};

struct SearchParameter
{
    ParameterType type{ParameterType::Video};
    std::string value;
};

struct ContentSearch
{
    std::vector<SearchParameter> parameters;
};

/// LaunchContent / LaunchURL 응답
struct LauncherResponse : StatusDataResponse
{
};

struct LaunchContent
{
    static constexpr std::uint32_t kClusterId = content_launcher::kClusterId;
    static constexpr std::uint32_t kCommandId = 0x00;
    using Response = LauncherResponse;

    ContentSearch search;
    bool autoPlay{true};
    std::optional<std::string> data;

    bool write(PacketWriter &w) const
    {
        if (search.parameters.empty())
            return false; // 검색 조건 없는 launch 는 거부

        const bool ok = codec::writeList(w, search.parameters,
                                         [](PacketWriter &pw, const SearchParameter &p)
                                         {
                                             pw.writeU8(static_cast<std::uint8_t>(p.type));
                                             return pw.writeStringU16Checked(p.value);
                                         });
        if (!ok)
            return false;
        w.writeBool(autoPlay);
        return codec::writeNullable(w, data);
    }

    bool read(PacketReader &r)
    {
        const bool ok = codec::readList(r, search.parameters,
                                        [](PacketReader &pr, SearchParameter &p)
                                        {
                                            std::uint8_t t = 0;
                                            if (!pr.readU8(t))
                                                return false;
                                            p.type = static_cast<ParameterType>(t);
                                            return pr.readStringU16(p.value);
                                        });
        return ok && r.readBool(autoPlay) && codec::readNullable(r, data);
    }
};

struct LaunchURL
{
    static constexpr std::uint32_t kClusterId = content_launcher::kClusterId;
    static constexpr std::uint32_t kCommandId = 0x01;
    using Response = LauncherResponse;

    std::string contentUrl;
    std::optional<std::string> displayString;

    bool write(PacketWriter &w) const
    {
        if (contentUrl.empty())
            return false;
        return w.writeStringU16Checked(contentUrl) && codec::writeNullable(w, displayString);
    }

    bool read(PacketReader &r)
    {
        return r.readStringU16(contentUrl) && codec::readNullable(r, displayString);
    }
};

/// bitmap: bit0 = DASH, bit1 = HLS
struct SupportedStreamingProtocols : ScalarAttribute<kClusterId, 0x0001, std::uint32_t>
{
    static constexpr std::uint32_t kDash = 1u << 0;
    static constexpr std::uint32_t kHls = 1u << 1;
};

static_assert(castlink::interaction::ClusterCommand<LaunchContent>);
static_assert(castlink::interaction::ClusterCommand<LaunchURL>);
static_assert(castlink::interaction::ClusterAttribute<SupportedStreamingProtocols>);

} // namespace casting::clusters::content_launcher
