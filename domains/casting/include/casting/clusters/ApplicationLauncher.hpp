#pragma once

#include <casting/clusters/Codec.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace casting::clusters::application_launcher
{

inline constexpr std::uint32_t kClusterId = 0x050C;

struct Application
{
    std::uint16_t catalogVendorId{0};
    std::string applicationId;

    bool write(PacketWriter &w) const
    {
        if (applicationId.empty())
            return false;
        w.writeU16Be(catalogVendorId);
        return w.writeStringU16Checked(applicationId);
    }

    bool read(PacketReader &r)
    {
        return r.readU16Be(catalogVendorId) && r.readStringU16(applicationId);
    }
};

struct LauncherResponse : StatusDataResponse
{
};

struct LaunchApp
{
    static constexpr std::uint32_t kClusterId = application_launcher::kClusterId;
    static constexpr std::uint32_t kCommandId = 0x00;
    using Response = LauncherResponse;

    Application application;
    std::optional<std::string> data;

    bool write(PacketWriter &w) const
    {
        return application.write(w) && codec::writeNullable(w, data);
    }
    bool read(PacketReader &r) { return application.read(r) && codec::readNullable(r, data); }
};

// StopApp / HideApp 은 payload 가 Application 하나뿐
template <std::uint32_t CommandId> struct ApplicationCommand
{
    static constexpr std::uint32_t kClusterId = application_launcher::kClusterId;
    static constexpr std::uint32_t kCommandId = CommandId;
    using Response = LauncherResponse;

    Application application;

    bool write(PacketWriter &w) const { return application.write(w); }
    bool read(PacketReader &r) { return application.read(r); }
};

struct StopApp : ApplicationCommand<0x01>
{
};
struct HideApp : ApplicationCommand<0x02>
{
};

static_assert(castlink::interaction::ClusterCommand<LaunchApp>);
static_assert(castlink::interaction::ClusterCommand<StopApp>);

} // namespace casting::clusters::application_launcher
