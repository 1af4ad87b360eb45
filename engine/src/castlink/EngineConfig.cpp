#include <castlink/EngineConfig.hpp>

#include <castlink/core/Defaults.hpp>
#include <castlink/session/OnboardingPayload.hpp>

#include <stdexcept>
#include <string>

namespace castlink
{

namespace
{
[[noreturn]] void throwConfigError(const std::string &detail)
{
    const std::string msg = "[EngineConfig] " + detail;
    CASTLINK_LOG_ERROR("EngineConfig", "ValidationError", "msg={}", msg);
    throw std::invalid_argument{msg};
}
} // namespace

void validateEngineConfig(const EngineConfig &config)
{
    if (config.tickResolutionMs > 1000)
        throwConfigError("tickResolutionMs must be <= 1000 when specified");
    if (config.timerSlots != 0 && config.timerSlots < 8)
        throwConfigError("timerSlots is too small (min 8 when specified)");

    if (config.discovery.maxPeers > 1024)
        throwConfigError("discovery.maxPeers must be <= 1024");

    const auto &c = config.commissioning;
    if (!session::OnboardingPayload::isValidPasscode(c.setupPasscode))
        throwConfigError("commissioning.setupPasscode is invalid: " +
                         std::to_string(c.setupPasscode));
    if (!session::OnboardingPayload::isValidDiscriminator(c.discriminator))
        throwConfigError("commissioning.discriminator must be a 12-bit value (<= 4095)");
    if (c.windowTimeoutS > 900)
        throwConfigError("commissioning.windowTimeoutS must be <= 900");

    const auto &i = config.interaction;
    if (i.commandTimeoutMs != 0 && i.commandTimeoutMs < effectiveTickResolutionMs(config))
        throwConfigError("interaction.commandTimeoutMs must be >= tickResolutionMs");
    if (i.subscribeTimeoutMs != 0 && i.subscribeTimeoutMs < effectiveTickResolutionMs(config))
        throwConfigError("interaction.subscribeTimeoutMs must be >= tickResolutionMs");
    if (i.sendRetries > 5)
        throwConfigError("interaction.sendRetries must be <= 5");
    if (i.maxPrimedReports > 256)
        throwConfigError("interaction.maxPrimedReports must be <= 256");
}

std::uint32_t effectiveTickResolutionMs(const EngineConfig &config) noexcept
{
    return config.tickResolutionMs != 0 ? config.tickResolutionMs
                                        : core::defaults::kTickResolutionMs;
}

std::size_t effectiveTimerSlots(const EngineConfig &config) noexcept
{
    return config.timerSlots != 0 ? config.timerSlots : core::defaults::kTimerSlots;
}

std::size_t effectiveMaxPeers(const EngineConfig &config) noexcept
{
    return config.discovery.maxPeers != 0 ? config.discovery.maxPeers
                                          : core::defaults::kMaxPeers;
}

std::uint32_t effectiveWindowTimeoutS(const EngineConfig &config) noexcept
{
    return config.commissioning.windowTimeoutS != 0 ? config.commissioning.windowTimeoutS
                                                    : core::defaults::kCommissioningWindowTimeoutS;
}

std::uint32_t effectiveCommandTimeoutMs(const EngineConfig &config) noexcept
{
    return config.interaction.commandTimeoutMs != 0 ? config.interaction.commandTimeoutMs
                                                    : core::defaults::kCommandTimeoutMs;
}

std::uint32_t effectiveSubscribeTimeoutMs(const EngineConfig &config) noexcept
{
    return config.interaction.subscribeTimeoutMs != 0 ? config.interaction.subscribeTimeoutMs
                                                      : core::defaults::kSubscribeTimeoutMs;
}

std::size_t effectiveMaxPrimedReports(const EngineConfig &config) noexcept
{
    return config.interaction.maxPrimedReports != 0 ? config.interaction.maxPrimedReports
                                                    : core::defaults::kMaxPrimedReports;
}

} // namespace castlink
