#pragma once
#include <cstddef>
#include <cstdint>

namespace castlink::core::defaults
{

// ===== Dispatch queue timer =====
inline constexpr std::uint32_t kTickResolutionMs = 10;
inline constexpr std::size_t kTimerSlots = 1024;

// ===== Discovery =====
inline constexpr std::size_t kMaxPeers = 16;

// ===== Commissioning =====
inline constexpr std::uint32_t kSetupPasscode = 20202021;
inline constexpr std::uint16_t kDiscriminator = 3840;
inline constexpr std::uint16_t kVendorId = 0xFFF1;
inline constexpr std::uint16_t kProductId = 0x8001;
inline constexpr std::uint32_t kCommissioningWindowTimeoutS = 180;

// ===== Interaction =====
inline constexpr std::uint32_t kCommandTimeoutMs = 10'000;
inline constexpr std::uint32_t kSubscribeTimeoutMs = 10'000;
inline constexpr std::uint32_t kLivenessMarginMs = 5'000;
inline constexpr std::uint16_t kTargetEndpoint = 1;
inline constexpr std::size_t kMaxPrimedReports = 8;

} // namespace castlink::core::defaults
