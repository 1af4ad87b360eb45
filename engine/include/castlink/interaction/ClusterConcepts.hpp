#pragma once

#include <castlink/protocol/PacketReader.hpp>
#include <castlink/protocol/PacketWriter.hpp>

#include <concepts>
#include <cstdint>

namespace castlink::interaction
{

/// 상태 응답만 오는 커맨드의 Response 타입 (payload 없음)
struct NoResponse
{
    bool read(protocol::PacketReader &) { return true; }
};

/// 커맨드 descriptor
///
///   struct Play {
///       static constexpr std::uint32_t kClusterId = 0x0506;
///       static constexpr std::uint32_t kCommandId = 0x00;
///       using Response = PlaybackResponse;
///       bool write(protocol::PacketWriter &w) const;   // false -> InvalidArgument
///   };
template <typename C>
concept ClusterCommand = requires(const C &cmd, protocol::PacketWriter &w,
                                  typename C::Response &resp, protocol::PacketReader &r) {
    { C::kClusterId } -> std::convertible_to<std::uint32_t>;
    { C::kCommandId } -> std::convertible_to<std::uint32_t>;
    { cmd.write(w) } -> std::same_as<bool>;
    { resp.read(r) } -> std::same_as<bool>;
    requires std::default_initializable<typename C::Response>;
    requires std::copy_constructible<typename C::Response>;
};

/// 구독 가능한 속성 descriptor
///
///   struct CurrentLevel {
///       static constexpr std::uint32_t kClusterId = 0x0008;
///       static constexpr std::uint32_t kAttributeId = 0x0000;
///       using Value = std::optional<std::uint8_t>;
///       static bool read(protocol::PacketReader &r, Value &out);
///   };
template <typename A>
concept ClusterAttribute = requires(protocol::PacketReader &r, typename A::Value &v) {
    { A::kClusterId } -> std::convertible_to<std::uint32_t>;
    { A::kAttributeId } -> std::convertible_to<std::uint32_t>;
    { A::read(r, v) } -> std::same_as<bool>;
    requires std::default_initializable<typename A::Value>;
    requires std::copy_constructible<typename A::Value>;
};

} // namespace castlink::interaction
