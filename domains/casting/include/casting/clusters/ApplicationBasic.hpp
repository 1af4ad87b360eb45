#pragma once

#include <casting/clusters/Codec.hpp>

#include <cstdint>
#include <string>

namespace casting::clusters::application_basic
{

inline constexpr std::uint32_t kClusterId = 0x050D;

struct VendorName : ScalarAttribute<kClusterId, 0x0000, std::string>
{
};
struct VendorID : ScalarAttribute<kClusterId, 0x0001, std::uint16_t>
{
};
struct ApplicationName : ScalarAttribute<kClusterId, 0x0002, std::string>
{
};
struct ProductID : ScalarAttribute<kClusterId, 0x0003, std::uint16_t>
{
};
struct ApplicationVersion : ScalarAttribute<kClusterId, 0x0006, std::string>
{
};

static_assert(castlink::interaction::ClusterAttribute<VendorName>);
static_assert(castlink::interaction::ClusterAttribute<ProductID>);

} // namespace casting::clusters::application_basic
