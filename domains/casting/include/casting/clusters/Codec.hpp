#pragma once

#include <castlink/interaction/ClusterConcepts.hpp>
#include <castlink/protocol/PacketReader.hpp>
#include <castlink/protocol/PacketWriter.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace casting::clusters
{

using castlink::interaction::NoResponse;
using castlink::protocol::PacketReader;
using castlink::protocol::PacketWriter;

// =============================================================================
// 클러스터 값 인코딩 (big-endian)
//   정수/bool/float : 고정 길이
//   string          : u16 길이 + 바이트
//   nullable<T>     : presence u8(0/1) + T
//   list<T>         : u16 개수 + T...
// =============================================================================
namespace codec
{

inline bool readValue(PacketReader &r, bool &v) { return r.readBool(v); }
inline bool readValue(PacketReader &r, std::uint8_t &v) { return r.readU8(v); }
inline bool readValue(PacketReader &r, std::uint16_t &v) { return r.readU16Be(v); }
inline bool readValue(PacketReader &r, std::uint32_t &v) { return r.readU32Be(v); }
inline bool readValue(PacketReader &r, std::uint64_t &v) { return r.readU64Be(v); }
inline bool readValue(PacketReader &r, float &v) { return r.readF32Be(v); }
inline bool readValue(PacketReader &r, std::string &v) { return r.readStringU16(v); }

inline bool writeValue(PacketWriter &w, bool v)
{
    w.writeBool(v);
    return true;
}
inline bool writeValue(PacketWriter &w, std::uint8_t v)
{
    w.writeU8(v);
    return true;
}
inline bool writeValue(PacketWriter &w, std::uint16_t v)
{
    w.writeU16Be(v);
    return true;
}
inline bool writeValue(PacketWriter &w, std::uint32_t v)
{
    w.writeU32Be(v);
    return true;
}
inline bool writeValue(PacketWriter &w, std::uint64_t v)
{
    w.writeU64Be(v);
    return true;
}
inline bool writeValue(PacketWriter &w, float v)
{
    w.writeF32Be(v);
    return true;
}
inline bool writeValue(PacketWriter &w, const std::string &v)
{
    return w.writeStringU16Checked(v);
}

template <typename T> bool readNullable(PacketReader &r, std::optional<T> &out)
{
    std::uint8_t present = 0;
    if (!r.readU8(present) || present > 1)
        return false;
    if (present == 0)
    {
        out.reset();
        return true;
    }
    T v{};
    if (!readValue(r, v))
        return false;
    out = std::move(v);
    return true;
}

template <typename T> bool writeNullable(PacketWriter &w, const std::optional<T> &v)
{
    w.writeU8(v ? 1 : 0);
    return !v || writeValue(w, *v);
}

template <typename T, typename ReadFn>
bool readList(PacketReader &r, std::vector<T> &out, ReadFn &&readOne)
{
    std::uint16_t count = 0;
    if (!r.readU16Be(count))
        return false;
    out.clear();
    out.reserve(count);
    for (std::uint16_t i = 0; i < count; ++i)
    {
        T item{};
        if (!readOne(r, item))
            return false;
        out.push_back(std::move(item));
    }
    return true;
}

template <typename T, typename WriteFn>
bool writeList(PacketWriter &w, const std::vector<T> &items, WriteFn &&writeOne)
{
    if (items.size() > 0xFFFF)
        return false;
    w.writeU16Be(static_cast<std::uint16_t>(items.size()));
    for (const auto &item : items)
    {
        if (!writeOne(w, item))
            return false;
    }
    return true;
}

} // namespace codec

// =============================================================================
// 속성 descriptor 베이스
//   struct CurrentLevel : NullableAttribute<0x0008, 0x0000, std::uint8_t> {};
// write() 는 시뮬레이터(커미셔너 쪽)가 report 를 만들 때 씁니다.
// =============================================================================
template <std::uint32_t Cluster, std::uint32_t Attribute, typename T> struct ScalarAttribute
{
    static constexpr std::uint32_t kClusterId = Cluster;
    static constexpr std::uint32_t kAttributeId = Attribute;
    using Value = T;

    static bool read(PacketReader &r, Value &out) { return codec::readValue(r, out); }
    static bool write(PacketWriter &w, const Value &v) { return codec::writeValue(w, v); }
};

template <std::uint32_t Cluster, std::uint32_t Attribute, typename T> struct NullableAttribute
{
    static constexpr std::uint32_t kClusterId = Cluster;
    static constexpr std::uint32_t kAttributeId = Attribute;
    using Value = std::optional<T>;

    static bool read(PacketReader &r, Value &out) { return codec::readNullable(r, out); }
    static bool write(PacketWriter &w, const Value &v) { return codec::writeNullable(w, v); }
};

/// status(u8) + optional data(string) 형태의 공통 커맨드 응답
struct StatusDataResponse
{
    std::uint8_t status{0};
    std::optional<std::string> data;

    [[nodiscard]] bool isSuccess() const noexcept { return status == 0; }

    bool read(PacketReader &r) { return r.readU8(status) && codec::readNullable(r, data); }
    bool write(PacketWriter &w) const
    {
        w.writeU8(status);
        return codec::writeNullable(w, data);
    }
};

} // namespace casting::clusters
