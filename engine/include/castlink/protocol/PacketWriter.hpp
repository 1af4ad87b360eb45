#pragma once

#include <castlink/protocol/Endian.hpp>
#include <castlink/protocol/MessageView.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <utility>
#include <vector>

namespace castlink::protocol
{
/// 인터랙션 프레임 직렬화용 append-only writer (big-endian)
class PacketWriter
{
  public:
    PacketWriter() = default;
    explicit PacketWriter(std::size_t reserveHint) { buf_.reserve(reserveHint); }

    void clear() { buf_.clear(); }
    void reserve(std::size_t n) { buf_.reserve(n); }
    [[nodiscard]] std::size_t size() const noexcept { return buf_.size(); }

    void writeU8(std::uint8_t v) { buf_.push_back(v); }
    void writeBool(bool v) { buf_.push_back(v ? 1 : 0); }

    void writeU16Be(std::uint16_t v) { appendBe_(v); }
    void writeU32Be(std::uint32_t v) { appendBe_(v); }
    void writeU64Be(std::uint64_t v) { appendBe_(v); }
    void writeF32Be(float v) { writeU32Be(floatToBits(v)); }

    void writeBytes(const void *p, std::size_t n)
    {
        if (n == 0)
            return;
        const auto *b = static_cast<const std::uint8_t *>(p);
        buf_.insert(buf_.end(), b, b + n);
    }

    void writeBytes(const MessageView &v) { writeBytes(v.data(), v.size()); }

    /// 길이 초과 시 아무것도 쓰지 않고 false. (잘라서 보내지 않는다)
    [[nodiscard]] bool writeStringU16Checked(std::string_view s, std::uint16_t maxLen = 0xFFFF)
    {
        if (s.size() > maxLen)
            return false;
        writeU16Be(static_cast<std::uint16_t>(s.size()));
        writeBytes(s.data(), s.size());
        return true;
    }

    [[nodiscard]] MessageView view() const noexcept
    {
        if (buf_.empty())
            return {nullptr, 0};
        return {buf_.data(), buf_.size()};
    }

    [[nodiscard]] const std::vector<std::uint8_t> &bytes() const noexcept { return buf_; }
    [[nodiscard]] std::vector<std::uint8_t> take() noexcept { return std::exchange(buf_, {}); }

  private:
    template <typename T> void appendBe_(T v)
    {
        const std::size_t at = buf_.size();
        buf_.resize(at + sizeof(T));
        storeBe(v, buf_.data() + at);
    }

    std::vector<std::uint8_t> buf_;
};
} // namespace castlink::protocol
