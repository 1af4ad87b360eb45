#pragma once

#include <castlink/protocol/Endian.hpp>
#include <castlink/protocol/MessageView.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace castlink::protocol
{
/// MessageView 위의 명시적 역직렬화 reader 입니다. (big-endian)
/// - 모든 read 는 실패 시 false 를 반환하고 위치를 옮기지 않습니다.
/// - string_view / MessageView 로 읽은 값은 원본 버퍼 수명 동안만 유효합니다.
class PacketReader
{
  public:
    PacketReader() noexcept = default;

    explicit PacketReader(const MessageView &v) noexcept { reset(v); }

    void reset(const MessageView &v) noexcept
    {
        if (!v.data() || v.size() == 0)
        {
            data_ = empty_();
            size_ = 0;
            pos_ = 0;
            return;
        }
        data_ = v.bytes();
        size_ = v.size();
        pos_ = 0;
    }

    [[nodiscard]] std::size_t size() const noexcept { return size_; }
    [[nodiscard]] std::size_t pos() const noexcept { return pos_; }
    [[nodiscard]] std::size_t remaining() const noexcept
    {
        return (pos_ <= size_) ? (size_ - pos_) : 0;
    }
    [[nodiscard]] bool eof() const noexcept { return pos_ == size_; }
    [[nodiscard]] bool expectEnd() const noexcept { return eof(); }

    bool skip(std::size_t n) noexcept
    {
        if (remaining() < n)
            return false;
        pos_ += n;
        return true;
    }

    bool readU8(std::uint8_t &out) noexcept
    {
        if (remaining() < 1)
            return false;
        out = data_[pos_];
        pos_ += 1;
        return true;
    }

    // 0/1 이외의 값은 잘못된 인코딩으로 본다.
    bool readBool(bool &out) noexcept
    {
        if (remaining() < 1 || data_[pos_] > 1)
            return false;
        out = (data_[pos_] == 1);
        pos_ += 1;
        return true;
    }

    bool readU16Be(std::uint16_t &out) noexcept { return readBe_(out); }
    bool readU32Be(std::uint32_t &out) noexcept { return readBe_(out); }
    bool readU64Be(std::uint64_t &out) noexcept { return readBe_(out); }

    bool readF32Be(float &out) noexcept
    {
        std::uint32_t bits = 0;
        if (!readU32Be(bits))
            return false;
        out = floatFromBits(bits);
        return true;
    }

    bool readBytes(std::string_view &out, std::size_t n) noexcept
    {
        if (remaining() < n)
            return false;
        out = std::string_view(reinterpret_cast<const char *>(data_ + pos_), n);
        pos_ += n;
        return true;
    }

    /// (U16BE length) + bytes
    bool readStringU16(std::string_view &out) noexcept
    {
        const std::size_t saved = pos_;
        std::uint16_t len = 0;
        if (!readU16Be(len))
            return false;
        if (!readBytes(out, static_cast<std::size_t>(len)))
        {
            pos_ = saved;
            return false;
        }
        return true;
    }

    /// 소유 문자열로 복사하는 버전 (디코딩된 응답 값처럼 콜백 밖으로 나가는 경우)
    bool readStringU16(std::string &out)
    {
        std::string_view sv;
        if (!readStringU16(sv))
            return false;
        out.assign(sv.data(), sv.size());
        return true;
    }

    /// 남은 바이트 전부 (프레임 body 의 payload 꼬리)
    bool readRest(MessageView &out) noexcept
    {
        const std::size_t n = remaining();
        out = MessageView(n ? static_cast<const void *>(data_ + pos_) : nullptr, n);
        pos_ = size_;
        return true;
    }

  private:
    template <typename T> bool readBe_(T &out) noexcept
    {
        if (remaining() < sizeof(T))
            return false;
        out = loadBe<T>(data_ + pos_);
        pos_ += sizeof(T);
        return true;
    }

    static const std::uint8_t *empty_() noexcept
    {
        static const std::uint8_t kEmpty[1] = {0};
        return kEmpty;
    }

    const std::uint8_t *data_{empty_()};
    std::size_t size_{0};
    std::size_t pos_{0};
};
} // namespace castlink::protocol
