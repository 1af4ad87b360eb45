#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace castlink::protocol
{

/// 소유권이 없는 바이트 뷰입니다.
///
/// ===== 수명 규약 =====
/// - 디스패치 핸들러/디코더가 실행되는 동안에만 유효합니다.
/// - 핸들러 밖으로 보관하려면 toBytes() 로 명시적으로 복사합니다.
///   (예: 구독 확립 전에 먼저 도착한 report 버퍼링)
class MessageView
{
  public:
    MessageView() noexcept = default;
    MessageView(const void *data, std::size_t size) noexcept : data_(data), size_(size) {}

    explicit MessageView(const std::vector<std::uint8_t> &bytes) noexcept
        : data_(bytes.empty() ? nullptr : bytes.data()), size_(bytes.size())
    {
    }

    [[nodiscard]] const void *data() const noexcept { return data_; }
    [[nodiscard]] const std::uint8_t *bytes() const noexcept
    {
        return static_cast<const std::uint8_t *>(data_);
    }
    [[nodiscard]] std::size_t size() const noexcept { return size_; }
    [[nodiscard]] bool empty() const noexcept { return size_ == 0; }

    [[nodiscard]] std::vector<std::uint8_t> toBytes() const
    {
        if (empty())
            return {};
        return std::vector<std::uint8_t>(bytes(), bytes() + size_);
    }

  private:
    const void *data_{nullptr};
    std::size_t size_{0};
};

} // namespace castlink::protocol
