#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>

namespace castlink::interaction
{

/// 커맨드/구독 공통 correlation id. 0 은 "없음".
using CorrelationId = std::uint32_t;
using RequestId = CorrelationId;
using SubscriptionId = CorrelationId;

inline constexpr CorrelationId kInvalidCorrelationId = 0;

/// 엔진 전체에서 단조 증가하는 correlation id 발급기.
/// 세션이 바뀌어도 id 를 재사용하지 않으며, 한 바퀴 돌아도 0 은 건너뜁니다.
class CorrelationIdAllocator
{
  public:
    CorrelationId next() noexcept
    {
        for (;;)
        {
            const CorrelationId id = next_.fetch_add(1, std::memory_order_relaxed);
            if (id != kInvalidCorrelationId)
                return id;
        }
    }

  private:
    std::atomic<CorrelationId> next_{1};
};

struct AttributePath
{
    std::uint16_t endpoint{0};
    std::uint32_t clusterId{0};
    std::uint32_t attributeId{0};
};

/// invoke<Command>() 호출별 옵션
struct InvokeOptions
{
    /// 0 이면 interaction.command_timeout_ms
    std::chrono::milliseconds timeout{0};

    /// 없으면 interaction.target_endpoint
    std::optional<std::uint16_t> endpoint;
};

/// subscribe<Attribute>() 파라미터
struct SubscribeParams
{
    std::uint16_t minIntervalS{0};
    std::uint16_t maxIntervalS{0};
    std::optional<std::uint16_t> endpoint;
};

enum class SubscriptionState : std::uint8_t
{
    Requested = 0,
    Established,
    Terminated,
};

[[nodiscard]] inline const char *toString(SubscriptionState s) noexcept
{
    switch (s)
    {
    case SubscriptionState::Requested:
        return "Requested";
    case SubscriptionState::Established:
        return "Established";
    case SubscriptionState::Terminated:
        return "Terminated";
    }
    return "Unknown";
}

} // namespace castlink::interaction
