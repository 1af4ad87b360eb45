#pragma once

#include <atomic>
#include <cstdint>
#include <string>

namespace castlink::monitoring
{

struct EngineMetricsSnapshot
{
    std::uint64_t peersDiscoveredTotal = 0;
    std::uint64_t sessionLossesTotal = 0;

    std::uint64_t commandsSentTotal = 0;
    std::uint64_t commandsSucceededTotal = 0;
    std::uint64_t commandsFailedTotal = 0;
    std::uint64_t commandsTimedOutTotal = 0;
    std::uint64_t commandsPending = 0;

    std::uint64_t subscriptionsEstablishedTotal = 0;
    std::uint64_t subscriptionsActive = 0;
    std::uint64_t reportsDeliveredTotal = 0;

    std::uint64_t decodeErrorsTotal = 0;
    std::uint64_t sendFailuresTotal = 0;
};

/// 엔진 인스턴스별 카운터.
/// 값 갱신은 DispatchQueue 스레드, 조회(snapshot)는 아무 스레드에서나 합니다.
class EngineMetrics
{
  public:
    EngineMetrics() = default;
    EngineMetrics(const EngineMetrics &) = delete;
    EngineMetrics &operator=(const EngineMetrics &) = delete;

    void onPeerDiscovered() noexcept { inc(peersDiscoveredTotal_); }
    void onSessionLost() noexcept { inc(sessionLossesTotal_); }

    void onCommandSent() noexcept
    {
        inc(commandsSentTotal_);
        commandsPending_.fetch_add(1, std::memory_order_relaxed);
    }
    void onCommandSucceeded() noexcept
    {
        inc(commandsSucceededTotal_);
        commandsPending_.fetch_sub(1, std::memory_order_relaxed);
    }
    void onCommandFailed() noexcept
    {
        inc(commandsFailedTotal_);
        commandsPending_.fetch_sub(1, std::memory_order_relaxed);
    }
    // timeout 도 failed 로 같이 집계
    void onCommandTimedOut() noexcept
    {
        inc(commandsTimedOutTotal_);
        onCommandFailed();
    }

    void onSubscriptionRegistered() noexcept
    {
        subscriptionsActive_.fetch_add(1, std::memory_order_relaxed);
    }
    void onSubscriptionEstablished() noexcept { inc(subscriptionsEstablishedTotal_); }
    void onSubscriptionTerminated() noexcept
    {
        subscriptionsActive_.fetch_sub(1, std::memory_order_relaxed);
    }
    void onReportDelivered() noexcept { inc(reportsDeliveredTotal_); }

    void onDecodeError() noexcept { inc(decodeErrorsTotal_); }
    void onSendFailure() noexcept { inc(sendFailuresTotal_); }

    [[nodiscard]] EngineMetricsSnapshot snapshot() const noexcept;
    [[nodiscard]] std::string toPrometheusText() const;

  private:
    static void inc(std::atomic<std::uint64_t> &c) noexcept
    {
        c.fetch_add(1, std::memory_order_relaxed);
    }

    std::atomic<std::uint64_t> peersDiscoveredTotal_{0};
    std::atomic<std::uint64_t> sessionLossesTotal_{0};

    std::atomic<std::uint64_t> commandsSentTotal_{0};
    std::atomic<std::uint64_t> commandsSucceededTotal_{0};
    std::atomic<std::uint64_t> commandsFailedTotal_{0};
    std::atomic<std::uint64_t> commandsTimedOutTotal_{0};
    std::atomic<std::int64_t> commandsPending_{0};

    std::atomic<std::uint64_t> subscriptionsEstablishedTotal_{0};
    std::atomic<std::int64_t> subscriptionsActive_{0};
    std::atomic<std::uint64_t> reportsDeliveredTotal_{0};

    std::atomic<std::uint64_t> decodeErrorsTotal_{0};
    std::atomic<std::uint64_t> sendFailuresTotal_{0};
};

} // namespace castlink::monitoring
