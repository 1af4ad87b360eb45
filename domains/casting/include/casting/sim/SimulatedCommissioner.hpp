#pragma once

#include <castlink/core/DispatchQueue.hpp>
#include <castlink/core/GlobalConfig.hpp>
#include <castlink/protocol/InteractionFrames.hpp>
#include <castlink/transport/IDiscoveryTransport.hpp>
#include <castlink/transport/ISessionTransport.hpp>
#include <castlink/util/NonCopyable.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace casting::sim
{

/// 인-프로세스 커미셔너(TV) 시뮬레이터.
///
/// 탐색 전송과 보안 세션 전송을 둘 다 구현하며, 자체 DispatchQueue 스레드("sim")에서
/// 동작합니다. 엔진 입장에서는 실제 전송처럼 임의의 스레드에서 이벤트가 올라옵니다.
///
/// - browse: peerCount 개의 피어를 광고 (첫 피어는 한 번 더 재광고)
/// - openCommissioningWindow: commissioningDelayMs 뒤 커미셔닝 완료 통지
/// - InvokeRequest: 클러스터별로 처리 후 InvokeResponse / StatusResponse
/// - SubscribeRequest: priming report -> SubscribeResponse -> 주기/변경 report
class SimulatedCommissioner final : public castlink::transport::IDiscoveryTransport,
                                    public castlink::transport::ISessionTransport,
                                    private castlink::util::NonMovable
{
  public:
    explicit SimulatedCommissioner(castlink::core::SimulatorConfig cfg);
    ~SimulatedCommissioner() override;

    void start();
    void stop();

    // ===== IDiscoveryTransport =====
    bool browse(std::weak_ptr<castlink::transport::IDiscoverySink> sink) override;
    void stopBrowse() noexcept override;

    // ===== ISessionTransport =====
    void setEventSink(std::weak_ptr<castlink::transport::ISessionEventSink> sink) override;
    bool sendUserDirectedCommissioningRequest(const castlink::transport::UdcTarget &target,
                                              UdcDone done) override;
    bool openCommissioningWindow(std::chrono::seconds timeout) override;
    bool send(const castlink::protocol::MessageView &frame) override;
    void close() noexcept override;

    /// 전송 단절 흉내 (엔진에는 onSessionLost 로 보임)
    void dropSession(std::string reason);

    [[nodiscard]] bool sessionUp() const noexcept { return sessionUp_.load(std::memory_order_acquire); }
    [[nodiscard]] std::uint64_t udcRequests() const noexcept { return udcRequests_.load(); }
    [[nodiscard]] std::uint64_t framesReceived() const noexcept { return framesReceived_.load(); }

  private:
    struct SimSubscription
    {
        std::uint32_t correlationId{0};
        std::uint32_t clusterId{0};
        std::uint32_t attributeId{0};
        std::uint16_t maxIntervalS{0};
        castlink::core::TimerWheel::TimerId periodicTimer{castlink::core::TimerWheel::kInvalidTimerId};
    };

    // 아래는 모두 sim 큐 스레드에서만 실행
    void advertise_(std::uint64_t browseGen);
    void completeCommissioning_(std::uint64_t windowGen);
    void handleFrame_(std::vector<std::uint8_t> frame);
    void handleInvoke_(const castlink::protocol::InvokeRequestFrame &req);
    void handleSubscribe_(const castlink::protocol::SubscribeRequestFrame &req);
    void handleCancel_(std::uint32_t correlationId);
    void schedulePeriodic_(SimSubscription &sub);
    void notifyAttributeChanged_(std::uint32_t clusterId, std::uint32_t attributeId);
    bool sendReport_(const SimSubscription &sub);
    bool encodeAttribute_(std::uint32_t clusterId, std::uint32_t attributeId,
                          castlink::protocol::PacketWriter &w) const;
    void reply_(std::vector<std::uint8_t> frame);
    void replyStatus_(std::uint32_t correlationId, castlink::protocol::InteractionStatus status,
                      std::string message = {});
    void endSession_();

    std::shared_ptr<castlink::transport::ISessionEventSink> lockSink_() const;

    castlink::core::SimulatorConfig cfg_;
    castlink::core::DispatchQueue dq_;

    mutable std::mutex sinkMu_;
    std::weak_ptr<castlink::transport::ISessionEventSink> sessionSink_;
    std::weak_ptr<castlink::transport::IDiscoverySink> discoverySink_;
    std::atomic<std::uint64_t> browseGen_{0};
    std::atomic<std::uint64_t> windowGen_{0};

    std::atomic_bool started_{false};
    std::atomic_bool windowOpen_{false};
    std::atomic_bool sessionUp_{false};
    std::atomic<std::uint64_t> udcRequests_{0};
    std::atomic<std::uint64_t> framesReceived_{0};

    // ----- 장치 상태 (sim 큐 스레드 전용) -----
    std::uint8_t level_{128};
    std::uint8_t playbackState_{2}; // NotPlaying
    std::uint64_t positionMs_{0};
    std::uint8_t currentTarget_{0};
    std::unordered_map<std::uint32_t, SimSubscription> subscriptions_;
};

} // namespace casting::sim
