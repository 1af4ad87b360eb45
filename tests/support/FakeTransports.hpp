#pragma once

#include <castlink/protocol/InteractionFrames.hpp>
#include <castlink/transport/IDiscoveryTransport.hpp>
#include <castlink/transport/ISessionTransport.hpp>

#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <vector>

namespace castlink::test
{

/// browse 호출을 기록하고, 테스트가 광고를 직접 밀어 넣는 탐색 전송.
class FakeDiscoveryTransport final : public transport::IDiscoveryTransport
{
  public:
    bool browse(std::weak_ptr<transport::IDiscoverySink> sink) override
    {
        ++browseCalls;
        if (!acceptBrowse)
            return false;
        previousSink = currentSink;
        currentSink = std::move(sink);
        return true;
    }

    void stopBrowse() noexcept override { ++stopCalls; }

    void advertise(discovery::PeerRecord rec) { advertiseTo(currentSink, std::move(rec)); }

    /// 이전 run 의 sink 로 늦게 도착하는 광고
    void advertiseLate(discovery::PeerRecord rec) { advertiseTo(previousSink, std::move(rec)); }

    static discovery::PeerRecord peer(const std::string &name, std::string address = "10.0.0.2",
                                      std::uint16_t port = 5540)
    {
        discovery::PeerRecord rec;
        rec.instanceName = name;
        rec.deviceName = "TV " + name;
        rec.port = port;
        if (!address.empty())
            rec.addresses.push_back(std::move(address));
        return rec;
    }

    bool acceptBrowse{true};
    int browseCalls{0};
    int stopCalls{0};

  private:
    static void advertiseTo(const std::weak_ptr<transport::IDiscoverySink> &weak,
                            discovery::PeerRecord rec)
    {
        if (auto sink = weak.lock())
            sink->onPeerDiscovered(std::move(rec));
    }

    std::weak_ptr<transport::IDiscoverySink> currentSink;
    std::weak_ptr<transport::IDiscoverySink> previousSink;
};

/// 보낸 프레임을 모아 두고, 세션 이벤트를 테스트가 직접 발생시키는 세션 전송.
class FakeSessionTransport final : public transport::ISessionTransport
{
  public:
    void setEventSink(std::weak_ptr<transport::ISessionEventSink> s) override
    {
        sink = std::move(s);
    }

    bool sendUserDirectedCommissioningRequest(const transport::UdcTarget &target,
                                              UdcDone done) override
    {
        udcTargets.push_back(target);
        if (!acceptUdc)
            return false;
        pendingUdc.push_back(std::move(done));
        return true;
    }

    bool openCommissioningWindow(std::chrono::seconds timeout) override
    {
        ++windowOpens;
        lastWindowTimeout = timeout;
        return acceptWindow;
    }

    bool send(const protocol::MessageView &frame) override
    {
        ++sendAttempts;
        if (failNextSends > 0)
        {
            --failNextSends;
            return false;
        }
        sent.push_back(frame.toBytes());
        return true;
    }

    void close() noexcept override { ++closes; }

    // ===== 이벤트 주입 (전송 스레드 역할) =====
    void completeUdc(bool ok)
    {
        if (pendingUdc.empty())
            return;
        auto done = std::move(pendingUdc.front());
        pendingUdc.pop_front();
        done(ok);
    }

    void commissioningComplete(Error result = Error::success())
    {
        if (auto s = sink.lock())
            s->onCommissioningComplete(std::move(result));
    }

    void receive(std::vector<std::uint8_t> frame)
    {
        if (auto s = sink.lock())
            s->onFrameReceived(std::move(frame));
    }

    template <typename Frame> void reply(const Frame &frame) { receive(protocol::encodeFrame(frame)); }

    void loseSession(std::string reason = "link down")
    {
        if (auto s = sink.lock())
            s->onSessionLost(std::move(reason));
    }

    /// sent[index] 를 Frame 으로 디코딩. payload 류 필드는 sent 버퍼를 가리킵니다.
    template <typename Frame> bool sentFrame(std::size_t index, Frame &out) const
    {
        if (index >= sent.size())
            return false;
        std::uint16_t opcode = 0;
        protocol::MessageView body;
        if (!protocol::splitFrame(protocol::MessageView(sent[index]), opcode, body) ||
            opcode != Frame::kOpcode)
            return false;
        return protocol::decodeBody(body, out);
    }

    std::weak_ptr<transport::ISessionEventSink> sink;

    bool acceptUdc{true};
    bool acceptWindow{true};
    int failNextSends{0};

    std::vector<transport::UdcTarget> udcTargets;
    std::deque<UdcDone> pendingUdc;
    int windowOpens{0};
    std::chrono::seconds lastWindowTimeout{0};
    int sendAttempts{0};
    int closes{0};
    std::vector<std::vector<std::uint8_t>> sent;
};

} // namespace castlink::test
