#pragma once

#include <castlink/Error.hpp>
#include <castlink/protocol/MessageView.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace castlink::transport
{

/// UDC 요청 대상
struct UdcTarget
{
    std::string address;
    std::uint16_t port{0};
    std::uint32_t interfaceId{0};
};

/// 보안 세션 전송이 엔진으로 올려보내는 이벤트.
/// 모든 콜백은 임의의 전송 스레드에서 올 수 있습니다.
class ISessionEventSink
{
  public:
    virtual ~ISessionEventSink() = default;

    /// 커미셔너가 general commissioning 핸드셰이크를 끝냈거나(ok) 실패했을 때
    virtual void onCommissioningComplete(Error result) = 0;

    /// 보안 세션 위로 도착한 인터랙션 프레임 1개 ([opcode][body])
    virtual void onFrameReceived(std::vector<std::uint8_t> frame) = 0;

    virtual void onSessionLost(std::string reason) = 0;
};

/// 보안 세션 전송 (암호화/세션 수립은 이 뒤에 숨겨져 있음)
///
/// 엔진은 DispatchQueue owner 스레드에서만 이 인터페이스를 호출합니다.
class ISessionTransport
{
  public:
    using UdcDone = std::function<void(bool sent)>;

    virtual ~ISessionTransport() = default;

    virtual void setEventSink(std::weak_ptr<ISessionEventSink> sink) = 0;

    /// fire-and-forget. done 은 전송 완료 시 임의 스레드에서 1회 호출됩니다.
    /// @return false 면 요청 자체를 시작하지 못했고 done 은 호출되지 않습니다.
    virtual bool sendUserDirectedCommissioningRequest(const UdcTarget &target, UdcDone done) = 0;

    /// basic commissioning window 를 엽니다. 윈도우 만료는 엔진이 직접 관리합니다.
    virtual bool openCommissioningWindow(std::chrono::seconds timeout) = 0;

    /// 인터랙션 프레임 1개 전송. 동기 전송 실패면 false (상대는 프레임을 보지 못함)
    virtual bool send(const protocol::MessageView &frame) = 0;

    virtual void close() noexcept = 0;
};

} // namespace castlink::transport
