#pragma once

#include <castlink/discovery/PeerRecord.hpp>

#include <cstdint>
#include <memory>
#include <string>

namespace castlink::transport
{

/// 탐색 결과 수신자. 콜백은 임의의 전송 스레드에서 호출될 수 있습니다.
class IDiscoverySink
{
  public:
    virtual ~IDiscoverySink() = default;

    virtual void onPeerDiscovered(discovery::PeerRecord record) = 0;
};

/// 플랫폼 탐색 전송 (mDNS 류 브라우징)
///
/// - browse() 는 sink 를 weak_ptr 로만 보관합니다. sink 가 사라지면 결과를 버려야 합니다.
/// - 새 browse() 는 이전 browse 를 대체합니다.
class IDiscoveryTransport
{
  public:
    virtual ~IDiscoveryTransport() = default;

    /// @return 탐색 요청을 내보냈으면 true
    virtual bool browse(std::weak_ptr<IDiscoverySink> sink) = 0;

    virtual void stopBrowse() noexcept = 0;
};

} // namespace castlink::transport
