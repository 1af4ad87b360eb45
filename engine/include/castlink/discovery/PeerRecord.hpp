#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace castlink::discovery
{

/// 탐색으로 발견한 커미셔너(TV) 1대의 광고 정보입니다.
/// PeerRegistry 에 들어간 뒤에는 바뀌지 않습니다.
struct PeerRecord
{
    std::string instanceName; // 탐색 run 안에서의 식별자 (중복 판별 키)
    std::string hostName;
    std::string deviceName;

    std::uint16_t vendorId{0};
    std::uint16_t productId{0};
    std::uint32_t deviceType{0};

    std::uint16_t longDiscriminator{0};
    std::uint8_t commissioningMode{0};
    std::uint16_t pairingHint{0};

    std::uint16_t port{0};
    std::vector<std::string> addresses; // 숫자 IP 문자열
    std::uint32_t interfaceId{0};       // UDC 전송 시 사용할 인터페이스 힌트

    [[nodiscard]] bool hasAddress() const noexcept { return !addresses.empty(); }
    [[nodiscard]] const std::string &primaryAddress() const noexcept { return addresses.front(); }
};

} // namespace castlink::discovery
