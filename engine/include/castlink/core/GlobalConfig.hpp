#pragma once

#include <castlink/EngineConfig.hpp>

#include <cstdint>
#include <string>

namespace castlink::core
{

using EngineConfig = castlink::EngineConfig;

/// cast_client 데모 앱이 띄우는 인-프로세스 커미셔너(TV) 시뮬레이터 설정
struct SimulatorConfig
{
    std::string deviceName{"Living Room TV"};
    std::uint16_t vendorId{0xFFF1};
    std::uint16_t productId{0x8001};

    /// 탐색 시작 후 피어 광고까지의 지연(ms)
    std::uint32_t advertiseDelayMs{50};

    /// 커미셔닝 윈도우 오픈 후 커미셔닝 완료까지의 지연(ms)
    std::uint32_t commissioningDelayMs{200};

    /// 커맨드 처리 지연(ms)
    std::uint32_t responseDelayMs{20};

    /// 시뮬레이터가 광고하는 피어 수(1 이상)
    std::uint32_t peerCount{2};
};

struct GlobalConfig
{
    EngineConfig engine{};
    SimulatorConfig sim{};
};

} // namespace castlink::core
