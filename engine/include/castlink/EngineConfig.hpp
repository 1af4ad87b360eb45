#pragma once

#include <castlink/core/Logger.hpp>

#include <cstddef>
#include <cstdint>
#include <string>

namespace castlink
{

/// 디스커버리(커미셔너 탐색) 설정입니다.
struct DiscoveryConfig
{
    /// 1회 탐색에서 보관할 최대 피어 수. 0이면 defaults::kMaxPeers.
    std::size_t maxPeers = 0;
};

/// 온보딩 페이로드와 커미셔닝 윈도우 설정입니다.
struct CommissioningConfig
{
    /// 셋업 패스코드 (1..99999998, 자명한 값 금지)
    std::uint32_t setupPasscode = 20202021;

    /// 12-bit long discriminator
    std::uint16_t discriminator = 3840;

    std::uint16_t vendorId = 0xFFF1;
    std::uint16_t productId = 0x8001;

    /// basic commissioning window 유지 시간(초). 0이면 기본값(180s).
    std::uint32_t windowTimeoutS = 0;
};

/// 커맨드/구독 설정입니다.
struct InteractionConfig
{
    /// 커맨드 응답 대기 시간(ms). 0이면 기본값(10s). 호출별 InvokeOptions 가 우선합니다.
    std::uint32_t commandTimeoutMs = 0;

    /// SubscribeResponse 대기 시간(ms). 0이면 기본값(10s).
    std::uint32_t subscribeTimeoutMs = 0;

    /// 전송 자체가 실패했을 때(상대가 요청을 못 본 경우)만 재시도하는 횟수.
    /// 응답 타임아웃은 재시도하지 않습니다.
    std::uint32_t sendRetries = 0;

    /// 커맨드/구독 기본 대상 endpoint
    std::uint16_t targetEndpoint = 1;

    /// 구독 liveness 여유 시간(ms). negotiated max interval + margin 동안 report 가 없으면
    /// Timeout 으로 종료합니다. 0이면 liveness 검사를 끕니다.
    std::uint32_t livenessMarginMs = 5'000;

    /// 구독 확립 전에 먼저 도착한 report 버퍼 크기. 0이면 기본값(8).
    std::size_t maxPrimedReports = 0;
};

/// castlink 엔진 설정 구조체입니다.
struct EngineConfig
{
    /// 로그 파일 경로. 빈 문자열이면 std::clog.
    std::string logFilePath;

    core::LogLevel logLevel = core::LogLevel::Info;

    // ===== Advanced tuning (0이면 엔진 기본값 사용) =====

    /// 디스패치 큐 타이머 tick 해상도(ms)
    std::uint32_t tickResolutionMs = 0;

    /// 타이머 슬롯 수(휠 크기)
    std::size_t timerSlots = 0;

    DiscoveryConfig discovery{};
    CommissioningConfig commissioning{};
    InteractionConfig interaction{};
};

/// 필드 값 검증. 실패 시 "[EngineConfig] " 접두사가 붙은 std::invalid_argument.
void validateEngineConfig(const EngineConfig &config);

// 0("기본값 사용") 을 실제 값으로 풀어주는 헬퍼들
std::uint32_t effectiveTickResolutionMs(const EngineConfig &config) noexcept;
std::size_t effectiveTimerSlots(const EngineConfig &config) noexcept;
std::size_t effectiveMaxPeers(const EngineConfig &config) noexcept;
std::uint32_t effectiveWindowTimeoutS(const EngineConfig &config) noexcept;
std::uint32_t effectiveCommandTimeoutMs(const EngineConfig &config) noexcept;
std::uint32_t effectiveSubscribeTimeoutMs(const EngineConfig &config) noexcept;
std::size_t effectiveMaxPrimedReports(const EngineConfig &config) noexcept;

} // namespace castlink
