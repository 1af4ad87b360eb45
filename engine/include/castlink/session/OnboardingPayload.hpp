#pragma once

#include <cstdint>
#include <string>

namespace castlink
{
struct CommissioningConfig;
}

namespace castlink::session
{

/// 이 클라이언트(commissionee)의 온보딩 정보입니다.
///
/// 엔진 생성 시 설정에서 한 번 계산/검증되고 이후 읽기 전용입니다.
/// 커미셔너는 이 값(패스코드/discriminator)으로 PASE 를 수립합니다.
class OnboardingPayload
{
  public:
    static constexpr std::uint32_t kMaxPasscode = 99'999'998;
    static constexpr std::uint16_t kMaxDiscriminator = 0x0FFF;

    /// @throws std::invalid_argument 패스코드/discriminator 가 유효 범위를 벗어날 때
    OnboardingPayload(std::uint32_t setupPasscode, std::uint16_t discriminator,
                      std::uint16_t vendorId, std::uint16_t productId);

    static OnboardingPayload fromConfig(const castlink::CommissioningConfig &cfg);

    [[nodiscard]] std::uint32_t setupPasscode() const noexcept { return setupPasscode_; }
    [[nodiscard]] std::uint16_t discriminator() const noexcept { return discriminator_; }
    [[nodiscard]] std::uint8_t shortDiscriminator() const noexcept
    {
        return static_cast<std::uint8_t>((discriminator_ >> 8) & 0x0F);
    }
    [[nodiscard]] std::uint16_t vendorId() const noexcept { return vendorId_; }
    [[nodiscard]] std::uint16_t productId() const noexcept { return productId_; }

    /// 11자리 수동 페어링 코드 (short discriminator + passcode + Verhoeff 체크 숫자)
    [[nodiscard]] std::string manualPairingCode() const;

    /// 1..99999998 이면서 자명한 값(00000000, 11111111, ..., 12345678, 87654321)이 아닌 것
    [[nodiscard]] static bool isValidPasscode(std::uint32_t passcode) noexcept;
    [[nodiscard]] static bool isValidDiscriminator(std::uint16_t discriminator) noexcept
    {
        return discriminator <= kMaxDiscriminator;
    }

    /// Verhoeff 체크 숫자 계산 (숫자 문자열 전용)
    [[nodiscard]] static char verhoeffCheckDigit(const std::string &digits);

  private:
    std::uint32_t setupPasscode_;
    std::uint16_t discriminator_;
    std::uint16_t vendorId_;
    std::uint16_t productId_;
};

} // namespace castlink::session
