#include <castlink/session/OnboardingPayload.hpp>

#include <castlink/EngineConfig.hpp>

#include <array>
#include <format>
#include <stdexcept>

namespace castlink::session
{

namespace
{
// Verhoeff (dihedral group D5)
constexpr std::array<std::array<std::uint8_t, 10>, 10> kMul = {{
    {0, 1, 2, 3, 4, 5, 6, 7, 8, 9},
    {1, 2, 3, 4, 0, 6, 7, 8, 9, 5},
    {2, 3, 4, 0, 1, 7, 8, 9, 5, 6},
    {3, 4, 0, 1, 2, 8, 9, 5, 6, 7},
    {4, 0, 1, 2, 3, 9, 5, 6, 7, 8},
    {5, 9, 8, 7, 6, 0, 4, 3, 2, 1},
    {6, 5, 9, 8, 7, 1, 0, 4, 3, 2},
    {7, 6, 5, 9, 8, 2, 1, 0, 4, 3},
    {8, 7, 6, 5, 9, 3, 2, 1, 0, 4},
    {9, 8, 7, 6, 5, 4, 3, 2, 1, 0},
}};

constexpr std::array<std::array<std::uint8_t, 10>, 8> kPerm = {{
    {0, 1, 2, 3, 4, 5, 6, 7, 8, 9},
    {1, 5, 7, 6, 2, 8, 3, 0, 9, 4},
    {5, 8, 0, 3, 7, 9, 6, 1, 4, 2},
    {8, 9, 1, 6, 0, 4, 3, 5, 2, 7},
    {9, 4, 5, 3, 1, 2, 6, 8, 7, 0},
    {4, 2, 8, 6, 5, 7, 3, 9, 0, 1},
    {2, 7, 9, 3, 8, 0, 6, 4, 1, 5},
    {7, 0, 4, 6, 9, 1, 3, 2, 5, 8},
}};

constexpr std::array<std::uint8_t, 10> kInv = {0, 4, 3, 2, 1, 5, 6, 7, 8, 9};

constexpr std::array<std::uint32_t, 12> kTrivialPasscodes = {
    0,        11111111, 22222222, 33333333, 44444444, 55555555,
    66666666, 77777777, 88888888, 99999999, 12345678, 87654321,
};
} // namespace

OnboardingPayload::OnboardingPayload(std::uint32_t setupPasscode, std::uint16_t discriminator,
                                     std::uint16_t vendorId, std::uint16_t productId)
    : setupPasscode_(setupPasscode), discriminator_(discriminator), vendorId_(vendorId),
      productId_(productId)
{
    if (!isValidPasscode(setupPasscode_))
        throw std::invalid_argument("OnboardingPayload: invalid setup passcode " +
                                    std::to_string(setupPasscode_));
    if (!isValidDiscriminator(discriminator_))
        throw std::invalid_argument("OnboardingPayload: discriminator must be <= 0xFFF");
}

OnboardingPayload OnboardingPayload::fromConfig(const castlink::CommissioningConfig &cfg)
{
    return OnboardingPayload(cfg.setupPasscode, cfg.discriminator, cfg.vendorId, cfg.productId);
}

bool OnboardingPayload::isValidPasscode(std::uint32_t passcode) noexcept
{
    if (passcode == 0 || passcode > kMaxPasscode)
        return false;
    for (auto trivial : kTrivialPasscodes)
    {
        if (passcode == trivial)
            return false;
    }
    return true;
}

char OnboardingPayload::verhoeffCheckDigit(const std::string &digits)
{
    std::uint8_t c = 0;
    std::size_t i = 0;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it, ++i)
    {
        if (*it < '0' || *it > '9')
            throw std::invalid_argument("verhoeffCheckDigit: non-digit input");
        const auto d = static_cast<std::uint8_t>(*it - '0');
        c = kMul[c][kPerm[(i + 1) % 8][d]];
    }
    return static_cast<char>('0' + kInv[c]);
}

std::string OnboardingPayload::manualPairingCode() const
{
    // 11자리 short code (vid/pid 미포함):
    //   chunk1(1)  = short discriminator 상위 2bit
    //   chunk2(5)  = (short discriminator 하위 2bit << 14) | passcode 하위 14bit
    //   chunk3(4)  = passcode 상위 13bit
    //   check(1)   = Verhoeff
    const std::uint32_t shortDisc = shortDiscriminator();
    const std::uint32_t chunk1 = (shortDisc >> 2) & 0x3;
    const std::uint32_t chunk2 = ((shortDisc & 0x3) << 14) | (setupPasscode_ & 0x3FFF);
    const std::uint32_t chunk3 = (setupPasscode_ >> 14) & 0x1FFF;

    std::string code = std::format("{:01d}{:05d}{:04d}", chunk1, chunk2, chunk3);
    code.push_back(verhoeffCheckDigit(code));
    return code;
}

} // namespace castlink::session
