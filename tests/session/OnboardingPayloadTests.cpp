#include "../support/Check.hpp"

#include <castlink/EngineConfig.hpp>
#include <castlink/session/OnboardingPayload.hpp>

#include <stdexcept>

using castlink::session::OnboardingPayload;

namespace
{

void test_default_manual_code()
{
    OnboardingPayload p(20202021, 3840, 0xFFF1, 0x8001);
    CHECK(p.shortDiscriminator() == 0x0F);
    CHECK(p.manualPairingCode() == "34970112332");
}

void test_from_config()
{
    castlink::CommissioningConfig cfg;
    const auto p = OnboardingPayload::fromConfig(cfg);
    CHECK(p.setupPasscode() == 20202021);
    CHECK(p.discriminator() == 3840);
    CHECK(p.vendorId() == 0xFFF1);
    CHECK(p.manualPairingCode().size() == 11);
}

void test_verhoeff()
{
    CHECK(OnboardingPayload::verhoeffCheckDigit("236") == '3');
    CHECK(OnboardingPayload::verhoeffCheckDigit("3497011233") == '2');

    bool threw = false;
    try
    {
        (void)OnboardingPayload::verhoeffCheckDigit("12a");
    }
    catch (const std::invalid_argument &)
    {
        threw = true;
    }
    CHECK(threw);
}

void test_passcode_rules()
{
    CHECK(OnboardingPayload::isValidPasscode(20202021));
    CHECK(!OnboardingPayload::isValidPasscode(0));
    CHECK(!OnboardingPayload::isValidPasscode(11111111));
    CHECK(!OnboardingPayload::isValidPasscode(12345678));
    CHECK(!OnboardingPayload::isValidPasscode(99999999));
    CHECK(OnboardingPayload::isValidPasscode(99999998));
}

void test_invalid_values_throw()
{
    bool threw = false;
    try
    {
        OnboardingPayload p(87654321, 100, 0, 0);
    }
    catch (const std::invalid_argument &)
    {
        threw = true;
    }
    CHECK(threw);

    threw = false;
    try
    {
        OnboardingPayload p(20202021, 0x1000, 0, 0);
    }
    catch (const std::invalid_argument &)
    {
        threw = true;
    }
    CHECK(threw);
}

} // namespace

int main()
{
    test_default_manual_code();
    test_from_config();
    test_verhoeff();
    test_passcode_rules();
    test_invalid_values_throw();
    return castlink::test::finish("session.onboarding_payload");
}
