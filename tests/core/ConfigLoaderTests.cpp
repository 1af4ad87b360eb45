#include "../support/Check.hpp"

#include <castlink/EngineConfig.hpp>
#include <castlink/core/ConfigLoader.hpp>
#include <castlink/core/Defaults.hpp>

#include <stdexcept>
#include <string>
#include <string_view>

using castlink::core::ConfigLoader;
using castlink::core::GlobalConfig;

namespace
{

template <typename Ex> bool throwsOn(std::string_view toml)
{
    try
    {
        (void)ConfigLoader::loadString(toml);
    }
    catch (const Ex &)
    {
        return true;
    }
    return false;
}

void test_minimal_config_uses_defaults()
{
    const GlobalConfig cfg = ConfigLoader::loadString("[engine]\n");

    CHECK(cfg.engine.logLevel == castlink::core::LogLevel::Info);
    CHECK(cfg.engine.logFilePath.empty());
    CHECK(cfg.engine.commissioning.setupPasscode == 20202021);
    CHECK(cfg.engine.commissioning.discriminator == 3840);
    CHECK(cfg.sim.peerCount == 2);

    // 0 은 엔진 기본값
    CHECK(castlink::effectiveTickResolutionMs(cfg.engine) ==
          castlink::core::defaults::kTickResolutionMs);
    CHECK(castlink::effectiveMaxPeers(cfg.engine) == castlink::core::defaults::kMaxPeers);
    CHECK(castlink::effectiveCommandTimeoutMs(cfg.engine) ==
          castlink::core::defaults::kCommandTimeoutMs);
    CHECK(castlink::effectiveWindowTimeoutS(cfg.engine) ==
          castlink::core::defaults::kCommissioningWindowTimeoutS);
    CHECK(castlink::effectiveMaxPrimedReports(cfg.engine) ==
          castlink::core::defaults::kMaxPrimedReports);
}

void test_full_config_is_applied()
{
    const GlobalConfig cfg = ConfigLoader::loadString(R"(
[engine]
log_level = "debug"
tick_resolution_ms = 5
timer_slots = 256

[discovery]
max_peers = 4

[commissioning]
setup_passcode = 12345679
discriminator = 0xABC
vendor_id = 0x1234
product_id = 0x5678
window_timeout_s = 60

[interaction]
command_timeout_ms = 2000
subscribe_timeout_ms = 3000
send_retries = 2
target_endpoint = 3
liveness_margin_ms = 0
max_primed_reports = 4

[app.simulator]
device_name = "Bedroom TV"
peer_count = 3
response_delay_ms = 1
)");

    CHECK(cfg.engine.logLevel == castlink::core::LogLevel::Debug);
    CHECK(cfg.engine.tickResolutionMs == 5);
    CHECK(cfg.engine.timerSlots == 256);
    CHECK(cfg.engine.discovery.maxPeers == 4);
    CHECK(cfg.engine.commissioning.setupPasscode == 12345679);
    CHECK(cfg.engine.commissioning.discriminator == 0xABC);
    CHECK(cfg.engine.commissioning.vendorId == 0x1234);
    CHECK(cfg.engine.commissioning.productId == 0x5678);
    CHECK(cfg.engine.commissioning.windowTimeoutS == 60);
    CHECK(cfg.engine.interaction.commandTimeoutMs == 2000);
    CHECK(cfg.engine.interaction.subscribeTimeoutMs == 3000);
    CHECK(cfg.engine.interaction.sendRetries == 2);
    CHECK(cfg.engine.interaction.targetEndpoint == 3);
    CHECK(cfg.engine.interaction.livenessMarginMs == 0);
    CHECK(cfg.engine.interaction.maxPrimedReports == 4);
    CHECK(cfg.sim.deviceName == "Bedroom TV");
    CHECK(cfg.sim.peerCount == 3);
    CHECK(cfg.sim.responseDelayMs == 1);
}

void test_missing_engine_section_is_rejected()
{
    CHECK(throwsOn<std::runtime_error>("[discovery]\nmax_peers = 4\n"));
}

void test_parse_error_is_reported()
{
    CHECK(throwsOn<std::runtime_error>("[engine\nlog_level = 1\n"));
}

void test_bad_values_are_rejected()
{
    CHECK(throwsOn<std::invalid_argument>("[engine]\nlog_level = \"loud\"\n"));
    CHECK(throwsOn<std::invalid_argument>("[engine]\ntick_resolution_ms = -1\n"));
    CHECK(throwsOn<std::invalid_argument>("[engine]\n[commissioning]\nvendor_id = 70000\n"));

    // 검증 단계 (EngineConfig)
    CHECK(throwsOn<std::invalid_argument>("[engine]\n[commissioning]\nsetup_passcode = 11111111\n"));
    CHECK(throwsOn<std::invalid_argument>("[engine]\n[commissioning]\ndiscriminator = 4096\n"));
    CHECK(throwsOn<std::invalid_argument>("[engine]\n[interaction]\nsend_retries = 9\n"));

    CHECK(throwsOn<std::runtime_error>("[engine]\n[app.simulator]\npeer_count = 0\n"));
}

void test_engine_config_validation_message_prefix()
{
    castlink::EngineConfig cfg;
    cfg.commissioning.discriminator = 5000;
    try
    {
        castlink::validateEngineConfig(cfg);
        CHECK(false);
    }
    catch (const std::invalid_argument &e)
    {
        CHECK(std::string(e.what()).rfind("[EngineConfig] ", 0) == 0);
    }
}

void test_missing_file_is_rejected()
{
    bool threw = false;
    try
    {
        (void)ConfigLoader::loadFile("/nonexistent/castlink.toml");
    }
    catch (const std::runtime_error &)
    {
        threw = true;
    }
    CHECK(threw);
}

void test_shipped_example_config_loads()
{
    const auto cfg = ConfigLoader::loadFile(CASTLINK_EXAMPLE_CONFIG);
    CHECK(cfg.engine.discovery.maxPeers == 16);
    CHECK(cfg.engine.commissioning.setupPasscode == 20202021u);
    CHECK(cfg.engine.commissioning.discriminator == 3840);
    CHECK(cfg.sim.peerCount == 2);
    CHECK(cfg.sim.deviceName == "Living Room TV");
}

} // namespace

int main()
{
    test_minimal_config_uses_defaults();
    test_full_config_is_applied();
    test_missing_engine_section_is_rejected();
    test_parse_error_is_reported();
    test_bad_values_are_rejected();
    test_engine_config_validation_message_prefix();
    test_missing_file_is_rejected();
    test_shipped_example_config_loads();
    return castlink::test::finish("core.config_loader");
}
