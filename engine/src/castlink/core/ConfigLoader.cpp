#include <castlink/core/ConfigLoader.hpp>

#include <castlink/core/Logger.hpp>
#include <castlink/EngineConfig.hpp>

#include <toml++/toml.hpp>

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace
{
using namespace castlink;
using namespace castlink::core;

// -----------------------------------------------------------------------------
// Helper Functions (Validation & Parsing)
// -----------------------------------------------------------------------------

void printUsage(const char *argv0)
{
    std::string exe = "cast_client";
    if (argv0 && *argv0)
        exe = std::filesystem::path(argv0).filename().string();
    std::cout << "Usage: " << exe << " --config <path.toml>\n";
}

LogLevel parseLogLevel(std::string_view s)
{
    std::string v(s);
    for (auto &c : v)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (v == "trace")
        return LogLevel::Trace;
    if (v == "debug")
        return LogLevel::Debug;
    if (v == "info")
        return LogLevel::Info;
    if (v == "warn" || v == "warning")
        return LogLevel::Warn;
    if (v == "error")
        return LogLevel::Error;
    if (v == "fatal")
        return LogLevel::Fatal;

    throw std::invalid_argument("Invalid log_level: " + std::string(s));
}

std::optional<std::string> scanCliForConfigPath(int argc, char **argv)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string_view a = argv[i] ? std::string_view(argv[i]) : std::string_view{};
        if (a == "--config" || a == "-c")
        {
            if (i + 1 >= argc || !argv[i + 1] || !*argv[i + 1])
                throw std::runtime_error("--config requires a path");
            return std::string(argv[i + 1]);
        }
    }
    return std::nullopt;
}

// [Strict Mode] 범위를 벗어나면 조용히 자르지 않고 바로 실패
std::uint16_t checkedU16FromI64(std::int64_t v, const char *key)
{
    if (v < 0 || v > 65535)
        throw std::invalid_argument(std::string(key) + " out of range (0..65535): " +
                                    std::to_string(v));
    return static_cast<std::uint16_t>(v);
}

std::uint32_t checkedU32FromI64(std::int64_t v, const char *key)
{
    if (v < 0 || v > static_cast<std::int64_t>(std::numeric_limits<std::uint32_t>::max()))
        throw std::invalid_argument(std::string(key) + " out of range: " + std::to_string(v));
    return static_cast<std::uint32_t>(v);
}

std::size_t checkedSizeFromI64(std::int64_t v, const char *key)
{
    if (v < 0)
        throw std::invalid_argument(std::string(key) + " must be non-negative: " +
                                    std::to_string(v));
    return static_cast<std::size_t>(v);
}

const toml::table &requireTable(const toml::table &root, const char *name)
{
    const auto *t = root[name].as_table();
    if (!t)
        throw std::runtime_error(std::string("Missing required [") + name + "] section");
    return *t;
}

// -----------------------------------------------------------------------------
// Main Parsing Logic
// -----------------------------------------------------------------------------

void applyEngineToml(GlobalConfig &cfg, const toml::table &root)
{
    // [Strict] [engine] 섹션 필수
    const toml::table &engine = requireTable(root, "engine");

    if (auto s = engine["log_level"].value<std::string>())
        cfg.engine.logLevel = parseLogLevel(*s);
    if (auto s = engine["log_file_path"].value<std::string>())
        cfg.engine.logFilePath = *s;

    if (auto v = engine["tick_resolution_ms"].value<std::int64_t>())
        cfg.engine.tickResolutionMs = checkedU32FromI64(*v, "tick_resolution_ms");
    if (auto v = engine["timer_slots"].value<std::int64_t>())
        cfg.engine.timerSlots = checkedSizeFromI64(*v, "timer_slots");
}

void applyDiscoveryToml(GlobalConfig &cfg, const toml::table &root)
{
    const auto *d = root["discovery"].as_table();
    if (!d)
        return;

    if (auto v = (*d)["max_peers"].value<std::int64_t>())
        cfg.engine.discovery.maxPeers = checkedSizeFromI64(*v, "max_peers");
}

void applyCommissioningToml(GlobalConfig &cfg, const toml::table &root)
{
    const auto *c = root["commissioning"].as_table();
    if (!c)
        return;

    auto &out = cfg.engine.commissioning;
    if (auto v = (*c)["setup_passcode"].value<std::int64_t>())
        out.setupPasscode = checkedU32FromI64(*v, "setup_passcode");
    if (auto v = (*c)["discriminator"].value<std::int64_t>())
        out.discriminator = checkedU16FromI64(*v, "discriminator");
    if (auto v = (*c)["vendor_id"].value<std::int64_t>())
        out.vendorId = checkedU16FromI64(*v, "vendor_id");
    if (auto v = (*c)["product_id"].value<std::int64_t>())
        out.productId = checkedU16FromI64(*v, "product_id");
    if (auto v = (*c)["window_timeout_s"].value<std::int64_t>())
        out.windowTimeoutS = checkedU32FromI64(*v, "window_timeout_s");
}

void applyInteractionToml(GlobalConfig &cfg, const toml::table &root)
{
    const auto *i = root["interaction"].as_table();
    if (!i)
        return;

    auto &out = cfg.engine.interaction;
    if (auto v = (*i)["command_timeout_ms"].value<std::int64_t>())
        out.commandTimeoutMs = checkedU32FromI64(*v, "command_timeout_ms");
    if (auto v = (*i)["subscribe_timeout_ms"].value<std::int64_t>())
        out.subscribeTimeoutMs = checkedU32FromI64(*v, "subscribe_timeout_ms");
    if (auto v = (*i)["send_retries"].value<std::int64_t>())
        out.sendRetries = checkedU32FromI64(*v, "send_retries");
    if (auto v = (*i)["target_endpoint"].value<std::int64_t>())
        out.targetEndpoint = checkedU16FromI64(*v, "target_endpoint");
    if (auto v = (*i)["liveness_margin_ms"].value<std::int64_t>())
        out.livenessMarginMs = checkedU32FromI64(*v, "liveness_margin_ms");
    if (auto v = (*i)["max_primed_reports"].value<std::int64_t>())
        out.maxPrimedReports = checkedSizeFromI64(*v, "max_primed_reports");
}

void applyAppToml(GlobalConfig &cfg, const toml::table &root)
{
    const auto *app = root["app"].as_table();
    if (!app)
        return;

    const auto *sim = (*app)["simulator"].as_table();
    if (!sim)
        return;

    if (auto s = (*sim)["device_name"].value<std::string>())
        cfg.sim.deviceName = *s;
    if (auto v = (*sim)["vendor_id"].value<std::int64_t>())
        cfg.sim.vendorId = checkedU16FromI64(*v, "simulator.vendor_id");
    if (auto v = (*sim)["product_id"].value<std::int64_t>())
        cfg.sim.productId = checkedU16FromI64(*v, "simulator.product_id");
    if (auto v = (*sim)["advertise_delay_ms"].value<std::int64_t>())
        cfg.sim.advertiseDelayMs = checkedU32FromI64(*v, "advertise_delay_ms");
    if (auto v = (*sim)["commissioning_delay_ms"].value<std::int64_t>())
        cfg.sim.commissioningDelayMs = checkedU32FromI64(*v, "commissioning_delay_ms");
    if (auto v = (*sim)["response_delay_ms"].value<std::int64_t>())
        cfg.sim.responseDelayMs = checkedU32FromI64(*v, "response_delay_ms");
    if (auto v = (*sim)["peer_count"].value<std::int64_t>())
        cfg.sim.peerCount = checkedU32FromI64(*v, "peer_count");
}

void validateFailFast(const GlobalConfig &cfg)
{
    if (cfg.sim.peerCount == 0)
        throw std::runtime_error("Config Error: [app.simulator] peer_count must be >= 1");
    if (cfg.sim.deviceName.empty())
        throw std::runtime_error("Config Error: [app.simulator] device_name must not be empty");

    validateEngineConfig(cfg.engine);
}

GlobalConfig applyAll(const toml::table &root)
{
    GlobalConfig cfg{};
    applyEngineToml(cfg, root);
    applyDiscoveryToml(cfg, root);
    applyCommissioningToml(cfg, root);
    applyInteractionToml(cfg, root);
    applyAppToml(cfg, root);
    validateFailFast(cfg);
    return cfg;
}

} // namespace

namespace castlink::core
{

GlobalConfig ConfigLoader::load(int argc, char **argv)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string_view a = argv[i] ? std::string_view(argv[i]) : std::string_view{};
        if (a == "--help" || a == "-h")
        {
            printUsage((argc > 0) ? argv[0] : nullptr);
            std::exit(0);
        }
    }

    auto configOpt = scanCliForConfigPath(argc, argv);
    if (!configOpt.has_value())
    {
        printUsage((argc > 0) ? argv[0] : nullptr);
        throw std::runtime_error("Missing required argument: --config <path.toml>");
    }

    return loadFile(*configOpt);
}

GlobalConfig ConfigLoader::loadFile(const std::string &path)
{
    if (!std::filesystem::exists(path))
        throw std::runtime_error("Config file not found: " + path);

    toml::table root;
    try
    {
        root = toml::parse_file(path);
    }
    catch (const toml::parse_error &e)
    {
        throw std::runtime_error("TOML Parse Error: " + std::string(e.description()));
    }

    GlobalConfig cfg = applyAll(root);
    CASTLINK_LOG_INFO("ConfigLoader", "Loaded", "path='{}'", path);
    return cfg;
}

GlobalConfig ConfigLoader::loadString(std::string_view tomlText)
{
    toml::table root;
    try
    {
        root = toml::parse(tomlText);
    }
    catch (const toml::parse_error &e)
    {
        throw std::runtime_error("TOML Parse Error: " + std::string(e.description()));
    }
    return applyAll(root);
}

} // namespace castlink::core
