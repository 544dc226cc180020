#include <coinchase/core/ConfigLoader.hpp>

#include <coinchase/core/Logger.hpp>

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
using namespace coinchase;
using namespace coinchase::core;

void printUsage(const char *argv0)
{
    std::string exe = "coinchase_server";
    if (argv0 && *argv0)
    {
        exe = std::filesystem::path(argv0).filename().string();
    }
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

std::uint16_t checkedPort(std::int64_t v, const char *key)
{
    if (v < 0 || v > 65535)
        throw std::invalid_argument(std::string(key) + " out of range (0..65535): " +
                                    std::to_string(v));
    return static_cast<std::uint16_t>(v);
}

std::uint32_t checkedU32(std::int64_t v, const char *key)
{
    if (v < 0 || v > static_cast<std::int64_t>(std::numeric_limits<std::uint32_t>::max()))
        throw std::invalid_argument(std::string(key) + " out of range: " + std::to_string(v));
    return static_cast<std::uint32_t>(v);
}

std::int32_t checkedI32(std::int64_t v, const char *key)
{
    if (v < std::numeric_limits<std::int32_t>::min() ||
        v > std::numeric_limits<std::int32_t>::max())
        throw std::invalid_argument(std::string(key) + " out of range: " + std::to_string(v));
    return static_cast<std::int32_t>(v);
}

std::size_t checkedSize(std::int64_t v, const char *key)
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

void applyServerToml(ServerConfig &cfg, const toml::table &root)
{
    const toml::table &server = requireTable(root, "server");

    if (auto s = server["http_address"].value<std::string>())
        cfg.httpAddress = *s;
    if (auto v = server["http_port"].value<std::int64_t>())
        cfg.httpPort = checkedPort(*v, "http_port");
    if (auto s = server["slot_address"].value<std::string>())
        cfg.slotAddress = *s;
    if (auto v = server["slot_base_port"].value<std::int64_t>())
        cfg.slotBasePort = checkedPort(*v, "slot_base_port");
    if (auto v = server["capacity"].value<std::int64_t>())
        cfg.capacity = checkedU32(*v, "capacity");
    if (auto s = server["log_level"].value<std::string>())
        cfg.logLevel = parseLogLevel(*s);
    if (auto s = server["log_file_path"].value<std::string>())
        cfg.logFilePath = *s;
}

void applySessionToml(ServerConfig &cfg, const toml::table &root)
{
    const auto *session = root["session"].as_table();
    if (!session)
        return;

    auto &s = cfg.session;
    if (auto v = (*session)["read_idle_timeout_ms"].value<std::int64_t>())
        s.readIdleTimeoutMs = checkedU32(*v, "read_idle_timeout_ms");
    if (auto v = (*session)["dial_timeout_ms"].value<std::int64_t>())
        s.dialTimeoutMs = checkedU32(*v, "dial_timeout_ms");
    if (auto v = (*session)["chunk_size"].value<std::int64_t>())
        s.chunkSize = checkedSize(*v, "chunk_size");
    if (auto v = (*session)["fault_tolerance"].value<std::int64_t>())
        s.faultTolerance = checkedU32(*v, "fault_tolerance");
    if (auto v = (*session)["poll_slice_ms"].value<std::int64_t>())
        s.pollSliceMs = checkedU32(*v, "poll_slice_ms");
    if (auto v = (*session)["broadcast_interval_ms"].value<std::int64_t>())
        s.broadcastIntervalMs = checkedU32(*v, "broadcast_interval_ms");
}

void applyLivenessToml(ServerConfig &cfg, const toml::table &root)
{
    const auto *liveness = root["liveness"].as_table();
    if (!liveness)
        return;

    if (auto v = (*liveness)["interval_ms"].value<std::int64_t>())
        cfg.liveness.intervalMs = checkedU32(*v, "interval_ms");
    if (auto v = (*liveness)["probe_timeout_ms"].value<std::int64_t>())
        cfg.liveness.probeTimeoutMs = checkedU32(*v, "probe_timeout_ms");
}

void applyGameToml(ServerConfig &cfg, const toml::table &root)
{
    const auto *game = root["game"].as_table();
    if (!game)
        return;

    auto &g = cfg.game;
    if (auto v = (*game)["map_size"].value<std::int64_t>())
        g.mapSize = checkedI32(*v, "map_size");
    if (auto v = (*game)["coin_count"].value<std::int64_t>())
        g.coinCount = checkedU32(*v, "coin_count");
    if (auto v = (*game)["item_count"].value<std::int64_t>())
        g.itemCount = checkedU32(*v, "item_count");
    if (auto v = (*game)["base_visibility"].value<std::int64_t>())
        g.baseVisibility = checkedI32(*v, "base_visibility");
    if (auto v = (*game)["seed"].value<std::int64_t>())
    {
        if (*v < 0)
            throw std::invalid_argument("seed must be non-negative: " + std::to_string(*v));
        g.seed = static_cast<std::uint64_t>(*v);
    }
}

} // namespace

namespace coinchase::core
{

ServerConfig ConfigLoader::loadFile(const std::string &path)
{
    if (!std::filesystem::exists(path))
    {
        throw std::runtime_error("Config file not found: " + path);
    }

    toml::table root;
    try
    {
        root = toml::parse_file(path);
    }
    catch (const toml::parse_error &e)
    {
        throw std::runtime_error("TOML Parse Error: " + std::string(e.description()));
    }

    ServerConfig cfg{};
    applyServerToml(cfg, root);
    applySessionToml(cfg, root);
    applyLivenessToml(cfg, root);
    applyGameToml(cfg, root);

    validateServerConfig(cfg);
    return cfg;
}

ServerConfig ConfigLoader::load(int argc, char **argv)
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

    ServerConfig cfg = loadFile(*configOpt);
    std::cout << "[ConfigLoader] Successfully loaded: " << *configOpt << "\n";
    return cfg;
}

} // namespace coinchase::core
