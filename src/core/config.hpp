#pragma once

#include <string>
#include <fstream>
#include <cstdint>
#include <cstdlib>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "utils.hpp"

namespace income_api {

using json = nlohmann::json;

struct ServiceConfig {
    uint16_t port{5000};
    std::string bind_address{"0.0.0.0"};
    size_t threads{0};  // 0 = let Drogon decide
};

struct UpstreamConfig {
    std::string base_url{"https://financialmodelingprep.com"};
    std::string api_key{};

    // Fixed for this service; not overridable from settings or per request.
    static constexpr const char* kSymbol = "AAPL";
    static constexpr const char* kPeriod = "annual";
};

struct LoggingConfig {
    std::string level{"info"};
};

struct Config {
    ServiceConfig services;
    UpstreamConfig upstream;
    LoggingConfig logging;
};

/**
 * Load settings from a JSON file. Keys absent from the file keep their
 * defaults; a missing file leaves the whole config at defaults.
 * Throws nlohmann::json::parse_error if the file exists but is not JSON.
 */
inline void load_config(Config& cfg, const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        spdlog::warn("Config file {} not found, using defaults", path);
        return;
    }
    json j = json::parse(f, nullptr, true, true);
    if (j.contains("services")) {
        auto& svc = j["services"];
        cfg.services.port = svc.value("port", cfg.services.port);
        cfg.services.bind_address = svc.value("bind_address", cfg.services.bind_address);
        cfg.services.threads = svc.value("threads", cfg.services.threads);
    }
    if (j.contains("upstream")) {
        auto& up = j["upstream"];
        cfg.upstream.base_url = up.value("base_url", cfg.upstream.base_url);
        cfg.upstream.api_key = up.value("api_key", cfg.upstream.api_key);
    }
    if (j.contains("logging")) {
        auto& l = j["logging"];
        cfg.logging.level = l.value("level", cfg.logging.level);
    }
}

/**
 * Seed the process environment from a KEY=VALUE file (".env").
 * Variables that are already set are left untouched. Blank lines, '#'
 * comments and an optional "export " prefix are accepted; matching single
 * or double quotes around the value are stripped.
 * Returns the number of variables set.
 */
inline int load_dotenv(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        spdlog::debug("No env file at {}", path);
        return 0;
    }
    int applied = 0;
    std::string line;
    while (std::getline(f, line)) {
        line = utils::trim_copy(line);
        if (line.empty() || line.front() == '#') continue;
        if (line.rfind("export ", 0) == 0) {
            line = utils::trim_copy(line.substr(7));
        }
        auto eq = line.find('=');
        if (eq == std::string::npos) {
            spdlog::warn("Ignoring malformed line in {}: {}", path, line);
            continue;
        }
        std::string key = utils::trim_copy(line.substr(0, eq));
        std::string val = utils::trim_copy(line.substr(eq + 1));
        if (key.empty()) continue;
        if (val.size() >= 2 &&
            ((val.front() == '"' && val.back() == '"') ||
             (val.front() == '\'' && val.back() == '\''))) {
            val = val.substr(1, val.size() - 2);
        }
        if (std::getenv(key.c_str()) != nullptr) continue;
        if (::setenv(key.c_str(), val.c_str(), 0) == 0) {
            ++applied;
        }
    }
    return applied;
}

/**
 * Resolve logging.level. spdlog maps unknown names to "off"; here an
 * unknown name warns and falls back to info instead.
 */
inline spdlog::level::level_enum log_level_from_string(const std::string& name) {
    auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
        spdlog::warn("Unknown logging.level '{}', using info", name);
        return spdlog::level::info;
    }
    return level;
}

/**
 * Overlay process environment onto the config. API_KEY wins over the file.
 */
inline void apply_env(Config& cfg) {
    if (const char* key = std::getenv("API_KEY"); key != nullptr && *key != '\0') {
        cfg.upstream.api_key = key;
    }
}

} // namespace income_api
