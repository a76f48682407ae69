// ═══════════════════════════════════════════════════════════════════
//  src/config.cpp — Config loading and validation
// ═══════════════════════════════════════════════════════════════════

#include "peerlink/config.h"
#include "peerlink/console.h"

#include <cstdlib>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <unordered_set>

namespace peerlink::config {

namespace {

int parseInt(const std::string& name, const std::string& value) {
    std::size_t used = 0;
    int result = 0;
    try {
        result = std::stoi(value, &used);
    } catch (const std::logic_error&) {
        throw std::invalid_argument(name + " is not an integer: '" + value + "'");
    }
    if (used != value.size()) {
        throw std::invalid_argument(name + " is not an integer: '" + value + "'");
    }
    return result;
}

std::optional<std::string> processEnv(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (!value) return std::nullopt;
    return std::string(value);
}

template <typename T>
void readKey(const nlohmann::json& j, const char* key, T& target) {
    auto it = j.find(key);
    if (it == j.end()) return;
    try {
        target = it->template get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("config key '") + key + "': " + e.what());
    }
}

} // namespace

void Config::validate() const {
    if (host.empty()) throw std::invalid_argument("host must not be empty");
    if (port < 0 || port > 65535) throw std::invalid_argument("port must be within 0-65535");
    if (uploadDir.empty()) throw std::invalid_argument("uploadDir must not be empty");
    if (listenerHost.empty()) throw std::invalid_argument("listenerHost must not be empty");
    if (connectTimeoutMs <= 0) throw std::invalid_argument("connectTimeoutMs must be positive");
    if (allocationAttempts < 1) throw std::invalid_argument("allocationAttempts must be at least 1");
    if (codeMin < 1) throw std::invalid_argument("codeMin must be at least 1");
    if (codeMin > codeMax) throw std::invalid_argument("codeMin must not exceed codeMax");
    if (maxHeaderBytes < 1024) throw std::invalid_argument("maxHeaderBytes must be at least 1024");
    if (transferBufferBytes == 0) throw std::invalid_argument("transferBufferBytes must be positive");
    console::parseLevel(logLevel);
}

BrokerOptions Config::brokerOptions() const {
    BrokerOptions options;
    options.codeMin  = codeMin;
    options.codeMax  = codeMax;
    options.attempts = allocationAttempts;
    return options;
}

ListenerOptions Config::listenerOptions() const {
    ListenerOptions options;
    options.host        = listenerHost;
    options.bufferBytes = transferBufferBytes;
    return options;
}

BridgeOptions Config::bridgeOptions() const {
    BridgeOptions options;
    options.host           = listenerHost;
    options.connectTimeout = std::chrono::milliseconds(connectTimeoutMs);
    return options;
}

http::ServerOptions Config::serverOptions() const {
    http::ServerOptions options;
    options.maxHeaderBytes = maxHeaderBytes;
    options.maxBodyBytes   = maxUploadBytes;
    return options;
}

void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json{
        {"host", c.host},
        {"port", c.port},
        {"uploadDir", c.uploadDir},
        {"maxHeaderBytes", c.maxHeaderBytes},
        {"maxUploadBytes", c.maxUploadBytes},
        {"corsOrigin", c.corsOrigin},
        {"listenerHost", c.listenerHost},
        {"connectTimeoutMs", c.connectTimeoutMs},
        {"allocationAttempts", c.allocationAttempts},
        {"codeMin", c.codeMin},
        {"codeMax", c.codeMax},
        {"transferBufferBytes", c.transferBufferBytes},
        {"logLevel", c.logLevel},
    };
}

void applyJson(Config& config, const nlohmann::json& j) {
    if (!j.is_object()) throw std::invalid_argument("config must be a JSON object");

    static const std::unordered_set<std::string> known = {
        "host", "port", "uploadDir", "maxHeaderBytes", "maxUploadBytes", "corsOrigin",
        "listenerHost", "connectTimeoutMs", "allocationAttempts", "codeMin", "codeMax",
        "transferBufferBytes", "logLevel",
    };
    for (auto& [key, value] : j.items()) {
        if (!known.count(key)) console::warn("Ignoring unknown config key", key);
    }

    readKey(j, "host", config.host);
    readKey(j, "port", config.port);
    readKey(j, "uploadDir", config.uploadDir);
    readKey(j, "maxHeaderBytes", config.maxHeaderBytes);
    readKey(j, "maxUploadBytes", config.maxUploadBytes);
    readKey(j, "corsOrigin", config.corsOrigin);
    readKey(j, "listenerHost", config.listenerHost);
    readKey(j, "connectTimeoutMs", config.connectTimeoutMs);
    readKey(j, "allocationAttempts", config.allocationAttempts);
    readKey(j, "transferBufferBytes", config.transferBufferBytes);
    readKey(j, "logLevel", config.logLevel);

    // Range codes go through int so 70000 is rejected instead of wrapping
    int codeMin = config.codeMin;
    int codeMax = config.codeMax;
    readKey(j, "codeMin", codeMin);
    readKey(j, "codeMax", codeMax);
    if (codeMin < 0 || codeMin > 65535 || codeMax < 0 || codeMax > 65535) {
        throw std::invalid_argument("codeMin and codeMax must be within 0-65535");
    }
    config.codeMin = static_cast<std::uint16_t>(codeMin);
    config.codeMax = static_cast<std::uint16_t>(codeMax);
}

void applyEnvironment(Config& config, const EnvLookup& env) {
    const EnvLookup& lookup = env ? env : EnvLookup(processEnv);

    if (auto v = lookup("PEERLINK_HOST"))      config.host = *v;
    if (auto v = lookup("PEERLINK_PORT"))      config.port = parseInt("PEERLINK_PORT", *v);
    if (auto v = lookup("UPLOAD_DIR"))         config.uploadDir = *v;
    if (auto v = lookup("PEERLINK_LOG_LEVEL")) config.logLevel = *v;
}

Config load(const std::optional<std::string>& path, const EnvLookup& env) {
    Config config;

    if (path) {
        std::ifstream in(*path);
        if (!in) throw std::invalid_argument("cannot open config file " + *path);
        nlohmann::json j;
        try {
            in >> j;
        } catch (const nlohmann::json::parse_error& e) {
            throw std::invalid_argument("invalid JSON in " + *path + ": " + e.what());
        }
        applyJson(config, j);
    }

    applyEnvironment(config, env);
    config.validate();
    return config;
}

} // namespace peerlink::config
