#pragma once
// ═══════════════════════════════════════════════════════════════════
//  peerlink/config.h — Server configuration
// ═══════════════════════════════════════════════════════════════════
//
//  Sources, later ones win:
//    1. built-in defaults
//    2. an optional JSON file     { "port": 8080, "uploadDir": "uploads", ... }
//    3. environment variables     PEERLINK_HOST, PEERLINK_PORT,
//                                 UPLOAD_DIR, PEERLINK_LOG_LEVEL
//
//  Every loader ends in validate(), which throws std::invalid_argument.
//
// ═══════════════════════════════════════════════════════════════════

#include "broker.h"
#include "bridge.h"
#include "http.h"
#include "transfer.h"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace peerlink::config {

struct Config {
    // ── HTTP front end ──
    std::string   host = "0.0.0.0";
    int           port = 8080;
    std::string   uploadDir = "uploads";
    std::uint32_t maxHeaderBytes = 16 * 1024;
    std::uint64_t maxUploadBytes = 0;             // 0 = unlimited
    std::string   corsOrigin = "*";

    // ── Offers and transfers ──
    std::string   listenerHost = "127.0.0.1";
    int           connectTimeoutMs = 5000;
    int           allocationAttempts = 20;
    std::uint16_t codeMin = 1024;
    std::uint16_t codeMax = 65535;
    std::size_t   transferBufferBytes = 16 * 1024;

    std::string   logLevel = "info";

    void validate() const;

    BrokerOptions   brokerOptions() const;
    ListenerOptions listenerOptions() const;
    BridgeOptions   bridgeOptions() const;
    http::ServerOptions serverOptions() const;
};

void to_json(nlohmann::json& j, const Config& c);

// Overlays the keys present in `j`; unknown keys are logged and ignored
void applyJson(Config& config, const nlohmann::json& j);

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// Overlays the PEERLINK_* / UPLOAD_DIR variables; `env` defaults to getenv
void applyEnvironment(Config& config, const EnvLookup& env = {});

// Defaults, then `path` if given (must exist), then the environment
Config load(const std::optional<std::string>& path = std::nullopt, const EnvLookup& env = {});

} // namespace peerlink::config
