// ═══════════════════════════════════════════════════════════════════
//  peerlink_server.cpp — The share service
// ═══════════════════════════════════════════════════════════════════
//
//  peerlink_server [config.json]
//
// ═══════════════════════════════════════════════════════════════════

#include <peerlink/peerlink.h>

#include <exception>
#include <optional>
#include <string>

using namespace peerlink;

int main(int argc, char** argv) {
    std::optional<std::string> configPath;
    if (argc > 1) configPath = argv[1];

    config::Config cfg;
    try {
        cfg = config::load(configPath);
    } catch (const std::exception& e) {
        console::error("Invalid configuration:", e.what());
        return 2;
    }
    console::setLevel(console::parseLevel(cfg.logLevel));

    try {
        ShareService service(cfg);
        lifecycle::enableGracefulShutdown(service);

        service.listen([&cfg] {
            console::log("PeerLink running on http://" + cfg.host + ":" + std::to_string(cfg.port));
            console::log("  POST /upload          — offer files, get an invite code");
            console::log("  GET  /download/:code  — fetch an offer");
            console::log("  GET  /health          — status");
            console::log("  uploads stored in", cfg.uploadDir);
        });
    } catch (const std::exception& e) {
        console::error("Server failed:", e.what());
        return 1;
    }
    return 0;
}
