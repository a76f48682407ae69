#pragma once
// ═══════════════════════════════════════════════════════════════════
//  peerlink/service.h — HTTP front end of the share pipeline
// ═══════════════════════════════════════════════════════════════════
//
//    POST /upload            multipart body → invite code (JSON)
//    GET  /download/:code    invite code → streamed artifact
//    GET  /health            broker and listener counters
//
//  The service owns the broker, the ingestor and one thread per
//  running TransferListener. Destroying it drops open connections,
//  waits for requests already inside a handler, cancels listeners
//  that are still waiting for their peer and joins all of them.
//
// ═══════════════════════════════════════════════════════════════════

#include "bridge.h"
#include "broker.h"
#include "config.h"
#include "http.h"
#include "ingest.h"
#include "transfer.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <vector>

namespace peerlink {

class ShareService {
public:
    // `randomCode` replaces the broker's random source when set
    explicit ShareService(config::Config config,
                          std::function<std::uint32_t()> randomCode = nullptr);
    ~ShareService();

    ShareService(const ShareService&) = delete;
    ShareService& operator=(const ShareService&) = delete;

    http::Server& server() { return server_; }
    CodeBroker& broker() { return broker_; }
    const config::Config& config() const { return config_; }

    // Binds config().host:config().port and serves until stop()
    void listen(std::function<void()> callback = nullptr);

    // Closes the HTTP server and its open connections, refuses further
    // uploads and cancels idle listeners; idempotent
    void stop();

    std::optional<ListenerState> listenerState(std::uint16_t code) const;
    std::size_t activeListeners() const;

private:
    void handleUpload(http::Request& req, http::Response& res);
    void handleDownload(http::Request& req, http::Response& res);
    void handleHealth(http::Request& req, http::Response& res);

    void launchListener(std::uint16_t code);
    void reapFinished();

    config::Config   config_;
    CodeBroker       broker_;
    ingest::ArtifactIngestor ingestor_;
    RetrievalBridge  bridge_;
    http::Server     server_;

    struct ListenerEntry {
        std::uint64_t threadId;
        ListenerState state;
    };

    mutable std::mutex listenersMutex_;
    std::unordered_map<std::uint16_t, ListenerEntry> listeners_;
    std::unordered_map<std::uint64_t, std::jthread>  threads_;
    std::vector<std::uint64_t> finished_;
    std::uint64_t nextThreadId_ = 0;
    std::atomic<bool> stopped_{false};
};

} // namespace peerlink
