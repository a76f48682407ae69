// ═══════════════════════════════════════════════════════════════════
//  src/service.cpp — ShareService routes and listener threads
// ═══════════════════════════════════════════════════════════════════

#include "peerlink/service.h"
#include "peerlink/bundle.h"
#include "peerlink/console.h"
#include "peerlink/errors.h"
#include "peerlink/middleware.h"
#include "peerlink/multipart.h"

#include <cctype>

namespace peerlink {

namespace {

BrokerOptions makeBrokerOptions(const config::Config& config,
                                std::function<std::uint32_t()> randomCode) {
    config.validate();
    auto options = config.brokerOptions();
    options.random = std::move(randomCode);
    return options;
}

nlohmann::json errorBody(const std::string& error, const Error& e) {
    return nlohmann::json{
        {"error", error},
        {"kind", to_string(e.kind())},
        {"message", e.what()},
    };
}

// Digits only, at most five of them
std::optional<std::uint32_t> parseCode(const std::string& raw) {
    if (raw.empty() || raw.size() > 5) return std::nullopt;
    for (char c : raw) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    }
    return static_cast<std::uint32_t>(std::stoul(raw));
}

std::string quotedFilename(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        out += (c == '"' || c == '\\') ? '_' : c;
    }
    return out;
}

} // namespace

ShareService::ShareService(config::Config config, std::function<std::uint32_t()> randomCode)
    : config_(std::move(config))
    , broker_(makeBrokerOptions(config_, std::move(randomCode)))
    , ingestor_(config_.uploadDir)
    , bridge_(broker_, config_.bridgeOptions())
    , server_(config_.serverOptions())
{
    middleware::CorsOptions cors;
    cors.origin = config_.corsOrigin;

    server_.use(middleware::requestLogger());
    server_.use(middleware::cors(cors));

    server_.post("/upload", [this](http::Request& req, http::Response& res) {
        handleUpload(req, res);
    });
    server_.get("/download/:code", [this](http::Request& req, http::Response& res) {
        handleDownload(req, res);
    });
    server_.get("/health", [this](http::Request& req, http::Response& res) {
        handleHealth(req, res);
    });
}

ShareService::~ShareService() {
    stop();

    // Handlers reference this object; none may still be running below
    server_.waitForSessions();

    std::unordered_map<std::uint64_t, std::jthread> threads;
    {
        std::lock_guard<std::mutex> lock(listenersMutex_);
        threads.swap(threads_);
        finished_.clear();
    }
    // jthread requests stop and joins
    threads.clear();
}

void ShareService::listen(std::function<void()> callback) {
    server_.listen(config_.host, config_.port, std::move(callback));
}

void ShareService::stop() {
    if (stopped_.exchange(true)) return;
    server_.close();

    std::lock_guard<std::mutex> lock(listenersMutex_);
    for (auto& [id, thread] : threads_) thread.request_stop();

    auto pending = broker_.pendingCount();
    if (pending > 0) {
        console::warn(pending, "offer(s) were still pending at shutdown");
    }
}

std::optional<ListenerState> ShareService::listenerState(std::uint16_t code) const {
    std::lock_guard<std::mutex> lock(listenersMutex_);
    auto it = listeners_.find(code);
    if (it == listeners_.end()) return std::nullopt;
    return it->second.state;
}

std::size_t ShareService::activeListeners() const {
    std::lock_guard<std::mutex> lock(listenersMutex_);
    return listeners_.size();
}

// ═══════════════════════════════════════════
//  Listener threads
// ═══════════════════════════════════════════

// Caller holds listenersMutex_. A finished thread records its id as the
// last thing it does under the lock, so joining here never waits on it.
void ShareService::reapFinished() {
    for (auto id : finished_) {
        auto it = threads_.find(id);
        if (it == threads_.end()) continue;
        it->second.join();
        threads_.erase(it);
    }
    finished_.clear();
}

void ShareService::launchListener(std::uint16_t code) {
    std::lock_guard<std::mutex> lock(listenersMutex_);
    reapFinished();

    auto id = nextThreadId_++;
    listeners_[code] = ListenerEntry{id, ListenerState::Registered};

    threads_.emplace(id, std::jthread([this, code, id](std::stop_token stop) {
        auto options = config_.listenerOptions();
        options.onStateChange = [this, id](std::uint16_t c, ListenerState state) {
            std::lock_guard<std::mutex> guard(listenersMutex_);
            auto it = listeners_.find(c);
            if (it != listeners_.end() && it->second.threadId == id) it->second.state = state;
        };

        TransferListener listener(broker_, options);
        try {
            listener.serve(code, stop);
        } catch (const Error& e) {
            console::warn("Listener for code", code, "ended with", to_string(e.kind()));
        } catch (const std::exception& e) {
            console::error("Listener for code", code, "crashed:", e.what());
        }

        std::lock_guard<std::mutex> guard(listenersMutex_);
        auto it = listeners_.find(code);
        if (it != listeners_.end() && it->second.threadId == id) listeners_.erase(it);
        finished_.push_back(id);
    }));

    // stop() already swept threads_ if it ran before we took the lock
    if (stopped_.load()) threads_.at(id).request_stop();
}

// ═══════════════════════════════════════════
//  POST /upload
// ═══════════════════════════════════════════
void ShareService::handleUpload(http::Request& req, http::Response& res) {
    if (stopped_.load()) {
        res.status(503).json(nlohmann::json{
            {"error", "Service Unavailable"},
            {"message", "server is shutting down"}
        });
        return;
    }

    auto contentType = req.header("content-type");
    if (!multipart::isMultipartFormData(contentType)) {
        res.status(400).json(nlohmann::json{
            {"error", "Bad Request"},
            {"message", "Content-Type must be multipart/form-data"}
        });
        return;
    }

    auto boundary = multipart::extractBoundary(contentType);
    if (boundary.empty()) {
        res.status(400).json(nlohmann::json{
            {"error", "Bad Request"},
            {"message", "multipart boundary missing from Content-Type"}
        });
        return;
    }

    multipart::DecoderOptions decoderOptions;
    decoderOptions.maxHeaderBytes = config_.maxHeaderBytes;
    multipart::Decoder decoder(
        [&req](char* dst, std::size_t max) { return req.read(dst, max); },
        boundary, decoderOptions);

    std::vector<ingest::Artifact> files;
    try {
        files = ingestor_.ingest(decoder);
    } catch (const DecodeError& e) {
        auto body = errorBody("Bad Request", e);
        if (e.partIndex()) body["partIndex"] = *e.partIndex();
        res.status(400).json(body);
        return;
    } catch (const http::PayloadTooLarge& e) {
        res.status(413).json(nlohmann::json{
            {"error", "Payload Too Large"},
            {"message", e.what()}
        });
        return;
    }

    if (files.empty()) {
        res.status(400).json(nlohmann::json{
            {"error", "Bad Request"},
            {"message", "no file part in upload"}
        });
        return;
    }

    // ── Decide what to offer: the file itself or a zip of all of them ──
    const bool isZip = files.size() > 1;
    ingest::Artifact served;
    if (isZip) {
        try {
            served = bundle::createBundle(files, ingestor_.uploadDir());
        } catch (const std::exception&) {
            ingest::ArtifactIngestor::discard(files);
            throw;
        }
        ingest::ArtifactIngestor::discard(files);
    } else {
        served = files.front();
    }

    std::uint16_t code = 0;
    try {
        code = broker_.registerArtifact(served.path.string());
    } catch (const PortExhausted& e) {
        ingest::ArtifactIngestor::discard({served});
        res.status(503).json(errorBody("Service Unavailable", e));
        return;
    }

    try {
        launchListener(code);
    } catch (const std::exception&) {
        broker_.revoke(code);
        ingest::ArtifactIngestor::discard({served});
        throw;
    }

    console::info("Upload of", files.size(), "file(s) offered as code", code);
    res.json(nlohmann::json{
        {"inviteCode", code},
        {"fileCount", files.size()},
        {"servedName", served.path.filename().string()},
        {"isZip", isZip},
        {"size", served.size},
        {"sha256", served.sha256},
    });
}

// ═══════════════════════════════════════════
//  GET /download/:code
// ═══════════════════════════════════════════
void ShareService::handleDownload(http::Request& req, http::Response& res) {
    auto code = parseCode(req.params["code"]);
    if (!code) {
        res.status(400).json(nlohmann::json{
            {"error", "Bad Request"},
            {"message", "invite code must be numeric"}
        });
        return;
    }

    std::optional<RetrievalStream> stream;
    try {
        stream.emplace(bridge_.open(*code));
    } catch (const NotRegistered& e) {
        res.status(404).json(errorBody("Not Found", e));
        return;
    } catch (const ConnectTimeout& e) {
        res.status(504).json(errorBody("Gateway Timeout", e));
        return;
    }

    res.set("Content-Disposition", "attachment; filename=\"" + quotedFilename(stream->filename()) + "\"");
    res.type("application/octet-stream");
    res.beginStream();

    std::vector<char> buffer(config_.transferBufferBytes);
    try {
        while (auto n = stream->read(buffer.data(), buffer.size())) {
            res.write(buffer.data(), n);
        }
    } catch (const TransferIOError& e) {
        console::error("Download of code", *code, "broke:", e.what());
        res.abortStream();
        return;
    }
    res.endStream();
}

// ═══════════════════════════════════════════
//  GET /health
// ═══════════════════════════════════════════
void ShareService::handleHealth(http::Request&, http::Response& res) {
    res.json(nlohmann::json{
        {"status", "ok"},
        {"pendingOffers", broker_.pendingCount()},
        {"activeListeners", activeListeners()},
    });
}

} // namespace peerlink
