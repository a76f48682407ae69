#pragma once
// ═══════════════════════════════════════════════════════════════════
//  peerlink/http.h — Express-style HTTP Server, Request, and Response
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    http::Server app;
//    app.get("/health", [](auto& req, auto& res) {
//        res.json({{"status", "ok"}});
//    });
//    app.listen("0.0.0.0", 8080);
//
//  Each connection is served on its own thread with blocking socket
//  I/O, so a handler may stream a large request body in with
//  req.read() and stream an unbounded response out with
//  res.beginStream() / res.write() / res.endStream().
//
// ═══════════════════════════════════════════════════════════════════

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace peerlink::http {

// ── Forward declarations ──
class Request;
class Response;
class Server;

// ── Type aliases ──
using HeaderMap          = std::unordered_map<std::string, std::string>;
using NextFunction       = std::function<void()>;
using MiddlewareFunction = std::function<void(Request&, Response&, NextFunction)>;
using RouteHandler       = std::function<void(Request&, Response&)>;

// ═══════════════════════════════════════════════════════════════════
//  class Request
//  Represents an incoming HTTP request. The body is pulled lazily
//  through read(); the transport installs a BodyReader, tests may
//  simply fill rawBody.
// ═══════════════════════════════════════════════════════════════════
class Request {
public:
    // Fills up to `max` bytes of dst, returns 0 at end of body, throws on I/O failure
    using BodyReader = std::function<std::size_t(char* dst, std::size_t max)>;

    // ── Core properties ──
    std::string method;
    std::string url;            // Full URL including query string
    std::string path;           // URL path without query string
    std::string rawBody;        // Body used when no BodyReader is attached
    std::string ip;             // Client IP address
    std::string protocol;       // "http"
    std::string hostname;       // Host header value

    // ── Parsed data ──
    HeaderMap headers;          // All headers (lowercase keys)
    std::unordered_map<std::string, std::string> params;    // Route parameters (:id -> params["id"])
    std::unordered_map<std::string, std::string> query;     // Query string parameters

    // ── Get a header value (case-insensitive) ──
    std::string header(const std::string& name) const {
        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
        auto it = headers.find(lower);
        return it != headers.end() ? it->second : "";
    }

    // ── Check Content-Type ──
    bool is(const std::string& type) const {
        auto ct = header("content-type");
        std::transform(ct.begin(), ct.end(), ct.begin(), ::tolower);
        return ct.find(type) != std::string::npos;
    }

    void setBodyReader(BodyReader reader) { reader_ = std::move(reader); }

    // ── Pull the next slice of the body ──
    std::size_t read(char* dst, std::size_t max) {
        if (reader_) return reader_(dst, max);
        auto n = std::min(max, rawBody.size() - rawOffset_);
        std::memcpy(dst, rawBody.data() + rawOffset_, n);
        rawOffset_ += n;
        return n;
    }

private:
    BodyReader reader_;
    std::size_t rawOffset_ = 0;
};

// ═══════════════════════════════════════════════════════════════════
//  class Response
//  Represents the HTTP response to send back.
//  Uses callbacks to decouple from the transport layer. A response is
//  either sent whole (send/json) or streamed in chunks; without
//  stream callbacks a streamed body is buffered and handed to the
//  SendCallback on endStream(), which keeps handlers testable.
// ═══════════════════════════════════════════════════════════════════
class Response {
public:
    using SendCallback = std::function<void(
        int statusCode,
        const HeaderMap& headers,
        const std::string& body
    )>;

    struct StreamCallbacks {
        std::function<void(int statusCode, const HeaderMap& headers)> begin;
        std::function<void(const char* data, std::size_t size)>     write;
        std::function<void()>                                        finish;
    };

    explicit Response(SendCallback cb)
        : sendCallback_(std::move(cb)) {}

    Response(SendCallback cb, StreamCallbacks stream)
        : sendCallback_(std::move(cb)), stream_(std::move(stream)) {}

    // Default constructor for testing
    Response() : sendCallback_(nullptr) {}

    // ── Set status code (chainable) ──
    Response& status(int code) {
        statusCode_ = code;
        return *this;
    }

    // ── Set a response header (chainable) ──
    Response& set(const std::string& key, const std::string& value) {
        headers_[key] = value;
        return *this;
    }

    // ── Set Content-Type (chainable) ──
    Response& type(const std::string& contentType) {
        return set("Content-Type", contentType);
    }

    // ── Send a string body ──
    void send(const std::string& body) {
        if (sent_) return;
        sent_ = true;
        if (headers_.find("Content-Type") == headers_.end()) {
            headers_["Content-Type"] = "text/plain; charset=utf-8";
        }
        body_ = body;
        if (sendCallback_) {
            sendCallback_(statusCode_, headers_, body_);
        }
    }

    // ── Send JSON ──
    //    Supports: res.json({{"key", "value"}, {"count", 5}})
    void json(const nlohmann::json& data) {
        set("Content-Type", "application/json; charset=utf-8");
        send(data.dump());
    }

    // ── End without body ──
    void end() {
        if (!sent_) {
            send("");
        }
    }

    // ═══════════════════════════════════════════
    //  Streaming (chunked transfer encoding)
    // ═══════════════════════════════════════════

    // ── Commit status and headers; body length stays open ──
    void beginStream() {
        if (sent_) return;
        sent_ = true;
        streaming_ = true;
        if (headers_.find("Content-Type") == headers_.end()) {
            headers_["Content-Type"] = "application/octet-stream";
        }
        if (stream_.begin) {
            stream_.begin(statusCode_, headers_);
        }
    }

    // ── Append a chunk; throws when the transport fails ──
    void write(const char* data, std::size_t size) {
        if (!streaming_ || finished_ || size == 0) return;
        if (stream_.write) {
            stream_.write(data, size);
        } else {
            body_.append(data, size);
        }
    }

    // ── Terminate the body normally ──
    void endStream() {
        if (!streaming_ || finished_) return;
        finished_ = true;
        if (stream_.finish) {
            stream_.finish();
        } else if (sendCallback_) {
            sendCallback_(statusCode_, headers_, body_);
        }
    }

    // ── Give up mid-body; the transport closes without a terminal chunk ──
    void abortStream() {
        if (!streaming_ || finished_) return;
        finished_ = true;
        aborted_ = true;
    }

    // ── Check if response was already sent ──
    bool headersSent() const { return sent_; }
    bool streaming() const { return streaming_; }
    bool aborted() const { return aborted_; }

    // ── Access the sent body (for testing) ──
    const std::string& getBody() const { return body_; }
    int getStatusCode() const { return statusCode_; }
    const HeaderMap& getHeaders() const { return headers_; }

private:
    int statusCode_ = 200;
    HeaderMap headers_;
    bool sent_ = false;
    bool streaming_ = false;
    bool finished_ = false;
    bool aborted_ = false;
    SendCallback sendCallback_;
    StreamCallbacks stream_;
    std::string body_;
};

// ── Thrown by Request::read once the body exceeds maxBodyBytes ──
class PayloadTooLarge : public std::runtime_error {
public:
    explicit PayloadTooLarge(std::uint64_t limit)
        : std::runtime_error("request body exceeds " + std::to_string(limit) + " bytes") {}
};

// ── Transport limits applied to every connection ──
struct ServerOptions {
    std::uint32_t maxHeaderBytes = 16 * 1024;
    std::uint64_t maxBodyBytes   = 0;           // 0 = unlimited
};

// ═══════════════════════════════════════════════════════════════════
//  class Server
//  Express-style HTTP server with routing and middleware.
//  Uses pimpl to hide Boost.Beast implementation details.
// ═══════════════════════════════════════════════════════════════════
class Server {
public:
    explicit Server(ServerOptions options = {});
    ~Server();
    Server(Server&&) noexcept;
    Server& operator=(Server&&) noexcept;

    // Non-copyable
    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // ── Middleware Registration ──
    Server& use(MiddlewareFunction middleware);

    // ── Route Registration ──
    Server& get(const std::string& path, RouteHandler handler) {
        addRoute("GET", path, std::move(handler));
        return *this;
    }

    Server& post(const std::string& path, RouteHandler handler) {
        addRoute("POST", path, std::move(handler));
        return *this;
    }

    Server& options(const std::string& path, RouteHandler handler) {
        addRoute("OPTIONS", path, std::move(handler));
        return *this;
    }

    Server& all(const std::string& path, RouteHandler handler) {
        addRoute("*", path, std::move(handler));
        return *this;
    }

    // ── Start Listening (blocks until close()) ──
    void listen(const std::string& host, int port, std::function<void()> callback = nullptr);

    // ── Stop accepting connections and shut down open ones ──
    //    A closed server does not serve again.
    void close();

    // ── Block until every connection thread has left its handler ──
    //    Must not be called from a handler.
    void waitForSessions();

    std::size_t activeSessions() const;

    // ── Process a request (used internally and for testing) ──
    void handleRequest(Request& req, Response& res);

private:
    friend class HttpSession;
    friend class HttpListener;

    struct Impl;
    std::shared_ptr<Impl> impl_;

    void addRoute(const std::string& method, const std::string& pattern, RouteHandler handler);
};

} // namespace peerlink::http
