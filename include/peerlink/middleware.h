#pragma once
// ═══════════════════════════════════════════════════════════════════
//  peerlink/middleware.h — Middleware used by the share service
// ═══════════════════════════════════════════════════════════════════
//
//    • cors()             — Cross-Origin Resource Sharing + preflight
//    • requestLogger()    — One access line per request
//
// ═══════════════════════════════════════════════════════════════════

#include "http.h"
#include "console.h"

#include <chrono>
#include <string>

namespace peerlink::middleware {

struct CorsOptions {
    std::string origin        = "*";
    std::string methods       = "GET, POST, OPTIONS";
    std::string allowHeaders  = "Content-Type";
    std::string exposeHeaders = "Content-Disposition";
    int         maxAge        = 86400; // seconds
};

// ═══════════════════════════════════════════
//  cors — Cross-Origin Resource Sharing
// ═══════════════════════════════════════════
inline http::MiddlewareFunction cors(CorsOptions options = {}) {
    return [options](http::Request& req, http::Response& res, http::NextFunction next) {
        res.set("Access-Control-Allow-Origin", options.origin);
        res.set("Access-Control-Allow-Methods", options.methods);
        res.set("Access-Control-Allow-Headers", options.allowHeaders);

        if (!options.exposeHeaders.empty()) {
            res.set("Access-Control-Expose-Headers", options.exposeHeaders);
        }

        // Preflight never reaches the routes
        if (req.method == "OPTIONS") {
            res.set("Access-Control-Max-Age", std::to_string(options.maxAge));
            res.status(204).end();
            return;
        }

        next();
    };
}

// ═══════════════════════════════════════════
//  requestLogger — Morgan-style request logging
// ═══════════════════════════════════════════
inline http::MiddlewareFunction requestLogger() {
    return [](http::Request& req, http::Response& res, http::NextFunction next) {
        auto start = std::chrono::steady_clock::now();
        console::debug(req.method, req.path, "from", req.ip);

        next();

        auto elapsed = std::chrono::steady_clock::now() - start;
        auto ms = std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count() / 1000.0;

        int status = res.getStatusCode();
        std::string statusStr = res.aborted() ? "aborted" : std::to_string(status);

        if (status >= 400 || res.aborted()) {
            console::error(req.method, req.path, statusStr, std::to_string(ms) + "ms");
        } else {
            console::success(req.method, req.path, statusStr, std::to_string(ms) + "ms");
        }
    };
}

} // namespace peerlink::middleware
