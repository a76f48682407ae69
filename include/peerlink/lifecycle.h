#pragma once
// ═══════════════════════════════════════════════════════════════════
//  peerlink/lifecycle.h — Graceful shutdown, signal handling
// ═══════════════════════════════════════════════════════════════════

#include "console.h"
#include "service.h"

#include <atomic>
#include <csignal>
#include <functional>
#include <mutex>
#include <vector>

namespace peerlink::lifecycle {

namespace detail {
    inline std::mutex& handlersMutex() {
        static std::mutex m;
        return m;
    }
    inline std::vector<std::function<void(int)>>& shutdownHandlers() {
        static std::vector<std::function<void(int)>> handlers;
        return handlers;
    }
    inline std::atomic<bool>& shuttingDown() {
        static std::atomic<bool> v{false};
        return v;
    }
    inline void signalHandler(int sig) {
        if (shuttingDown().exchange(true)) return; // Already shutting down
        console::info("Received signal", sig, "- shutting down gracefully...");
        std::lock_guard<std::mutex> lock(handlersMutex());
        for (auto& handler : shutdownHandlers()) {
            handler(sig);
        }
    }
} // namespace detail

// ── Register a shutdown handler ──
inline void onShutdown(std::function<void(int)> handler) {
    std::lock_guard<std::mutex> lock(detail::handlersMutex());
    detail::shutdownHandlers().push_back(std::move(handler));
}

// ── Enable graceful shutdown on SIGINT and SIGTERM ──
//    Pending offers are not persisted; their count is logged.
inline void enableGracefulShutdown(ShareService& service) {
    std::signal(SIGINT, detail::signalHandler);
    std::signal(SIGTERM, detail::signalHandler);

    onShutdown([&service](int) {
        console::info("Stopping share service with", service.broker().pendingCount(),
                      "pending offer(s)...");
        service.stop();
        console::success("Server stopped.");
    });
}

} // namespace peerlink::lifecycle
