// ═══════════════════════════════════════════════════════════════════
//  src/broker.cpp — CodeBroker
// ═══════════════════════════════════════════════════════════════════

#include "peerlink/broker.h"
#include "peerlink/console.h"
#include "peerlink/crypto.h"
#include "peerlink/errors.h"

#include <algorithm>
#include <stdexcept>

namespace peerlink {

CodeBroker::CodeBroker(BrokerOptions options)
    : options_(std::move(options))
{
    if (options_.codeMin > options_.codeMax) {
        throw std::invalid_argument("CodeBroker: codeMin must not exceed codeMax");
    }
    if (options_.attempts < 1) {
        throw std::invalid_argument("CodeBroker: attempts must be at least 1");
    }
    if (!options_.random) {
        auto lo = options_.codeMin;
        auto hi = options_.codeMax;
        options_.random = [lo, hi] { return crypto::randomInRange(lo, hi); };
    }
    if (!options_.clock) {
        options_.clock = [] { return std::chrono::system_clock::now(); };
    }
}

std::uint16_t CodeBroker::registerArtifact(const std::string& artifactPath) {
    for (int attempt = 1; attempt <= options_.attempts; ++attempt) {
        // Draw outside the lock; the random source may block on entropy
        auto candidate = options_.random();
        if (!inRange(candidate)) {
            console::debug("Code candidate", candidate, "outside range, retrying");
            continue;
        }

        auto code = static_cast<std::uint16_t>(candidate);
        auto now = options_.clock();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto [it, inserted] = offers_.try_emplace(code, PendingOffer{code, artifactPath, now});
            if (inserted) {
                console::debug("Registered code", code, "after", attempt, "attempt(s)");
                return code;
            }
        }
        console::debug("Code", code, "already taken, retrying");
    }

    console::warn("Code allocation gave up after", options_.attempts, "attempts");
    throw PortExhausted(options_.attempts);
}

std::optional<std::string> CodeBroker::lookup(std::uint16_t code) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = offers_.find(code);
    if (it == offers_.end()) return std::nullopt;
    return it->second.artifactPath;
}

std::optional<PendingOffer> CodeBroker::offer(std::uint16_t code) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = offers_.find(code);
    if (it == offers_.end()) return std::nullopt;
    return it->second;
}

bool CodeBroker::revoke(std::uint16_t code) {
    std::lock_guard<std::mutex> lock(mutex_);
    return offers_.erase(code) > 0;
}

std::size_t CodeBroker::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return offers_.size();
}

std::vector<PendingOffer> CodeBroker::snapshot() const {
    std::vector<PendingOffer> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result.reserve(offers_.size());
        for (auto& [code, offer] : offers_) result.push_back(offer);
    }
    std::sort(result.begin(), result.end(),
              [](const PendingOffer& a, const PendingOffer& b) { return a.createdAt < b.createdAt; });
    return result;
}

} // namespace peerlink
