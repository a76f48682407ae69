#pragma once
// ═══════════════════════════════════════════════════════════════════
//  peerlink/broker.h — Invite code allocation and the offer table
// ═══════════════════════════════════════════════════════════════════
//
//  auto code = broker.registerArtifact("uploads/report.pdf");
//  auto path = broker.lookup(code);       // std::optional<std::string>
//  broker.revoke(code);                   // idempotent
//
//  A code is drawn at random from [codeMin, codeMax] and doubles as
//  the loopback port the artifact is later served on. Every access
//  to the table happens under one mutex that never covers I/O.
//
// ═══════════════════════════════════════════════════════════════════

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace peerlink {

struct PendingOffer {
    std::uint16_t                         code = 0;
    std::string                           artifactPath;
    std::chrono::system_clock::time_point createdAt;
};

struct BrokerOptions {
    std::uint16_t codeMin  = 1024;
    std::uint16_t codeMax  = 65535;
    int           attempts = 20;

    // Returns a candidate code; defaults to a uniform draw over [codeMin, codeMax]
    std::function<std::uint32_t()> random;
    std::function<std::chrono::system_clock::time_point()> clock;
};

class CodeBroker {
public:
    explicit CodeBroker(BrokerOptions options = {});

    CodeBroker(const CodeBroker&) = delete;
    CodeBroker& operator=(const CodeBroker&) = delete;

    // Throws PortExhausted when every attempt hits a taken or invalid code
    std::uint16_t registerArtifact(const std::string& artifactPath);

    std::optional<std::string>  lookup(std::uint16_t code) const;
    std::optional<PendingOffer> offer(std::uint16_t code) const;

    // Returns true if this call removed the offer
    bool revoke(std::uint16_t code);

    std::size_t pendingCount() const;
    std::vector<PendingOffer> snapshot() const;

    bool inRange(std::uint32_t code) const {
        return code >= options_.codeMin && code <= options_.codeMax;
    }

    const BrokerOptions& options() const { return options_; }

private:
    BrokerOptions options_;
    mutable std::mutex mutex_;
    std::unordered_map<std::uint16_t, PendingOffer> offers_;
};

} // namespace peerlink
