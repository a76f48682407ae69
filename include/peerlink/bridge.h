#pragma once
// ═══════════════════════════════════════════════════════════════════
//  peerlink/bridge.h — Client side of a transfer
// ═══════════════════════════════════════════════════════════════════
//
//  auto stream = bridge.open(code);
//  res.set("Content-Disposition", "attachment; filename=\"" + stream.filename() + "\"");
//  while (auto n = stream.read(buf, sizeof(buf))) { ... }
//
//  The bridge connects to the listener that serves `code` and relays
//  whatever it sends until the listener closes the connection.
//
// ═══════════════════════════════════════════════════════════════════

#include "broker.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace peerlink {

struct BridgeOptions {
    std::string               host = "127.0.0.1";
    std::chrono::milliseconds connectTimeout{5000};
};

// ── An open connection to a listener ──
class RetrievalStream {
public:
    ~RetrievalStream();
    RetrievalStream(RetrievalStream&&) noexcept;
    RetrievalStream& operator=(RetrievalStream&&) noexcept;

    // Basename of the offered artifact, or "downloaded" if the broker
    // had no record of it
    const std::string& filename() const { return filename_; }
    std::uint16_t code() const { return code_; }
    std::uint64_t bytesRead() const { return bytesRead_; }

    // Returns 0 once the listener has closed cleanly.
    // Throws TransferIOError on a reset or any other read failure.
    std::size_t read(char* dst, std::size_t max);

    void close();

private:
    friend class RetrievalBridge;
    struct Impl;

    RetrievalStream(std::unique_ptr<Impl> impl, std::uint16_t code, std::string filename);

    std::unique_ptr<Impl> impl_;
    std::uint16_t         code_ = 0;
    std::string           filename_;
    std::uint64_t         bytesRead_ = 0;
};

class RetrievalBridge {
public:
    using Sink = std::function<void(const char* data, std::size_t size)>;

    explicit RetrievalBridge(const CodeBroker& broker, BridgeOptions options = {});

    // Throws NotRegistered (unknown, consumed or out-of-range code) or
    // ConnectTimeout (registered but nothing accepted in time)
    RetrievalStream open(std::uint32_t code) const;

    // open() and relay everything to `sink`; returns the byte count
    std::uint64_t fetch(std::uint32_t code, const Sink& sink,
                        std::size_t bufferBytes = 16 * 1024) const;

    static std::string hintedFilename(const std::optional<std::string>& artifactPath);

private:
    const CodeBroker& broker_;
    BridgeOptions     options_;
};

} // namespace peerlink
