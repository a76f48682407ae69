#pragma once
// ═══════════════════════════════════════════════════════════════════
//  peerlink/transfer.h — One-shot loopback listener for an offer
// ═══════════════════════════════════════════════════════════════════
//
//  serve(code) binds <host>:<code>, accepts exactly one connection,
//  streams the artifact to it and returns. Whatever the outcome the
//  code is revoked and the sockets are closed before serve() exits.
//
//      Registered → Listening → Transferring → Completed
//                                     └──────→ Failed
//
// ═══════════════════════════════════════════════════════════════════

#include "broker.h"

#include <cstdint>
#include <functional>
#include <stop_token>
#include <string>

namespace peerlink {

enum class ListenerState {
    Registered,
    Listening,
    Transferring,
    Completed,
    Failed,
};

inline const char* to_string(ListenerState state) {
    switch (state) {
        case ListenerState::Registered:   return "registered";
        case ListenerState::Listening:    return "listening";
        case ListenerState::Transferring: return "transferring";
        case ListenerState::Completed:    return "completed";
        case ListenerState::Failed:       return "failed";
    }
    return "unknown";
}

struct ListenerOptions {
    std::string host        = "127.0.0.1";
    std::size_t bufferBytes = 16 * 1024;
    std::function<void(std::uint16_t code, ListenerState state)> onStateChange;
};

class TransferListener {
public:
    explicit TransferListener(CodeBroker& broker, ListenerOptions options = {});

    // Blocks until the single transfer for `code` ends. Returns the number
    // of bytes sent. Throws NotRegistered, BindFailure or TransferIOError.
    // A stop request while still waiting for the peer ends the wait with
    // TransferIOError; a transfer already in progress runs to completion.
    std::uint64_t serve(std::uint16_t code, std::stop_token stop = {});

private:
    void notify(std::uint16_t code, ListenerState state) const;

    CodeBroker&     broker_;
    ListenerOptions options_;
};

} // namespace peerlink
