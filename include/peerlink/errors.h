#pragma once
// ═══════════════════════════════════════════════════════════════════
//  peerlink/errors.h — Error taxonomy for the transfer pipeline
// ═══════════════════════════════════════════════════════════════════
//
//  Every failure the pipeline can report is a peerlink::Error carrying
//  an ErrorKind, so HTTP handlers can map it to a status code and a
//  client can tell "never existed" apart from "failed mid-stream".
//
// ═══════════════════════════════════════════════════════════════════

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace peerlink {

enum class ErrorKind {
    Decode,
    PortExhausted,
    NotRegistered,
    BindFailure,
    ConnectTimeout,
    TransferIO,
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Decode:         return "DecodeError";
        case ErrorKind::PortExhausted:  return "PortExhausted";
        case ErrorKind::NotRegistered:  return "NotRegistered";
        case ErrorKind::BindFailure:    return "BindFailure";
        case ErrorKind::ConnectTimeout: return "ConnectTimeout";
        case ErrorKind::TransferIO:     return "TransferIOError";
    }
    return "Unknown";
}

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

// ── Malformed or truncated multipart stream ──
//    partIndex is the zero-based part being decoded when the failure
//    happened; empty when the stream broke before the first part.
class DecodeError : public Error {
public:
    explicit DecodeError(const std::string& message,
                         std::optional<std::size_t> partIndex = std::nullopt)
        : Error(ErrorKind::Decode, message), partIndex_(partIndex) {}

    std::optional<std::size_t> partIndex() const noexcept { return partIndex_; }

private:
    std::optional<std::size_t> partIndex_;
};

class PortExhausted : public Error {
public:
    explicit PortExhausted(int attempts)
        : Error(ErrorKind::PortExhausted,
                "no free code after " + std::to_string(attempts) + " attempts") {}
};

class NotRegistered : public Error {
public:
    explicit NotRegistered(std::uint32_t code)
        : Error(ErrorKind::NotRegistered,
                "code " + std::to_string(code) + " is not registered"),
          code_(code) {}

    std::uint32_t code() const noexcept { return code_; }

private:
    std::uint32_t code_;
};

class BindFailure : public Error {
public:
    BindFailure(std::uint16_t code, const std::string& reason)
        : Error(ErrorKind::BindFailure,
                "cannot bind listener for code " + std::to_string(code) + ": " + reason) {}
};

class ConnectTimeout : public Error {
public:
    ConnectTimeout(std::uint16_t code, const std::string& reason)
        : Error(ErrorKind::ConnectTimeout,
                "cannot reach listener for code " + std::to_string(code) + ": " + reason) {}
};

class TransferIOError : public Error {
public:
    explicit TransferIOError(const std::string& message)
        : Error(ErrorKind::TransferIO, message) {}
};

} // namespace peerlink
