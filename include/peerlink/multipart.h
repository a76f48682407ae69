#pragma once
// ═══════════════════════════════════════════════════════════════════
//  peerlink/multipart.h — Streaming multipart/form-data decoder
// ═══════════════════════════════════════════════════════════════════
//
//  multipart::Decoder decoder(source, boundary);
//  while (auto part = decoder.next()) {
//      char buf[8192];
//      while (auto n = part->read(buf, sizeof(buf))) { ... }
//  }
//
//  The body is never materialized: bytes are pulled from the source
//  on demand and a part's body is released as soon as it is known not
//  to belong to the "\r\n--boundary" delimiter. The decoder must
//  outlive the parts it yields; moving on with next() drains what is
//  left of the current part.
//
// ═══════════════════════════════════════════════════════════════════

#include "errors.h"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace peerlink::multipart {

// Fills up to `max` bytes of dst, returns 0 at end of stream
using ByteSource = std::function<std::size_t(char* dst, std::size_t max)>;

// Header names are stored lowercase; duplicates keep the last value
using HeaderMap = std::unordered_map<std::string, std::string>;

struct Disposition {
    std::string name;
    std::string filename;
};

// ── Content-Type helpers ──
bool isMultipartFormData(const std::string& contentType);
std::string extractBoundary(const std::string& contentType);

// ── Content-Disposition: form-data; name="a"; filename="b.txt" ──
Disposition parseContentDisposition(const std::string& value);

// ── In-memory source, handing out at most `chunk` bytes per read ──
ByteSource stringSource(std::string data, std::size_t chunk = 0);

struct DecoderOptions {
    std::size_t maxHeaderBytes  = 16 * 1024;
    std::size_t readBufferBytes = 8 * 1024;
};

class Decoder;

// ═══════════════════════════════════════════
//  Part — one decoded section of the body
// ═══════════════════════════════════════════
class Part {
public:
    const HeaderMap& headers() const { return headers_; }
    std::string header(const std::string& name) const;

    const std::string& name() const { return disposition_.name; }
    const std::string& filename() const { return disposition_.filename; }
    std::string contentType() const;
    bool isFile() const { return !disposition_.filename.empty(); }

    // Zero-based position in the stream
    std::size_t index() const { return index_; }

    // Returns 0 once the body is exhausted or the decoder moved on
    std::size_t read(char* dst, std::size_t max);
    std::string readAll();

private:
    friend class Decoder;
    Part(Decoder* decoder, std::size_t index, HeaderMap headers);

    Decoder*    decoder_;
    std::size_t index_;
    HeaderMap   headers_;
    Disposition disposition_;
};

// ═══════════════════════════════════════════
//  Decoder
// ═══════════════════════════════════════════
class Decoder {
public:
    Decoder(ByteSource source, const std::string& boundary, DecoderOptions options = {});

    Decoder(const Decoder&) = delete;
    Decoder& operator=(const Decoder&) = delete;

    // Next part in source order; nullopt after the closing delimiter.
    // Throws DecodeError for malformed or truncated input.
    std::optional<Part> next();

    std::size_t partsDecoded() const { return partCount_; }

private:
    friend class Part;

    enum class State { Preamble, Headers, Body, Done, Failed };
    enum class Scan { Matched, Suspended, Eof };

    std::size_t readBody(std::size_t index, char* dst, std::size_t max);

    int nextByte();
    Scan scan(std::string* sink, std::size_t limit);
    void skipPreamble();
    bool finishDelimiterLine(std::optional<std::size_t> index);
    HeaderMap readHeaders(std::size_t index);
    [[noreturn]] void fail(const std::string& message, std::optional<std::size_t> index);

    ByteSource     source_;
    DecoderOptions options_;
    std::string    marker_;                 // "\r\n--" + boundary
    std::vector<std::size_t> failure_;      // KMP failure table over marker_

    std::vector<char> input_;
    std::size_t inputPos_ = 0;
    std::size_t inputLen_ = 0;
    bool        eof_ = false;

    std::size_t matched_ = 0;               // marker_ prefix currently held back
    std::string pending_;                   // released body bytes not yet read
    std::size_t pendingPos_ = 0;

    State       state_ = State::Preamble;
    std::size_t partCount_ = 0;
};

} // namespace peerlink::multipart
