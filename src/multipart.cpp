// ═══════════════════════════════════════════════════════════════════
//  src/multipart.cpp — Streaming multipart/form-data decoder
// ═══════════════════════════════════════════════════════════════════

#include "peerlink/multipart.h"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <utility>

namespace peerlink::multipart {

namespace detail {

inline std::string toLower(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

inline std::string trim(const std::string& s) {
    std::size_t a = 0, b = s.size();
    while (a < b && (s[a] == ' ' || s[a] == '\t')) ++a;
    while (b > a && (s[b - 1] == ' ' || s[b - 1] == '\t' || s[b - 1] == '\r')) --b;
    return s.substr(a, b - a);
}

inline int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// %XX only; '+' is literal in header parameters
inline std::string percentDecode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            int hi = hexValue(s[i + 1]);
            int lo = hexValue(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>(hi * 16 + lo);
                i += 2;
                continue;
            }
        }
        out += s[i];
    }
    return out;
}

// Splits "a=1; b=\"x;y\"" on semicolons outside quotes into lowercase-key pairs
inline std::vector<std::pair<std::string, std::string>> parseParams(const std::string& value) {
    std::vector<std::pair<std::string, std::string>> params;
    std::size_t pos = 0;
    while (pos < value.size()) {
        std::string token;
        bool quoted = false;
        for (; pos < value.size(); ++pos) {
            char c = value[pos];
            if (c == '"') quoted = !quoted;
            if (c == ';' && !quoted) break;
            token += c;
        }
        ++pos;

        auto eq = token.find('=');
        if (eq == std::string::npos) continue;
        auto key = toLower(trim(token.substr(0, eq)));
        auto val = trim(token.substr(eq + 1));

        if (val.size() >= 2 && val.front() == '"' && val.back() == '"') {
            std::string unquoted;
            for (std::size_t i = 1; i + 1 < val.size(); ++i) {
                if (val[i] == '\\' && i + 2 < val.size()) ++i;
                unquoted += val[i];
            }
            val = unquoted;
        }
        params.emplace_back(std::move(key), std::move(val));
    }
    return params;
}

} // namespace detail

// ═══════════════════════════════════════════
//  Header helpers
// ═══════════════════════════════════════════

bool isMultipartFormData(const std::string& contentType) {
    auto mediaType = detail::toLower(detail::trim(contentType.substr(0, contentType.find(';'))));
    return mediaType == "multipart/form-data";
}

std::string extractBoundary(const std::string& contentType) {
    auto semicolon = contentType.find(';');
    if (semicolon == std::string::npos) return "";

    for (auto& [key, value] : detail::parseParams(contentType.substr(semicolon + 1))) {
        if (key == "boundary") return value;
    }
    return "";
}

Disposition parseContentDisposition(const std::string& value) {
    Disposition result;
    auto semicolon = value.find(';');
    if (semicolon == std::string::npos) return result;

    std::string extended;
    for (auto& [key, val] : detail::parseParams(value.substr(semicolon + 1))) {
        if (key == "name") {
            result.name = val;
        } else if (key == "filename") {
            result.filename = detail::percentDecode(val);
        } else if (key == "filename*") {
            // RFC 5987: charset'language'percent-encoded
            auto quote = val.find('\'');
            auto second = quote == std::string::npos ? quote : val.find('\'', quote + 1);
            extended = detail::percentDecode(
                second == std::string::npos ? val : val.substr(second + 1));
        }
    }
    if (!extended.empty()) result.filename = extended;
    return result;
}

ByteSource stringSource(std::string data, std::size_t chunk) {
    auto state = std::make_shared<std::pair<std::string, std::size_t>>(std::move(data), 0);
    return [state, chunk](char* dst, std::size_t max) -> std::size_t {
        auto& [buffer, offset] = *state;
        auto n = std::min(max, buffer.size() - offset);
        if (chunk > 0) n = std::min(n, chunk);
        std::memcpy(dst, buffer.data() + offset, n);
        offset += n;
        return n;
    };
}

// ═══════════════════════════════════════════
//  Part
// ═══════════════════════════════════════════

Part::Part(Decoder* decoder, std::size_t index, HeaderMap headers)
    : decoder_(decoder)
    , index_(index)
    , headers_(std::move(headers))
{
    auto it = headers_.find("content-disposition");
    if (it != headers_.end()) {
        disposition_ = parseContentDisposition(it->second);
    }
}

std::string Part::header(const std::string& name) const {
    auto it = headers_.find(detail::toLower(name));
    return it != headers_.end() ? it->second : "";
}

std::string Part::contentType() const {
    auto ct = header("content-type");
    return ct.empty() ? "application/octet-stream" : ct;
}

std::size_t Part::read(char* dst, std::size_t max) {
    return decoder_->readBody(index_, dst, max);
}

std::string Part::readAll() {
    std::string out;
    char buf[4096];
    while (auto n = read(buf, sizeof(buf))) {
        out.append(buf, n);
    }
    return out;
}

// ═══════════════════════════════════════════
//  Decoder
// ═══════════════════════════════════════════

Decoder::Decoder(ByteSource source, const std::string& boundary, DecoderOptions options)
    : source_(std::move(source))
    , options_(options)
    , marker_("\r\n--" + boundary)
    , input_(std::max<std::size_t>(options.readBufferBytes, 1))
{
    if (boundary.empty()) {
        throw std::invalid_argument("multipart boundary must not be empty");
    }

    // KMP failure table: failure_[i] is the length of the longest proper
    // prefix of marker_[0..i] that is also a suffix of it.
    failure_.assign(marker_.size(), 0);
    std::size_t k = 0;
    for (std::size_t i = 1; i < marker_.size(); ++i) {
        while (k > 0 && marker_[i] != marker_[k]) k = failure_[k - 1];
        if (marker_[i] == marker_[k]) ++k;
        failure_[i] = k;
    }
}

void Decoder::fail(const std::string& message, std::optional<std::size_t> index) {
    state_ = State::Failed;
    throw DecodeError(message, index);
}

int Decoder::nextByte() {
    if (inputPos_ == inputLen_) {
        if (eof_) return -1;
        inputLen_ = source_(input_.data(), input_.size());
        inputPos_ = 0;
        if (inputLen_ == 0) {
            eof_ = true;
            return -1;
        }
    }
    return static_cast<unsigned char>(input_[inputPos_++]);
}

// Feeds input through the delimiter matcher. Bytes proven not to belong
// to the delimiter are appended to sink (discarded when sink is null).
// Only a prefix of marker_ is ever held back, so a mismatch releases
// marker_[0 .. matched - fallback).
Decoder::Scan Decoder::scan(std::string* sink, std::size_t limit) {
    while (true) {
        if (sink && sink->size() >= limit) return Scan::Suspended;

        int c = nextByte();
        if (c < 0) return Scan::Eof;
        char ch = static_cast<char>(c);

        while (matched_ > 0 && marker_[matched_] != ch) {
            auto fallback = failure_[matched_ - 1];
            if (sink) sink->append(marker_, 0, matched_ - fallback);
            matched_ = fallback;
        }

        if (marker_[matched_] == ch) {
            if (++matched_ == marker_.size()) {
                matched_ = 0;
                return Scan::Matched;
            }
        } else if (sink) {
            sink->push_back(ch);
        }
    }
}

void Decoder::skipPreamble() {
    // The opening delimiter may sit at offset 0 with no CRLF before it
    matched_ = 2;
    if (scan(nullptr, 0) != Scan::Matched) {
        fail("multipart boundary not found", std::nullopt);
    }
    state_ = finishDelimiterLine(std::nullopt) ? State::Done : State::Headers;
}

// Consumes the rest of a delimiter line; true when it closes the stream
bool Decoder::finishDelimiterLine(std::optional<std::size_t> index) {
    int c = nextByte();
    if (c == '-') {
        if (nextByte() != '-') fail("malformed closing delimiter", index);
        return true;
    }
    while (c == ' ' || c == '\t') c = nextByte();
    if (c == '\r') c = nextByte();
    if (c == '\n') return false;
    if (c < 0) fail("stream ended after delimiter", index);
    fail("malformed delimiter line", index);
}

HeaderMap Decoder::readHeaders(std::size_t index) {
    HeaderMap headers;
    std::string lastName;
    std::size_t total = 0;

    while (true) {
        std::string line;
        int c;
        while ((c = nextByte()) >= 0 && c != '\n') {
            if (++total > options_.maxHeaderBytes) {
                fail("header block too large in part " + std::to_string(index), index);
            }
            line += static_cast<char>(c);
        }
        if (c < 0) fail("stream ended inside headers of part " + std::to_string(index), index);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) return headers;

        if ((line[0] == ' ' || line[0] == '\t') && !lastName.empty()) {
            headers[lastName] += " " + detail::trim(line);
            continue;
        }

        auto colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            fail("malformed header line in part " + std::to_string(index), index);
        }
        lastName = detail::toLower(detail::trim(line.substr(0, colon)));
        headers[lastName] = detail::trim(line.substr(colon + 1));
    }
}

std::size_t Decoder::readBody(std::size_t index, char* dst, std::size_t max) {
    if (index + 1 != partCount_ || max == 0) return 0;

    while (pendingPos_ == pending_.size() && state_ == State::Body) {
        pending_.clear();
        pendingPos_ = 0;

        switch (scan(&pending_, options_.readBufferBytes)) {
            case Scan::Suspended:
                break;
            case Scan::Matched:
                state_ = finishDelimiterLine(index) ? State::Done : State::Headers;
                break;
            case Scan::Eof:
                fail("stream ended inside part " + std::to_string(index), index);
        }
    }

    auto n = std::min(max, pending_.size() - pendingPos_);
    std::memcpy(dst, pending_.data() + pendingPos_, n);
    pendingPos_ += n;
    return n;
}

std::optional<Part> Decoder::next() {
    if (state_ == State::Failed) {
        std::optional<std::size_t> last;
        if (partCount_ > 0) last = partCount_ - 1;
        throw DecodeError("decoder already failed", last);
    }

    if (state_ == State::Preamble) {
        skipPreamble();
    }

    if (state_ == State::Body) {
        char scratch[4096];
        while (readBody(partCount_ - 1, scratch, sizeof(scratch)) > 0) {
        }
    }

    if (state_ != State::Headers) return std::nullopt;

    auto index = partCount_++;
    auto headers = readHeaders(index);
    pending_.clear();
    pendingPos_ = 0;
    matched_ = 0;
    state_ = State::Body;
    return Part(this, index, std::move(headers));
}

} // namespace peerlink::multipart
