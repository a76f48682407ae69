#pragma once
// ═══════════════════════════════════════════════════════════════════
//  peerlink/testing.h — TestClient (supertest equivalent), mock factories
// ═══════════════════════════════════════════════════════════════════

#include "http.h"
#include "multipart.h"

#include <algorithm>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace peerlink::testing {

// ── Create a mock Request ──
inline http::Request createRequest(
    const std::string& method = "GET",
    const std::string& path = "/",
    const std::string& body = "",
    const std::unordered_map<std::string, std::string>& headers = {}) {
    http::Request req;
    req.method = method;
    req.path = path;
    req.url = path;
    req.rawBody = body;
    req.ip = "127.0.0.1";
    req.protocol = "http";
    req.hostname = "localhost";
    // Lowercase all header keys
    for (auto& [k, v] : headers) {
        std::string lk = k;
        std::transform(lk.begin(), lk.end(), lk.begin(), ::tolower);
        req.headers[lk] = v;
    }
    return req;
}

// ═══════════════════════════════════════════
//  MultipartBody — builds multipart/form-data payloads
// ═══════════════════════════════════════════
class MultipartBody {
public:
    explicit MultipartBody(std::string boundary = "----peerlinkTestBoundary7MA4YWxk")
        : boundary_(std::move(boundary)) {}

    MultipartBody& field(const std::string& name, const std::string& value) {
        body_ += "--" + boundary_ + "\r\n";
        body_ += "Content-Disposition: form-data; name=\"" + name + "\"\r\n\r\n";
        body_ += value + "\r\n";
        return *this;
    }

    MultipartBody& file(const std::string& name, const std::string& filename,
                        const std::string& content,
                        const std::string& contentType = "application/octet-stream") {
        body_ += "--" + boundary_ + "\r\n";
        body_ += "Content-Disposition: form-data; name=\"" + name
               + "\"; filename=\"" + filename + "\"\r\n";
        body_ += "Content-Type: " + contentType + "\r\n\r\n";
        body_ += content + "\r\n";
        return *this;
    }

    const std::string& boundary() const { return boundary_; }
    std::string contentType() const { return "multipart/form-data; boundary=" + boundary_; }

    // Body with the closing delimiter
    std::string str() const { return body_ + "--" + boundary_ + "--\r\n"; }

    // Body cut off before the closing delimiter
    std::string truncated() const { return body_; }

private:
    std::string boundary_;
    std::string body_;
};

// ── Test Result ──
struct TestResult {
    int status = 0;
    std::string body;
    std::unordered_map<std::string, std::string> headers;
    bool streamed = false;
    bool aborted = false;

    nlohmann::json json() const {
        return nlohmann::json::parse(body);
    }

    std::string header(const std::string& name) const {
        auto it = headers.find(name);
        return it == headers.end() ? "" : it->second;
    }
};

// ═══════════════════════════════════════════
//  TestClient — supertest-style API
// ═══════════════════════════════════════════
class TestClient {
public:
    explicit TestClient(http::Server& app) : app_(app) {}

    // ── Fluent request builder ──
    class RequestBuilder {
    public:
        RequestBuilder(http::Server& app, const std::string& method, const std::string& path)
            : app_(app), method_(method), path_(path) {}

        RequestBuilder& set(const std::string& key, const std::string& value) {
            headers_[key] = value;
            return *this;
        }

        RequestBuilder& send(const std::string& body) {
            body_ = body;
            if (headers_.find("Content-Type") == headers_.end()) {
                headers_["Content-Type"] = "application/json";
            }
            return *this;
        }

        RequestBuilder& send(const nlohmann::json& j) {
            body_ = j.dump();
            headers_["Content-Type"] = "application/json";
            return *this;
        }

        RequestBuilder& send(const MultipartBody& form) {
            body_ = form.str();
            headers_["Content-Type"] = form.contentType();
            return *this;
        }

        // Deliver the body at most `bytes` at a time, like a slow socket
        RequestBuilder& chunked(std::size_t bytes) {
            chunk_ = bytes;
            return *this;
        }

        RequestBuilder& query(const std::string& key, const std::string& value) {
            query_[key] = value;
            return *this;
        }

        // ── Execute the request ──
        TestResult expect(int expectedStatus) {
            auto result = exec();
            if (result.status != expectedStatus) {
                throw std::runtime_error(
                    "Expected status " + std::to_string(expectedStatus) +
                    " but got " + std::to_string(result.status) + ": " + result.body);
            }
            return result;
        }

        TestResult exec() {
            auto req = createRequest(method_, path_, body_, headers_);
            req.query = query_;
            if (chunk_ > 0) {
                req.setBodyReader(multipart::stringSource(body_, chunk_));
            }

            http::Response res([](int, const http::HeaderMap&, const std::string&) {});
            app_.handleRequest(req, res);

            TestResult result;
            result.status   = res.getStatusCode();
            result.body     = res.getBody();
            result.headers  = res.getHeaders();
            result.streamed = res.streaming();
            result.aborted  = res.aborted();
            return result;
        }

    private:
        http::Server& app_;
        std::string method_;
        std::string path_;
        std::string body_;
        std::size_t chunk_ = 0;
        std::unordered_map<std::string, std::string> headers_;
        std::unordered_map<std::string, std::string> query_;
    };

    RequestBuilder get(const std::string& path) { return {app_, "GET", path}; }
    RequestBuilder post(const std::string& path) { return {app_, "POST", path}; }
    RequestBuilder options(const std::string& path) { return {app_, "OPTIONS", path}; }

private:
    http::Server& app_;
};

} // namespace peerlink::testing
