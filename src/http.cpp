// ═══════════════════════════════════════════════════════════════════
//  src/http.cpp — Boost.Beast-powered HTTP server implementation
// ═══════════════════════════════════════════════════════════════════

#include "peerlink/http.h"
#include "peerlink/console.h"

#include <utility>  // boost/asio/awaitable.hpp uses std::exchange without including it
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio.hpp>
#include <boost/asio/strand.hpp>

#include <regex>
#include <string>
#include <system_error>
#include <vector>
#include <algorithm>
#include <sstream>
#include <memory>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <unordered_set>

namespace peerlink::http {

namespace beast  = boost::beast;
namespace net    = boost::asio;
namespace bhttp  = beast::http;
using tcp        = net::ip::tcp;

// ═══════════════════════════════════════════
//  Internal: Compiled route with regex
// ═══════════════════════════════════════════
struct CompiledRoute {
    std::string method;
    std::string pattern;
    std::regex  regex;
    std::vector<std::string> paramNames;
    RouteHandler handler;
};

// ═══════════════════════════════════════════
//  Internal: URL parsing utilities
// ═══════════════════════════════════════════
namespace detail {

inline std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), ::tolower);
    return s;
}

inline std::string urlDecode(const std::string& str) {
    std::string result;
    result.reserve(str.size());
    for (std::size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '%' && i + 2 < str.size()) {
            int hex = 0;
            std::istringstream iss(str.substr(i + 1, 2));
            if (iss >> std::hex >> hex) {
                result += static_cast<char>(hex);
                i += 2;
            } else {
                result += str[i];
            }
        } else if (str[i] == '+') {
            result += ' ';
        } else {
            result += str[i];
        }
    }
    return result;
}

inline std::pair<std::string, std::string> splitUrl(const std::string& url) {
    auto pos = url.find('?');
    if (pos == std::string::npos) return {url, ""};
    return {url.substr(0, pos), url.substr(pos + 1)};
}

inline std::unordered_map<std::string, std::string> parseQueryString(const std::string& qs) {
    std::unordered_map<std::string, std::string> result;
    if (qs.empty()) return result;

    std::istringstream stream(qs);
    std::string pair;
    while (std::getline(stream, pair, '&')) {
        auto eq = pair.find('=');
        if (eq != std::string::npos) {
            result[urlDecode(pair.substr(0, eq))] = urlDecode(pair.substr(eq + 1));
        } else {
            result[urlDecode(pair)] = "";
        }
    }
    return result;
}

inline CompiledRoute compileRoute(const std::string& method,
                                   const std::string& pattern,
                                   RouteHandler handler) {
    CompiledRoute route;
    route.method  = method;
    route.pattern = pattern;
    route.handler = std::move(handler);

    std::string regexStr;
    std::size_t pos = 0;

    while (pos < pattern.size()) {
        char c = pattern[pos];
        if (c == ':') {
            // Route parameter — :paramName
            pos++;
            std::string paramName;
            while (pos < pattern.size() && pattern[pos] != '/') {
                paramName += pattern[pos++];
            }
            route.paramNames.push_back(paramName);
            regexStr += "([^/]+)";
        } else if (c == '*') {
            regexStr += "(.*)";
            route.paramNames.push_back("*");
            pos++;
        } else {
            if (c == '.' || c == '(' || c == ')' ||
                c == '[' || c == ']' || c == '{' ||
                c == '}' || c == '+' || c == '?' ||
                c == '^' || c == '$' || c == '|') {
                regexStr += '\\';
            }
            regexStr += c;
            pos++;
        }
    }

    route.regex = std::regex("^" + regexStr + "$");
    return route;
}

inline bool matchRoute(const CompiledRoute& route,
                        const std::string& method,
                        const std::string& path,
                        Request& req) {
    if (route.method != method && route.method != "*") return false;

    std::smatch match;
    if (std::regex_match(path, match, route.regex)) {
        for (std::size_t i = 0; i < route.paramNames.size(); ++i) {
            req.params[route.paramNames[i]] = match[i + 1].str();
        }
        return true;
    }
    return false;
}

} // namespace detail

// ═══════════════════════════════════════════
//  Server::Impl — Hidden implementation
// ═══════════════════════════════════════════
class HttpSession;

struct Server::Impl {
    ServerOptions                    options;
    std::vector<MiddlewareFunction>  middlewares;
    std::vector<CompiledRoute>       routes;
    std::mutex                       iocMutex;
    std::unique_ptr<net::io_context> ioc;
    bool running = false;

    // ── Live connections; closing refuses new ones ──
    std::mutex                         sessionsMutex;
    std::condition_variable            sessionsDrained;
    std::unordered_set<HttpSession*>   sessions;
    bool                               closing = false;

    bool addSession(HttpSession* session);
    void removeSession(HttpSession* session);
    void closeSessions();

    bool isClosing() {
        std::lock_guard<std::mutex> lock(sessionsMutex);
        return closing;
    }

    // ── Middleware chain executor ──
    void executeMiddlewareChain(Request& req, Response& res,
                                std::size_t index,
                                std::function<void()> done) {
        if (res.headersSent()) return;
        if (index >= middlewares.size()) {
            done();
            return;
        }

        auto& mw = middlewares[index];
        mw(req, res, [this, &req, &res, index, done = std::move(done)]() {
            executeMiddlewareChain(req, res, index + 1, std::move(done));
        });
    }

    // ── Request handler: middleware chain → route matching ──
    void handleRequest(Request& req, Response& res) {
        try {
            executeMiddlewareChain(req, res, 0, [this, &req, &res]() {
                if (res.headersSent()) return;

                for (auto& route : routes) {
                    auto savedParams = req.params;
                    req.params.clear();

                    if (detail::matchRoute(route, req.method, req.path, req)) {
                        route.handler(req, res);
                        return;
                    }

                    req.params = std::move(savedParams);
                }

                res.status(404).json(nlohmann::json{
                    {"error", "Not Found"},
                    {"message", "Cannot " + req.method + " " + req.path}
                });
            });
        } catch (const std::exception& e) {
            console::error("Unhandled error in", req.method, req.path, "-", e.what());
            if (!res.headersSent()) {
                res.status(500).json(nlohmann::json{
                    {"error", "Internal Server Error"},
                    {"message", e.what()}
                });
            } else {
                res.abortStream();
            }
        }
    }
};

// ═══════════════════════════════════════════
//  Session — Serves one connection on its own thread
// ═══════════════════════════════════════════
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket socket, std::shared_ptr<Server::Impl> server)
        : socket_(std::move(socket))
        , server_(std::move(server))
    {}

    // Blocks until the peer goes away, keep-alive ends or the server closes
    void run() {
        try {
            while (!server_->isClosing() && serveOne()) {
            }
        } catch (const beast::system_error& e) {
            if (e.code() != bhttp::error::end_of_stream) {
                console::debug("Connection closed:", e.code().message());
            }
        } catch (const std::exception& e) {
            console::error("Connection dropped:", e.what());
        }

        // The peer may already be gone; nothing left to report
        beast::error_code shutdown_ec;
        socket_.shutdown(tcp::socket::shutdown_send, shutdown_ec);
        server_->removeSession(this);
    }

    // Called by Server::close() from another thread; unblocks any read
    void cancel() {
        beast::error_code ec;
        socket_.shutdown(tcp::socket::shutdown_both, ec);
    }

private:
    tcp::socket socket_;
    beast::flat_buffer buffer_;
    std::shared_ptr<Server::Impl> server_;

    // Returns true when the connection may carry another request
    bool serveOne() {
        bhttp::request_parser<bhttp::buffer_body> parser;
        parser.header_limit(server_->options.maxHeaderBytes);
        parser.body_limit(boost::none);

        bhttp::read_header(socket_, buffer_, parser);
        auto& message = parser.get();

        // A declared length over the limit is refused on the first body
        // read, so the handler can still answer it
        const auto maxBody = server_->options.maxBodyBytes;
        bool declaredTooLarge = false;
        if (maxBody > 0) {
            auto declared = parser.content_length();
            if (declared && *declared > maxBody) {
                declaredTooLarge = true;
            } else {
                parser.body_limit(maxBody);
            }
        }

        // ── Build peerlink::Request from the Beast header ──
        Request req;
        req.method = std::string(message.method_string());
        req.url    = std::string(message.target());

        auto [path, queryString] = detail::splitUrl(req.url);
        req.path     = path;
        req.query    = detail::parseQueryString(queryString);
        req.protocol = "http";

        beast::error_code endpoint_ec;
        auto remote = socket_.remote_endpoint(endpoint_ec);
        req.ip = endpoint_ec ? "unknown" : remote.address().to_string();

        for (auto& field : message) {
            req.headers[detail::toLower(std::string(field.name_string()))]
                = std::string(field.value());
        }
        req.hostname = req.header("host");

        req.setBodyReader([this, &parser, declaredTooLarge, maxBody](
                char* dst, std::size_t max) -> std::size_t {
            if (declaredTooLarge) throw PayloadTooLarge(maxBody);
            while (!parser.is_done()) {
                parser.get().body().data = dst;
                parser.get().body().size = max;
                beast::error_code ec;
                bhttp::read(socket_, buffer_, parser, ec);
                if (ec == bhttp::error::need_buffer) ec = {};
                if (ec == bhttp::error::body_limit) {
                    throw PayloadTooLarge(maxBody);
                }
                if (ec) throw beast::system_error(ec);
                auto n = max - parser.get().body().size;
                if (n > 0) return n;
            }
            return 0;
        });

        const unsigned version = message.version();
        const bool keepAlive   = message.keep_alive();
        bool broken = false;

        // ── Whole-body responses ──
        auto sendWhole = [this, version, keepAlive, &broken](
                int statusCode, const HeaderMap& headers, const std::string& body) {
            bhttp::response<bhttp::string_body> res;
            res.result(static_cast<bhttp::status>(statusCode));
            res.version(version);
            for (auto& [key, value] : headers) {
                if (!value.empty()) res.set(key, value);
            }
            res.body() = body;
            res.prepare_payload();
            res.keep_alive(keepAlive);

            broken = true;
            bhttp::write(socket_, res);
            broken = false;
        };

        // ── Chunked responses ──
        Response::StreamCallbacks stream;
        stream.begin = [this, version, keepAlive, &broken](
                int statusCode, const HeaderMap& headers) {
            bhttp::response<bhttp::empty_body> res;
            res.result(static_cast<bhttp::status>(statusCode));
            res.version(version);
            for (auto& [key, value] : headers) {
                if (!value.empty()) res.set(key, value);
            }
            res.keep_alive(keepAlive);
            res.chunked(true);

            broken = true;
            bhttp::response_serializer<bhttp::empty_body> sr{res};
            bhttp::write_header(socket_, sr);
            broken = false;
        };
        stream.write = [this, &broken](const char* data, std::size_t size) {
            broken = true;
            net::write(socket_, bhttp::make_chunk(net::const_buffer(data, size)));
            broken = false;
        };
        stream.finish = [this, &broken]() {
            broken = true;
            net::write(socket_, bhttp::make_chunk_last());
            broken = false;
        };

        Response res(sendWhole, stream);
        server_->handleRequest(req, res);

        if (!res.headersSent()) {
            res.status(404).json(nlohmann::json{
                {"error", "Not Found"},
                {"message", "No response sent by handler"}
            });
        }

        // An unread body or an interrupted response leaves the stream
        // out of sync, so the connection cannot be reused.
        return keepAlive && !broken && !res.aborted() && parser.is_done();
    }
};

// ═══════════════════════════════════════════
//  Listener — Accepts incoming TCP connections
// ═══════════════════════════════════════════
class HttpListener : public std::enable_shared_from_this<HttpListener> {
public:
    HttpListener(net::io_context& ioc, tcp::endpoint endpoint, std::shared_ptr<Server::Impl> server)
        : ioc_(ioc)
        , acceptor_(net::make_strand(ioc))
        , server_(std::move(server))
    {
        beast::error_code ec;

        acceptor_.open(endpoint.protocol(), ec);
        if (ec) throw std::runtime_error("Failed to open acceptor: " + ec.message());

        acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        if (ec) throw std::runtime_error("Failed to set reuse_address: " + ec.message());

        acceptor_.bind(endpoint, ec);
        if (ec) throw std::runtime_error("Failed to bind to port: " + ec.message());

        acceptor_.listen(net::socket_base::max_listen_connections, ec);
        if (ec) throw std::runtime_error("Failed to listen: " + ec.message());
    }

    void run() {
        doAccept();
    }

private:
    net::io_context& ioc_;
    tcp::acceptor    acceptor_;
    std::shared_ptr<Server::Impl> server_;

    void doAccept() {
        acceptor_.async_accept(
            net::make_strand(ioc_),
            beast::bind_front_handler(&HttpListener::onAccept, shared_from_this())
        );
    }

    void onAccept(beast::error_code ec, tcp::socket socket) {
        if (ec == net::error::operation_aborted) return;
        if (ec) {
            console::warn("Accept failed:", ec.message());
        } else {
            auto session = std::make_shared<HttpSession>(std::move(socket), server_);
            if (!server_->addSession(session.get())) return;
            try {
                std::thread([session]() { session->run(); }).detach();
            } catch (const std::system_error& e) {
                server_->removeSession(session.get());
                console::warn("Cannot start session thread:", e.what());
            }
        }
        doAccept();
    }
};

// ═══════════════════════════════════════════
//  Session bookkeeping
// ═══════════════════════════════════════════

bool Server::Impl::addSession(HttpSession* session) {
    std::lock_guard<std::mutex> lock(sessionsMutex);
    if (closing) return false;
    sessions.insert(session);
    return true;
}

void Server::Impl::removeSession(HttpSession* session) {
    std::lock_guard<std::mutex> lock(sessionsMutex);
    sessions.erase(session);
    if (sessions.empty()) sessionsDrained.notify_all();
}

// A session leaves the set before its socket is destroyed, so every
// pointer seen here is alive
void Server::Impl::closeSessions() {
    std::lock_guard<std::mutex> lock(sessionsMutex);
    closing = true;
    for (auto* session : sessions) session->cancel();
}

// ═══════════════════════════════════════════
//  Server — Public API implementation
// ═══════════════════════════════════════════

Server::Server(ServerOptions options)
    : impl_(std::make_shared<Impl>())
{
    impl_->options = options;
}

Server::~Server() {
    if (!impl_) return;
    close();
    waitForSessions();
}

Server::Server(Server&&) noexcept = default;
Server& Server::operator=(Server&&) noexcept = default;

Server& Server::use(MiddlewareFunction middleware) {
    impl_->middlewares.push_back(std::move(middleware));
    return *this;
}

void Server::addRoute(const std::string& method,
                       const std::string& pattern,
                       RouteHandler handler) {
    impl_->routes.push_back(
        detail::compileRoute(method, pattern, std::move(handler))
    );
}

void Server::handleRequest(Request& req, Response& res) {
    impl_->handleRequest(req, res);
}

void Server::listen(const std::string& host, int port, std::function<void()> callback) {
    net::io_context* ioc = nullptr;
    {
        std::lock_guard<std::mutex> lock(impl_->iocMutex);
        impl_->ioc = std::make_unique<net::io_context>(1);
        ioc = impl_->ioc.get();
    }

    auto address  = net::ip::make_address(host);
    auto endpoint = tcp::endpoint(address, static_cast<unsigned short>(port));

    auto httpListener = std::make_shared<HttpListener>(*ioc, endpoint, impl_);
    httpListener->run();

    {
        std::lock_guard<std::mutex> lock(impl_->iocMutex);
        impl_->running = true;
    }

    if (callback) {
        callback();
    }

    // Block on the accept loop; sessions run on their own threads
    ioc->run();
}

void Server::close() {
    {
        std::lock_guard<std::mutex> lock(impl_->iocMutex);
        if (impl_->ioc && impl_->running) {
            impl_->running = false;
            impl_->ioc->stop();
        }
    }
    impl_->closeSessions();
}

void Server::waitForSessions() {
    std::unique_lock<std::mutex> lock(impl_->sessionsMutex);
    impl_->sessionsDrained.wait(lock, [this] { return impl_->sessions.empty(); });
}

std::size_t Server::activeSessions() const {
    std::lock_guard<std::mutex> lock(impl_->sessionsMutex);
    return impl_->sessions.size();
}

} // namespace peerlink::http
