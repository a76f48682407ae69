// ═══════════════════════════════════════════════════════════════════
//  src/bridge.cpp — RetrievalBridge
// ═══════════════════════════════════════════════════════════════════

#include "peerlink/bridge.h"
#include "peerlink/console.h"
#include "peerlink/errors.h"

#include <utility>  // boost/asio/awaitable.hpp uses std::exchange without including it
#include <boost/asio.hpp>

#include <filesystem>
#include <vector>

namespace peerlink {

namespace net = boost::asio;
using tcp     = net::ip::tcp;

struct RetrievalStream::Impl {
    net::io_context ioc;
    tcp::socket     socket{ioc};
};

RetrievalStream::RetrievalStream(std::unique_ptr<Impl> impl, std::uint16_t code, std::string filename)
    : impl_(std::move(impl))
    , code_(code)
    , filename_(std::move(filename))
{
}

RetrievalStream::~RetrievalStream() { close(); }
RetrievalStream::RetrievalStream(RetrievalStream&&) noexcept = default;
RetrievalStream& RetrievalStream::operator=(RetrievalStream&&) noexcept = default;

std::size_t RetrievalStream::read(char* dst, std::size_t max) {
    if (!impl_ || !impl_->socket.is_open() || max == 0) return 0;

    boost::system::error_code ec;
    auto n = impl_->socket.read_some(net::buffer(dst, max), ec);
    if (ec == net::error::eof) {
        close();
        return 0;
    }
    if (ec) {
        close();
        throw TransferIOError("transfer of code " + std::to_string(code_)
                              + " broke after " + std::to_string(bytesRead_)
                              + " bytes: " + ec.message());
    }
    bytesRead_ += n;
    return n;
}

void RetrievalStream::close() {
    if (!impl_) return;
    boost::system::error_code ec;
    impl_->socket.close(ec);
}

// ═══════════════════════════════════════════
//  RetrievalBridge
// ═══════════════════════════════════════════

RetrievalBridge::RetrievalBridge(const CodeBroker& broker, BridgeOptions options)
    : broker_(broker)
    , options_(std::move(options))
{
}

std::string RetrievalBridge::hintedFilename(const std::optional<std::string>& artifactPath) {
    if (!artifactPath) return "downloaded";
    auto name = std::filesystem::path(*artifactPath).filename().string();
    return name.empty() ? "downloaded" : name;
}

RetrievalStream RetrievalBridge::open(std::uint32_t code) const {
    if (!broker_.inRange(code)) throw NotRegistered(code);
    auto port = static_cast<std::uint16_t>(code);

    auto filename = hintedFilename(broker_.lookup(port));

    auto impl = std::make_unique<RetrievalStream::Impl>();
    boost::system::error_code ec;
    tcp::endpoint endpoint;
    try {
        endpoint = tcp::endpoint(net::ip::make_address(options_.host), port);
    } catch (const boost::system::system_error& e) {
        throw ConnectTimeout(port, e.code().message());
    }

    // ── Connect with a deadline ──
    ec = net::error::would_block;
    impl->socket.async_connect(endpoint, [&ec](const boost::system::error_code& result) {
        ec = result;
    });
    impl->ioc.run_for(options_.connectTimeout);
    if (!impl->ioc.stopped()) {
        boost::system::error_code ignored;
        impl->socket.close(ignored);
        impl->ioc.run();
        ec = net::error::timed_out;
    }

    if (ec) {
        boost::system::error_code ignored;
        impl->socket.close(ignored);
        // Looked up again: the listener may have finished while we were connecting
        if (broker_.lookup(port)) {
            console::warn("Code", port, "is registered but unreachable:", ec.message());
            throw ConnectTimeout(port, ec.message());
        }
        throw NotRegistered(port);
    }

    console::debug("Connected to listener", port, "for", filename);
    return RetrievalStream(std::move(impl), port, std::move(filename));
}

std::uint64_t RetrievalBridge::fetch(std::uint32_t code, const Sink& sink,
                                     std::size_t bufferBytes) const {
    auto stream = open(code);
    std::vector<char> buffer(bufferBytes == 0 ? 16 * 1024 : bufferBytes);
    while (auto n = stream.read(buffer.data(), buffer.size())) {
        sink(buffer.data(), n);
    }
    return stream.bytesRead();
}

} // namespace peerlink
