// ═══════════════════════════════════════════════════════════════════
//  src/transfer.cpp — TransferListener over blocking Boost.Asio sockets
// ═══════════════════════════════════════════════════════════════════

#include "peerlink/transfer.h"
#include "peerlink/console.h"
#include "peerlink/errors.h"

#include <utility>  // boost/asio/awaitable.hpp uses std::exchange without including it
#include <boost/asio.hpp>

#include <fstream>
#include <vector>

namespace peerlink {

namespace net = boost::asio;
using tcp     = net::ip::tcp;

namespace {

// Revokes the code on every exit path out of serve()
class RevokeGuard {
public:
    RevokeGuard(CodeBroker& broker, std::uint16_t code) : broker_(broker), code_(code) {}
    ~RevokeGuard() {
        if (broker_.revoke(code_)) {
            console::debug("Revoked code", code_);
        }
    }

    RevokeGuard(const RevokeGuard&) = delete;
    RevokeGuard& operator=(const RevokeGuard&) = delete;

private:
    CodeBroker&   broker_;
    std::uint16_t code_;
};

// Closes with RST so the downloader sees an error instead of a clean EOF
void abortConnection(tcp::socket& socket) {
    boost::system::error_code ec;
    socket.set_option(net::socket_base::linger(true, 0), ec);
    socket.close(ec);
}

} // namespace

TransferListener::TransferListener(CodeBroker& broker, ListenerOptions options)
    : broker_(broker)
    , options_(std::move(options))
{
    if (options_.bufferBytes == 0) options_.bufferBytes = 16 * 1024;
}

void TransferListener::notify(std::uint16_t code, ListenerState state) const {
    console::debug("Listener", code, "->", to_string(state));
    if (options_.onStateChange) options_.onStateChange(code, state);
}

std::uint64_t TransferListener::serve(std::uint16_t code, std::stop_token stop) {
    auto path = broker_.lookup(code);
    if (!path) throw NotRegistered(code);

    RevokeGuard guard(broker_, code);
    notify(code, ListenerState::Registered);

    try {
        std::ifstream in(*path, std::ios::binary);
        if (!in) throw TransferIOError("cannot open artifact " + *path);

        // ── Bind ──
        net::io_context ioc;
        tcp::acceptor acceptor(ioc);
        boost::system::error_code ec;
        tcp::endpoint endpoint;
        try {
            endpoint = tcp::endpoint(net::ip::make_address(options_.host), code);
        } catch (const boost::system::system_error& e) {
            throw BindFailure(code, e.code().message());
        }

        acceptor.open(endpoint.protocol(), ec);
        if (!ec) acceptor.set_option(net::socket_base::reuse_address(true), ec);
        if (!ec) acceptor.bind(endpoint, ec);
        if (!ec) acceptor.listen(1, ec);
        if (ec) throw BindFailure(code, ec.message());

        notify(code, ListenerState::Listening);
        console::info("Offer", code, "listening on", options_.host + ":" + std::to_string(code));

        // ── Accept exactly one peer ──
        tcp::socket socket(ioc);
        {
            std::stop_callback onStop(stop, [&ioc, &acceptor] {
                net::post(ioc, [&acceptor] {
                    boost::system::error_code ignored;
                    acceptor.close(ignored);
                });
            });
            ec = net::error::would_block;
            acceptor.async_accept(socket, [&ec](const boost::system::error_code& result) {
                ec = result;
            });
            ioc.run();
        }
        if (ec == net::error::operation_aborted) {
            throw TransferIOError("listener for code " + std::to_string(code) + " cancelled");
        }
        if (ec) throw TransferIOError("accept failed on code " + std::to_string(code) + ": " + ec.message());
        acceptor.close(ec);

        notify(code, ListenerState::Transferring);

        // ── Copy ──
        std::uint64_t sent = 0;
        std::vector<char> buffer(options_.bufferBytes);
        try {
            while (in) {
                in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                auto got = static_cast<std::size_t>(in.gcount());
                if (in.bad()) throw TransferIOError("read failed on " + *path);
                if (got == 0) break;

                net::write(socket, net::buffer(buffer.data(), got), ec);
                if (ec) {
                    throw TransferIOError("transfer of code " + std::to_string(code)
                                          + " interrupted after " + std::to_string(sent)
                                          + " bytes: " + ec.message());
                }
                sent += got;
            }
        } catch (const TransferIOError&) {
            abortConnection(socket);
            throw;
        }

        socket.shutdown(tcp::socket::shutdown_send, ec);
        socket.close(ec);

        notify(code, ListenerState::Completed);
        console::success("Offer", code, "delivered", sent, "bytes");
        return sent;
    } catch (const Error& e) {
        console::error("Offer", code, "failed:", e.what());
        notify(code, ListenerState::Failed);
        throw;
    }
}

} // namespace peerlink
