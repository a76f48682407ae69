// ═══════════════════════════════════════════════════════════════════
//  peerlink_fetch.cpp — Fetch an offer straight from its listener
// ═══════════════════════════════════════════════════════════════════
//
//  peerlink_fetch <code> [output] [--host 127.0.0.1] [--timeout-ms 5000]
//
//  Talks to the loopback listener directly, bypassing the HTTP front
//  end. Without a broker record the output name falls back to
//  "downloaded".
//
// ═══════════════════════════════════════════════════════════════════

#include <peerlink/bridge.h>
#include <peerlink/broker.h>
#include <peerlink/console.h>
#include <peerlink/errors.h>

#include <chrono>
#include <cstdint>
#include <exception>
#include <fstream>
#include <string>
#include <vector>

using namespace peerlink;

namespace {

int usage() {
    console::error("usage: peerlink_fetch <code> [output] [--host H] [--timeout-ms N]");
    return 2;
}

} // namespace

int main(int argc, char** argv) {
    std::vector<std::string> positional;
    BridgeOptions options;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--host" && i + 1 < argc) {
            options.host = argv[++i];
        } else if (arg == "--timeout-ms" && i + 1 < argc) {
            try {
                options.connectTimeout = std::chrono::milliseconds(std::stoi(argv[++i]));
            } catch (const std::exception&) {
                return usage();
            }
        } else if (!arg.empty() && arg[0] == '-') {
            return usage();
        } else {
            positional.push_back(arg);
        }
    }
    if (positional.empty() || positional.size() > 2) return usage();

    std::uint32_t code = 0;
    try {
        std::size_t used = 0;
        code = static_cast<std::uint32_t>(std::stoul(positional[0], &used));
        if (used != positional[0].size()) return usage();
    } catch (const std::exception&) {
        return usage();
    }

    // No shared broker in this process: every in-range code is attempted
    CodeBroker broker;
    RetrievalBridge bridge(broker, options);

    try {
        auto stream = bridge.open(code);
        auto output = positional.size() > 1 ? positional[1] : stream.filename();

        std::ofstream out(output, std::ios::binary | std::ios::trunc);
        if (!out) {
            console::error("Cannot create", output);
            return 1;
        }

        std::vector<char> buffer(16 * 1024);
        while (auto n = stream.read(buffer.data(), buffer.size())) {
            out.write(buffer.data(), static_cast<std::streamsize>(n));
            if (!out) {
                console::error("Write to", output, "failed");
                return 1;
            }
        }
        console::success("Saved", stream.bytesRead(), "bytes to", output);
    } catch (const Error& e) {
        console::error(std::string(to_string(e.kind())) + ":", e.what());
        return 1;
    }
    return 0;
}
