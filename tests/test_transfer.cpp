// ═══════════════════════════════════════════════════════════════════
//  test_transfer.cpp — Tests for the loopback listener and the bridge
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <peerlink/bridge.h>
#include <peerlink/broker.h>
#include <peerlink/crypto.h>
#include <peerlink/errors.h>
#include <peerlink/transfer.h>

#include <utility>  // boost/asio/awaitable.hpp uses std::exchange without including it
#include <boost/asio.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

using namespace peerlink;
namespace fs  = std::filesystem;
namespace net = boost::asio;
using tcp     = net::ip::tcp;

namespace {

// Asks the kernel for a port nobody is using right now
std::uint16_t freePort() {
    net::io_context ioc;
    tcp::acceptor acceptor(ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
    return acceptor.local_endpoint().port();
}

std::unique_ptr<CodeBroker> brokerHanding(std::uint16_t code) {
    BrokerOptions options;
    options.random = [code] { return static_cast<std::uint32_t>(code); };
    options.attempts = 1;
    return std::make_unique<CodeBroker>(options);
}

// Records every state change and signals once the listener is accepting
class StateRecorder {
public:
    ListenerOptions options() {
        ListenerOptions opts;
        opts.onStateChange = [this](std::uint16_t, ListenerState state) {
            std::lock_guard<std::mutex> lock(mutex_);
            states_.push_back(state);
            if (state == ListenerState::Listening) listening_.set_value();
        };
        return opts;
    }

    bool waitListening(std::chrono::seconds timeout = std::chrono::seconds(5)) {
        return future_.wait_for(timeout) == std::future_status::ready;
    }

    std::vector<ListenerState> states() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return states_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<ListenerState> states_;
    std::promise<void> listening_;
    std::future<void> future_ = listening_.get_future();
};

class TransferTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() / ("peerlink-transfer-" + crypto::uuid());
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path write(const std::string& name, const std::string& content) {
        auto path = dir_ / name;
        std::ofstream(path, std::ios::binary) << content;
        return path;
    }

    fs::path dir_;
};

} // namespace

TEST_F(TransferTest, DeliversFileAndRevokesCode) {
    std::string content(100000, '\0');
    for (std::size_t i = 0; i < content.size(); ++i) content[i] = static_cast<char>(i * 7);

    auto port = freePort();
    auto broker = brokerHanding(port);
    auto code = broker->registerArtifact(write("report.bin", content).string());
    ASSERT_EQ(code, port);

    StateRecorder recorder;
    TransferListener listener(*broker, recorder.options());
    auto served = std::async(std::launch::async, [&] { return listener.serve(code); });
    ASSERT_TRUE(recorder.waitListening());

    RetrievalBridge bridge(*broker);
    auto stream = bridge.open(code);
    EXPECT_EQ(stream.filename(), "report.bin");
    EXPECT_EQ(stream.code(), code);

    std::string received;
    char buf[4096];
    while (auto n = stream.read(buf, sizeof(buf))) received.append(buf, n);

    EXPECT_EQ(served.get(), content.size());
    EXPECT_EQ(received, content);
    EXPECT_EQ(stream.bytesRead(), content.size());
    EXPECT_FALSE(broker->lookup(code).has_value());

    EXPECT_EQ(recorder.states(), (std::vector<ListenerState>{
        ListenerState::Registered, ListenerState::Listening,
        ListenerState::Transferring, ListenerState::Completed}));

    // A consumed code has nothing behind it any more
    EXPECT_THROW(bridge.open(code), NotRegistered);
}

TEST_F(TransferTest, EmptyFileDeliversCleanEof) {
    auto port = freePort();
    auto broker = brokerHanding(port);
    auto code = broker->registerArtifact(write("empty.txt", "").string());

    StateRecorder recorder;
    TransferListener listener(*broker, recorder.options());
    auto served = std::async(std::launch::async, [&] { return listener.serve(code); });
    ASSERT_TRUE(recorder.waitListening());

    RetrievalBridge bridge(*broker);
    std::string received;
    auto n = bridge.fetch(code, [&](const char* data, std::size_t size) { received.append(data, size); });

    EXPECT_EQ(served.get(), 0u);
    EXPECT_EQ(n, 0u);
    EXPECT_TRUE(received.empty());
}

TEST_F(TransferTest, PeerResetMidCopyFailsTransfer) {
    // Large enough that the listener is still writing when the peer resets
    std::string content(64 * 1024 * 1024, 'z');
    auto port = freePort();
    auto broker = brokerHanding(port);
    auto code = broker->registerArtifact(write("huge.bin", content).string());
    content.clear();

    StateRecorder recorder;
    TransferListener listener(*broker, recorder.options());
    auto served = std::async(std::launch::async, [&] { return listener.serve(code); });
    ASSERT_TRUE(recorder.waitListening());

    {
        net::io_context ioc;
        tcp::socket peer(ioc);
        peer.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), code));
        std::vector<char> chunk(64 * 1024);
        net::read(peer, net::buffer(chunk));
        peer.set_option(net::socket_base::linger(true, 0));
        peer.close();
    }

    EXPECT_THROW(served.get(), TransferIOError);
    EXPECT_FALSE(broker->lookup(code).has_value());
    EXPECT_EQ(recorder.states().back(), ListenerState::Failed);

    RetrievalBridge bridge(*broker);
    EXPECT_THROW(bridge.open(code), NotRegistered);
}

TEST_F(TransferTest, ListenerResetSurfacesAsReadError) {
    auto port = freePort();
    CodeBroker broker;

    // A fake listener that sends a little and then resets
    std::promise<void> ready;
    std::thread fake([&] {
        net::io_context ioc;
        tcp::acceptor acceptor(ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), port));
        ready.set_value();
        auto socket = acceptor.accept();
        net::write(socket, net::buffer(std::string("partial")));
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        socket.set_option(net::socket_base::linger(true, 0));
        socket.close();
    });
    ready.get_future().wait();

    RetrievalBridge bridge(broker);
    auto stream = bridge.open(port);
    EXPECT_EQ(stream.filename(), "downloaded");

    std::string received;
    char buf[64];
    EXPECT_THROW({
        while (auto n = stream.read(buf, sizeof(buf))) received.append(buf, n);
    }, TransferIOError);
    fake.join();
    EXPECT_EQ(received.substr(0, 7), std::string("partial").substr(0, received.size()));
}

TEST_F(TransferTest, RegisteredCodeWithoutListenerIsConnectTimeout) {
    auto port = freePort();
    auto broker = brokerHanding(port);
    auto code = broker->registerArtifact(write("idle.txt", "idle").string());

    BridgeOptions options;
    options.connectTimeout = std::chrono::milliseconds(300);
    RetrievalBridge bridge(*broker, options);

    auto started = std::chrono::steady_clock::now();
    try {
        bridge.open(code);
        FAIL() << "expected ConnectTimeout";
    } catch (const ConnectTimeout& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ConnectTimeout);
    }
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(3));

    // Nothing was consumed
    EXPECT_TRUE(broker->lookup(code).has_value());
}

TEST_F(TransferTest, HangingConnectTimesOutAtDeadline) {
    // A listener that never accepts, with its backlog already full, leaves
    // further SYNs unanswered so the connect neither completes nor fails
    net::io_context fillerIoc;
    tcp::acceptor stalled(fillerIoc);
    stalled.open(tcp::v4());
    stalled.set_option(tcp::acceptor::reuse_address(true));
    stalled.bind(tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
    stalled.listen(0);
    auto port = stalled.local_endpoint().port();

    std::vector<std::unique_ptr<tcp::socket>> fillers;
    for (int i = 0; i < 4; ++i) {
        fillers.push_back(std::make_unique<tcp::socket>(fillerIoc));
        fillers.back()->async_connect(stalled.local_endpoint(), [](boost::system::error_code) {});
        fillerIoc.restart();
        fillerIoc.run_for(std::chrono::milliseconds(200));
    }

    auto broker = brokerHanding(port);
    auto code = broker->registerArtifact(write("stalled.txt", "stalled").string());

    const auto timeout = std::chrono::milliseconds(400);
    BridgeOptions options;
    options.connectTimeout = timeout;
    RetrievalBridge bridge(*broker, options);

    auto started = std::chrono::steady_clock::now();
    EXPECT_THROW(bridge.open(code), ConnectTimeout);
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_GE(elapsed, timeout - std::chrono::milliseconds(50));
    EXPECT_LT(elapsed, timeout + std::chrono::seconds(2));
    EXPECT_TRUE(broker->lookup(code).has_value());
}

TEST_F(TransferTest, UnknownAndOutOfRangeCodesAreNotRegistered) {
    CodeBroker broker;
    RetrievalBridge bridge(broker);

    EXPECT_THROW(bridge.open(80), NotRegistered);
    EXPECT_THROW(bridge.open(70000), NotRegistered);
    EXPECT_THROW(bridge.open(freePort()), NotRegistered);
}

TEST_F(TransferTest, BusyPortIsBindFailure) {
    net::io_context ioc;
    tcp::acceptor squatter(ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
    auto port = squatter.local_endpoint().port();

    auto broker = brokerHanding(port);
    auto code = broker->registerArtifact(write("busy.txt", "busy").string());

    StateRecorder recorder;
    TransferListener listener(*broker, recorder.options());
    EXPECT_THROW(listener.serve(code), BindFailure);
    EXPECT_FALSE(broker->lookup(code).has_value());
    EXPECT_EQ(recorder.states(), (std::vector<ListenerState>{
        ListenerState::Registered, ListenerState::Failed}));
}

TEST_F(TransferTest, MissingArtifactFailsBeforeBinding) {
    auto port = freePort();
    auto broker = brokerHanding(port);
    auto code = broker->registerArtifact((dir_ / "vanished.bin").string());

    TransferListener listener(*broker);
    EXPECT_THROW(listener.serve(code), TransferIOError);
    EXPECT_FALSE(broker->lookup(code).has_value());
}

TEST_F(TransferTest, ServeUnknownCodeIsNotRegistered) {
    CodeBroker broker;
    TransferListener listener(broker);
    EXPECT_THROW(listener.serve(freePort()), NotRegistered);
}

TEST_F(TransferTest, StopRequestCancelsIdleListener) {
    auto port = freePort();
    auto broker = brokerHanding(port);
    auto code = broker->registerArtifact(write("never.txt", "never fetched").string());

    StateRecorder recorder;
    TransferListener listener(*broker, recorder.options());
    std::stop_source stop;
    auto served = std::async(std::launch::async, [&] { return listener.serve(code, stop.get_token()); });
    ASSERT_TRUE(recorder.waitListening());

    stop.request_stop();
    EXPECT_THROW(served.get(), TransferIOError);
    EXPECT_FALSE(broker->lookup(code).has_value());
    EXPECT_EQ(recorder.states().back(), ListenerState::Failed);
}

TEST(HintedFilenameTest, BasenameOrFallback) {
    EXPECT_EQ(RetrievalBridge::hintedFilename(std::string("uploads/abc-report.pdf")), "abc-report.pdf");
    EXPECT_EQ(RetrievalBridge::hintedFilename(std::string("plain")), "plain");
    EXPECT_EQ(RetrievalBridge::hintedFilename(std::nullopt), "downloaded");
    EXPECT_EQ(RetrievalBridge::hintedFilename(std::string("")), "downloaded");
}

TEST(ListenerStateTest, Names) {
    EXPECT_STREQ(to_string(ListenerState::Registered), "registered");
    EXPECT_STREQ(to_string(ListenerState::Transferring), "transferring");
    EXPECT_STREQ(to_string(ListenerState::Failed), "failed");
}
