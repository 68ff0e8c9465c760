#include "local_ws_server.hpp"
#include "tool_dispatcher.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <unistd.h>
#include <thread>

using json = nlohmann::json;
using tcp = boost::asio::ip::tcp;
namespace websocket = boost::beast::websocket;

namespace {

class LocalWSServerTest : public ::testing::Test {
protected:
    LocalWSServerTest() : service_(sink_, config()), tools_(service_), server_(tools_, 2) {}

    static ServiceConfig config() {
        ServiceConfig cfg;
        cfg.run_command = sh_runtime("cat");
        return cfg;
    }

    RecordingSink sink_;
    JobService service_;
    ToolDispatcher tools_;
    LocalWSServer server_;
};

// One request over a fresh connection; retries until the listener is up.
json ws_roundtrip(unsigned short port, const std::string& text) {
    boost::asio::io_context ioc;
    tcp::resolver resolver{ioc};
    for (int attempt = 0;; ++attempt) {
        try {
            websocket::stream<tcp::socket> ws{ioc};
            auto results = resolver.resolve("127.0.0.1", std::to_string(port));
            boost::asio::connect(ws.next_layer(), results.begin(), results.end());
            ws.handshake("127.0.0.1", "/");
            ws.write(boost::asio::buffer(text));
            boost::beast::flat_buffer buffer;
            ws.read(buffer);
            boost::system::error_code ec;
            ws.close(websocket::close_code::normal, ec);
            return json::parse(boost::beast::buffers_to_string(buffer.data()));
        } catch (const boost::system::system_error&) {
            if (attempt >= 40) throw;
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    }
}

} // namespace

TEST_F(LocalWSServerTest, RejectsMalformedRequests) {
    for (const json& req : {json::parse("{bad", nullptr, false), json::array(), json{{"arguments", json::object()}},
                            json{{"tool", 5}}}) {
        auto resp = server_.process_request(req);
        EXPECT_EQ(resp["ok"], false);
        EXPECT_EQ(resp["error"], "invalid request");
    }
}

TEST_F(LocalWSServerTest, WrapsToolResults) {
    auto ok = server_.process_request({{"tool", "ollama_run"}, {"arguments", {{"model", "m"}, {"prompt", "hi"}}}});
    EXPECT_EQ(ok["ok"], true);
    EXPECT_EQ(ok["result"]["stdout"], "hi\n");

    auto bad = server_.process_request({{"tool", "ollama_run"}, {"arguments", {{"model", ""}, {"prompt", "hi"}}}});
    EXPECT_EQ(bad["ok"], false);
    EXPECT_EQ(bad["error"], "Model name must be a non-empty string");

    auto unknown = server_.process_request({{"tool", "nope"}});
    EXPECT_EQ(unknown["error"], "Unknown tool: nope");
}

TEST_F(LocalWSServerTest, ServesOneRequestPerConnection) {
    const unsigned short port = static_cast<unsigned short>(39000 + ::getpid() % 2000);
    EXPECT_EQ(server_.get_threads(), 2);
    ASSERT_TRUE(server_.start("127.0.0.1", port));
    EXPECT_FALSE(server_.start("127.0.0.1", port));

    auto first = ws_roundtrip(port, R"({"tool":"ollama_run","arguments":{"model":"m","prompt":"over ws"}})");
    EXPECT_EQ(first["ok"], true);
    EXPECT_EQ(first["result"]["stdout"], "over ws\n");

    auto second = ws_roundtrip(port, "not json");
    EXPECT_EQ(second["ok"], false);

    server_.stop();
    EXPECT_EQ(sink_.count(), 1u);
}

TEST_F(LocalWSServerTest, BadListenAddressStopsCleanly) {
    ASSERT_TRUE(server_.start("not-an-address", 39999));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    server_.stop();
    // The listener gave up, so it can be started again.
    EXPECT_TRUE(server_.start("not-an-address", 39999));
    server_.stop();
}
