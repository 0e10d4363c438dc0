#include <gtest/gtest.h>
#include "wire/exchange_session.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <chrono>
#include <thread>
#include <vector>

using namespace ramm;

namespace {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

// Accepts the market and order WebSockets and answers their close
// handshakes. Sends nothing.
class LocalReplayServer {
public:
    LocalReplayServer()
        : acceptor_(ioc_, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0)),
          port_(acceptor_.local_endpoint().port()) {
        thread_ = std::thread([this] { serve(); });
    }
    ~LocalReplayServer() { thread_.join(); }

    std::string host() const { return "127.0.0.1:" + std::to_string(port_); }

private:
    void serve() {
        std::vector<std::thread> clients;
        for (int i = 0; i < 2; ++i) {
            beast::error_code ec;
            tcp::socket socket(ioc_);
            acceptor_.accept(socket, ec);
            if (ec) break;
            clients.emplace_back([s = std::move(socket)]() mutable { read_until_closed(std::move(s)); });
        }
        for (auto& t : clients) t.join();
    }

    static void read_until_closed(tcp::socket socket) {
        websocket::stream<tcp::socket> ws(std::move(socket));
        beast::error_code ec;
        ws.accept(ec);
        beast::flat_buffer buf;
        while (!ec) {
            ws.read(buf, ec);
            buf.consume(buf.size());
        }
    }

    net::io_context ioc_;
    tcp::acceptor   acceptor_;
    unsigned short  port_;
    std::thread     thread_;
};

} // namespace

TEST(ExchangeSessionTest, SplitsHostAndPort) {
    auto ep = split_endpoint("localhost:8080", false);
    EXPECT_EQ(ep.host, "localhost");
    EXPECT_EQ(ep.port, "8080");

    ep = split_endpoint("replay.example.com", true);
    EXPECT_EQ(ep.host, "replay.example.com");
    EXPECT_EQ(ep.port, "443");

    ep = split_endpoint("replay.example.com", false);
    EXPECT_EQ(ep.port, "80");

    ep = split_endpoint("replay.example.com:", true);
    EXPECT_EQ(ep.host, "replay.example.com");
    EXPECT_EQ(ep.port, "443");
}

TEST(ExchangeSessionTest, ParsesCredentials) {
    auto creds = parse_credentials(R"({"token": "abc123", "run_id": "run-7", "extra": 1})");
    EXPECT_EQ(creds.token, "abc123");
    EXPECT_EQ(creds.run_id, "run-7");
}

TEST(ExchangeSessionTest, MissingCredentialFieldsThrow) {
    EXPECT_THROW(parse_credentials(R"({"run_id": "run-7"})"), SessionError);
    EXPECT_THROW(parse_credentials(R"({"token": "abc"})"), SessionError);
    EXPECT_THROW(parse_credentials(R"({"token": "", "run_id": "x"})"), SessionError);
}

TEST(ExchangeSessionTest, NonJsonRegistrationBodyThrows) {
    EXPECT_THROW(parse_credentials("<html>bad gateway</html>"), SessionError);
    EXPECT_THROW(parse_credentials(""), SessionError);
}

TEST(ExchangeSessionTest, UnreachableServerIsSessionError) {
    SessionConfig config;
    config.host = "127.0.0.1:1";
    config.name = "bot";
    EXPECT_THROW(register_session(config), SessionError);
}

TEST(ExchangeSessionTest, StopReturnsOnceBothChannelsClose) {
    LocalReplayServer server;
    SessionConfig config;
    config.host = server.host();
    config.name = "bot";

    EngineEventQueue events;
    ExchangeSession session(config, SessionCredentials{"token", "run-1"}, events);
    session.start();

    auto begin = std::chrono::steady_clock::now();
    session.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - begin, ExchangeSession::kCloseGrace);

    auto ev = events.wait_for_pop(std::chrono::seconds(1));
    ASSERT_TRUE(ev.has_value());
    ASSERT_TRUE(std::holds_alternative<DisconnectedEvent>(*ev));
    EXPECT_FALSE(std::get<DisconnectedEvent>(*ev).error);
}
