#pragma once

#include "engine/engine_events.hpp"
#include "execution/execution_gateway.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/ssl/context.hpp>
#include <spdlog/logger.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

namespace ramm {

class SessionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct SessionConfig {
    std::string host     = "localhost:8080";   // host[:port]
    std::string name;                          // team / client name
    std::string password;                      // optional X-Team-Password
    std::string scenario = "normal_market";
    bool        secure   = false;              // https / wss, peer not verified
};

struct SessionCredentials {
    std::string token;
    std::string run_id;
};

struct Endpoint {
    std::string host;
    std::string port;
};

// Splits "host[:port]", defaulting the port to 443 when secure, else 80.
Endpoint split_endpoint(const std::string& host, bool secure);

// GET /api/replays/<scenario>/start. Throws SessionError on transport
// failure, a non-200 status, or a response without token and run_id.
SessionCredentials register_session(const SessionConfig& config);

// Parses the registration response body. Throws SessionError.
SessionCredentials parse_credentials(const std::string& body);

// Market and order WebSockets driven by one io_context worker thread.
// Inbound messages become engine events; outbound writes are queued on the
// order channel's strand.
class ExchangeSession : public IExecutionGateway {
public:
    class Channel;

    // Upper bound on waiting for the server's close frames in stop().
    static constexpr std::chrono::seconds kCloseGrace{2};

    ExchangeSession(SessionConfig config, SessionCredentials credentials,
                    EngineEventQueue& events);
    ~ExchangeSession() override;

    ExchangeSession(const ExchangeSession&) = delete;
    ExchangeSession& operator=(const ExchangeSession&) = delete;

    // Connects both channels and starts the worker. Throws SessionError.
    void start();
    // Closes both channels and joins the worker once both report closed,
    // or after kCloseGrace.
    void stop();

    void send_order(const OrderRecord& order) override;
    void cancel_order(const std::string& order_id) override;
    void signal_done() override;

private:
    void on_market_message(const std::string& text);
    void on_order_message(const std::string& text);
    void on_channel_closed(const std::string& channel, const std::string& reason, bool error);

    SessionConfig      config_;
    SessionCredentials credentials_;
    EngineEventQueue&  events_;

    boost::asio::io_context  ioc_;
    boost::asio::steady_timer close_grace_;
    boost::asio::ssl::context ssl_ctx_;
    std::unique_ptr<Channel> market_;
    std::unique_ptr<Channel> orders_;
    std::thread              worker_;
    std::atomic<bool>        disconnected_{false};
    int                      channels_open_ = 0;   // worker thread only once started

    std::shared_ptr<spdlog::logger> log_;
};

} // namespace ramm
