#include "wire/exchange_session.hpp"
#include "common/logging.hpp"
#include "config/json_value.hpp"
#include "wire/message_codec.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include <chrono>
#include <deque>
#include <functional>

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace ramm {

namespace {

constexpr const char* kUserAgent = "regime_bot/" BOOST_BEAST_VERSION_STRING;
constexpr auto kConnectTimeout = std::chrono::seconds(10);

void set_sni(beast::ssl_stream<beast::tcp_stream>& stream, const std::string& host) {
    if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
        beast::error_code ec(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());
        throw beast::system_error(ec);
    }
}

// Plain TCP needs no transport handshake.
void transport_handshake(websocket::stream<beast::tcp_stream>& /*ws*/, const std::string& /*host*/) {}

void transport_handshake(websocket::stream<beast::ssl_stream<beast::tcp_stream>>& ws,
                         const std::string& host) {
    set_sni(ws.next_layer(), host);
    ws.next_layer().handshake(ssl::stream_base::client);
}

template<class Stream>
http::response<http::string_body> perform(Stream& stream, const http::request<http::empty_body>& req) {
    http::write(stream, req);
    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(stream, buffer, res);
    return res;
}

} // anonymous namespace

// --- Channel ---

class ExchangeSession::Channel {
public:
    using MessageCb = std::function<void(const std::string&)>;
    using CloseCb   = std::function<void(const std::string& reason, bool error)>;

    virtual ~Channel() = default;

    // Synchronous connect + handshake. Throws beast::system_error.
    virtual void connect(const Endpoint& ep, const std::string& target) = 0;
    virtual void start_reading(MessageCb on_message, CloseCb on_close) = 0;
    virtual void send(std::string msg) = 0;
    virtual void close() = 0;
};

namespace {

template<class WsStream>
class WsChannel : public ExchangeSession::Channel {
public:
    template<class... Args>
    WsChannel(net::io_context& ioc, std::shared_ptr<spdlog::logger> log, Args&&... args)
        : strand_(net::make_strand(ioc)),
          ws_(strand_, std::forward<Args>(args)...),
          log_(std::move(log)) {}

    void connect(const Endpoint& ep, const std::string& target) override {
        tcp::resolver resolver(strand_);
        auto results = resolver.resolve(ep.host, ep.port);
        beast::get_lowest_layer(ws_).connect(results);

        transport_handshake(ws_, ep.host);

        ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        ws_.set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
            req.set(http::field::user_agent, kUserAgent);
        }));
        ws_.handshake(ep.host + ":" + ep.port, target);
        ws_.text(true);
    }

    void start_reading(MessageCb on_message, CloseCb on_close) override {
        on_message_ = std::move(on_message);
        on_close_   = std::move(on_close);
        net::post(strand_, [this] { do_read(); });
    }

    void send(std::string msg) override {
        net::post(strand_, [this, m = std::move(msg)]() mutable {
            if (closed_) return;
            write_queue_.emplace_back(std::move(m));
            if (write_queue_.size() == 1) {
                do_write();
            }
        });
    }

    void close() override {
        net::post(strand_, [this] {
            if (closed_ || !ws_.is_open()) return;
            ws_.async_close(websocket::close_code::normal, [this](beast::error_code ec) {
                if (ec) log_->debug("close: {}", ec.message());
            });
        });
    }

private:
    void do_read() {
        ws_.async_read(buf_, [this](beast::error_code ec, std::size_t) { on_read(ec); });
    }

    void on_read(beast::error_code ec) {
        if (ec) {
            fail(ec);
            return;
        }
        std::string payload = beast::buffers_to_string(buf_.data());
        buf_.consume(buf_.size());
        if (on_message_) on_message_(payload);
        do_read();
    }

    void do_write() {
        if (write_queue_.empty()) return;
        ws_.async_write(net::buffer(write_queue_.front()),
            [this](beast::error_code ec, std::size_t) {
                if (ec) {
                    fail(ec);
                    return;
                }
                write_queue_.pop_front();
                if (!write_queue_.empty()) do_write();
            });
    }

    void fail(beast::error_code ec) {
        if (closed_) return;
        closed_ = true;
        write_queue_.clear();
        bool error = ec != websocket::error::closed && ec != net::error::operation_aborted;
        if (on_close_) on_close_(ec.message(), error);
    }

    net::strand<net::io_context::executor_type> strand_;
    WsStream ws_;
    beast::flat_buffer buf_;
    std::deque<std::string> write_queue_;
    bool closed_ = false;

    MessageCb on_message_;
    CloseCb   on_close_;
    std::shared_ptr<spdlog::logger> log_;
};

using PlainChannel = WsChannel<websocket::stream<beast::tcp_stream>>;
using TlsChannel   = WsChannel<websocket::stream<beast::ssl_stream<beast::tcp_stream>>>;

} // anonymous namespace

// --- Registration ---

Endpoint split_endpoint(const std::string& host, bool secure) {
    auto colon = host.rfind(':');
    if (colon == std::string::npos || colon + 1 == host.size()) {
        return Endpoint{host.substr(0, colon), secure ? "443" : "80"};
    }
    return Endpoint{host.substr(0, colon), host.substr(colon + 1)};
}

SessionCredentials parse_credentials(const std::string& body) {
    JsonValue root;
    try {
        root = parse_json(body);
    } catch (const ParseError& e) {
        throw SessionError(std::string("registration response is not JSON: ") + e.what());
    }

    SessionCredentials creds{root.get_string("token"), root.get_string("run_id")};
    if (creds.token.empty() || creds.run_id.empty()) {
        throw SessionError("registration response is missing token or run_id");
    }
    return creds;
}

SessionCredentials register_session(const SessionConfig& config) {
    auto log = get_logger("session");
    const Endpoint ep = split_endpoint(config.host, config.secure);
    const std::string target = "/api/replays/" + config.scenario + "/start";

    http::request<http::empty_body> req{http::verb::get, target, 11};
    req.set(http::field::host, ep.host);
    req.set(http::field::user_agent, kUserAgent);
    req.set(http::field::authorization, "Bearer " + config.name);
    if (!config.password.empty()) {
        req.set("X-Team-Password", config.password);
    }

    log->info("registering '{}' for scenario '{}' at {}://{}:{}",
              config.name, config.scenario, config.secure ? "https" : "http", ep.host, ep.port);

    http::response<http::string_body> res;
    try {
        net::io_context ioc;
        tcp::resolver resolver(ioc);
        auto results = resolver.resolve(ep.host, ep.port);

        if (config.secure) {
            ssl::context ctx(ssl::context::tls_client);
            ctx.set_verify_mode(ssl::verify_none);
            beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
            set_sni(stream, ep.host);
            beast::get_lowest_layer(stream).expires_after(kConnectTimeout);
            beast::get_lowest_layer(stream).connect(results);
            stream.handshake(ssl::stream_base::client);
            res = perform(stream, req);

            beast::error_code ec;
            stream.shutdown(ec);
            if (ec && ec != net::ssl::error::stream_truncated) {
                log->debug("tls shutdown: {}", ec.message());
            }
        } else {
            beast::tcp_stream stream(ioc);
            stream.expires_after(kConnectTimeout);
            stream.connect(results);
            res = perform(stream, req);

            beast::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
            if (ec && ec != beast::errc::not_connected) {
                log->debug("socket shutdown: {}", ec.message());
            }
        }
    } catch (const beast::system_error& e) {
        throw SessionError(std::string("registration failed: ") + e.what());
    }

    if (res.result() != http::status::ok) {
        throw SessionError("registration rejected (HTTP " +
                           std::to_string(res.result_int()) + "): " + res.body());
    }

    auto creds = parse_credentials(res.body());
    log->info("registered, run id {}", creds.run_id);
    return creds;
}

// --- ExchangeSession ---

ExchangeSession::ExchangeSession(SessionConfig config, SessionCredentials credentials,
                                 EngineEventQueue& events)
    : config_(std::move(config)),
      credentials_(std::move(credentials)),
      events_(events),
      close_grace_(ioc_),
      ssl_ctx_(ssl::context::tls_client),
      log_(get_logger("session")) {
    // Replay servers commonly run with self-signed certificates.
    ssl_ctx_.set_verify_mode(ssl::verify_none);

    if (config_.secure) {
        market_ = std::make_unique<TlsChannel>(ioc_, log_, ssl_ctx_);
        orders_ = std::make_unique<TlsChannel>(ioc_, log_, ssl_ctx_);
    } else {
        market_ = std::make_unique<PlainChannel>(ioc_, log_);
        orders_ = std::make_unique<PlainChannel>(ioc_, log_);
    }
}

ExchangeSession::~ExchangeSession() {
    stop();
}

void ExchangeSession::start() {
    const Endpoint ep = split_endpoint(config_.host, config_.secure);
    const std::string market_target = "/api/ws/market?run_id=" + credentials_.run_id;
    const std::string order_target = "/api/ws/orders?token=" + credentials_.token +
                                     "&run_id=" + credentials_.run_id;

    try {
        market_->connect(ep, market_target);
        log_->info("market data connected");
        orders_->connect(ep, order_target);
        log_->info("order entry connected");
    } catch (const beast::system_error& e) {
        throw SessionError(std::string("websocket connect failed: ") + e.what());
    }

    channels_open_ = 2;
    market_->start_reading(
        [this](const std::string& text) { on_market_message(text); },
        [this](const std::string& reason, bool error) { on_channel_closed("market", reason, error); });
    orders_->start_reading(
        [this](const std::string& text) { on_order_message(text); },
        [this](const std::string& reason, bool error) { on_channel_closed("orders", reason, error); });

    worker_ = std::thread([this] { ioc_.run(); });
}

void ExchangeSession::stop() {
    if (!worker_.joinable()) return;

    market_->close();
    orders_->close();

    // Bound the wait for the server's close frames. The worker returns by
    // itself once both channels are closed and the timer is cancelled.
    net::post(ioc_, [this] {
        if (channels_open_ == 0) return;
        close_grace_.expires_after(kCloseGrace);
        close_grace_.async_wait([this](beast::error_code ec) {
            if (!ec) ioc_.stop();
        });
    });

    worker_.join();
}

void ExchangeSession::send_order(const OrderRecord& order) {
    orders_->send(encode_order(order));
}

void ExchangeSession::cancel_order(const std::string& order_id) {
    orders_->send(encode_cancel(order_id));
}

void ExchangeSession::signal_done() {
    orders_->send(encode_done());
}

void ExchangeSession::on_market_message(const std::string& text) {
    InboundMessage msg;
    try {
        msg = decode_market_message(text);
    } catch (const ParseError& e) {
        log_->warn("skipping market message: {}", e.what());
        return;
    }

    switch (msg.kind) {
        case InboundMessage::Kind::MarketData:
            events_.push(SnapshotEvent{std::move(msg.snapshot), std::chrono::steady_clock::now()});
            break;
        case InboundMessage::Kind::Connected:
            log_->debug("market channel acknowledged");
            break;
        default:
            log_->debug("ignoring market message type '{}'", msg.text);
            break;
    }
}

void ExchangeSession::on_order_message(const std::string& text) {
    InboundMessage msg;
    try {
        msg = decode_order_message(text);
    } catch (const ParseError& e) {
        log_->warn("skipping order message: {}", e.what());
        return;
    }

    switch (msg.kind) {
        case InboundMessage::Kind::Fill:
            events_.push(FillEvent{std::move(msg.fill)});
            break;
        case InboundMessage::Kind::Error:
            events_.push(ErrorEvent{std::move(msg.text)});
            break;
        case InboundMessage::Kind::Authenticated:
            events_.push(AuthenticatedEvent{});
            break;
        default:
            log_->debug("ignoring order message type '{}'", msg.text);
            break;
    }
}

void ExchangeSession::on_channel_closed(const std::string& channel, const std::string& reason,
                                        bool error) {
    if (error) {
        log_->error("{} channel failed: {}", channel, reason);
    } else {
        log_->info("{} channel closed: {}", channel, reason);
    }
    if (!disconnected_.exchange(true)) {
        events_.push(DisconnectedEvent{channel + ": " + reason, error});
    }
    if (--channels_open_ == 0) {
        close_grace_.cancel();
    }
}

} // namespace ramm
