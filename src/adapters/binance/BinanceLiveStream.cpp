#include "adapters/binance/BinanceLiveStream.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <exception>
#include <future>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <boost/json.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include "adapters/binance/KlineParser.hpp"
#include "common/Log.hpp"
#include "common/Metrics.hpp"

namespace adapters::binance {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = net::ip::tcp;

namespace {
using csync::log::Category;
namespace metric = csync::common::metrics;

std::string streamName(const domain::SeriesKey& key) {
    std::string lower = key.symbol;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return lower + "@kline_" + binanceInterval(key.granularity);
}

}  // namespace

class BinanceLiveStream::Session : public std::enable_shared_from_this<BinanceLiveStream::Session> {
public:
    using WsStream = websocket::stream<ssl::stream<beast::tcp_stream>>;

    Session(net::io_context& ioc,
            const LiveStreamConfig& config,
            domain::SeriesKey key,
            std::uint64_t generation,
            std::shared_ptr<StreamDelivery> delivery,
            core::ConnectionTracker& tracker)
        : ioc_(ioc),
          config_(config),
          key_(std::move(key)),
          generation_(generation),
          delivery_(std::move(delivery)),
          tracker_(tracker),
          sslCtx_(ssl::context::tls_client),
          resolver_(ioc),
          retryTimer_(ioc) {
        sslCtx_.set_default_verify_paths();
        sslCtx_.set_verify_mode(ssl::verify_peer);
    }

    void start() {
        if (stopped_) {
            return;
        }
        if (!tracker_.beginConnect()) {
            return;
        }
        ws_ = std::make_unique<WsStream>(ioc_, sslCtx_);
        buffer_.clear();

        LOG_INFO(Category::Net,
                 "Live stream connecting to " << config_.host << ":" << config_.port << " for "
                                              << domain::toString(key_));
        resolver_.async_resolve(config_.host,
                                config_.port,
                                [self = shared_from_this()](const beast::error_code& ec,
                                                            tcp::resolver::results_type results) {
                                    self->onResolve_(ec, std::move(results));
                                });
    }

    void stop() {
        stopped_ = true;
        beast::error_code ec;
        retryTimer_.cancel();
        resolver_.cancel();
        if (ws_) {
            beast::get_lowest_layer(*ws_).socket().shutdown(tcp::socket::shutdown_both, ec);
            beast::get_lowest_layer(*ws_).socket().close(ec);
        }
    }

private:
    void onResolve_(const beast::error_code& ec, tcp::resolver::results_type results) {
        if (ec) {
            return fail_(ec, "resolve");
        }
        beast::get_lowest_layer(*ws_).expires_after(std::chrono::seconds(config_.handshakeTimeoutSec));
        beast::get_lowest_layer(*ws_).async_connect(
            results,
            [self = shared_from_this()](const beast::error_code& connectEc, const tcp::endpoint&) {
                self->onConnect_(connectEc);
            });
    }

    void onConnect_(const beast::error_code& ec) {
        if (ec) {
            return fail_(ec, "connect");
        }
        ws_->next_layer().set_verify_callback(ssl::host_name_verification(config_.host));
        if (!::SSL_set_tlsext_host_name(ws_->next_layer().native_handle(), config_.host.c_str())) {
            const beast::error_code sniEc{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
            return fail_(sniEc, "sni");
        }
        beast::get_lowest_layer(*ws_).expires_after(std::chrono::seconds(config_.handshakeTimeoutSec));
        ws_->next_layer().async_handshake(ssl::stream_base::client,
                                          [self = shared_from_this()](const beast::error_code& tlsEc) {
                                              self->onTlsHandshake_(tlsEc);
                                          });
    }

    void onTlsHandshake_(const beast::error_code& ec) {
        if (ec) {
            return fail_(ec, "tls handshake");
        }
        // The websocket stream runs its own timers from here on.
        beast::get_lowest_layer(*ws_).expires_never();

        websocket::stream_base::timeout timeouts{};
        timeouts.handshake_timeout = std::chrono::seconds(config_.handshakeTimeoutSec);
        timeouts.idle_timeout = std::chrono::seconds(config_.idleTimeoutSec);
        timeouts.keep_alive_pings = true;
        ws_->set_option(timeouts);
        ws_->set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
            req.set(beast::http::field::user_agent, "candlesync-live-stream");
        }));

        ws_->async_handshake(config_.host + ":" + config_.port,
                             config_.target,
                             [self = shared_from_this()](const beast::error_code& wsEc) {
                                 self->onWsHandshake_(wsEc);
                             });
    }

    void onWsHandshake_(const beast::error_code& ec) {
        if (ec) {
            return fail_(ec, "websocket handshake");
        }
        subscribeFrame_ = BinanceLiveStream::subscribeMessage(key_, ++requestId_);
        ws_->text(true);
        ws_->async_write(net::buffer(subscribeFrame_),
                         [self = shared_from_this()](const beast::error_code& writeEc, std::size_t) {
                             self->onSubscribed_(writeEc);
                         });
    }

    void onSubscribed_(const beast::error_code& ec) {
        if (ec) {
            return fail_(ec, "subscribe");
        }
        if (stopped_) {
            return;
        }
        tracker_.onConnected();
        LOG_INFO(Category::Net, "Live stream subscribed " << subscribeFrame_);
        read_();
    }

    void read_() {
        ws_->async_read(buffer_, [self = shared_from_this()](const beast::error_code& ec, std::size_t) {
            self->onRead_(ec);
        });
    }

    void onRead_(const beast::error_code& ec) {
        if (ec) {
            return fail_(ec, "read");
        }
        const std::string payload = beast::buffers_to_string(buffer_.cdata());
        buffer_.consume(buffer_.size());
        if (!payload.empty()) {
            LOG_DEBUG(Category::Net, "Live stream frame bytes=" << payload.size());
            delivery_->deliverFrame(generation_, payload);
        }
        if (!stopped_) {
            read_();
        }
    }

    void fail_(const beast::error_code& ec, const char* stage) {
        if (stopped_) {
            return;
        }
        LOG_WARN(Category::Net, "Live stream " << stage << " failed: " << ec.message());

        const auto delay = tracker_.onTransportLost();
        if (!delay) {
            return;
        }
        metric::Registry::instance().incrementCounter(metric::names::kReconnectAttempts);

        if (ws_) {
            beast::error_code closeEc;
            beast::get_lowest_layer(*ws_).socket().close(closeEc);
        }
        retryTimer_.expires_after(*delay);
        retryTimer_.async_wait([self = shared_from_this()](const beast::error_code& timerEc) {
            if (timerEc == net::error::operation_aborted || self->stopped_) {
                return;
            }
            self->start();
        });
    }

    net::io_context& ioc_;
    const LiveStreamConfig& config_;
    const domain::SeriesKey key_;
    const std::uint64_t generation_;
    std::shared_ptr<StreamDelivery> delivery_;
    core::ConnectionTracker& tracker_;

    ssl::context sslCtx_;
    tcp::resolver resolver_;
    net::steady_timer retryTimer_;
    std::unique_ptr<WsStream> ws_;
    beast::flat_buffer buffer_;
    std::string subscribeFrame_;
    std::uint64_t requestId_{0};
    bool stopped_{false};
};

BinanceLiveStream::BinanceLiveStream(net::io_context& callbackContext, LiveStreamConfig config)
    : config_(std::move(config)),
      delivery_(std::make_shared<StreamDelivery>(callbackContext)),
      tracker_(config_.backoff) {
    tracker_.setListener([delivery = delivery_](domain::ConnectionState state) {
        metric::Registry::instance().setGauge(metric::names::kWsState,
                                              state == domain::ConnectionState::Connected ? 1.0 : 0.0);
        delivery->deliverState(delivery->generation(), state);
    });
}

BinanceLiveStream::~BinanceLiveStream() {
    unsubscribe();
}

std::string BinanceLiveStream::subscribeMessage(const domain::SeriesKey& key, std::uint64_t requestId) {
    boost::json::object message;
    message["method"] = "SUBSCRIBE";
    boost::json::array params;
    params.emplace_back(streamName(key));
    message["params"] = std::move(params);
    message["id"] = requestId;
    return boost::json::serialize(message);
}

void BinanceLiveStream::subscribe(const domain::SeriesKey& key, UpdateHandler onUpdate, StateHandler onState) {
    if (key.symbol.empty()) {
        throw std::invalid_argument("BinanceLiveStream: subscribe requires a symbol");
    }
    unsubscribe();

    const auto generation = delivery_->open(key, std::move(onUpdate), std::move(onState));

    std::lock_guard<std::mutex> lock(mutex_);
    ioc_ = std::make_unique<net::io_context>();
    work_.emplace(ioc_->get_executor());
    session_ = std::make_shared<Session>(*ioc_, config_, key, generation, delivery_, tracker_);
    net::post(*ioc_, [session = session_]() { session->start(); });

    LOG_INFO(Category::Net, "Live stream subscribe " << domain::toString(key) << " generation=" << generation);

    ioThread_ = std::thread([ioc = ioc_.get()]() {
        try {
            ioc->run();
        } catch (const std::exception& ex) {
            LOG_ERR(Category::Net, "Live stream io thread crashed: " << ex.what());
        }
    });
}

void BinanceLiveStream::unsubscribe() {
    delivery_->close();

    std::lock_guard<std::mutex> lock(mutex_);
    if (!ioc_) {
        return;
    }
    if (session_) {
        auto closed = std::make_shared<std::promise<void>>();
        auto future = closed->get_future();
        net::post(*ioc_, [session = session_, closed]() {
            session->stop();
            closed->set_value();
        });
        if (future.wait_for(std::chrono::seconds(5)) != std::future_status::ready) {
            LOG_WARN(Category::Net, "Live stream close timed out");
        }
    }
    work_.reset();
    ioc_->stop();
    if (ioThread_.joinable()) {
        ioThread_.join();
    }
    session_.reset();
    ioc_.reset();

    tracker_.onClosed();
    LOG_INFO(Category::Net, "Live stream unsubscribed");
}

}  // namespace adapters::binance
