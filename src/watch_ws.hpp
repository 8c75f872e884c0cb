/*
 * File: src/watch_ws.hpp
 * Project: Channel Watch
 * Purpose: Beast WebSocket transport + connector for the gateway client
 * Notes:
 *  - wss:// (TLS) for the real gateway, ws:// for loopback tests
 *  - connect/handshake are synchronous; afterwards one io thread runs all
 *    async_read/async_write so a read and a write may be in flight together
 * Last updated: 2026-10-19
 */

#pragma once
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>

#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "common/endpoint.hpp"
#include "common/watch_errors.hpp"
#include "watch_fetch.hpp" // browser_user_agent
#include "watch_gateway.hpp"
#include "watch_log.hpp"

namespace websocket = boost::beast::websocket;

using plain_ws = websocket::stream<boost::beast::tcp_stream>;
using tls_ws = websocket::stream<boost::beast::ssl_stream<boost::beast::tcp_stream>>;

inline void tls_handshake(plain_ws &, const std::string &) {}

inline void tls_handshake(tls_ws &ws, const std::string &host)
{
    if (!SSL_set_tlsext_host_name(ws.next_layer().native_handle(), host.c_str()))
        throw TransportError("failed to set SNI host name");
    ws.next_layer().set_verify_callback(boost::asio::ssl::host_name_verification(host));
    ws.next_layer().handshake(boost::asio::ssl::stream_base::client);
}

template <class WsStream>
class BeastGatewayTransport : public GatewayTransport
{
    boost::asio::io_context ioc_;
    std::shared_ptr<boost::asio::ssl::context> tls_; // kept alive for the stream
    WsStream ws_;
    boost::beast::flat_buffer buffer_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
    std::thread io_thread_;

public:
    template <class... Args>
    explicit BeastGatewayTransport(std::shared_ptr<boost::asio::ssl::context> tls, Args &&...args)
        : tls_(std::move(tls)), ws_(ioc_, std::forward<Args>(args)...) {}

    ~BeastGatewayTransport() override
    {
        close();
        work_.reset();
        if (io_thread_.joinable())
            io_thread_.join();
    }

    void connect(const Endpoint &ep, std::chrono::milliseconds timeout)
    {
        try
        {
            boost::asio::ip::tcp::resolver resolver{ioc_};
            auto &tcp = boost::beast::get_lowest_layer(ws_);
            tcp.expires_after(timeout);
            tcp.connect(resolver.resolve(ep.host, ep.port));
            tcp.expires_after(timeout);
            tls_handshake(ws_, ep.host);
            // websocket timeouts take over from here
            tcp.expires_never();
            ws_.set_option(websocket::stream_base::timeout::suggested(boost::beast::role_type::client));
            ws_.set_option(websocket::stream_base::decorator([](websocket::request_type &req)
                                                             { req.set(boost::beast::http::field::user_agent, browser_user_agent()); }));
            ws_.handshake(ep.host, ep.target);
            ws_.text(true);
        }
        catch (const boost::system::system_error &e)
        {
            throw TransportError(std::string("connect to ") + ep.host + ":" + ep.port + " failed: " + e.what());
        }
        work_.emplace(boost::asio::make_work_guard(ioc_));
        io_thread_ = std::thread([this]
                                 { ioc_.run(); });
    }

    std::optional<std::string> read() override
    {
        std::promise<std::optional<std::string>> done;
        auto result = done.get_future();
        boost::asio::post(ioc_, [this, &done]
                          { ws_.async_read(buffer_, [this, &done](boost::beast::error_code ec, std::size_t)
                                           {
                if (ec == websocket::error::closed)
                {
                    done.set_value(std::nullopt);
                    return;
                }
                if (ec)
                {
                    done.set_exception(std::make_exception_ptr(TransportError("read: " + ec.message())));
                    return;
                }
                auto text = boost::beast::buffers_to_string(buffer_.data());
                buffer_.consume(buffer_.size());
                done.set_value(std::move(text)); }); });
        return result.get();
    }

    void write(const std::string &text) override
    {
        auto payload = std::make_shared<std::string>(text);
        std::promise<void> done;
        auto result = done.get_future();
        boost::asio::post(ioc_, [this, payload, &done]
                          { ws_.async_write(boost::asio::buffer(*payload), [payload, &done](boost::beast::error_code ec, std::size_t)
                                            {
                if (ec)
                    done.set_exception(std::make_exception_ptr(TransportError("write: " + ec.message())));
                else
                    done.set_value(); }); });
        result.get();
    }

    // abrupt close: pending operations complete with operation_aborted
    void close() override
    {
        boost::asio::post(ioc_, [this]
                          {
            auto &sock = boost::beast::get_lowest_layer(ws_).socket();
            if (!sock.is_open())
                return;
            boost::beast::error_code ec;
            sock.close(ec);
            if (ec)
                log_debug("WS", "socket close: " + ec.message()); });
    }
};

class BeastGatewayConnector : public GatewayConnector
{
    Endpoint ep_;
    std::chrono::milliseconds timeout_;
    std::shared_ptr<boost::asio::ssl::context> tls_;

public:
    explicit BeastGatewayConnector(const std::string &gateway_url,
                                   std::chrono::milliseconds timeout = std::chrono::seconds(10))
        : timeout_(timeout)
    {
        try
        {
            ep_ = parse_endpoint(gateway_url);
        }
        catch (const std::invalid_argument &e)
        {
            throw ConfigError(std::string("bad gateway url: ") + e.what());
        }
        if (ep_.scheme != "ws" && ep_.scheme != "wss")
            throw ConfigError("gateway url must be ws:// or wss://, got " + ep_.scheme);
        if (ep_.secure())
        {
            tls_ = std::make_shared<boost::asio::ssl::context>(boost::asio::ssl::context::tlsv12_client);
            tls_->set_default_verify_paths();
            tls_->set_verify_mode(boost::asio::ssl::verify_peer);
        }
    }

    const Endpoint &endpoint() const { return ep_; }

    std::unique_ptr<GatewayTransport> connect() override
    {
        if (ep_.secure())
        {
            auto t = std::make_unique<BeastGatewayTransport<tls_ws>>(tls_, *tls_);
            t->connect(ep_, timeout_);
            return t;
        }
        auto t = std::make_unique<BeastGatewayTransport<plain_ws>>(nullptr);
        t->connect(ep_, timeout_);
        return t;
    }
};
