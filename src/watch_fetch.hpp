/*
 * File: src/watch_fetch.hpp
 * Project: Channel Watch
 * Purpose: REST fetch of the watched channel's current name
 * Notes:
 *  - GET {api-base}/channels/{id} with Authorization + browser User-Agent
 *  - https (TLS, SNI, peer verification) or plain http for loopback tests
 *  - every failure surfaces as FetchError; callers log and keep going
 * Last updated: 2026-10-19
 */

#pragma once
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <string>

#include "common/channel.hpp"
#include "common/endpoint.hpp"
#include "common/watch_errors.hpp"
#include "watch_log.hpp"

namespace http = boost::beast::http;

inline const char *browser_user_agent()
{
    return "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/120.0.0.0 Safari/537.36";
}

class ChannelFetcher
{
public:
    virtual ~ChannelFetcher() = default;
    // Throws FetchError.
    virtual WatchedName fetch_name(const std::string &token, const std::string &channel_id) = 0;
};

// Decoding half of the fetch: status check then channel record.
inline WatchedName parse_channel_response(unsigned status, const std::string &body)
{
    if (status < 200 || status >= 300)
    {
        std::string excerpt = body.substr(0, 200);
        throw FetchError("HTTP " + std::to_string(status) + ": " + excerpt);
    }
    auto j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded())
        throw FetchError("response body is not valid JSON");
    try
    {
        return channel_from_json(j).name;
    }
    catch (const std::exception &e)
    {
        throw FetchError(std::string("unexpected channel record: ") + e.what());
    }
}

class HttpChannelFetcher : public ChannelFetcher
{
    Endpoint api_;
    std::chrono::milliseconds timeout_;
    std::shared_ptr<boost::asio::ssl::context> tls_;

public:
    explicit HttpChannelFetcher(const std::string &api_base,
                                std::chrono::milliseconds timeout = std::chrono::seconds(5))
        : timeout_(timeout)
    {
        try
        {
            api_ = parse_endpoint(api_base);
        }
        catch (const std::invalid_argument &e)
        {
            throw ConfigError(std::string("bad api base: ") + e.what());
        }
        if (api_.secure())
        {
            tls_ = std::make_shared<boost::asio::ssl::context>(boost::asio::ssl::context::tlsv12_client);
            tls_->set_default_verify_paths();
            tls_->set_verify_mode(boost::asio::ssl::verify_peer);
        }
    }

    const Endpoint &endpoint() const { return api_; }

    std::string channel_target(const std::string &channel_id) const
    {
        return join_target(api_.target, "/channels/" + channel_id);
    }

    WatchedName fetch_name(const std::string &token, const std::string &channel_id) override
    {
        http::request<http::string_body> req{http::verb::get, channel_target(channel_id), 11};
        req.set(http::field::host, api_.host);
        req.set(http::field::authorization, token);
        req.set(http::field::user_agent, browser_user_agent());
        req.set(http::field::accept, "application/json");

        http::response<http::string_body> res;
        try
        {
            res = api_.secure() ? exchange_tls(req) : exchange_plain(req);
        }
        catch (const boost::system::system_error &e)
        {
            throw FetchError(std::string("request failed: ") + e.what());
        }
        return parse_channel_response(res.result_int(), res.body());
    }

private:
    template <class Stream>
    static http::response<http::string_body> round_trip(Stream &stream, http::request<http::string_body> &req)
    {
        http::write(stream, req);
        boost::beast::flat_buffer buf;
        http::response<http::string_body> res;
        http::read(stream, buf, res);
        return res;
    }

    http::response<http::string_body> exchange_plain(http::request<http::string_body> &req)
    {
        boost::asio::io_context ioc;
        boost::asio::ip::tcp::resolver resolver{ioc};
        boost::beast::tcp_stream stream{ioc};
        stream.expires_after(timeout_);
        stream.connect(resolver.resolve(api_.host, api_.port));
        stream.expires_after(timeout_);
        auto res = round_trip(stream, req);

        boost::beast::error_code ec;
        stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
        // not_connected happens when the server closed first
        if (ec && ec != boost::beast::errc::not_connected)
            log_debug("POLL", "socket shutdown: " + ec.message());
        return res;
    }

    http::response<http::string_body> exchange_tls(http::request<http::string_body> &req)
    {
        boost::asio::io_context ioc;
        boost::asio::ip::tcp::resolver resolver{ioc};
        boost::beast::ssl_stream<boost::beast::tcp_stream> stream{ioc, *tls_};

        if (!SSL_set_tlsext_host_name(stream.native_handle(), api_.host.c_str()))
            throw FetchError("failed to set SNI host name");
        stream.set_verify_callback(boost::asio::ssl::host_name_verification(api_.host));

        auto &tcp = boost::beast::get_lowest_layer(stream);
        tcp.expires_after(timeout_);
        tcp.connect(resolver.resolve(api_.host, api_.port));
        tcp.expires_after(timeout_);
        stream.handshake(boost::asio::ssl::stream_base::client);
        tcp.expires_after(timeout_);
        auto res = round_trip(stream, req);

        // many servers drop the connection without close_notify
        boost::beast::error_code ec;
        tcp.expires_after(timeout_);
        stream.shutdown(ec);
        if (ec && ec != boost::asio::error::eof && ec != boost::asio::ssl::error::stream_truncated)
            log_debug("POLL", "tls shutdown: " + ec.message());
        return res;
    }
};
