/*
 * File: tests/loopback_servers.hpp
 * Project: Channel Watch
 * Purpose: Local REST and gateway servers for end-to-end tests
 * Notes:
 *  - bind 127.0.0.1 port 0; port() reports the chosen port
 *  - REST: GET {base}/channels/{id} answered from a route table
 * Last updated: 2026-10-19
 */

#pragma once
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/asio.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace http = boost::beast::http;
namespace websocket = boost::beast::websocket;

// -------- REST --------

class FakeRestServer
{
public:
    struct Reply
    {
        http::status status = http::status::ok;
        std::string body;
    };

private:
    boost::asio::io_context ioc_{1};
    boost::asio::ip::tcp::acceptor acceptor_{ioc_};
    boost::asio::ip::tcp::socket socket_{ioc_};
    std::thread th_;

    std::mutex m_;
    std::map<std::string, Reply> routes_;
    std::vector<http::request<http::string_body>> seen_;

public:
    FakeRestServer()
    {
        boost::asio::ip::tcp::endpoint ep{boost::asio::ip::make_address("127.0.0.1"), 0};
        acceptor_.open(ep.protocol());
        acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
        acceptor_.bind(ep);
        acceptor_.listen(boost::asio::socket_base::max_listen_connections);
        do_accept();
        th_ = std::thread([this] { ioc_.run(); });
    }

    ~FakeRestServer()
    {
        ioc_.stop();
        if (th_.joinable())
            th_.join();
    }

    unsigned short port() const { return acceptor_.local_endpoint().port(); }
    std::string base() const { return "http://127.0.0.1:" + std::to_string(port()) + "/api/v9"; }

    void route(const std::string &target, Reply r)
    {
        std::scoped_lock lk(m_);
        routes_[target] = std::move(r);
    }

    std::vector<http::request<http::string_body>> requests()
    {
        std::scoped_lock lk(m_);
        return seen_;
    }

private:
    void do_accept()
    {
        acceptor_.async_accept(socket_, [this](boost::beast::error_code ec)
                               {
            if (!ec) std::make_shared<Session>(std::move(socket_), *this)->run();
            if (ec != boost::asio::error::operation_aborted) do_accept(); });
    }

    Reply answer(const http::request<http::string_body> &req)
    {
        std::scoped_lock lk(m_);
        seen_.push_back(req);
        auto it = routes_.find(std::string(req.target()));
        if (it == routes_.end())
            return Reply{http::status::not_found, R"({"message":"Unknown Channel","code":10003})"};
        return it->second;
    }

    struct Session : std::enable_shared_from_this<Session>
    {
        boost::asio::ip::tcp::socket socket;
        boost::beast::flat_buffer buffer;
        http::request<http::string_body> req;
        FakeRestServer &server;

        Session(boost::asio::ip::tcp::socket &&s, FakeRestServer &sv)
            : socket(std::move(s)), server(sv) {}

        void run()
        {
            auto self = shared_from_this();
            http::async_read(socket, buffer, req, [self](boost::beast::error_code ec, std::size_t)
                             { if (!ec) self->respond(); });
        }

        void respond()
        {
            auto r = server.answer(req);
            auto self = shared_from_this();
            auto sp = std::make_shared<http::response<http::string_body>>(r.status, req.version());
            sp->set(http::field::content_type, "application/json");
            sp->keep_alive(false);
            sp->body() = r.body;
            sp->prepare_payload();
            http::async_write(socket, *sp, [self, sp](boost::beast::error_code, std::size_t)
                              {
                boost::system::error_code ec;
                self->socket.shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec); });
        }
    };
};

// -------- gateway --------

// Serves one connection: hello, read identify, send scripted frames, close.
class FakeGatewayServer
{
    boost::asio::io_context ioc_{1};
    boost::asio::ip::tcp::acceptor acceptor_{ioc_};
    std::thread th_;
    std::vector<std::string> script_;

    std::mutex m_;
    std::string identify_;
    std::string user_agent_;
    std::string error_;

public:
    explicit FakeGatewayServer(std::vector<std::string> after_identify)
        : script_(std::move(after_identify))
    {
        boost::asio::ip::tcp::endpoint ep{boost::asio::ip::make_address("127.0.0.1"), 0};
        acceptor_.open(ep.protocol());
        acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
        acceptor_.bind(ep);
        acceptor_.listen();
        th_ = std::thread([this] { serve(); });
    }

    ~FakeGatewayServer()
    {
        if (th_.joinable())
            th_.join();
    }

    std::string url() const
    {
        return "ws://127.0.0.1:" + std::to_string(acceptor_.local_endpoint().port()) + "/?v=9&encoding=json";
    }

    void join()
    {
        if (th_.joinable())
            th_.join();
    }

    std::string identify()
    {
        std::scoped_lock lk(m_);
        return identify_;
    }
    std::string user_agent()
    {
        std::scoped_lock lk(m_);
        return user_agent_;
    }
    std::string error()
    {
        std::scoped_lock lk(m_);
        return error_;
    }

private:
    void serve()
    {
        try
        {
            boost::asio::ip::tcp::socket sock{ioc_};
            acceptor_.accept(sock);

            boost::beast::flat_buffer buf;
            http::request<http::string_body> upgrade;
            http::read(sock, buf, upgrade);
            {
                std::scoped_lock lk(m_);
                user_agent_ = std::string(upgrade[http::field::user_agent]);
            }

            websocket::stream<boost::asio::ip::tcp::socket> ws{std::move(sock)};
            ws.accept(upgrade);
            ws.text(true);
            ws.write(boost::asio::buffer(std::string(R"({"op":10,"d":{"heartbeat_interval":60000}})")));

            boost::beast::flat_buffer in;
            ws.read(in);
            {
                std::scoped_lock lk(m_);
                identify_ = boost::beast::buffers_to_string(in.data());
            }
            for (auto &frame : script_)
                ws.write(boost::asio::buffer(frame));
            ws.close(websocket::close_code::normal);

            // drain until the client's close reply
            boost::beast::flat_buffer rest;
            boost::beast::error_code ec;
            while (!ec)
                ws.read(rest, ec);
        }
        catch (const std::exception &e)
        {
            std::scoped_lock lk(m_);
            error_ = e.what();
        }
    }
};
