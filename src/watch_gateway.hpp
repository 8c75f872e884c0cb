/*
 * File: src/watch_gateway.hpp
 * Project: Channel Watch
 * Purpose: Gateway client state machine
 *          Disconnected -> AwaitingGreeting -> Authenticating -> Active -> Disconnected
 * Notes:
 *  - transport is abstract; watch_ws.hpp has the Beast implementation
 *  - per session: reader thread + heartbeat timer feed one bounded queue,
 *    the owning thread is the only writer on the transport
 *  - every failure ends the session; run() waits the reconnect delay and retries forever
 * Last updated: 2026-10-19
 */

#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <variant>

#include "common/gateway_message.hpp"
#include "common/watch_errors.hpp"
#include "watch_state.hpp"

class GatewayTransport
{
public:
    virtual ~GatewayTransport() = default;
    // Blocks for the next text frame; std::nullopt once the peer has closed. Throws TransportError.
    virtual std::optional<std::string> read() = 0;
    // Throws TransportError.
    virtual void write(const std::string &text) = 0;
    // Thread-safe, idempotent; a pending read() returns or throws promptly.
    virtual void close() = 0;
};

class GatewayConnector
{
public:
    virtual ~GatewayConnector() = default;
    // Throws TransportError.
    virtual std::unique_ptr<GatewayTransport> connect() = 0;
};

enum class GatewayPhase
{
    Disconnected,
    AwaitingGreeting,
    Authenticating,
    Active
};

enum class SessionEnd
{
    Stopped,
    ConnectFailed,
    HandshakeFailed,
    Closed,
    TransportFailed,
    ReconnectRequested,
    HeartbeatTimeout
};

inline const char *to_string(SessionEnd e)
{
    switch (e)
    {
    case SessionEnd::Stopped:
        return "stopped";
    case SessionEnd::ConnectFailed:
        return "connect failed";
    case SessionEnd::HandshakeFailed:
        return "handshake failed";
    case SessionEnd::Closed:
        return "closed";
    case SessionEnd::TransportFailed:
        return "transport failed";
    case SessionEnd::ReconnectRequested:
        return "reconnect requested";
    case SessionEnd::HeartbeatTimeout:
        return "heartbeat timeout";
    }
    return "unknown";
}

struct GatewayTiming
{
    std::chrono::milliseconds reconnect_delay{5000};
    // 0 = acks are not checked
    int missed_ack_limit = 0;
};

// -------- per-session plumbing --------

struct SessionEvent
{
    enum class Kind
    {
        Frame,
        HeartbeatDue,
        Closed,
        Failed
    };
    Kind kind;
    std::string text;
};

// Bounded MPSC queue between reader/heartbeat threads and the session owner.
class SessionQueue
{
    std::mutex m_;
    std::condition_variable cv_;
    std::deque<SessionEvent> q_;
    size_t capacity_;
    bool heartbeat_pending_ = false;
    bool shut_ = false;

public:
    explicit SessionQueue(size_t capacity = 64) : capacity_(capacity) {}

    // Blocks while full. False once shut down.
    bool push(SessionEvent ev)
    {
        std::unique_lock lk(m_);
        cv_.wait(lk, [this] { return shut_ || q_.size() < capacity_; });
        if (shut_)
            return false;
        q_.push_back(std::move(ev));
        cv_.notify_all();
        return true;
    }

    // At most one heartbeat waits in the queue; extra ticks are dropped.
    bool push_heartbeat()
    {
        std::scoped_lock lk(m_);
        if (shut_)
            return false;
        if (heartbeat_pending_)
            return true;
        heartbeat_pending_ = true;
        q_.push_back(SessionEvent{SessionEvent::Kind::HeartbeatDue, {}});
        cv_.notify_all();
        return true;
    }

    std::optional<SessionEvent> pop()
    {
        std::unique_lock lk(m_);
        cv_.wait(lk, [this] { return shut_ || !q_.empty(); });
        if (shut_)
            return std::nullopt;
        SessionEvent ev = std::move(q_.front());
        q_.pop_front();
        if (ev.kind == SessionEvent::Kind::HeartbeatDue)
            heartbeat_pending_ = false;
        cv_.notify_all();
        return ev;
    }

    void shutdown()
    {
        {
            std::scoped_lock lk(m_);
            shut_ = true;
        }
        cv_.notify_all();
    }
};

// Posts HeartbeatDue every interval until cancelled or destroyed.
class HeartbeatTimer
{
    std::mutex m_;
    std::condition_variable cv_;
    bool cancelled_ = false;
    std::thread th_;

public:
    HeartbeatTimer(std::chrono::milliseconds interval, SessionQueue &queue)
    {
        th_ = std::thread([this, interval, &queue]
                          {
            std::unique_lock lk(m_);
            while (!cv_.wait_for(lk, interval, [this] { return cancelled_; }))
            {
                lk.unlock();
                bool open = queue.push_heartbeat();
                lk.lock();
                if (!open)
                    return;
            } });
    }

    ~HeartbeatTimer() { cancel(); }

    HeartbeatTimer(const HeartbeatTimer &) = delete;
    HeartbeatTimer &operator=(const HeartbeatTimer &) = delete;

    void cancel()
    {
        {
            std::scoped_lock lk(m_);
            cancelled_ = true;
        }
        cv_.notify_all();
        if (th_.joinable())
            th_.join();
    }
};

// -------- gateway client --------

class GatewayClient
{
    GatewayConnector &connector_;
    std::string token_;
    WatchState &state_;
    AlertController &alerts_;
    GatewayTiming timing_;
    IdentifyProperties props_;

    std::atomic<GatewayPhase> phase_{GatewayPhase::Disconnected};
    std::atomic<int64_t> heartbeat_ms_{0};
    std::atomic<uint64_t> heartbeats_sent_{0};
    std::optional<int64_t> last_seq_; // owner thread only

    std::mutex m_; // guards everything below
    std::condition_variable cv_;
    bool stopped_ = false;
    GatewayTransport *live_ = nullptr;
    SessionQueue *live_queue_ = nullptr;

public:
    GatewayClient(GatewayConnector &connector, std::string token, WatchState &state, AlertController &alerts,
                  GatewayTiming timing = {})
        : connector_(connector), token_(std::move(token)), state_(state), alerts_(alerts), timing_(timing) {}

    // Never returns during normal operation; only stop() ends it.
    void run()
    {
        while (!is_stopped())
        {
            auto end = run_session();
            if (is_stopped())
                break;
            state_.stats.reconnects.fetch_add(1);
            log_info("WS", std::string("Session ended (") + to_string(end) + "), reconnecting in " +
                               std::to_string(timing_.reconnect_delay.count()) + "ms...");
            if (!wait_reconnect())
                break;
        }
        phase_ = GatewayPhase::Disconnected;
    }

    // One connect..disconnect cycle.
    SessionEnd run_session()
    {
        phase_ = GatewayPhase::Disconnected;
        last_seq_.reset();

        log_info("WS", "Connecting to gateway...");
        std::unique_ptr<GatewayTransport> transport;
        try
        {
            transport = connector_.connect();
        }
        catch (const TransportError &e)
        {
            log_error("WS", std::string("Failed to connect: ") + e.what());
            return SessionEnd::ConnectFailed;
        }
        log_info("WS", "Connected to gateway");

        {
            std::scoped_lock lk(m_);
            if (stopped_)
            {
                transport->close();
                return SessionEnd::Stopped;
            }
            live_ = transport.get();
        }
        LiveReset unregister{*this};

        phase_ = GatewayPhase::AwaitingGreeting;
        HelloFrame hello;
        try
        {
            auto first = transport->read();
            if (!first)
            {
                log_error("WS", "Connection closed before Hello");
                return SessionEnd::HandshakeFailed;
            }
            hello = decode_hello(decode_envelope(*first));
        }
        catch (const TransportError &e)
        {
            log_error("WS", std::string("WebSocket error: ") + e.what());
            return SessionEnd::HandshakeFailed;
        }
        catch (const ProtocolError &e)
        {
            log_error("WS", std::string("Bad greeting: ") + e.what());
            return SessionEnd::HandshakeFailed;
        }
        heartbeat_ms_ = hello.heartbeat_interval.count();
        log_info("WS", "Received Hello, heartbeat_interval: " + std::to_string(hello.heartbeat_interval.count()) + "ms");

        phase_ = GatewayPhase::Authenticating;
        try
        {
            transport->write(encode_identify(token_, props_));
        }
        catch (const TransportError &e)
        {
            log_error("WS", std::string("Failed to send Identify: ") + e.what());
            return SessionEnd::TransportFailed;
        }
        log_info("WS", "Sent Identify payload");

        phase_ = GatewayPhase::Active;
        auto end = run_active(*transport, hello.heartbeat_interval);
        phase_ = GatewayPhase::Disconnected;
        return end;
    }

    void stop()
    {
        std::scoped_lock lk(m_);
        stopped_ = true;
        if (live_queue_)
            live_queue_->shutdown();
        if (live_)
            live_->close();
        cv_.notify_all();
    }

    GatewayPhase phase() const { return phase_.load(); }
    // interval from the most recent greeting, 0 before the first
    std::chrono::milliseconds heartbeat_interval() const { return std::chrono::milliseconds(heartbeat_ms_.load()); }
    uint64_t heartbeats_sent() const { return heartbeats_sent_.load(); }

private:
    struct LiveReset
    {
        GatewayClient &c;
        ~LiveReset()
        {
            std::scoped_lock lk(c.m_);
            c.live_ = nullptr;
        }
    };

    // Tears the Active state down in a fixed order, also on exceptions.
    struct ActiveGuard
    {
        GatewayClient &client;
        HeartbeatTimer &beat;
        SessionQueue &queue;
        GatewayTransport &transport;
        std::thread &reader;
        ~ActiveGuard()
        {
            {
                std::scoped_lock lk(client.m_);
                client.live_queue_ = nullptr;
            }
            beat.cancel();
            queue.shutdown();
            transport.close();
            if (reader.joinable())
                reader.join();
        }
    };

    bool is_stopped()
    {
        std::scoped_lock lk(m_);
        return stopped_;
    }

    bool wait_reconnect()
    {
        std::unique_lock lk(m_);
        return !cv_.wait_for(lk, timing_.reconnect_delay, [this] { return stopped_; });
    }

    SessionEnd run_active(GatewayTransport &transport, std::chrono::milliseconds interval)
    {
        SessionQueue queue;
        {
            std::scoped_lock lk(m_);
            if (stopped_)
                return SessionEnd::Stopped;
            live_queue_ = &queue;
        }

        HeartbeatTimer beat(interval, queue);
        std::thread reader([&transport, &queue]
                           {
            try
            {
                while (true)
                {
                    auto text = transport.read();
                    if (!text)
                    {
                        queue.push(SessionEvent{SessionEvent::Kind::Closed, {}});
                        return;
                    }
                    if (!queue.push(SessionEvent{SessionEvent::Kind::Frame, std::move(*text)}))
                        return;
                }
            }
            catch (const TransportError &e)
            {
                queue.push(SessionEvent{SessionEvent::Kind::Failed, e.what()});
            } });
        ActiveGuard guard{*this, beat, queue, transport, reader};

        int unacked = 0;
        while (true)
        {
            auto ev = queue.pop();
            if (!ev)
                return SessionEnd::Stopped;

            switch (ev->kind)
            {
            case SessionEvent::Kind::HeartbeatDue:
                if (timing_.missed_ack_limit > 0 && unacked >= timing_.missed_ack_limit)
                {
                    log_error("WS", "No heartbeat ACK for " + std::to_string(unacked) + " intervals, dropping connection");
                    return SessionEnd::HeartbeatTimeout;
                }
                if (!send_heartbeat(transport))
                    return SessionEnd::TransportFailed;
                ++unacked;
                break;
            case SessionEvent::Kind::Closed:
                log_info("WS", "Connection closed");
                return SessionEnd::Closed;
            case SessionEvent::Kind::Failed:
                log_error("WS", "WebSocket error: " + ev->text);
                return SessionEnd::TransportFailed;
            case SessionEvent::Kind::Frame:
                if (auto end = handle_frame(transport, ev->text, unacked))
                    return *end;
                break;
            }
        }
    }

    bool send_heartbeat(GatewayTransport &transport)
    {
        try
        {
            transport.write(encode_heartbeat(last_seq_));
        }
        catch (const TransportError &e)
        {
            log_error("WS", std::string("Failed to send heartbeat: ") + e.what());
            return false;
        }
        heartbeats_sent_.fetch_add(1);
        log_debug("WS", "Sent heartbeat");
        return true;
    }

    std::optional<SessionEnd> handle_frame(GatewayTransport &transport, const std::string &text, int &unacked)
    {
        GatewayFrame frame;
        try
        {
            frame = decode_frame(text);
        }
        catch (const ProtocolError &e)
        {
            log_error("WS", std::string("Ignoring malformed frame: ") + e.what());
            return std::nullopt;
        }

        if (auto *d = std::get_if<DispatchFrame>(&frame))
        {
            if (d->seq)
                last_seq_ = d->seq;
            if (d->type == "CHANNEL_UPDATE")
                on_channel_update(d->data);
        }
        else if (std::holds_alternative<HeartbeatAckFrame>(frame))
        {
            unacked = 0;
            state_.stats.heartbeat_acks.fetch_add(1);
            log_debug("WS", "Heartbeat ACK received");
        }
        else if (std::holds_alternative<HeartbeatRequestFrame>(frame))
        {
            if (!send_heartbeat(transport))
                return SessionEnd::TransportFailed;
        }
        else if (std::holds_alternative<ReconnectFrame>(frame))
        {
            log_info("WS", "Server requested reconnect");
            return SessionEnd::ReconnectRequested;
        }
        else if (auto *u = std::get_if<UnknownFrame>(&frame))
        {
            log_debug("WS", "Ignoring op " + std::to_string(u->op));
        }
        return std::nullopt;
    }

    void on_channel_update(const nlohmann::json &data)
    {
        ChannelRecord ch;
        try
        {
            ch = channel_from_json(data);
        }
        catch (const std::exception &e)
        {
            log_error("WS", std::string("Bad CHANNEL_UPDATE payload: ") + e.what());
            return;
        }
        if (ch.id != state_.channel_id)
            return;
        state_.stats.ws_events.fetch_add(1);
        log_info("WS", "Channel update detected: " + describe_name(ch.name));
        reconcile_name(state_, alerts_, ch.name, "WS");
    }
};
