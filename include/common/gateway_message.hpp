/*
 * File: include/common/gateway_message.hpp
 * Project: Channel Watch
 * Purpose: Gateway wire frames: envelope decode, tagged frame variant, encoders
 * Notes:
 *  - Two-stage decode: envelope {op,s,t,d} first, payload by op second
 *  - All decode failures surface as ProtocolError
 * Last updated: 2026-10-19
 */

#pragma once
#include <chrono>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

#include "common/watch_errors.hpp"

namespace gateway_op
{
constexpr int dispatch = 0;
constexpr int heartbeat = 1;
constexpr int identify = 2;
constexpr int reconnect = 7;
constexpr int hello = 10;
constexpr int heartbeat_ack = 11;
} // namespace gateway_op

struct GatewayEnvelope
{
    int op = -1;
    std::optional<int64_t> seq;
    std::optional<std::string> type;
    nlohmann::json data; // null when "d" is absent
};

struct HelloFrame
{
    std::chrono::milliseconds heartbeat_interval{0};
};

struct DispatchFrame
{
    std::string type;
    std::optional<int64_t> seq;
    nlohmann::json data;
};

struct HeartbeatAckFrame
{
};

// server asks for an immediate heartbeat
struct HeartbeatRequestFrame
{
};

struct ReconnectFrame
{
};

struct UnknownFrame
{
    int op = -1;
};

using GatewayFrame = std::variant<HelloFrame, DispatchFrame, HeartbeatAckFrame,
                                  HeartbeatRequestFrame, ReconnectFrame, UnknownFrame>;

struct IdentifyProperties
{
    std::string os = "linux";
    std::string browser = "Chrome";
    std::string device = "Chrome";
};

inline GatewayEnvelope decode_envelope(const std::string &text)
{
    using nlohmann::json;
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded())
        throw ProtocolError("frame is not valid JSON");
    if (!j.is_object())
        throw ProtocolError("frame is not a JSON object");

    auto op = j.find("op");
    if (op == j.end() || !op->is_number_integer())
        throw ProtocolError("frame has no integer 'op'");

    // wider values must not wrap onto a known op
    if (op->is_number_unsigned() ? op->get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int>::max())
                                 : (op->get<int64_t>() < std::numeric_limits<int>::min() ||
                                    op->get<int64_t>() > std::numeric_limits<int>::max()))
        throw ProtocolError("'op' out of range");

    GatewayEnvelope env;
    env.op = static_cast<int>(op->get<int64_t>());

    auto s = j.find("s");
    if (s != j.end() && !s->is_null())
    {
        if (!s->is_number_integer())
            throw ProtocolError("'s' is not an integer");
        env.seq = s->get<int64_t>();
    }
    auto t = j.find("t");
    if (t != j.end() && !t->is_null())
    {
        if (!t->is_string())
            throw ProtocolError("'t' is not a string");
        env.type = t->get<std::string>();
    }
    auto d = j.find("d");
    if (d != j.end())
        env.data = *d;
    return env;
}

inline HelloFrame decode_hello(const GatewayEnvelope &env)
{
    if (env.op != gateway_op::hello)
        throw ProtocolError("expected op 10, got op " + std::to_string(env.op));
    if (!env.data.is_object())
        throw ProtocolError("hello frame missing 'd'");
    auto hi = env.data.find("heartbeat_interval");
    if (hi == env.data.end() || !hi->is_number_integer())
        throw ProtocolError("hello frame missing integer heartbeat_interval");
    auto ms = hi->get<int64_t>();
    if (ms <= 0)
        throw ProtocolError("heartbeat_interval must be positive, got " + std::to_string(ms));
    return HelloFrame{std::chrono::milliseconds(ms)};
}

inline GatewayFrame decode_frame(const GatewayEnvelope &env)
{
    switch (env.op)
    {
    case gateway_op::hello:
        return decode_hello(env);
    case gateway_op::dispatch:
        if (!env.type)
            throw ProtocolError("dispatch frame missing 't'");
        return DispatchFrame{*env.type, env.seq, env.data};
    case gateway_op::heartbeat_ack:
        return HeartbeatAckFrame{};
    case gateway_op::heartbeat:
        return HeartbeatRequestFrame{};
    case gateway_op::reconnect:
        return ReconnectFrame{};
    default:
        return UnknownFrame{env.op};
    }
}

inline GatewayFrame decode_frame(const std::string &text)
{
    return decode_frame(decode_envelope(text));
}

inline std::string encode_identify(const std::string &token, const IdentifyProperties &props = {})
{
    nlohmann::json j{
        {"op", gateway_op::identify},
        {"d", {{"token", token},
               {"properties", {{"os", props.os}, {"browser", props.browser}, {"device", props.device}}}}}};
    return j.dump();
}

// d carries the last dispatch sequence, null before the first one
inline std::string encode_heartbeat(std::optional<int64_t> last_seq)
{
    nlohmann::json j{{"op", gateway_op::heartbeat}, {"d", nullptr}};
    if (last_seq)
        j["d"] = *last_seq;
    return j.dump();
}
