/*
 * File: tests/test_gateway_message.cpp
 * Project: Channel Watch
 * Purpose: Gateway frame decoding and encoding
 * Last updated: 2026-10-19
 */

#include <catch2/catch_all.hpp>
#include <nlohmann/json.hpp>

#include "common/channel.hpp"
#include "common/gateway_message.hpp"

using nlohmann::json;

TEST_CASE("hello frame yields the heartbeat interval")
{
    auto f = decode_frame(R"({"op":10,"d":{"heartbeat_interval":41250}})");
    REQUIRE(std::holds_alternative<HelloFrame>(f));
    REQUIRE(std::get<HelloFrame>(f).heartbeat_interval == std::chrono::milliseconds(41250));
}

TEST_CASE("greeting decode rejects anything but a valid op 10")
{
    REQUIRE_THROWS_AS(decode_hello(decode_envelope(R"({"op":5})")), ProtocolError);
    REQUIRE_THROWS_AS(decode_hello(decode_envelope(R"({"op":10})")), ProtocolError);
    REQUIRE_THROWS_AS(decode_hello(decode_envelope(R"({"op":10,"d":{}})")), ProtocolError);
    REQUIRE_THROWS_AS(decode_hello(decode_envelope(R"({"op":10,"d":{"heartbeat_interval":"fast"}})")), ProtocolError);
    REQUIRE_THROWS_AS(decode_hello(decode_envelope(R"({"op":10,"d":{"heartbeat_interval":0}})")), ProtocolError);
}

TEST_CASE("malformed envelopes are protocol errors")
{
    REQUIRE_THROWS_AS(decode_envelope("not json"), ProtocolError);
    REQUIRE_THROWS_AS(decode_envelope("[1,2]"), ProtocolError);
    REQUIRE_THROWS_AS(decode_envelope(R"({"t":"X"})"), ProtocolError);
    REQUIRE_THROWS_AS(decode_envelope(R"({"op":"0"})"), ProtocolError);
    // 2^32 + 10 must not pass as a greeting
    REQUIRE_THROWS_AS(decode_frame(R"({"op":4294967306,"d":{"heartbeat_interval":41250}})"), ProtocolError);
    REQUIRE_THROWS_AS(decode_envelope(R"({"op":-4294967286})"), ProtocolError);
    REQUIRE_THROWS_AS(decode_envelope(R"({"op":18446744073709551615})"), ProtocolError);
    REQUIRE_THROWS_AS(decode_frame(R"({"op":0,"d":{}})"), ProtocolError); // dispatch without t
}

TEST_CASE("channel update dispatch decodes in two stages")
{
    auto env = decode_envelope(R"({"op":0,"s":7,"t":"CHANNEL_UPDATE","d":{"id":"123","name":"general-chat"}})");
    REQUIRE(env.op == 0);
    REQUIRE(env.seq == 7);
    REQUIRE(env.type == std::string("CHANNEL_UPDATE"));

    auto f = decode_frame(env);
    auto &d = std::get<DispatchFrame>(f);
    auto ch = channel_from_json(d.data);
    REQUIRE(ch.id == "123");
    REQUIRE(ch.name == WatchedName("general-chat"));
}

TEST_CASE("channel record name may be null or missing")
{
    REQUIRE_FALSE(channel_from_json(json::parse(R"({"id":"1","name":null})")).name.has_value());
    REQUIRE_FALSE(channel_from_json(json::parse(R"({"id":"1"})")).name.has_value());
    REQUIRE_THROWS(channel_from_json(json::parse(R"({"name":"x"})")));
    REQUIRE_THROWS(channel_from_json(json::parse("[]")));
}

TEST_CASE("other ops map to their frame kinds")
{
    REQUIRE(std::holds_alternative<HeartbeatAckFrame>(decode_frame(R"({"op":11})")));
    REQUIRE(std::holds_alternative<HeartbeatRequestFrame>(decode_frame(R"({"op":1,"d":null})")));
    REQUIRE(std::holds_alternative<ReconnectFrame>(decode_frame(R"({"op":7,"d":null})")));
    auto u = decode_frame(R"({"op":5})");
    REQUIRE(std::get<UnknownFrame>(u).op == 5);
}

TEST_CASE("identify carries token and client properties")
{
    auto j = json::parse(encode_identify("my_secret_token"));
    REQUIRE(j["op"] == 2);
    REQUIRE(j["d"]["token"] == "my_secret_token");
    REQUIRE(j["d"]["properties"]["os"] == "linux");
    REQUIRE(j["d"]["properties"]["browser"] == "Chrome");
    REQUIRE(j["d"]["properties"]["device"] == "Chrome");
}

TEST_CASE("heartbeat carries the last sequence or null")
{
    auto first = json::parse(encode_heartbeat(std::nullopt));
    REQUIRE(first["op"] == 1);
    REQUIRE(first["d"].is_null());
    REQUIRE(json::parse(encode_heartbeat(42))["d"] == 42);
}
