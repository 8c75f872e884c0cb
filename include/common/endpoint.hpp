/*
 * File: include/common/endpoint.hpp
 * Project: Channel Watch
 * Purpose: Split http(s)/ws(s) URLs into host, port and target
 * Last updated: 2026-10-19
 */

#pragma once
#include <string>
#include <stdexcept>


struct Endpoint {
std::string scheme;   // http, https, ws, wss
std::string host;
std::string port;
std::string target{"/"};
bool secure() const { return scheme == "https" || scheme == "wss"; }
};


// expect scheme://host[:port][/path][?query]
inline Endpoint parse_endpoint(const std::string& url){
auto scheme_pos = url.find("://");
if(scheme_pos == std::string::npos) throw std::invalid_argument("missing scheme in url: " + url);
Endpoint ep;
ep.scheme = url.substr(0, scheme_pos);
if(ep.scheme != "http" && ep.scheme != "https" && ep.scheme != "ws" && ep.scheme != "wss")
    throw std::invalid_argument("unsupported scheme: " + ep.scheme);
auto rest = url.substr(scheme_pos + 3);
auto slash = rest.find_first_of("/?");
std::string hp = (slash == std::string::npos) ? rest : rest.substr(0, slash);
if(slash != std::string::npos)
    ep.target = rest[slash] == '?' ? "/" + rest.substr(slash) : rest.substr(slash);
auto colon = hp.find(':');
if(colon == std::string::npos){
    ep.host = hp;
    ep.port = ep.secure() ? "443" : "80";
} else {
    ep.host = hp.substr(0, colon);
    ep.port = hp.substr(colon + 1);
}
if(ep.host.empty()) throw std::invalid_argument("missing host in url: " + url);
if(ep.port.empty()) throw std::invalid_argument("empty port in url: " + url);
return ep;
}


// joins a base target ("/api/v9") with a path ("/channels/1")
inline std::string join_target(const std::string& base, const std::string& path){
if(base.empty() || base == "/") return path;
if(base.back() == '/') return base.substr(0, base.size() - 1) + path;
return base + path;
}
