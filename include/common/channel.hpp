/*
 * File: include/common/channel.hpp
 * Project: Channel Watch
 * Purpose: Channel record, watched name and the shared last-name store
 * Notes:
 *  - NameStore is the single source of truth for "last observed name"
 *  - Poller and gateway client must share one instance
 * Last updated: 2026-10-19
 */

#pragma once
#include <optional>
#include <string>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <nlohmann/json.hpp>


// empty = channel has no name, or nothing observed yet
using WatchedName = std::optional<std::string>;


struct ChannelRecord {
std::string id;
WatchedName name;
};


// Throws nlohmann::json::exception or std::invalid_argument on a bad shape.
inline ChannelRecord channel_from_json(const nlohmann::json& j){
if(!j.is_object()) throw std::invalid_argument("channel record is not an object");
ChannelRecord c;
c.id = j.at("id").get<std::string>();
auto it = j.find("name");
if(it != j.end() && !it->is_null()) c.name = it->get<std::string>();
return c;
}


inline std::string describe_name(const WatchedName& n){
return n ? "'" + *n + "'" : std::string("<none>");
}


class NameStore {
mutable std::shared_mutex m_;
WatchedName last_{};
public:
WatchedName get() const { std::shared_lock lk(m_); return last_; }
void set(WatchedName n){ std::unique_lock lk(m_); last_ = std::move(n); }

// Compare-and-replace. Only the caller that actually changes the value gets true.
bool update(const WatchedName& observed){
{ std::shared_lock lk(m_); if(last_ == observed) return false; }
std::unique_lock lk(m_);
if(last_ == observed) return false;
last_ = observed;
return true;
}
};
