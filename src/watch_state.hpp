/*
 * File: src/watch_state.hpp
 * Project: Channel Watch
 * Purpose: State shared by poller and gateway client, and the reconcile path
 * Notes:
 *  - NameStore::update() decides which observer fires the alert
 *  - counters replace the old log-scraping status script
 * Last updated: 2026-10-19
 */

#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <sstream>
#include <string>

#include "common/channel.hpp"
#include "watch_alert.hpp"
#include "watch_log.hpp"


struct WatchStats {
std::atomic<uint64_t> ws_events{0};        // CHANNEL_UPDATE for the watched channel
std::atomic<uint64_t> poll_detections{0};
std::atomic<uint64_t> ws_detections{0};
std::atomic<uint64_t> heartbeat_acks{0};
std::atomic<uint64_t> reconnects{0};
};


struct WatchState {
std::string channel_id;
NameStore names;
WatchStats stats;
std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
explicit WatchState(std::string id) : channel_id(std::move(id)) {}
};


// Returns true if this observation changed the stored name.
inline bool reconcile_name(WatchState& state, AlertController& alerts, const WatchedName& observed, const std::string& source){
if(!state.names.update(observed)) return false;
if(source == "POLL") state.stats.poll_detections.fetch_add(1);
else state.stats.ws_detections.fetch_add(1);
if(observed && !observed->empty()){
    log_info(source, "Channel name changed to: " + *observed);
    alerts.trigger(*observed);
} else {
    log_info(source, "Channel name cleared (now " + describe_name(observed) + ")");
}
return true;
}


inline std::string stats_summary(const WatchState& state, const AlertController& alerts){
auto up = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - state.start).count();
std::ostringstream oss;
oss << "uptime=" << up << "s"
    << " channel=" << describe_name(state.names.get())
    << " ws_events=" << state.stats.ws_events.load()
    << " poll_detections=" << state.stats.poll_detections.load()
    << " ws_detections=" << state.stats.ws_detections.load()
    << " heartbeat_acks=" << state.stats.heartbeat_acks.load()
    << " reconnects=" << state.stats.reconnects.load()
    << " alarms=" << alerts.triggered();
return oss.str();
}
