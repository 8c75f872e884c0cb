/*
 * File: src/watch_poll.hpp
 * Project: Channel Watch
 * Purpose: Fixed-interval REST poller
 * Notes:
 *  - sleep, fetch, reconcile; failures are logged and the loop goes on
 *  - no backoff: the interval is the whole retry policy
 * Last updated: 2026-10-19
 */

#pragma once
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>

#include "watch_fetch.hpp"
#include "watch_state.hpp"

class Poller
{
    ChannelFetcher &fetcher_;
    std::string token_;
    WatchState &state_;
    AlertController &alerts_;
    std::chrono::milliseconds interval_;

    std::mutex m_;
    std::condition_variable cv_;
    bool stopped_ = false;

public:
    Poller(ChannelFetcher &fetcher, std::string token, WatchState &state, AlertController &alerts,
           std::chrono::milliseconds interval = std::chrono::milliseconds(1500))
        : fetcher_(fetcher), token_(std::move(token)), state_(state), alerts_(alerts), interval_(interval) {}

    void run()
    {
        while (wait_interval())
            poll_once();
    }

    // One fetch + reconcile. True when the stored name changed.
    bool poll_once()
    {
        try
        {
            auto name = fetcher_.fetch_name(token_, state_.channel_id);
            return reconcile_name(state_, alerts_, name, "POLL");
        }
        catch (const FetchError &e)
        {
            log_error("POLL", std::string("Failed to fetch channel: ") + e.what());
            return false;
        }
    }

    void stop()
    {
        {
            std::scoped_lock lk(m_);
            stopped_ = true;
        }
        cv_.notify_all();
    }

    std::chrono::milliseconds interval() const { return interval_; }

private:
    // false once stop() was called
    bool wait_interval()
    {
        std::unique_lock lk(m_);
        return !cv_.wait_for(lk, interval_, [this] { return stopped_; });
    }
};
