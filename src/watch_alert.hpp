/*
 * File: src/watch_alert.hpp
 * Project: Channel Watch
 * Purpose: Alert lifecycle: notify once, loop the alarm sound until stopped
 * Notes:
 *  - one alert loop at a time; trigger() while sounding only re-notifies
 *  - stop() is honoured within one check step, playback in flight is not killed
 * Last updated: 2026-10-19
 */

#pragma once
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <boost/process.hpp>

#include "watch_log.hpp"

class AlertBackend
{
public:
    virtual ~AlertBackend() = default;
    // Both block until the external action finishes; throw on failure.
    virtual void notify(const std::string &title, const std::string &body) = 0;
    virtual void play(const std::string &sound_path) = 0;
};

inline const char *alert_title() { return "CHANNEL OPEN"; }

inline std::string alert_body(const std::string &channel_name)
{
    return "Channel is now: " + channel_name;
}

inline std::vector<std::string> notification_args(const std::string &title, const std::string &body)
{
    return {"-u", "critical", title, body};
}

inline std::vector<std::string> sound_args(const std::string &sound_path)
{
    return {"--no-video", "--really-quiet", sound_path};
}

// notify-send + mpv as child processes
class ProcessAlertBackend : public AlertBackend
{
public:
    void notify(const std::string &title, const std::string &body) override
    {
        run_tool("notify-send", notification_args(title, body));
    }

    void play(const std::string &sound_path) override
    {
        run_tool("mpv", sound_args(sound_path));
    }

private:
    static void run_tool(const std::string &tool, const std::vector<std::string> &args)
    {
        namespace bp = boost::process;
        auto exe = bp::search_path(tool);
        if (exe.empty())
            throw std::runtime_error(tool + " not found in PATH");
        int rc = 0;
        try
        {
            rc = bp::system(exe, bp::args(args), bp::std_out > bp::null, bp::std_err > bp::null);
        }
        catch (const bp::process_error &e)
        {
            throw std::runtime_error(tool + " failed to start: " + e.what());
        }
        if (rc != 0)
            throw std::runtime_error(tool + " exited with status " + std::to_string(rc));
    }
};

struct AlertTiming
{
    std::chrono::milliseconds cycle{3000}; // pause between playbacks
    std::chrono::milliseconds step{100};   // granularity of the stop check
};

class AlertController
{
    AlertBackend &backend_;
    std::string sound_path_;
    AlertTiming timing_;

    std::atomic<bool> running_{false};
    std::atomic<bool> sounding_{false};
    std::atomic<uint64_t> generation_{0};
    std::atomic<uint64_t> triggered_{0};
    std::atomic<uint64_t> played_{0};

    std::mutex loop_mtx_; // guards loop_ and clearing sounding_
    std::thread loop_;
    std::mutex wake_mtx_;
    std::condition_variable wake_;

public:
    AlertController(AlertBackend &backend, std::string sound_path, AlertTiming timing = {})
        : backend_(backend), sound_path_(std::move(sound_path)), timing_(timing) {}

    ~AlertController()
    {
        stop();
        std::thread last;
        {
            std::scoped_lock lk(loop_mtx_);
            last = std::move(loop_);
        }
        // each loop joins the one it replaced
        if (last.joinable())
            last.join();
    }

    AlertController(const AlertController &) = delete;
    AlertController &operator=(const AlertController &) = delete;

    void trigger(const std::string &channel_name)
    {
        triggered_.fetch_add(1);
        bool expected = false;
        const bool start_loop = running_.compare_exchange_strong(expected, true);

        log_info("ALERT", "ALARM STARTED for channel: " + channel_name);
        send_notification(channel_name);
        if (!start_loop)
            return; // already sounding

        std::scoped_lock lk(loop_mtx_);
        const uint64_t gen = generation_.fetch_add(1) + 1;
        sounding_ = true;
        // a stopped loop may still be inside play(); its successor joins it
        loop_ = std::thread([this, gen, previous = std::move(loop_)]() mutable
                            {
            if (previous.joinable())
                previous.join();
            alert_loop(gen); });
    }

    void stop()
    {
        {
            std::scoped_lock lk(wake_mtx_);
            running_ = false;
        }
        wake_.notify_all();
    }

    bool running() const { return running_.load(); }
    // true while the loop thread has not exited
    bool sounding() const { return sounding_.load(); }
    uint64_t triggered() const { return triggered_.load(); }
    uint64_t played() const { return played_.load(); }
    const std::string &sound_path() const { return sound_path_; }

    // one notification + one playback, no loop
    void test_once(const std::string &channel_name)
    {
        send_notification(channel_name);
        play_once();
    }

private:
    bool active(uint64_t gen) const
    {
        return running_.load() && generation_.load() == gen;
    }

    void send_notification(const std::string &channel_name)
    {
        try
        {
            backend_.notify(alert_title(), alert_body(channel_name));
        }
        catch (const std::exception &e)
        {
            log_error("ALERT", std::string("Failed to send notification: ") + e.what());
        }
    }

    void play_once()
    {
        try
        {
            backend_.play(sound_path_);
            played_.fetch_add(1);
        }
        catch (const std::exception &e)
        {
            log_error("ALERT", std::string("Failed to play sound: ") + e.what());
        }
    }

    void alert_loop(uint64_t gen)
    {
        while (active(gen))
        {
            play_once();
            auto remaining = timing_.cycle;
            std::unique_lock lk(wake_mtx_);
            while (remaining.count() > 0 && active(gen))
            {
                auto slice = std::min(remaining, timing_.step);
                wake_.wait_for(lk, slice, [&] { return !active(gen); });
                remaining -= slice;
            }
        }
        {
            std::scoped_lock lk(loop_mtx_);
            if (generation_.load() == gen)
                sounding_ = false; // a newer loop owns the flag otherwise
        }
        log_info("ALERT", "Alarm loop stopped");
    }
};
