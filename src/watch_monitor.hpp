/*
 * File: src/watch_monitor.hpp
 * Project: Channel Watch
 * Purpose: Bootstrap the last-known name, then run poller and gateway together
 * Notes:
 *  - poller and gateway share one WatchState and one AlertController
 *  - SIGINT/SIGTERM stop the monitor, SIGUSR1 acknowledges (stops) the alarm
 * Last updated: 2026-10-19
 */

#pragma once
#include <boost/asio.hpp>

#include <csignal>
#include <functional>
#include <thread>

#include "watch_config.hpp"
#include "watch_fetch.hpp"
#include "watch_gateway.hpp"
#include "watch_poll.hpp"
#include "watch_state.hpp"
#include "watch_ws.hpp"

class ChannelMonitor
{
    std::string token_;
    WatchState &state_;
    ChannelFetcher &fetcher_;
    AlertController &alerts_;
    Poller poller_;
    GatewayClient gateway_;

public:
    ChannelMonitor(std::string token, WatchState &state, ChannelFetcher &fetcher, GatewayConnector &connector,
                   AlertController &alerts, std::chrono::milliseconds poll_interval, GatewayTiming timing = {})
        : token_(token), state_(state), fetcher_(fetcher), alerts_(alerts),
          poller_(fetcher, token, state, alerts, poll_interval),
          gateway_(connector, token, state, alerts, timing) {}

    // Seeds the store without alerting; a failed fetch leaves it empty.
    void bootstrap()
    {
        log_info("MONITOR", "Fetching initial channel state...");
        try
        {
            auto name = fetcher_.fetch_name(token_, state_.channel_id);
            state_.names.set(name);
            log_info("MONITOR", "Current channel name: " + describe_name(name));
        }
        catch (const FetchError &e)
        {
            log_error("MONITOR", std::string("Failed to fetch initial channel state: ") + e.what());
        }
    }

    // Blocks until stop().
    void run()
    {
        log_info("MONITOR", "Starting dual-mode monitoring (REST polling + gateway)...");
        std::thread poll_thread([this]
                                { poller_.run(); });
        gateway_.run();
        poller_.stop();
        poll_thread.join();
    }

    void stop()
    {
        poller_.stop();
        gateway_.stop();
    }

    GatewayClient &gateway() { return gateway_; }
    Poller &poller() { return poller_; }
};

// Entry point for the command line: wires the real network and OS pieces.
inline int run_monitor(const WatchConfig &cfg)
{
    WatchState state{cfg.channel_id};
    ProcessAlertBackend backend;
    AlertController alerts{backend, cfg.sound_path};
    HttpChannelFetcher fetcher{cfg.api_base};
    BeastGatewayConnector connector{cfg.gateway_url};

    GatewayTiming timing;
    timing.reconnect_delay = cfg.reconnect_delay;
    ChannelMonitor monitor{cfg.token, state, fetcher, connector, alerts, cfg.poll_interval, timing};

    boost::asio::io_context sig_ioc{1};
    boost::asio::signal_set signals{sig_ioc, SIGINT, SIGTERM, SIGUSR1};
    std::function<void()> arm;
    arm = [&]
    {
        signals.async_wait([&](const boost::system::error_code &ec, int sig)
                           {
            if (ec)
                return; // cancelled on shutdown
            if (sig == SIGUSR1)
            {
                log_info("MONITOR", "Alarm acknowledged");
                alerts.stop();
                arm();
                return;
            }
            log_info("MONITOR", "Received shutdown signal, stopping...");
            alerts.stop();
            monitor.stop(); });
    };
    arm();
    std::thread sig_thread([&]
                           { sig_ioc.run(); });

    monitor.bootstrap();
    monitor.run();

    boost::system::error_code ec;
    signals.cancel(ec);
    if (ec)
        log_error("MONITOR", "signal cancel: " + ec.message());
    sig_ioc.stop();
    sig_thread.join();

    log_info("MONITOR", "Stopped. " + stats_summary(state, alerts));
    return 0;
}

// Notification + one playback, then exit.
inline int run_alert_test(const WatchConfig &cfg)
{
    log_info("ALERT", "Testing notification system...");
    std::error_code ec;
    if (!fs::exists(cfg.sound_path, ec))
        log_error("ALERT", "Warning: sound file not found at " + cfg.sound_path);
    ProcessAlertBackend backend;
    AlertController alerts{backend, cfg.sound_path};
    alerts.test_once("TEST-CHANNEL");
    log_info("ALERT", "Test complete (" + std::to_string(alerts.played()) + " playback)");
    return alerts.played() == 1 ? 0 : 1;
}
