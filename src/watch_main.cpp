/*
 * File: src/watch_main.cpp
 * Project: Channel Watch
 * Purpose: Command line entry: load configuration, run the monitor or the alert test
 * Last updated: 2026-10-19
 */

#include <iostream>

#include "watch_config.hpp"
#include "watch_log.hpp"
#include "watch_monitor.hpp"

int main(int argc, char **argv)
{
    WatchConfig cfg;
    try
    {
        cfg = load_config(argc, argv);
    }
    catch (const ConfigError &e)
    {
        std::cerr << "Configuration error: " << e.what() << "\n\n";
        print_usage(std::cerr, argv[0]);
        return 1;
    }
    if (cfg.command == "help")
    {
        print_usage(std::cout, argv[0]);
        return 0;
    }
    log_verbose() = cfg.verbose;

    try
    {
        if (cfg.command == "test")
            return run_alert_test(cfg);

        log_info("CONFIG", "Channel ID: " + cfg.channel_id);
        log_info("CONFIG", "Sound path: " + cfg.sound_path);
        log_info("CONFIG", "Polling every " + std::to_string(cfg.poll_interval.count()) + "ms + gateway real-time events");
        return run_monitor(cfg);
    }
    catch (const ConfigError &e)
    {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    }
}
