/*
 * File: src/watch_config.hpp
 * Project: Channel Watch
 * Purpose: Configuration from .env file, environment and command line
 * Notes:
 *  - precedence: command line > environment > .env file > defaults
 *  - missing DISCORD_TOKEN / CHANNEL_ID is the only fatal condition
 * Last updated: 2026-10-19
 */

#pragma once
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "common/watch_errors.hpp"

namespace fs = std::filesystem;

struct WatchConfig
{
    std::string command = "run"; // run | test
    std::string token;
    std::string channel_id;
    std::string sound_path;
    std::string api_base = "https://discord.com/api/v9";
    std::string gateway_url = "wss://gateway.discord.gg/?v=9&encoding=json";
    std::string env_file = ".env";
    std::chrono::milliseconds poll_interval{1500};
    std::chrono::milliseconds reconnect_delay{5000};
    bool verbose = false;
};

inline std::string trim(const std::string &s)
{
    auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
        return "";
    auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

// KEY=VALUE per line; '#' comments, optional "export ", optional quotes
inline std::map<std::string, std::string> parse_env_text(const std::string &text)
{
    std::map<std::string, std::string> out;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line))
    {
        line = trim(line);
        if (line.empty() || line[0] == '#')
            continue;
        if (line.rfind("export ", 0) == 0)
            line = trim(line.substr(7));
        auto eq = line.find('=');
        if (eq == std::string::npos)
            continue;
        auto key = trim(line.substr(0, eq));
        auto value = trim(line.substr(eq + 1));
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front())
            value = value.substr(1, value.size() - 2);
        if (!key.empty())
            out[key] = value;
    }
    return out;
}

// Exports entries not already set in the environment. False if the file is absent.
inline bool load_env_file(const fs::path &path)
{
    std::ifstream f(path);
    if (!f)
        return false;
    std::ostringstream ss;
    ss << f.rdbuf();
    for (const auto &[key, value] : parse_env_text(ss.str()))
    {
        if (::setenv(key.c_str(), value.c_str(), 0) != 0)
            throw ConfigError("setenv failed for " + key);
    }
    return true;
}

inline std::string env_or(const char *name, const std::string &fallback)
{
    const char *v = std::getenv(name);
    return (v && *v) ? std::string(v) : fallback;
}

// boom.mp3 beside the executable, then two levels up, then the working directory
inline std::string default_sound_path()
{
    std::error_code ec;
    auto exe = fs::read_symlink("/proc/self/exe", ec);
    if (!ec)
    {
        auto dir = exe.parent_path();
        if (fs::exists(dir / "boom.mp3", ec))
            return (dir / "boom.mp3").string();
        auto up = dir.parent_path().parent_path();
        if (!up.empty() && fs::exists(up / "boom.mp3", ec))
            return (up / "boom.mp3").string();
    }
    return "boom.mp3";
}

inline std::chrono::milliseconds parse_seconds(const std::string &flag, const std::string &value)
{
    double secs = 0;
    try
    {
        size_t used = 0;
        secs = std::stod(value, &used);
        if (used != value.size())
            throw std::invalid_argument(value);
    }
    catch (const std::exception &)
    {
        throw ConfigError(flag + " expects a number of seconds, got '" + value + "'");
    }
    // whole milliseconds, between 1 ms and one day
    constexpr double max_ms = 86400.0 * 1000.0;
    const double ms = secs * 1000.0;
    if (!std::isfinite(secs) || ms < 1.0 || ms > max_ms)
        throw ConfigError(flag + " must be between 0.001 and 86400 seconds, got '" + value + "'");
    return std::chrono::milliseconds(static_cast<long long>(ms));
}

inline void print_usage(std::ostream &os, const char *program_name)
{
    os << "Usage: " << program_name << " [run|test] [options]\n"
       << "\n"
       << "Commands:\n"
       << "  run                     Watch the channel (default)\n"
       << "  test                    Send one test notification and play the sound once\n"
       << "\n"
       << "Options:\n"
       << "  --env FILE              .env file to load (default: ./.env)\n"
       << "  --sound PATH            Alarm sound (env SOUND_PATH)\n"
       << "  --poll-interval SECS    REST poll interval (default: 1.5)\n"
       << "  --reconnect-delay SECS  Gateway reconnect delay (default: 5)\n"
       << "  --api URL               REST base (env DISCORD_API_BASE)\n"
       << "  --gateway URL           Gateway url (env DISCORD_GATEWAY_URL)\n"
       << "  --verbose               Log heartbeats\n"
       << "  -h, --help              Show this help\n"
       << "\n"
       << "Environment:\n"
       << "  DISCORD_TOKEN           Account token (required for run)\n"
       << "  CHANNEL_ID              Channel to watch (required for run)\n";
}

// Throws ConfigError. command == "help" when usage was asked for.
inline WatchConfig load_config(int argc, char **argv)
{
    WatchConfig cfg;
    std::map<std::string, std::string> flags;
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "-h" || a == "--help")
        {
            cfg.command = "help";
            return cfg;
        }
        else if (a == "--verbose")
            cfg.verbose = true;
        else if (a == "run" || a == "test")
            cfg.command = a;
        else if ((a == "--env" || a == "--sound" || a == "--poll-interval" || a == "--reconnect-delay" ||
                  a == "--api" || a == "--gateway") &&
                 i + 1 < argc)
            flags[a] = argv[++i];
        else
            throw ConfigError("unknown argument: " + a);
    }

    if (flags.count("--env"))
    {
        cfg.env_file = flags["--env"];
        if (!load_env_file(cfg.env_file))
            throw ConfigError("cannot read env file: " + cfg.env_file);
    }
    else
    {
        load_env_file(cfg.env_file); // optional
    }

    cfg.token = env_or("DISCORD_TOKEN", "");
    cfg.channel_id = env_or("CHANNEL_ID", "");
    cfg.sound_path = flags.count("--sound") ? flags["--sound"] : env_or("SOUND_PATH", default_sound_path());
    cfg.api_base = flags.count("--api") ? flags["--api"] : env_or("DISCORD_API_BASE", cfg.api_base);
    cfg.gateway_url = flags.count("--gateway") ? flags["--gateway"] : env_or("DISCORD_GATEWAY_URL", cfg.gateway_url);
    if (flags.count("--poll-interval"))
        cfg.poll_interval = parse_seconds("--poll-interval", flags["--poll-interval"]);
    if (flags.count("--reconnect-delay"))
        cfg.reconnect_delay = parse_seconds("--reconnect-delay", flags["--reconnect-delay"]);

    if (cfg.command == "run")
    {
        if (cfg.token.empty())
            throw ConfigError("DISCORD_TOKEN environment variable not set");
        if (cfg.channel_id.empty())
            throw ConfigError("CHANNEL_ID environment variable not set");
    }
    return cfg;
}
