/*
 * File: include/common/watch_errors.hpp
 * Project: Channel Watch
 * Purpose: Exception taxonomy shared by poller, gateway and alert code
 * Notes:
 *  - Loops catch these at their own boundary, log and retry
 *  - Only ConfigError is fatal (startup)
 * Last updated: 2026-10-19
 */

#pragma once
#include <stdexcept>
#include <string>

struct WatchError : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

// connect / send / receive failures on a socket or stream
struct TransportError : WatchError
{
    using WatchError::WatchError;
};

// malformed or out-of-sequence gateway frames
struct ProtocolError : WatchError
{
    using WatchError::WatchError;
};

// REST non-success, network failure or undecodable body
struct FetchError : WatchError
{
    using WatchError::WatchError;
};

struct ConfigError : WatchError
{
    using WatchError::WatchError;
};
