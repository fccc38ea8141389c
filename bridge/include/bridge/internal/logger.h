/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <cassert>
#include <cstddef>
#include <string>

#include <fmt/format.h>

// implemented by the host application, bridge_logging provides an spdlog backed version
extern "C"
{
    void bridge_log(int level, const char* str, size_t sz);
}

namespace bridge
{
    namespace log_level
    {
        constexpr int debug = 0;
        constexpr int trace = 1;
        constexpr int info = 2;
        constexpr int warn = 3;
        constexpr int err = 4;
        constexpr int critical = 5;
    }
}

#define BRIDGE_LOG_AT(level, ...)                                                                                      \
    do                                                                                                                 \
    {                                                                                                                  \
        auto bridge_log_message_ = fmt::format(__VA_ARGS__);                                                           \
        bridge_log(level, bridge_log_message_.data(), bridge_log_message_.size());                                     \
    } while (0)

#ifdef BRIDGE_DISABLE_DEBUG_LOGGING
#define BRIDGE_DEBUG(...)                                                                                              \
    do                                                                                                                 \
    {                                                                                                                  \
    } while (0)
#define BRIDGE_TRACE(...)                                                                                              \
    do                                                                                                                 \
    {                                                                                                                  \
    } while (0)
#else
#define BRIDGE_DEBUG(...) BRIDGE_LOG_AT(bridge::log_level::debug, __VA_ARGS__)
#define BRIDGE_TRACE(...) BRIDGE_LOG_AT(bridge::log_level::trace, __VA_ARGS__)
#endif

#define BRIDGE_INFO(...) BRIDGE_LOG_AT(bridge::log_level::info, __VA_ARGS__)
#define BRIDGE_WARNING(...) BRIDGE_LOG_AT(bridge::log_level::warn, __VA_ARGS__)
#define BRIDGE_ERROR(...) BRIDGE_LOG_AT(bridge::log_level::err, __VA_ARGS__)
#define BRIDGE_CRITICAL(...) BRIDGE_LOG_AT(bridge::log_level::critical, __VA_ARGS__)

#define BRIDGE_ASSERT(x) assert(x)
