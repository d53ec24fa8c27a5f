#pragma once

#include "logger.hpp"

/// Logging macros with file and line information.
/// RIVET_LOG_DEBUG is compiled out unless RIVET_DEBUG is defined.

#define RIVET_LOG_AT(lvl, fmt, ...) \
    ::rivet::log::logger::instance().log( \
        lvl, __FILE__, __LINE__, \
        fmt __VA_OPT__(,) __VA_ARGS__ \
    )

#ifdef RIVET_DEBUG
    #define RIVET_LOG_DEBUG(fmt, ...) \
        RIVET_LOG_AT(::rivet::log::level::debug, fmt __VA_OPT__(,) __VA_ARGS__)
#else
    #define RIVET_LOG_DEBUG(fmt, ...) ((void)0)
#endif

#define RIVET_LOG_INFO(fmt, ...) \
    RIVET_LOG_AT(::rivet::log::level::info, fmt __VA_OPT__(,) __VA_ARGS__)

#define RIVET_LOG_WARNING(fmt, ...) \
    RIVET_LOG_AT(::rivet::log::level::warning, fmt __VA_OPT__(,) __VA_ARGS__)

#define RIVET_LOG_ERROR(fmt, ...) \
    RIVET_LOG_AT(::rivet::log::level::error, fmt __VA_OPT__(,) __VA_ARGS__)
