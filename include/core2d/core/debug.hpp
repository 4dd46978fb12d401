#pragma once

#include <functional>
#include <iostream>
#include <string>

// Set to 1 to enable debug output, 0 to disable
#ifndef CORE2D_ENABLE_DEBUG
#define CORE2D_ENABLE_DEBUG 0
#endif

// Debug levels
#define CORE2D_DEBUG_LEVEL_NONE 0
#define CORE2D_DEBUG_LEVEL_BASIC 1
#define CORE2D_DEBUG_LEVEL_VERBOSE 2

#ifndef CORE2D_CURRENT_DEBUG_LEVEL
#define CORE2D_CURRENT_DEBUG_LEVEL CORE2D_DEBUG_LEVEL_BASIC
#endif

// Debug macros
#define CORE2D_DEBUG(level, x) do { \
    if (CORE2D_ENABLE_DEBUG && level <= CORE2D_CURRENT_DEBUG_LEVEL) { \
        std::cout << x; \
    } \
} while(0)

/**
 * @brief Runtime diagnostic channel.
 *
 * Non-fatal conditions (out-of-grid lookups, suspicious masses) are reported
 * through a Sink rather than written straight to a stream, so a host can
 * route them to its own log or silence them in tests.
 */
namespace Diagnostics {

enum class Level {
    Debug,
    Warning,
    Error
};

using Sink = std::function<void(Level, const std::string &)>;

/**
 * @brief Sink that writes "[core2d] <Level>: msg" lines.
 *
 * Warnings and errors go to std::cerr, debug lines to std::cout.
 */
Sink consoleSink();

/** @brief Sink that drops everything */
Sink nullSink();

const char *levelName(Level level);

/**
 * @brief Forwards to sink if it is set, otherwise to the console sink
 */
void emit(const Sink &sink, Level level, const std::string &message);

} // namespace Diagnostics
