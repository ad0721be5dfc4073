/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file logger.hpp
 * @brief Thread-safe diagnostic logging facility for DocGate.
 *
 * @details
 * This header declares the `Logger` class, the single reporting interface of the
 * gateway. Because `stdout` is reserved for protocol responses, every diagnostic line
 * is written to `stderr`, whatever its severity.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <optional>
#include <string>

namespace docgate::infra {

/**
 * @enum LogLevel
 * @brief Severity hierarchy for diagnostic messages.
 */
enum class LogLevel {
    TRACE, ///< Per-node traversal details.
    DEBUG, ///< Per-request dispatch information.
    INFO,  ///< Startup, shutdown and write operations.
    WARN,  ///< Rejected requests and unusual but recoverable conditions.
    ERROR, ///< Store failures.
    FATAL  ///< Failures that terminate the process.
};

/**
 * @class Logger
 * @brief A static utility class providing process-wide logging.
 *
 * @details
 * Output is serialized through an internal mutex so entries from concurrent callers
 * never interleave. Messages below the threshold set with `set_level()` are dropped
 * before any formatting work happens.
 */
class Logger {
  public:
    /**
     * @brief Writes a formatted diagnostic message to `stderr`.
     *
     * The output includes a timestamp, the severity tag, and the payload.
     *
     * @param level The severity classification of the message.
     * @param message The content payload to be logged.
     *
     * @code
     * docgate::infra::Logger::log(LogLevel::WARN, "Security: Rejected operator '$where'");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /**
     * @brief Sets the minimum severity that is emitted. Defaults to `INFO`.
     */
    static void set_level(LogLevel level);

    /// @brief Returns the current minimum severity.
    static LogLevel level();

    /**
     * @brief Parses a level name ("trace", "debug", "info", "warn", "error", "fatal").
     *
     * Matching is case-insensitive; "warning" is accepted as an alias of "warn".
     *
     * @return The level, or `std::nullopt` for an unknown name.
     */
    static std::optional<LogLevel> parse_level(const std::string& name);

  private:
    /// @brief Guards `std::cerr` and `std::localtime`'s static buffer.
    static std::mutex mutex_;

    /// @brief Minimum emitted severity.
    static std::atomic<LogLevel> threshold_;
};

} // namespace docgate::infra
