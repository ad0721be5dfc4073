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
 * @file stdio_server.hpp
 * @brief Line-delimited message loop over a pair of streams.
 *
 * @details
 * The transport reads one JSON-RPC message per line from the input stream and writes
 * one response per line to the output stream. The output stream carries nothing else;
 * diagnostics go through the logger to `stderr`.
 */

#pragma once

#include "docgate/network/dispatcher.hpp"

#include <atomic>
#include <cstddef>
#include <istream>
#include <ostream>

namespace docgate::network {

/**
 * @class StdioServer
 * @brief Blocking request-response loop.
 *
 * **Operational Workflow:**
 * 1. **Read:** block on the next line; blank lines are skipped.
 * 2. **Process:** hand the line to the `Dispatcher`.
 * 3. **Write:** emit the response (if any) followed by `\n`, then flush.
 * 4. **Stop:** on end of input, after answering `shutdown`, or when `stop()` was called.
 */
class StdioServer {
  public:
    StdioServer(Dispatcher& dispatcher, std::istream& in, std::ostream& out);

    /**
     * @brief Runs the loop until a stop condition is met.
     *
     * @return Number of messages processed.
     */
    std::size_t run();

    /// @brief Requests the loop to end after the current message. Signal-safe.
    void stop() { running_ = false; }

  private:
    Dispatcher& dispatcher_;
    std::istream& in_;
    std::ostream& out_;
    std::atomic<bool> running_;
};

} // namespace docgate::network
