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
 * @file stdio_server.cpp
 * @brief Implementation of the line transport.
 */

#include "docgate/network/stdio_server.hpp"

#include "docgate/infra/logger.hpp"
#include "docgate/infra/string.hpp"

#include <string>

namespace docgate::network {

StdioServer::StdioServer(Dispatcher& dispatcher, std::istream& in, std::ostream& out)
    : dispatcher_(dispatcher), in_(in), out_(out), running_(false)
{
}

std::size_t StdioServer::run()
{
    running_ = true;
    infra::Logger::log(infra::LogLevel::INFO, "Network: Listening on stdio");

    std::size_t processed = 0;
    std::string line;
    while (running_ && std::getline(in_, line)) {
        if (infra::String::trim(line).empty()) {
            continue;
        }

        auto response = dispatcher_.process(line);
        ++processed;

        if (response) {
            out_ << *response << '\n';
            out_.flush();
            if (!out_) {
                infra::Logger::log(infra::LogLevel::ERROR,
                                   "Network: Output stream closed, stopping");
                break;
            }
        }

        if (dispatcher_.shutdown_requested()) {
            break;
        }
    }

    running_ = false;
    infra::Logger::log(infra::LogLevel::INFO,
                       "Network: Session closed after " + std::to_string(processed) +
                           " message(s)");
    return processed;
}

} // namespace docgate::network
