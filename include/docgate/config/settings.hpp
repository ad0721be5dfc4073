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
 * @file settings.hpp
 * @brief Process configuration from environment variables and command-line flags.
 *
 * @details
 * | Environment                 | Flag                    | Default |
 * |-----------------------------|-------------------------|---------|
 * | DOCGATE_ALLOW_DANGEROUS     | --dangerous             | false   |
 * | DOCGATE_MAX_DOCUMENTS       | --max-documents N       | 1000    |
 * | DOCGATE_MAX_PIPELINE_STAGES | --max-stages N          | 20      |
 * | DOCGATE_MAX_STRING_LENGTH   | --max-string-length N   | 1000    |
 * | DOCGATE_MAX_DEPTH           | --max-depth N           | 10      |
 * | DOCGATE_TIMEOUT             | --timeout SECONDS       | 30      |
 * | DOCGATE_DEFAULT_LIMIT       | --default-limit N       | 100     |
 * | DOCGATE_LOG_LEVEL           | --log-level LEVEL       | info    |
 *
 * Flags override the environment. Flags take their value either as the next argument or
 * after `=`; `--dangerous` alone means true.
 */

#pragma once

#include "docgate/infra/logger.hpp"
#include "docgate/security/policy.hpp"

#include <functional>
#include <optional>
#include <string>

namespace docgate::config {

/**
 * @struct Settings
 * @brief Fully resolved startup configuration.
 */
struct Settings {
    /// @brief Looks up one environment variable; `std::nullopt` when unset.
    using Environment = std::function<std::optional<std::string>(const std::string&)>;

    security::PolicyConfig policy;
    infra::LogLevel log_level = infra::LogLevel::INFO;
    bool show_help = false;

    /**
     * @brief Resolves settings from defaults, then `env`, then `argv`.
     *
     * @throws ConfigurationError on an unknown flag, a missing flag value, a boolean that is
     * not one of true/false/1/0/yes/no/on/off, a non-positive integer or an unknown log level.
     */
    static Settings load(int argc, const char* const argv[], const Environment& env);

    /// @brief Environment backed by `std::getenv`.
    static Environment process_environment();

    /// @brief Help text printed for `--help`.
    static std::string usage(const std::string& binary);
};

} // namespace docgate::config
