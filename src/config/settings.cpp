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
 * @file settings.cpp
 * @brief Implementation of the configuration loader.
 */

#include "docgate/config/settings.hpp"

#include "docgate/error.hpp"
#include "docgate/infra/string.hpp"

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace docgate::config {

namespace {

/// @brief One configurable key, reachable as `--<flag>` and as `<env>`.
struct Option {
    const char* flag;
    const char* env;
    bool is_switch;
};

const Option kOptions[] = {
    {"dangerous", "DOCGATE_ALLOW_DANGEROUS", true},
    {"max-documents", "DOCGATE_MAX_DOCUMENTS", false},
    {"max-stages", "DOCGATE_MAX_PIPELINE_STAGES", false},
    {"max-string-length", "DOCGATE_MAX_STRING_LENGTH", false},
    {"max-depth", "DOCGATE_MAX_DEPTH", false},
    {"timeout", "DOCGATE_TIMEOUT", false},
    {"default-limit", "DOCGATE_DEFAULT_LIMIT", false},
    {"log-level", "DOCGATE_LOG_LEVEL", false},
};

const Option* find_option(const std::string& flag)
{
    for (const auto& option : kOptions) {
        if (flag == option.flag) {
            return &option;
        }
    }
    return nullptr;
}

bool parse_bool(const std::string& source, const std::string& raw)
{
    const std::string value = infra::String::to_lower(infra::String::trim(raw));
    if (value == "true" || value == "1" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "false" || value == "0" || value == "no" || value == "off") {
        return false;
    }
    throw ConfigurationError(source + ": expected a boolean, got '" + raw + "'");
}

std::int64_t parse_positive(const std::string& source, const std::string& raw,
                            std::int64_t max = std::numeric_limits<std::int32_t>::max())
{
    const std::string value = infra::String::trim(raw);
    std::size_t consumed = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(value, &consumed);
    } catch (const std::invalid_argument&) {
        throw ConfigurationError(source + ": expected a positive integer, got '" + raw + "'");
    } catch (const std::out_of_range&) {
        throw ConfigurationError(source + ": value '" + raw + "' is out of range");
    }
    if (consumed != value.size() || parsed <= 0) {
        throw ConfigurationError(source + ": expected a positive integer, got '" + raw + "'");
    }
    if (parsed > max) {
        throw ConfigurationError(source + ": value '" + raw + "' is out of range");
    }
    return parsed;
}

void apply(Settings& settings, const Option& option, const std::string& source,
           const std::string& value)
{
    const std::string key = option.flag;
    auto& policy = settings.policy;

    if (key == "dangerous") {
        policy.dangerous_mode = parse_bool(source, value);
    } else if (key == "max-documents") {
        policy.max_document_count = parse_positive(source, value);
    } else if (key == "max-stages") {
        policy.max_pipeline_stages = static_cast<std::size_t>(parse_positive(source, value));
    } else if (key == "max-string-length") {
        policy.max_string_length = static_cast<std::size_t>(parse_positive(source, value));
    } else if (key == "max-depth") {
        policy.max_depth = static_cast<int>(parse_positive(source, value));
    } else if (key == "timeout") {
        policy.timeout = std::chrono::seconds(parse_positive(source, value));
    } else if (key == "default-limit") {
        policy.default_limit = parse_positive(source, value);
    } else if (key == "log-level") {
        auto level = infra::Logger::parse_level(value);
        if (!level) {
            throw ConfigurationError(source + ": unknown log level '" + value + "'");
        }
        settings.log_level = *level;
    }
}

} // namespace

Settings Settings::load(int argc, const char* const argv[], const Environment& env)
{
    Settings settings;

    // 1. Environment
    if (env) {
        for (const auto& option : kOptions) {
            if (auto value = env(option.env)) {
                apply(settings, option, option.env, *value);
            }
        }
    }

    // 2. Flags
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            settings.show_help = true;
            continue;
        }
        if (arg.rfind("--", 0) != 0) {
            throw ConfigurationError("Unexpected argument: '" + arg + "'");
        }

        std::string name = arg.substr(2);
        std::optional<std::string> value;
        const auto eq = name.find('=');
        if (eq != std::string::npos) {
            value = name.substr(eq + 1);
            name = name.substr(0, eq);
        }

        const Option* option = find_option(name);
        if (option == nullptr) {
            throw ConfigurationError("Unknown option: --" + name);
        }
        if (!value) {
            if (option->is_switch) {
                value = "true";
            } else if (i + 1 < argc) {
                value = argv[++i];
            } else {
                throw ConfigurationError("Option --" + name + " requires a value");
            }
        }
        apply(settings, *option, "--" + name, *value);
    }

    if (settings.policy.default_limit > settings.policy.max_document_count) {
        settings.policy.default_limit = settings.policy.max_document_count;
    }
    return settings;
}

Settings::Environment Settings::process_environment()
{
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    };
}

std::string Settings::usage(const std::string& binary)
{
    std::ostringstream out;
    out << "Usage: " << binary << " [OPTIONS]\n"
        << "Serves the document gateway over JSON-RPC on stdin/stdout.\n"
        << "Options:\n"
        << "  --dangerous               Enable writes, index creation and privileged operators\n"
        << "  --max-documents N         Maximum documents per query (Default: 1000)\n"
        << "  --max-stages N            Maximum aggregation stages (Default: 20)\n"
        << "  --max-string-length N     Maximum string length (Default: 1000)\n"
        << "  --max-depth N             Maximum nesting depth (Default: 10)\n"
        << "  --timeout SECONDS         Store operation time limit (Default: 30)\n"
        << "  --default-limit N         Result limit when none is given (Default: 100)\n"
        << "  --log-level LEVEL         trace, debug, info, warn, error, fatal (Default: info)\n"
        << "  --help                    Show this help message\n"
        << "Each option may also be set through its DOCGATE_* environment variable.\n";
    return out.str();
}

} // namespace docgate::config
