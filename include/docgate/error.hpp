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
 * @file error.hpp
 * @brief Failure taxonomy of the gateway.
 *
 * @details
 * Every rejection raised by the gateway derives from `docgate::Error`, which itself
 * derives from `std::runtime_error` so top-level handlers can keep catching
 * `std::exception`. The concrete type tells the wire layer which error code to emit.
 *
 * Ordering guarantee: `ValidationError`, `SanitizationError` and `PermissionDenied` are
 * always raised before the store is contacted. `ExecutionFailed` is only raised after a
 * store call failed.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace docgate {

/**
 * @enum ErrorKind
 * @brief Coarse classification used for wire error codes and log tags.
 */
enum class ErrorKind {
    VALIDATION,    ///< Forbidden operator/stage, malformed stage or pipeline too long.
    SANITIZATION,  ///< Depth exceeded, string too long or document too large.
    PERMISSION,    ///< Write or privileged operation without dangerous mode.
    EXECUTION,     ///< The store reported a failure.
    CONFIGURATION  ///< Invalid configuration value (loader only).
};

/**
 * @brief Returns the taxonomy name of an error kind (e.g. "ValidationError").
 */
inline const char* to_string(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::VALIDATION:
        return "ValidationError";
    case ErrorKind::SANITIZATION:
        return "SanitizationError";
    case ErrorKind::PERMISSION:
        return "PermissionDenied";
    case ErrorKind::EXECUTION:
        return "ExecutionFailed";
    case ErrorKind::CONFIGURATION:
        return "ConfigurationError";
    }
    return "Error";
}

/**
 * @class Error
 * @brief Base class of every gateway failure.
 */
class Error : public std::runtime_error {
  public:
    Error(ErrorKind kind, const std::string& message) : std::runtime_error(message), kind_(kind)
    {
    }

    ErrorKind kind() const noexcept { return kind_; }

  private:
    ErrorKind kind_;
};

/**
 * @class ValidationError
 * @brief A policy violation detected while inspecting query or pipeline structure.
 *
 * Carries the offending operator/stage name and the path where it was found, so the
 * caller can fix the request without the gateway echoing the rejected payload back.
 */
class ValidationError : public Error {
  public:
    explicit ValidationError(const std::string& message, std::string offender = "",
                             std::string location = "")
        : Error(ErrorKind::VALIDATION, message), offender_(std::move(offender)),
          location_(std::move(location))
    {
    }

    /// @brief The operator, stage or name that was rejected (may be empty).
    const std::string& offender() const noexcept { return offender_; }

    /// @brief Dotted path to the rejected key, e.g. `$or[1].age` or `pipeline[3]`.
    const std::string& location() const noexcept { return location_; }

  private:
    std::string offender_;
    std::string location_;
};

/**
 * @class SanitizationError
 * @brief Input exceeded a resource bound or had the wrong scalar type.
 */
class SanitizationError : public Error {
  public:
    explicit SanitizationError(const std::string& message)
        : Error(ErrorKind::SANITIZATION, message)
    {
    }
};

/**
 * @class DepthExceeded
 * @brief Nesting deeper than the configured maximum.
 */
class DepthExceeded : public SanitizationError {
  public:
    explicit DepthExceeded(const std::string& message) : SanitizationError(message) {}
};

/**
 * @class PermissionDenied
 * @brief A mutating operation was attempted while dangerous mode is off.
 */
class PermissionDenied : public Error {
  public:
    explicit PermissionDenied(const std::string& message) : Error(ErrorKind::PERMISSION, message)
    {
    }
};

/**
 * @class ExecutionFailed
 * @brief Wraps a store-reported failure.
 */
class ExecutionFailed : public Error {
  public:
    explicit ExecutionFailed(const std::string& message) : Error(ErrorKind::EXECUTION, message) {}
};

/**
 * @class ConfigurationError
 * @brief Raised by the settings loader for unusable values.
 */
class ConfigurationError : public Error {
  public:
    explicit ConfigurationError(const std::string& message)
        : Error(ErrorKind::CONFIGURATION, message)
    {
    }
};

} // namespace docgate
