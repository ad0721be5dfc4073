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
 * @file framework.hpp
 * @brief A lightweight, header-only unit testing micro-framework for docgate.
 *
 * @details
 * This utility provides a minimal footprint infrastructure for validating the gateway
 * components. It features ANSI-colored terminal output, exception-protected execution
 * blocks, and standardized assertion macros.
 */

#pragma once

#include <exception>
#include <functional>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace docgate::test {

// ========================================================================
// Global Metrics
// ========================================================================

inline int passed_count = 0; ///< Cumulative successful test counter.
inline int failed_count = 0; ///< Cumulative failed test counter.

/// @brief Raised by assertion primitives after the failure has been reported and counted.
class AssertionFailure : public std::runtime_error {
  public:
    AssertionFailure() : std::runtime_error("Assertion failed") {}
};

// ========================================================================
// Assertion Primitives
// ========================================================================

/// @brief Reports one failed assertion, counts it and aborts the current test.
[[noreturn]] inline void fail(const char* file, int line, const std::string& detail)
{
    std::cout << "\033[31m[FAIL]\033[0m " << file << ":" << line << " -> " << detail << std::endl;
    failed_count++;
    throw AssertionFailure();
}

template <typename T> std::string describe(const T& value)
{
    std::ostringstream out;
    out << value;
    return out.str();
}

/// @brief Equality check; both sides must already have the same type.
template <typename T> void assert_eq(T val1, T val2, const char* file, int line, const char* expr)
{
    if (!(val1 == val2)) {
        fail(file, line,
             std::string(expr) + " (" + describe(val1) + " != " + describe(val2) + ")");
    }
}

template <typename T> void assert_ne(T val1, T val2, const char* file, int line, const char* expr)
{
    if (val1 == val2) {
        fail(file, line, std::string(expr) + " (both " + describe(val1) + ")");
    }
}

inline void assert_true(bool cond, const char* file, int line, const char* expr)
{
    if (!cond) {
        fail(file, line, std::string(expr) + " is FALSE");
    }
}

inline void assert_true_false(bool cond, const char* file, int line, const char* expr)
{
    if (cond) {
        fail(file, line, std::string(expr) + " is TRUE");
    }
}

/**
 * @brief Validates that `func` raises an `E` (or a subclass).
 *
 * Any other exception escapes to `run`, which reports it as a failure.
 */
template <typename E>
void assert_throws(const std::function<void()>& func, const char* file, int line,
                   const char* expr)
{
    try {
        func();
    } catch (const E&) {
        return;
    }
    fail(file, line, std::string(expr) + " did not throw");
}

// ========================================================================
// Execution Orchestrator
// ========================================================================

/**
 * @brief Executes a test case within a protected execution context.
 */
inline void run(std::string_view name, std::function<void()> func)
{
    std::cout << "[RUN  ] " << name << "... " << std::flush;
    try {
        func();
        // Clear line and print pass status
        std::cout << "\r\033[32m[PASS]\033[0m " << name << "          " << std::endl;
        passed_count++;
    } catch (const AssertionFailure&) {
        // Already reported and counted by the assertion primitive
        std::cout << "\r\033[31m[FAIL]\033[0m " << name << "          " << std::endl;
    } catch (const std::exception& e) {
        std::cout << "\r\033[31m[FAIL]\033[0m " << name << " -> unexpected exception: "
                  << e.what() << std::endl;
        failed_count++;
    }
}

/**
 * @brief Emits a summary report of the current test session.
 */
inline void print_summary()
{
    std::cout << "\n\033[36m=== docgate Test Summary ===\033[0m" << std::endl;
    std::cout << "Passed: " << passed_count << std::endl;
    if (failed_count > 0) {
        std::cout << "Failed: \033[31m" << failed_count << "\033[0m" << std::endl;
    } else {
        std::cout << "Failed: 0" << std::endl;
    }
    std::cout << "Total:  " << (passed_count + failed_count) << std::endl;
}

} // namespace docgate::test

// ============================================================================
// API Macros
// ============================================================================

/**
 * @def ASSERT_EQ
 * @brief Macro for equality assertions. Includes file and line metadata.
 */
#define ASSERT_EQ(a, b) docgate::test::assert_eq((a), (b), __FILE__, __LINE__, #a " == " #b)

/**
 * @def ASSERT_NE
 * @brief Macro for inequality assertions. Includes file and line metadata.
 */
#define ASSERT_NE(a, b) docgate::test::assert_ne((a), (b), __FILE__, __LINE__, #a " != " #b)

/**
 * @def ASSERT_TRUE
 * @brief Macro for truthiness assertions.
 */
#define ASSERT_TRUE(a) docgate::test::assert_true((a), __FILE__, __LINE__, #a)

/**
 * @def ASSERT_FALSE
 * @brief Macro for falsiness assertions.
 */
#define ASSERT_FALSE(a) docgate::test::assert_true_false((a), __FILE__, __LINE__, #a)

/**
 * @def ASSERT_THROWS
 * @brief Macro asserting that a statement raises the given exception type.
 *
 * The statement comes last so that it may contain commas:
 * `ASSERT_THROWS(ValidationError, validate(query, false));`
 */
#define ASSERT_THROWS(type, ...)                                                                   \
    docgate::test::assert_throws<type>([&]() { __VA_ARGS__; }, __FILE__, __LINE__, #__VA_ARGS__)

/**
 * @def RUN_TEST
 * @brief Orchestrates the execution of a named test function.
 */
#define RUN_TEST(func_name) docgate::test::run(#func_name, func_name)
