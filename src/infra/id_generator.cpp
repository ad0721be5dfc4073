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
 * @file id_generator.cpp
 * @brief Implementation of the identifier generation utility.
 */

#include "docgate/infra/id_generator.hpp"

#include <atomic>
#include <chrono>
#include <random>

namespace docgate::infra {

namespace {

/// Draws 64 random bits from a thread-local Mersenne Twister.
std::uint64_t random_bits()
{
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    static thread_local std::uniform_int_distribution<std::uint64_t> dis;
    return dis(gen);
}

} // namespace

/**
 * @brief Generates an ObjectId-layout identifier.
 *
 * Implementation Strategy:
 * 1. **Process Nonce**: 40 random bits fixed for the lifetime of the process
 * (function-local static, initialized once in a thread-safe manner).
 * 2. **Counter**: A 24-bit atomic counter with a random origin, so two processes that
 * start within the same second still diverge.
 * 3. **Timestamp**: Current wall-clock seconds, written big-endian so identifiers sort
 * by creation time.
 */
std::array<std::uint8_t, 12> IdGenerator::generate()
{
    static const std::uint64_t process_nonce = random_bits() & 0xFFFFFFFFFFULL;
    static std::atomic<std::uint32_t> counter{static_cast<std::uint32_t>(random_bits())};

    const auto seconds = static_cast<std::uint32_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch())
            .count());
    const std::uint32_t count = counter.fetch_add(1) & 0xFFFFFF;

    std::array<std::uint8_t, 12> bytes{};

    // Group 1: Timestamp (4 bytes)
    bytes[0] = static_cast<std::uint8_t>(seconds >> 24);
    bytes[1] = static_cast<std::uint8_t>(seconds >> 16);
    bytes[2] = static_cast<std::uint8_t>(seconds >> 8);
    bytes[3] = static_cast<std::uint8_t>(seconds);

    // Group 2: Process nonce (5 bytes)
    for (int i = 0; i < 5; ++i) {
        bytes[4 + i] = static_cast<std::uint8_t>(process_nonce >> (8 * (4 - i)));
    }

    // Group 3: Counter (3 bytes)
    bytes[9] = static_cast<std::uint8_t>(count >> 16);
    bytes[10] = static_cast<std::uint8_t>(count >> 8);
    bytes[11] = static_cast<std::uint8_t>(count);

    return bytes;
}

} // namespace docgate::infra
