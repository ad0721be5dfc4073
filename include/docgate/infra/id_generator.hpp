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
 * @file id_generator.hpp
 * @brief Infrastructure utility for generating 12-byte document identifiers.
 *
 * @details
 * Declares the `IdGenerator` class, which produces ObjectId-layout identifiers for
 * documents inserted without an `_id`.
 */

#pragma once

#include <array>
#include <cstdint>

namespace docgate::infra {

/**
 * @class IdGenerator
 * @brief A static utility for generating ObjectId-compatible byte sequences.
 *
 * @details
 * **Layout (12 bytes, big-endian fields):**
 * - bytes 0-3: seconds since the Unix epoch.
 * - bytes 4-8: a per-process random value, drawn once.
 * - bytes 9-11: a counter, seeded randomly and incremented atomically per call.
 *
 * Identifiers generated by one process are therefore unique and roughly ordered by
 * creation time.
 */
class IdGenerator {
  public:
    /**
     * @brief Generates the next identifier.
     *
     * @code
     * auto bytes = docgate::infra::IdGenerator::generate();
     * docgate::bson::ObjectId oid(bytes);
     * @endcode
     */
    static std::array<std::uint8_t, 12> generate();
};

} // namespace docgate::infra
