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
 * @file string.hpp
 * @brief Supplementary string manipulation primitives.
 *
 * @details
 * This header defines the `String` utility class, a static extension to `std::string`
 * providing the byte-level text operations used by the sanitizer, the configuration
 * loader and the extended JSON codec.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace docgate::infra {

/**
 * @class String
 * @brief A static container for text processing algorithms.
 */
class String {
  public:
    /**
     * @brief Trims leading and trailing whitespace from a string.
     *
     * **Whitespace Definitions:** space, `\t`, `\n`, `\r`, `\v`, `\f`.
     *
     * @param s The source string to process.
     * @return std::string The trimmed content, or an empty string if the input
     * consists solely of whitespace.
     *
     * @code
     * std::string clean = docgate::infra::String::trim("   active   "); // "active"
     * @endcode
     */
    static std::string trim(const std::string& s);

    /**
     * @brief Removes ASCII control characters that have no place in field names or values.
     *
     * Stripped bytes: `0x00-0x08`, `0x0B`, `0x0C`, `0x0E-0x1F` and `0x7F`. Tab (`0x09`),
     * line feed (`0x0A`) and carriage return (`0x0D`) are kept. Bytes `>= 0x80` are never
     * touched, so UTF-8 sequences survive intact.
     */
    static std::string strip_control(const std::string& s);

    /// @brief ASCII lower-casing.
    static std::string to_lower(const std::string& s);

    /// @brief Lower-case hexadecimal rendering of a byte range.
    static std::string to_hex(const std::uint8_t* data, std::size_t size);

    /**
     * @brief Parses a hexadecimal string into bytes.
     *
     * @return false if the input has odd length or a non-hex digit.
     */
    static bool from_hex(const std::string& hex, std::vector<std::uint8_t>& out);
};

} // namespace docgate::infra
