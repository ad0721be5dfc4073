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
 * @file base64.hpp
 * @brief RFC 4648 Base64 transcoding for binary payloads in extended JSON.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace docgate::infra {

/**
 * @class Base64
 * @brief Standard-alphabet Base64 with `=` padding.
 */
class Base64 {
  public:
    /// @brief Encodes raw bytes. The output length is always a multiple of 4.
    static std::string encode(const std::vector<std::uint8_t>& data);

    /**
     * @brief Decodes padded Base64 text.
     *
     * @param text The encoded input. Whitespace is not tolerated.
     * @param out Receives the decoded bytes.
     * @return false if the length is not a multiple of 4, a character lies outside the
     * alphabet, or padding appears anywhere but the tail.
     */
    static bool decode(const std::string& text, std::vector<std::uint8_t>& out);
};

} // namespace docgate::infra
