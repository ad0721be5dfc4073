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
 * @file base64.cpp
 * @brief Implementation of Base64 transcoding.
 *
 * @details
 * Works on 3-byte groups mapped onto 4 sextets. A 256-entry reverse table built once
 * at first use resolves decoding in constant time per character.
 */

#include "docgate/infra/base64.hpp"

#include <array>

namespace docgate::infra {

namespace {

const char* const kAlphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
                              "abcdefghijklmnopqrstuvwxyz"
                              "0123456789"
                              "+/";

/// Reverse lookup: alphabet character -> sextet, -1 for everything else.
const std::array<int, 256>& reverse_table()
{
    static const std::array<int, 256> table = [] {
        std::array<int, 256> t{};
        t.fill(-1);
        for (int i = 0; i < 64; ++i) {
            t[static_cast<unsigned char>(kAlphabet[i])] = i;
        }
        return t;
    }();
    return table;
}

} // namespace

std::string Base64::encode(const std::vector<std::uint8_t>& data)
{
    std::string out;
    out.reserve(((data.size() + 2) / 3) * 4);

    for (std::size_t i = 0; i < data.size(); i += 3) {
        const std::size_t left = data.size() - i;
        std::uint32_t group = static_cast<std::uint32_t>(data[i]) << 16;
        if (left > 1)
            group |= static_cast<std::uint32_t>(data[i + 1]) << 8;
        if (left > 2)
            group |= static_cast<std::uint32_t>(data[i + 2]);

        out.push_back(kAlphabet[(group >> 18) & 0x3F]);
        out.push_back(kAlphabet[(group >> 12) & 0x3F]);
        out.push_back(left > 1 ? kAlphabet[(group >> 6) & 0x3F] : '=');
        out.push_back(left > 2 ? kAlphabet[group & 0x3F] : '=');
    }
    return out;
}

bool Base64::decode(const std::string& text, std::vector<std::uint8_t>& out)
{
    out.clear();
    if (text.size() % 4 != 0) {
        return false;
    }

    const auto& table = reverse_table();
    out.reserve((text.size() / 4) * 3);

    for (std::size_t i = 0; i < text.size(); i += 4) {
        const bool last = (i + 4 == text.size());
        int pad = 0;
        std::uint32_t group = 0;

        for (std::size_t j = 0; j < 4; ++j) {
            const char c = text[i + j];
            if (c == '=') {
                // Padding is only legal in the last two positions of the final quad.
                if (!last || j < 2) {
                    return false;
                }
                pad++;
                group <<= 6;
                continue;
            }
            if (pad > 0) {
                return false;
            }
            const int sextet = table[static_cast<unsigned char>(c)];
            if (sextet < 0) {
                return false;
            }
            group = (group << 6) | static_cast<std::uint32_t>(sextet);
        }

        out.push_back(static_cast<std::uint8_t>((group >> 16) & 0xFF));
        if (pad < 2)
            out.push_back(static_cast<std::uint8_t>((group >> 8) & 0xFF));
        if (pad < 1)
            out.push_back(static_cast<std::uint8_t>(group & 0xFF));
    }
    return true;
}

} // namespace docgate::infra
