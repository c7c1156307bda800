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
 * @file string.cpp
 * @brief Implementation of the string and byte formatting primitives.
 */

#include "cuidkit/infra/string.hpp"

#include <cctype>

namespace cuidkit::infra {

/**
 * @brief Trims leading and trailing whitespace.
 *
 * @note The `static_cast<unsigned char>` avoids undefined behavior in
 * `std::isspace` for negative `char` values.
 */
std::string String::trim(std::string_view s)
{
    std::size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
        start++;
    }

    if (start == s.size()) {
        return "";
    }

    std::size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        end--;
    }

    return std::string(s.substr(start, end - start));
}

std::string String::to_hex(const std::uint8_t* data, std::size_t size)
{
    static constexpr char kDigits[] = "0123456789abcdef";

    std::string out;
    out.reserve(size * 2);
    for (std::size_t i = 0; i < size; ++i) {
        out.push_back(kDigits[data[i] >> 4]);
        out.push_back(kDigits[data[i] & 0x0F]);
    }
    return out;
}

bool String::is_lower_alpha(char c)
{
    return c >= 'a' && c <= 'z';
}

bool String::is_lower_alnum(char c)
{
    return is_lower_alpha(c) || (c >= '0' && c <= '9');
}

} // namespace cuidkit::infra
