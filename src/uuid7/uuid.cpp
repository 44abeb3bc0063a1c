/*
 *  This Source Code Form is subject to the terms of the Mozilla Public
 *  License, v. 2.0. If a copy of the MPL was not distributed with this
 *  file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */
#include "uuid7/uuid.hpp"

#include "uuid7/exception.hpp"

#include <fmt/format.h>


namespace uuid7
{

namespace
{

constexpr bool is_hyphen_position(std::size_t i) noexcept
{
    return i == 8 || i == 13 || i == 18 || i == 23;
}

int hex_digit_value(char c) noexcept
{
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace


std::string to_string(const uuid& u)
{
    return fmt::format(
        "{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
        u.hi >> 32,
        (u.hi >> 16) & detail::mask(16),
        u.hi & detail::mask(16),
        u.lo >> 48,
        u.lo & detail::mask(48));
}


std::string to_hex(const uuid& u)
{
    return fmt::format("{:016x}{:016x}", u.hi, u.lo);
}


uuid parse(std::string_view text)
{
    if (text.size() != uuid_string_length) {
        throw format_error(fmt::format(
            "Expected {} characters, got {}",
            uuid_string_length,
            text.size()));
    }

    uuid result;
    int digits = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (is_hyphen_position(i)) {
            if (c != '-') {
                throw format_error(fmt::format(
                    "Expected '-' at position {}, got '{}'", i, c));
            }
            continue;
        }
        const int value = hex_digit_value(c);
        if (value < 0) {
            throw format_error(fmt::format(
                "Invalid hexadecimal digit '{}' at position {}", c, i));
        }
        auto& word = digits < 16 ? result.hi : result.lo;
        word = (word << 4) | static_cast<std::uint64_t>(value);
        ++digits;
    }
    return result;
}


std::array<std::uint8_t, uuid_size> to_bytes(const uuid& u) noexcept
{
    std::array<std::uint8_t, uuid_size> bytes;
    for (int i = 0; i < 8; ++i) {
        bytes[i] = static_cast<std::uint8_t>(u.hi >> (56 - 8 * i));
        bytes[8 + i] = static_cast<std::uint8_t>(u.lo >> (56 - 8 * i));
    }
    return bytes;
}


uuid from_bytes(gsl::span<const std::uint8_t> bytes)
{
    if (bytes.size() != uuid_size) {
        throw format_error(fmt::format(
            "Expected {} bytes, got {}", uuid_size, bytes.size()));
    }
    uuid result;
    for (std::size_t i = 0; i < 8; ++i) {
        result.hi = (result.hi << 8) | bytes[i];
        result.lo = (result.lo << 8) | bytes[8 + i];
    }
    return result;
}


std::ostream& operator<<(std::ostream& stream, const uuid& u)
{
    return stream << to_string(u);
}


} // namespace uuid7
