/**
 *  \file
 *  The UUID value type and its binary and textual layout.
 *
 *  \copyright
 *      This Source Code Form is subject to the terms of the Mozilla Public
 *      License, v. 2.0. If a copy of the MPL was not distributed with this
 *      file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */
#ifndef UUID7_UUID_HPP
#define UUID7_UUID_HPP

#include <boost/functional/hash.hpp>
#include <gsl/span>

#include <array>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>


namespace uuid7
{


/// The number of bytes in the binary representation of a UUID.
constexpr std::size_t uuid_size = 16;

/// The number of characters in the canonical textual representation.
constexpr std::size_t uuid_string_length = 36;

/// The version number stored in the UUIDs produced by this library.
constexpr std::uint8_t version_7 = 7;

/// The variant bits of RFC 4122/9562 UUIDs, `0b10`.
constexpr std::uint8_t rfc_variant = 0b10;


/**
 *  A 128-bit UUID value.
 *
 *  The value is stored as two 64-bit words, with `hi` holding the most
 *  significant bits.  Comparison operators order UUIDs as unsigned 128-bit
 *  integers, which coincides with the lexicographic order of both the
 *  big-endian byte form and the canonical text form.
 *
 *  A default-constructed `uuid` is the nil UUID.
 */
struct uuid
{
    /// Bits 127-64.
    std::uint64_t hi = 0;

    /// Bits 63-0.
    std::uint64_t lo = 0;

    constexpr uuid() noexcept = default;

    constexpr uuid(std::uint64_t high, std::uint64_t low) noexcept
        : hi(high)
        , lo(low)
    { }

    /// Returns the nil UUID (all bits zero).
    static constexpr uuid nil() noexcept { return uuid(); }

    /// Returns the max UUID (all bits one).
    static constexpr uuid max() noexcept
    {
        return uuid(~std::uint64_t(0), ~std::uint64_t(0));
    }

    constexpr bool is_nil() const noexcept { return hi == 0 && lo == 0; }
};

constexpr bool operator==(const uuid& a, const uuid& b) noexcept
{
    return a.hi == b.hi && a.lo == b.lo;
}

constexpr bool operator!=(const uuid& a, const uuid& b) noexcept
{
    return !(a == b);
}

constexpr bool operator<(const uuid& a, const uuid& b) noexcept
{
    return a.hi < b.hi || (a.hi == b.hi && a.lo < b.lo);
}

constexpr bool operator>(const uuid& a, const uuid& b) noexcept
{
    return b < a;
}

constexpr bool operator<=(const uuid& a, const uuid& b) noexcept
{
    return !(b < a);
}

constexpr bool operator>=(const uuid& a, const uuid& b) noexcept
{
    return !(a < b);
}


/**
 *  The fields of a version 7 UUID as laid out by RFC 9562.
 *
 *  Each member is wider than the field it represents.  `pack()` masks every
 *  member to its field width, so out-of-range bits are dropped silently.
 */
struct uuid_fields
{
    /// Bits 127-80: milliseconds since the Unix epoch (48 bits).
    std::uint64_t unix_ts_ms = 0;

    /// Bits 79-76: version (4 bits).
    std::uint8_t ver = 0;

    /// Bits 75-64: `rand_a` (12 bits).
    std::uint16_t rand_a = 0;

    /// Bits 63-62: variant (2 bits).
    std::uint8_t var = 0;

    /// Bits 61-0: `rand_b` (62 bits).
    std::uint64_t rand_b = 0;
};

constexpr bool operator==(const uuid_fields& a, const uuid_fields& b) noexcept
{
    return a.unix_ts_ms == b.unix_ts_ms &&
        a.ver == b.ver &&
        a.rand_a == b.rand_a &&
        a.var == b.var &&
        a.rand_b == b.rand_b;
}

constexpr bool operator!=(const uuid_fields& a, const uuid_fields& b) noexcept
{
    return !(a == b);
}


namespace detail
{
constexpr std::uint64_t mask(int bits) noexcept
{
    return bits >= 64 ? ~std::uint64_t(0) : (std::uint64_t(1) << bits) - 1;
}
} // namespace detail


/// Assembles a UUID from its fields, truncating each to its field width.
constexpr uuid pack(const uuid_fields& fields) noexcept
{
    return uuid(
        ((fields.unix_ts_ms & detail::mask(48)) << 16) |
            ((std::uint64_t(fields.ver) & detail::mask(4)) << 12) |
            (std::uint64_t(fields.rand_a) & detail::mask(12)),
        ((std::uint64_t(fields.var) & detail::mask(2)) << 62) |
            (fields.rand_b & detail::mask(62)));
}


/// Splits a UUID into its RFC 9562 version 7 fields.
constexpr uuid_fields unpack(const uuid& u) noexcept
{
    uuid_fields f;
    f.unix_ts_ms = u.hi >> 16;
    f.ver = static_cast<std::uint8_t>((u.hi >> 12) & detail::mask(4));
    f.rand_a = static_cast<std::uint16_t>(u.hi & detail::mask(12));
    f.var = static_cast<std::uint8_t>(u.lo >> 62);
    f.rand_b = u.lo & detail::mask(62);
    return f;
}


/// Returns the 48-bit Unix millisecond timestamp of a version 7 UUID.
constexpr std::uint64_t unix_ts_ms(const uuid& u) noexcept
{
    return u.hi >> 16;
}

/// Returns the version number (bits 79-76).
constexpr std::uint8_t get_version(const uuid& u) noexcept
{
    return static_cast<std::uint8_t>((u.hi >> 12) & detail::mask(4));
}

/// Returns the raw two most significant variant bits (bits 63-62).
constexpr std::uint8_t get_variant(const uuid& u) noexcept
{
    return static_cast<std::uint8_t>(u.lo >> 62);
}

/// Returns whether the UUID carries the RFC 4122/9562 variant.
constexpr bool is_rfc_variant(const uuid& u) noexcept
{
    return get_variant(u) == rfc_variant;
}


/**
 *  Returns the timestamp embedded in a UUID.
 *
 *  For version 7 this is the Unix time in milliseconds.  For every other
 *  version the value is assembled from the `time_low`, `time_mid` and
 *  `time_hi` fields of the version 1 layout, i.e. a count of 100 ns
 *  intervals since 1582-10-15.  The result is meaningless for versions that
 *  do not store a timestamp, but no error is reported.
 */
constexpr std::uint64_t timestamp(const uuid& u) noexcept
{
    if (get_version(u) == version_7) return unix_ts_ms(u);
    const auto timeLow = u.hi >> 32;
    const auto timeMid = (u.hi >> 16) & detail::mask(16);
    const auto timeHi = u.hi & detail::mask(12);
    return (timeHi << 48) | (timeMid << 32) | timeLow;
}


/// Returns the canonical form `xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx`.
std::string to_string(const uuid& u);

/// Returns the 32 lowercase hexadecimal digits of a UUID without hyphens.
std::string to_hex(const uuid& u);

/**
 *  Parses the canonical textual representation of a UUID.
 *
 *  The input must be exactly 36 characters long, with hyphens at offsets
 *  8, 13, 18 and 23 and hexadecimal digits (in either case) everywhere
 *  else.
 *
 *  \throws format_error if `text` does not have this form.
 */
uuid parse(std::string_view text);

/// Returns the 16-byte big-endian (network order) representation.
std::array<std::uint8_t, uuid_size> to_bytes(const uuid& u) noexcept;

/**
 *  Decodes the 16-byte big-endian representation of a UUID.
 *
 *  \throws format_error if `bytes` is not exactly 16 bytes long.
 */
uuid from_bytes(gsl::span<const std::uint8_t> bytes);

/// Writes the canonical textual representation to `stream`.
std::ostream& operator<<(std::ostream& stream, const uuid& u);


} // namespace uuid7


// Specialisation of std::hash for uuid
namespace std
{

template<>
class hash<uuid7::uuid>
{
public:
    std::size_t operator()(const uuid7::uuid& v) const noexcept
    {
        std::size_t seed = 0;
        boost::hash_combine(seed, v.hi);
        boost::hash_combine(seed, v.lo);
        return seed;
    }
};

} // namespace std
#endif // header guard
