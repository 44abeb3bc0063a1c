/**
 *  \file
 *  Monotonic version 7 UUID generation.
 *
 *  \copyright
 *      This Source Code Form is subject to the terms of the Mozilla Public
 *      License, v. 2.0. If a copy of the MPL was not distributed with this
 *      file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */
#ifndef UUID7_GENERATOR_HPP
#define UUID7_GENERATOR_HPP

#include <uuid7/entropy_source.hpp>
#include <uuid7/time_source.hpp>
#include <uuid7/uuid.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>


namespace uuid7
{


/// The number of bits in the per-millisecond counter.
constexpr int counter_bits = 42;

/// The largest value the per-millisecond counter can hold.
constexpr std::uint64_t max_counter = (std::uint64_t(1) << counter_bits) - 1;


/// A snapshot of the state a `generator` carries between calls.
struct generator_state
{
    /// The timestamp embedded in the most recently generated UUID.
    std::uint64_t last_timestamp_ms = 0;

    /**
     *  The 42-bit counter of the most recently generated UUID.
     *
     *  Bits 41-30 are stored in `rand_a`, bits 29-0 in the upper part of
     *  `rand_b`.
     */
    std::uint64_t counter = 0;
};

constexpr bool operator==(const generator_state& a, const generator_state& b) noexcept
{
    return a.last_timestamp_ms == b.last_timestamp_ms && a.counter == b.counter;
}

constexpr bool operator!=(const generator_state& a, const generator_state& b) noexcept
{
    return !(a == b);
}


/**
 *  A generator of monotonically increasing version 7 UUIDs.
 *
 *  Every UUID returned by `generate()` is strictly greater, as an unsigned
 *  128-bit integer, than the one returned by the preceding call on the same
 *  object, regardless of which threads made the calls.
 *
 *  Each UUID is laid out as follows:
 *
 *      | unix_ts_ms | ver | counter_hi | var | counter_lo | random |
 *      |     48     |  4  |     12     |  2  |     30     |   32   |
 *
 *  When the clock has advanced since the previous call, the 42-bit counter
 *  is reseeded with random bits and its most significant bit cleared.
 *  Otherwise the previous timestamp is kept, even if the clock went
 *  backwards, and the counter is incremented.  If the counter overflows,
 *  the timestamp is advanced by one millisecond beyond the previous one and
 *  the counter is reseeded.  The trailing 32 bits are drawn afresh on every
 *  call.
 *
 *  All public member functions are thread safe.
 */
class generator
{
public:
    /// Constructs a generator that uses the system clock and the OS CSPRNG.
    generator();

    /**
     *  Constructs a generator with custom time and entropy sources.
     *
     *  A null pointer selects the default source for that slot.
     */
    generator(
        std::shared_ptr<time_source> clock,
        std::shared_ptr<entropy_source> entropy);

    ~generator() noexcept;

    generator(const generator&) = delete;
    generator& operator=(const generator&) = delete;

    generator(generator&&) noexcept;
    generator& operator=(generator&&) noexcept;

    /**
     *  Generates a new UUID.
     *
     *  \throws error with code `errc::entropy_unavailable` if the entropy
     *      source fails.  The generator state is left unchanged in that case.
     */
    uuid generate();

    /// Generates a new UUID and returns its canonical textual form.
    std::string generate_string();

    /// Returns the current state, or nothing if no UUID has been generated.
    std::optional<generator_state> state() const;

    /**
     *  Replaces the generator state.
     *
     *  The timestamp is truncated to 48 bits and the counter to 42 bits.
     *  The next call to `generate()` behaves as if the last UUID it produced
     *  had carried this state.
     */
    void reset(const generator_state& state);

private:
    class impl;
    std::unique_ptr<impl> pimpl_;
};


/**
 *  Returns a process-wide generator, constructed with default sources on
 *  first use.
 *
 *  Code that needs an isolated sequence should own a `generator` instead.
 */
generator& process_generator();


} // namespace uuid7
#endif // header guard
