/*
 *  This Source Code Form is subject to the terms of the Mozilla Public
 *  License, v. 2.0. If a copy of the MPL was not distributed with this
 *  file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */
#include "uuid7/generator.hpp"

#include "uuid7/error.hpp"
#include "uuid7/log/logger.hpp"

#include <array>
#include <mutex>
#include <utility>


namespace uuid7
{

namespace
{

constexpr std::uint64_t timestamp_mask = (std::uint64_t(1) << 48) - 1;
constexpr std::uint64_t counter_lo_mask = (std::uint64_t(1) << 30) - 1;
constexpr std::uint64_t tail_mask = 0xFFFFFFFF;

// The counter MSB is left clear on reseed to leave room for increments.
constexpr std::uint64_t seed_mask = max_counter >> 1;

std::uint64_t load_be(const std::uint8_t* bytes, int count) noexcept
{
    std::uint64_t value = 0;
    for (int i = 0; i < count; ++i) value = (value << 8) | bytes[i];
    return value;
}

} // namespace


class generator::impl
{
public:
    impl(std::shared_ptr<time_source> clock, std::shared_ptr<entropy_source> entropy)
        : clock_(clock ? std::move(clock) : std::make_shared<system_time_source>())
        , entropy_(entropy ? std::move(entropy) : std::make_shared<system_entropy_source>())
    { }

    uuid generate()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto nowMs = clock_->now_ms();

        std::uint64_t timestampMs = 0;
        std::uint64_t counter = 0;
        std::uint64_t tail = 0;
        if (!state_ || nowMs > state_->last_timestamp_ms) {
            timestampMs = nowMs;
            draw_seed(counter, tail);
        } else {
            timestampMs = state_->last_timestamp_ms;
            if (nowMs < timestampMs) {
                log::debug(
                    "Clock moved backwards from {} ms to {} ms, keeping previous timestamp",
                    timestampMs,
                    nowMs);
            }
            counter = state_->counter + 1;
            if (counter > max_counter) {
                ++timestampMs;
                log::debug(
                    "Counter exhausted within one millisecond, advancing timestamp to {} ms",
                    timestampMs);
                draw_seed(counter, tail);
            } else {
                tail = draw_tail();
            }
        }

        uuid_fields fields;
        fields.unix_ts_ms = timestampMs & timestamp_mask;
        fields.ver = version_7;
        fields.rand_a = static_cast<std::uint16_t>(counter >> 30);
        fields.var = rfc_variant;
        fields.rand_b = ((counter & counter_lo_mask) << 32) | (tail & tail_mask);

        // Commit only once every random draw has succeeded.
        state_ = generator_state{timestampMs, counter};
        return pack(fields);
    }

    std::optional<generator_state> state() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    void reset(const generator_state& state)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = generator_state{
            state.last_timestamp_ms & timestamp_mask,
            state.counter & max_counter};
    }

private:
    // Draws a fresh counter seed (42 bits, MSB clear) and a 32-bit tail.
    void draw_seed(std::uint64_t& counter, std::uint64_t& tail)
    {
        std::array<std::uint8_t, 10> bytes;
        entropy_->fill(bytes);
        const auto rand = load_be(bytes.data(), 6);
        counter = rand & seed_mask;
        tail = load_be(bytes.data() + 6, 4);
    }

    std::uint64_t draw_tail()
    {
        std::array<std::uint8_t, 4> bytes;
        entropy_->fill(bytes);
        return load_be(bytes.data(), 4);
    }

    std::shared_ptr<time_source> clock_;
    std::shared_ptr<entropy_source> entropy_;
    mutable std::mutex mutex_;
    std::optional<generator_state> state_;
};


generator::generator()
    : pimpl_(std::make_unique<impl>(nullptr, nullptr))
{
}

generator::generator(
    std::shared_ptr<time_source> clock,
    std::shared_ptr<entropy_source> entropy)
    : pimpl_(std::make_unique<impl>(std::move(clock), std::move(entropy)))
{
}

generator::~generator() noexcept = default;
generator::generator(generator&&) noexcept = default;
generator& generator::operator=(generator&&) noexcept = default;

uuid generator::generate()
{
    UUID7_PRECONDITION(pimpl_);
    return pimpl_->generate();
}

std::string generator::generate_string()
{
    return to_string(generate());
}

std::optional<generator_state> generator::state() const
{
    UUID7_PRECONDITION(pimpl_);
    return pimpl_->state();
}

void generator::reset(const generator_state& state)
{
    UUID7_PRECONDITION(pimpl_);
    pimpl_->reset(state);
}


generator& process_generator()
{
    static generator instance;
    return instance;
}


} // namespace uuid7
