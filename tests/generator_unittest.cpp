#include "mock_sources.hpp"

#include <uuid7/generator.hpp>
#include <uuid7/lib_info.hpp>
#include <uuid7/log/logger.hpp>

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <array>
#include <chrono>
#include <regex>
#include <set>
#include <vector>


namespace
{
constexpr std::uint64_t T0 = 1700000000000;

std::uint64_t wall_clock_ms()
{
    return static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch())
            .count());
}
} // namespace


TEST_CASE("generated_uuids_increase_strictly")
{
    uuid7::generator gen;
    const auto before = wall_clock_ms();
    auto previous = gen.generate();
    for (int i = 0; i < 20000; ++i) {
        const auto next = gen.generate();
        REQUIRE(previous < next);
        previous = next;
    }
    const auto after = wall_clock_ms();

    CHECK(uuid7::unix_ts_ms(previous) >= before);
    CHECK(uuid7::unix_ts_ms(previous) <= after + 5);
}

TEST_CASE("generated_fields")
{
    uuid7::generator gen;
    for (int i = 0; i < 1000; ++i) {
        const auto start = wall_clock_ms();
        const auto u = gen.generate();
        CHECK(uuid7::get_version(u) == 7);
        CHECK(uuid7::get_variant(u) == 0b10);
        CHECK(((u.hi >> 12) & 0xF) == 0x7);
        CHECK((u.lo >> 62) == 0b10);
        CHECK(uuid7::unix_ts_ms(u) + 5 >= start);
        CHECK(uuid7::unix_ts_ms(u) <= wall_clock_ms() + 5);
    }
}

TEST_CASE("generate_string_is_canonical")
{
    uuid7::generator gen;
    const std::regex shape("^[0-9a-f]{8}-[0-9a-f]{4}-7[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");
    const auto a = gen.generate_string();
    const auto b = gen.generate_string();
    CHECK(std::regex_match(a, shape));
    CHECK(std::regex_match(b, shape));
    CHECK(a < b);
    CHECK(uuid7::parse(a) < uuid7::parse(b));
}

TEST_CASE("same_millisecond_increments_counter")
{
    const auto clock = std::make_shared<manual_clock>(T0);
    uuid7::generator gen(clock, nullptr);

    const auto first = gen.generate();
    const auto second = gen.generate();
    const auto third = gen.generate();

    CHECK(uuid7::unix_ts_ms(first) == T0);
    CHECK(uuid7::unix_ts_ms(second) == T0);
    CHECK(uuid7::unix_ts_ms(third) == T0);
    CHECK(counter_of(second) == counter_of(first) + 1);
    CHECK(counter_of(third) == counter_of(second) + 1);
    CHECK(first < second);
    CHECK(second < third);

    REQUIRE(gen.state().has_value());
    CHECK(gen.state()->last_timestamp_ms == T0);
    CHECK(gen.state()->counter == counter_of(third));
}

TEST_CASE("new_millisecond_reseeds_counter")
{
    const auto clock = std::make_shared<manual_clock>(T0);
    const auto entropy = std::make_shared<constant_entropy>(0xFF);
    uuid7::generator gen(clock, entropy);

    const auto u = gen.generate();
    // The seed has its most significant bit cleared.
    CHECK(counter_of(u) == (std::uint64_t(1) << 41) - 1);
    CHECK((u.lo & 0xFFFFFFFF) == 0xFFFFFFFF);
    CHECK(uuid7::get_version(u) == 7);
    CHECK(uuid7::get_variant(u) == 0b10);

    gen.generate();
    clock->advance(1);
    const auto v = gen.generate();
    CHECK(uuid7::unix_ts_ms(v) == T0 + 1);
    CHECK(counter_of(v) == (std::uint64_t(1) << 41) - 1);
    CHECK(u < v);
    CHECK(entropy->calls() == 3);
}

TEST_CASE("reseeded_counters_look_random")
{
    const auto clock = std::make_shared<manual_clock>(T0);
    uuid7::generator gen(clock, nullptr);

    std::set<std::uint64_t> seeds;
    int highHalf = 0;
    constexpr int ticks = 400;
    for (int i = 0; i < ticks; ++i) {
        clock->advance(1);
        const auto c = counter_of(gen.generate());
        CHECK(c < (std::uint64_t(1) << 41));
        if (c >= (std::uint64_t(1) << 40)) ++highHalf;
        seeds.insert(c);
    }
    CHECK(seeds.size() == ticks);
    // Expect about half the seeds in the upper half of the seed range.
    CHECK(highHalf > ticks / 4);
    CHECK(highHalf < 3 * ticks / 4);
}

TEST_CASE("clock_regression_keeps_previous_timestamp")
{
    uuid7::log::set_logging_level(uuid7::log::level::debug);
    const auto clock = std::make_shared<manual_clock>(T0);
    uuid7::generator gen(clock, nullptr);

    const auto a = gen.generate();
    clock->set(T0 - 1000);
    const auto b = gen.generate();
    const auto c = gen.generate();

    CHECK(uuid7::unix_ts_ms(b) == T0);
    CHECK(uuid7::unix_ts_ms(c) == T0);
    CHECK(counter_of(b) == counter_of(a) + 1);
    CHECK(counter_of(c) == counter_of(b) + 1);
    CHECK(a < b);
    CHECK(b < c);

    clock->set(T0 + 1);
    const auto d = gen.generate();
    CHECK(uuid7::unix_ts_ms(d) == T0 + 1);
    CHECK(c < d);
    uuid7::log::set_logging_level(uuid7::log::level::info);
}

TEST_CASE("counter_overflow_advances_timestamp")
{
    const auto clock = std::make_shared<manual_clock>(T0);
    uuid7::generator gen(clock, nullptr);
    gen.reset({T0, uuid7::max_counter - 1});

    const auto last = gen.generate();
    CHECK(uuid7::unix_ts_ms(last) == T0);
    CHECK(counter_of(last) == uuid7::max_counter);

    const auto bumped = gen.generate();
    CHECK(uuid7::unix_ts_ms(bumped) == T0 + 1);
    CHECK(counter_of(bumped) < (std::uint64_t(1) << 41));
    CHECK(last < bumped);

    // The wall clock has not caught up, so the bumped timestamp stays.
    const auto next = gen.generate();
    CHECK(uuid7::unix_ts_ms(next) == T0 + 1);
    CHECK(counter_of(next) == counter_of(bumped) + 1);
    CHECK(bumped < next);

    clock->set(T0 + 1);
    const auto caughtUp = gen.generate();
    CHECK(uuid7::unix_ts_ms(caughtUp) == T0 + 1);
    CHECK(counter_of(caughtUp) == counter_of(next) + 1);

    clock->set(T0 + 2);
    const auto ahead = gen.generate();
    CHECK(uuid7::unix_ts_ms(ahead) == T0 + 2);
    CHECK(caughtUp < ahead);
}

TEST_CASE("state_lifecycle")
{
    const auto clock = std::make_shared<manual_clock>(T0);
    uuid7::generator gen(clock, nullptr);
    CHECK_FALSE(gen.state().has_value());

    gen.generate();
    REQUIRE(gen.state().has_value());
    CHECK(gen.state()->last_timestamp_ms == T0);

    gen.reset({0xFFFF000000000005, 0xFFFFFC0000000007});
    const auto s = gen.state();
    REQUIRE(s.has_value());
    CHECK(s->last_timestamp_ms == 5);
    CHECK(s->counter == 7);
    const auto expected = uuid7::generator_state{5, 7};
    CHECK(*s == expected);

    // Timestamp 5 lies behind the clock, so the next call starts a new tick.
    const auto u = gen.generate();
    CHECK(uuid7::unix_ts_ms(u) == T0);
}

TEST_CASE("entropy_failure_propagates")
{
    const auto clock = std::make_shared<manual_clock>(T0);
    const auto entropy = std::make_shared<failing_entropy>(1);
    uuid7::generator gen(clock, entropy);

    const auto first = gen.generate();
    const auto stateBefore = gen.state();

    try {
        gen.generate();
        FAIL("Expected entropy failure");
    } catch (const uuid7::error& e) {
        CHECK(e.code() == uuid7::errc::entropy_unavailable);
    }
    CHECK(gen.state() == stateBefore);

    clock->advance(1);
    CHECK_THROWS_AS(gen.generate(), uuid7::error);
    CHECK(gen.state() == stateBefore);

    entropy->set_remaining(1);
    const auto recovered = gen.generate();
    CHECK(first < recovered);
}

TEST_CASE("independent_generators")
{
    const auto clock = std::make_shared<manual_clock>(T0);
    uuid7::generator a(clock, nullptr);
    uuid7::generator b(clock, nullptr);
    a.generate();
    a.generate();
    CHECK(a.state().has_value());
    CHECK_FALSE(b.state().has_value());

    uuid7::generator moved(std::move(a));
    CHECK(moved.state().has_value());
    CHECK(uuid7::unix_ts_ms(moved.generate()) == T0);
}

TEST_CASE("process_generator")
{
    auto& gen = uuid7::process_generator();
    CHECK(&gen == &uuid7::process_generator());
    const auto a = gen.generate();
    const auto b = uuid7::process_generator().generate();
    CHECK(a < b);
}

TEST_CASE("error_category")
{
    CHECK(std::string(uuid7::error_category().name()) == "libuuid7");
    const auto ec = uuid7::make_error_code(uuid7::errc::format_error);
    CHECK(ec.category() == uuid7::error_category());
    CHECK(ec == uuid7::errc::format_error);
    CHECK_FALSE(ec.message().empty());
    CHECK(uuid7::make_error_code(uuid7::errc::entropy_unavailable).message() !=
        ec.message());

    const uuid7::format_error e("bad input");
    CHECK(e.code() == uuid7::errc::format_error);
    CHECK(std::string(e.what()).find("bad input") != std::string::npos);
}

TEST_CASE("system_entropy_source")
{
    uuid7::system_entropy_source entropy;
    std::array<std::uint8_t, 64> a = {};
    std::array<std::uint8_t, 64> b = {};
    entropy.fill(a);
    entropy.fill(b);
    CHECK(a != b);

    // Sizes that are not a multiple of the device word size.
    std::array<std::uint8_t, 7> odd = {};
    entropy.fill(odd);
    entropy.fill(gsl::span<std::uint8_t>());
}

TEST_CASE("library_info")
{
    CHECK(std::string(uuid7::library_short_name) == "libuuid7");
    const auto v = uuid7::library_version();
    CHECK(v.major >= 0);
    CHECK((v.major > 0 || v.minor > 0 || v.patch > 0));
}
