#include <catch2/catch_test_macros.hpp>

#include "ring_buffer.hpp"

#include <cstdint>
#include <numeric>
#include <vector>

TEST_CASE("RingBuffer", "[ring_buffer]") {
    constexpr size_t cap = 256;
    RingBuffer rb(cap);

    SECTION("WriteAndDrain") {
        std::vector<int16_t> data(64);
        std::iota(data.begin(), data.end(), int16_t(-32));

        REQUIRE(rb.write(data) == 64);
        REQUIRE(rb.available() == 64);

        std::vector<int16_t> out;
        REQUIRE(rb.drain(out) == 64);
        REQUIRE(out == data);
        REQUIRE(rb.available() == 0);
    }

    SECTION("Wraparound") {
        std::vector<int16_t> fill(200, 7);
        REQUIRE(rb.write(fill) == 200);
        std::vector<int16_t> sink;
        REQUIRE(rb.drain(sink) == 200);

        // Positions sit at 200; the next write crosses the end of storage.
        std::vector<int16_t> wrap(128);
        std::iota(wrap.begin(), wrap.end(), int16_t(1000));
        REQUIRE(rb.write(wrap) == 128);

        std::vector<int16_t> out;
        REQUIRE(rb.drain(out) == 128);
        REQUIRE(out == wrap);
    }

    SECTION("OverflowDropsNewest") {
        std::vector<int16_t> big(cap + 100, 1);
        REQUIRE(rb.write(big) == cap);
        REQUIRE(rb.available() == cap);
        REQUIRE(rb.take_dropped() == 100);
        REQUIRE(rb.take_dropped() == 0);
    }

    SECTION("PartialDrainAppends") {
        std::vector<int16_t> data = {1, 2, 3, 4, 5};
        rb.write(data);

        std::vector<int16_t> out = {99};
        REQUIRE(rb.drain(out, 2) == 2);
        REQUIRE(out == std::vector<int16_t>{99, 1, 2});
        REQUIRE(rb.available() == 3);

        REQUIRE(rb.drain(out) == 3);
        REQUIRE(out == std::vector<int16_t>{99, 1, 2, 3, 4, 5});
    }

    SECTION("EmptyDrain") {
        std::vector<int16_t> out;
        REQUIRE(rb.drain(out) == 0);
        REQUIRE(out.empty());
    }

    SECTION("ResetClearsState") {
        std::vector<int16_t> data(cap + 1, -1);
        rb.write(data);
        rb.reset();
        REQUIRE(rb.available() == 0);
        REQUIRE(rb.take_dropped() == 0);
        REQUIRE(rb.capacity() == cap);
    }
}
