#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "transcript/similarity.hpp"

using Catch::Approx;

TEST_CASE("similarity", "[similarity]") {

    SECTION("Normalize") {
        REQUIRE(similarity::normalize("  Hello World\n") == "hello world");
        REQUIRE(similarity::normalize(" \t ").empty());
    }

    SECTION("Identical") {
        REQUIRE(similarity::dice("hello there", "hello there") == 1.0);
        REQUIRE(similarity::dice("Hello There ", "hello there") == 1.0);
    }

    SECTION("EmptyIsZero") {
        REQUIRE(similarity::dice("", "hello") == 0.0);
        REQUIRE(similarity::dice("hello", "   ") == 0.0);
    }

    SECTION("BigramOverlap") {
        // {ni,ig,gh,ht} vs {na,ac,ch,ht}: one shared bigram.
        REQUIRE(similarity::dice("night", "nacht") == Approx(0.25));
        REQUIRE(similarity::dice("abc", "xyz") == 0.0);
    }

    SECTION("Symmetric") {
        REQUIRE(similarity::dice("sounds good", "sound good") ==
                Approx(similarity::dice("sound good", "sounds good")));
    }

    SECTION("SingleCharacters") {
        REQUIRE(similarity::dice("a", "b") == 0.0);
        REQUIRE(similarity::dice("a", "A") == 1.0);
    }
}
