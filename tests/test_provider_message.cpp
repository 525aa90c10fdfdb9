#include <catch2/catch_test_macros.hpp>
#include "fakes.hpp"
#include "upstream/provider_message.hpp"

TEST_CASE("parse_provider_message", "[provider]") {

    SECTION("FinalResultWithWordSpeaker") {
        auto ev = parse_provider_message(results_json("sounds good", 1));
        REQUIRE(ev.has_value());
        REQUIRE(ev->type == ProviderEventType::Transcript);
        REQUIRE(ev->text == "sounds good");
        REQUIRE(ev->is_final);
        REQUIRE(ev->speaker == 1);
    }

    SECTION("InterimResult") {
        auto ev = parse_provider_message(results_json("soun", 0, false));
        REQUIRE(ev.has_value());
        REQUIRE(ev->type == ProviderEventType::Transcript);
        REQUIRE_FALSE(ev->is_final);
    }

    SECTION("AlternativeSpeakerPreferred") {
        auto ev = parse_provider_message(R"({"is_final":true,"channel":{"alternatives":[
            {"transcript":"hi","speaker":4,"words":[{"word":"hi","speaker":2}]}]}})");
        REQUIRE(ev.has_value());
        REQUIRE(ev->speaker == 4);
    }

    SECTION("NoSpeaker") {
        auto ev = parse_provider_message(
            R"({"is_final":true,"channel":{"alternatives":[{"transcript":"","words":[]}]}})");
        REQUIRE(ev.has_value());
        REQUIRE(ev->type == ProviderEventType::Transcript);
        REQUIRE(ev->text.empty());
        REQUIRE_FALSE(ev->speaker.has_value());
    }

    SECTION("MissingAlternatives") {
        auto ev = parse_provider_message(R"({"type":"Results","channel":{}})");
        REQUIRE_FALSE(ev.has_value());
    }

    SECTION("ErrorMessages") {
        auto a = parse_provider_message(R"({"type":"Error","description":"bad audio"})");
        REQUIRE(a->type == ProviderEventType::Error);
        REQUIRE(a->error == "bad audio");

        auto b = parse_provider_message(R"({"err_code":"INVALID_AUTH","err_msg":"no key"})");
        REQUIRE(b->type == ProviderEventType::Error);
        REQUIRE(b->error == "no key");

        auto c = parse_provider_message(R"({"error":"quota"})");
        REQUIRE(c->error == "quota");
    }

    SECTION("ControlMessages") {
        REQUIRE(parse_provider_message(R"({"type":"Metadata","request_id":"x"})")->type ==
                ProviderEventType::Metadata);
        REQUIRE(parse_provider_message(R"({"type":"UtteranceEnd","last_word_end":1.2})")->type ==
                ProviderEventType::UtteranceEnd);
        REQUIRE(parse_provider_message(R"({"type":"SpeechStarted"})")->type ==
                ProviderEventType::SpeechStarted);
        REQUIRE(parse_provider_message(R"({"type":"Something"})")->type ==
                ProviderEventType::Unknown);
    }

    SECTION("Malformed") {
        auto ev = parse_provider_message("{not json");
        REQUIRE_FALSE(ev.has_value());
        REQUIRE(ev.error().starts_with("JSON parse error"));
        REQUIRE_FALSE(parse_provider_message("[1,2]").has_value());
    }
}
