#include <catch2/catch_test_macros.hpp>

#include "call_engine/audio/segmenter.hpp"

#include <string>
#include <vector>

using call_engine::audio::TextSegmenter;

TEST_CASE("split cuts at sentence ends") {
    const auto fragments = TextSegmenter::split("Hello there. How are you today? Great!", 160);
    REQUIRE(fragments == std::vector<std::string>{"Hello there.", "How are you today?", "Great!"});
}

TEST_CASE("abbreviations, initials and decimals are not sentence ends") {
    const auto fragments =
        TextSegmenter::split("Dr. Smith paid 3.5 dollars to J. Doe. Then he left.", 160);
    REQUIRE(fragments.size() == 2);
    REQUIRE(fragments[0] == "Dr. Smith paid 3.5 dollars to J. Doe.");
    REQUIRE(fragments[1] == "Then he left.");
}

TEST_CASE("long sentences fall back to secondary punctuation") {
    const std::string text =
        "We build websites for small businesses, we host them for free, and we only charge "
        "when the site starts bringing you new customers every month";
    const auto fragments = TextSegmenter::split(text, 60);
    REQUIRE(fragments.size() >= 2);
    for (const auto& fragment : fragments) {
        REQUIRE(fragment.size() <= 60);
    }
    REQUIRE(fragments[0].back() == ',');
}

TEST_CASE("without punctuation the cut lands on whitespace") {
    const std::string text = "one two three four five six seven eight nine ten eleven twelve";
    const auto fragments = TextSegmenter::split(text, 20);
    for (const auto& fragment : fragments) {
        REQUIRE(fragment.size() <= 20);
        REQUIRE(fragment.front() != ' ');
        REQUIRE(fragment.back() != ' ');
    }
    std::string joined;
    for (const auto& fragment : fragments) {
        joined += (joined.empty() ? "" : " ") + fragment;
    }
    REQUIRE(joined == text);
}

TEST_CASE("streaming waits for the character after a period") {
    TextSegmenter segmenter(160);
    REQUIRE(segmenter.push("It costs 3.").empty());
    REQUIRE(segmenter.push("5 dollars").empty());
    const auto ready = segmenter.push(". And more");
    REQUIRE(ready == std::vector<std::string>{"It costs 3.5 dollars."});
    REQUIRE(segmenter.flush() == std::vector<std::string>{"And more"});
    REQUIRE(segmenter.flush().empty());
}

TEST_CASE("reset drops buffered text") {
    TextSegmenter segmenter(160);
    segmenter.push("half a sentence");
    segmenter.reset();
    REQUIRE(segmenter.flush().empty());
}
