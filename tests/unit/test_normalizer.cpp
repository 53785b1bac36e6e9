#include <catch2/catch_test_macros.hpp>
#include "vaultphrases/phrase/normalizer.hpp"
#include "vaultphrases/crypto/sodium_interop.hpp"
#include "helpers/wordlist_fixtures.hpp"
#include <string>

using namespace vaultphrases;
using namespace vaultphrases::phrase;
using namespace vaultphrases::test_helpers;

namespace {

std::string NormalizedBytes(std::string_view raw) {
    auto secret = Normalizer::Normalize(raw).Unwrap();
    return secret.WithReadAccess([](std::span<const uint8_t> bytes) {
        return std::string(bytes.begin(), bytes.end());
    }).Unwrap();
}

PhraseStrength StrengthOf(std::string_view raw) {
    const auto normalized = Normalizer::NormalizeText(raw).Unwrap();
    return Normalizer::AssessStrength(ToBytes(normalized));
}

}

TEST_CASE("Normalizer - Canonical form", "[phrase][normalizer]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());

    SECTION("Trims, lowercases and collapses whitespace") {
        REQUIRE(NormalizedBytes("  Root   Phrase  ") == "root phrase");
        REQUIRE(NormalizedBytes("  Root   Phrase  ") == NormalizedBytes("root phrase"));
        REQUIRE(NormalizedBytes("\tCorrect\nHORSE \r\n battery\vstaple\f") ==
                "correct horse battery staple");
    }

    SECTION("Non-ASCII capitals are lowercased") {
        // "ÉTÉ Café" -> "été café"
        REQUIRE(NormalizedBytes("\xC3\x89T\xC3\x89 Caf\xC3\xA9") ==
                "\xC3\xA9t\xC3\xA9 caf\xC3\xA9");
        REQUIRE(NormalizedBytes("\xC3\x84pfel  Birne") == "\xC3\xA4pfel birne");
    }

    SECTION("Unicode whitespace separates words") {
        // NBSP, IDEOGRAPHIC SPACE, EM SPACE, LINE SEPARATOR
        REQUIRE(NormalizedBytes("\xC3\xA9t\xC3\xA9\xC2\xA0" "caf\xC3\xA9") ==
                "\xC3\xA9t\xC3\xA9 caf\xC3\xA9");
        REQUIRE(NormalizedBytes("CAF\xC3\x89\xE3\x80\x80" "BAR") == "caf\xC3\xA9 bar");
        REQUIRE(NormalizedBytes("\xE2\x80\x83 Stra\xC3\x9F" "e \xE2\x80\xA8MASSE ") ==
                "stra\xC3\x9F" "e masse");
        REQUIRE(NormalizedBytes("a\x1F" "b\x1C" "c") == "a b c");
    }

    SECTION("Zero-width space is not whitespace") {
        REQUIRE(NormalizedBytes("A\xE2\x80\x8B" "B") == "a\xE2\x80\x8B" "b");
    }

    SECTION("Context-sensitive lowercase mappings") {
        // "ΟΔΟΣ ΣΑΣ" -> "οδος σας" with final sigma
        REQUIRE(NormalizedBytes("\xCE\x9F\xCE\x94\xCE\x9F\xCE\xA3 \xCE\xA3\xCE\x91\xCE\xA3") ==
                "\xCE\xBF\xCE\xB4\xCE\xBF\xCF\x82 \xCF\x83\xCE\xB1\xCF\x82");
        // U+0130 maps to "i" + U+0307 outside Turkish tailoring
        REQUIRE(NormalizedBytes("\xC4\xB0stanbul") == "i\xCC\x87stanbul");
    }

    SECTION("Case variants reach the same secret") {
        REQUIRE(NormalizedBytes("\xC3\x89T\xC3\x89") == NormalizedBytes("\xC3\xA9t\xC3\xA9"));
        REQUIRE(NormalizedBytes("\xC3\x89T\xC3\x89") == NormalizedBytes("\xC3\x89t\xC3\xA9"));
    }

    SECTION("Ill-formed UTF-8 is rejected") {
        for (const std::string_view raw : {
                 std::string_view("\xFF\xFE"),
                 std::string_view("caf\xC3"),
                 std::string_view("\xC0\xAF"),
                 std::string_view("\xED\xA0\x80"),
                 std::string_view("\xF4\x90\x80\x80")}) {
            auto result = Normalizer::Normalize(raw);
            REQUIRE(result.IsErr());
            REQUIRE(result.UnwrapErr().type == VaultFailureType::InvalidEncoding);
            REQUIRE(Normalizer::NormalizeText(raw).IsErr());
        }
    }

    SECTION("Encoding failures report the offset only") {
        auto result = Normalizer::Normalize("secret words \xFF");
        REQUIRE(result.IsErr());
        const auto& message = result.UnwrapErr().message;
        REQUIRE(message.find("byte offset 13") != std::string::npos);
        REQUIRE(message.find("secret") == std::string::npos);
    }

    SECTION("Punctuation is kept") {
        REQUIRE(NormalizedBytes("Word-Word_word, WORD") == "word-word_word, word");
    }

    SECTION("Whitespace only is rejected") {
        for (const auto* raw : {"", " ", "\t\n\r ", "     ", "\xC2\xA0\xE3\x80\x80"}) {
            auto result = Normalizer::Normalize(raw);
            REQUIRE(result.IsErr());
            REQUIRE(result.UnwrapErr().type == VaultFailureType::EmptyInput);
        }
    }

    SECTION("Secret size matches the canonical text") {
        auto secret = Normalizer::Normalize("  A  B  ").Unwrap();
        REQUIRE(secret.Size() == 3);
    }
}

TEST_CASE("Normalizer - Idempotence", "[phrase][normalizer]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());

    for (const auto* raw : {
             "correct horse battery staple",
             "  MiXeD   Case\twith\ttabs  ",
             "already normalized",
             "UPPER-CASE_words, and\npunctuation!",
             "\xC3\xA9t\xC3\xA9  CAF\xC3\x89",
             "\xCE\x9F\xCE\x94\xCE\x9F\xCE\xA3\xC2\xA0\xC4\xB0stanbul"}) {
        const auto once = Normalizer::NormalizeText(raw).Unwrap();
        REQUIRE(Normalizer::NormalizeText(once).Unwrap() == once);
        REQUIRE(NormalizedBytes(once) == NormalizedBytes(raw));
    }
}

TEST_CASE("Normalizer - Strength classification", "[phrase][normalizer]") {
    SECTION("Few words is weak") {
        const auto strength = StrengthOf("correct horse battery staple");
        REQUIRE(strength.level == StrengthLevel::Weak);
        REQUIRE(strength.word_count == 4);
        REQUIRE(strength.char_count == 28);
    }

    SECTION("Enough words but short is weak") {
        const auto strength = StrengthOf("a b c d e f g h");
        REQUIRE(strength.word_count == 8);
        REQUIRE(strength.level == StrengthLevel::Weak);
    }

    SECTION("Middle ground is ok") {
        const auto strength = StrengthOf("correct horse battery staple extra words here");
        REQUIRE(strength.word_count == 7);
        REQUIRE(strength.char_count == 45);
        REQUIRE(strength.level == StrengthLevel::Ok);
    }

    SECTION("Twelve long words is strong") {
        const auto strength = StrengthOf(
            "alpha bravo charlie delta echo foxtrot golf hotel india juliett kilo lima");
        REQUIRE(strength.word_count == 12);
        REQUIRE(strength.char_count == 73);
        REQUIRE(strength.level == StrengthLevel::Strong);
    }

    SECTION("Hyphenated phrases count their words") {
        const auto strength = StrengthOf("alpha-bravo-charlie-delta-echo-foxtrot-golf");
        REQUIRE(strength.word_count == 7);
        REQUIRE(strength.level == StrengthLevel::Ok);
    }

    SECTION("Each separator splits on its own") {
        const auto strength = StrengthOf("one two-three four-five six-seven");
        REQUIRE(strength.word_count == 4);
        REQUIRE(strength.level == StrengthLevel::Weak);
    }

    SECTION("Empty pieces between separators still count") {
        REQUIRE(StrengthOf("a--b").word_count == 3);
        REQUIRE(StrengthOf("a,b,,c").word_count == 4);
    }

    SECTION("Characters are code points, not bytes") {
        const auto strength = StrengthOf("h\xC3\xA9llo");
        REQUIRE(strength.char_count == 5);
    }

    SECTION("Level names") {
        REQUIRE(ToString(StrengthLevel::Weak) == "weak");
        REQUIRE(ToString(StrengthLevel::Ok) == "ok");
        REQUIRE(ToString(StrengthLevel::Strong) == "strong");
    }
}
