#include <catch2/catch_test_macros.hpp>
#include "vaultphrases/phrase/wordlist.hpp"
#include "vaultphrases/crypto/sodium_interop.hpp"
#include "helpers/wordlist_fixtures.hpp"
#include <filesystem>
#include <string_view>

using namespace vaultphrases;
using namespace vaultphrases::phrase;
using namespace vaultphrases::test_helpers;

TEST_CASE("Wordlist - Line formats", "[wordlist]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());

    SECTION("Index<TAB>word") {
        auto wordlist = NatoWordlist();
        REQUIRE(wordlist.Size() == 26);
        REQUIRE(wordlist.At(0) == "alpha");
        REQUIRE(wordlist.At(25) == "zulu");
        REQUIRE(wordlist.Words() == NatoWords());
    }

    SECTION("Bare words") {
        auto wordlist = ParseText("apple\nbanana\n").Unwrap();
        REQUIRE(wordlist.Words() == std::vector<std::string>{"apple", "banana"});
    }

    SECTION("EFF dice numbers") {
        auto wordlist = ParseText("11111\tabacus\n11112 abdomen\n11113   abdominal\n").Unwrap();
        REQUIRE(wordlist.Words() == std::vector<std::string>{"abacus", "abdomen", "abdominal"});
    }

    SECTION("Comments, blank lines, CRLF and padding are ignored") {
        auto wordlist = ParseText("# my list\r\n\r\n   apple  \r\n\t\nbanana\n# trailing").Unwrap();
        REQUIRE(wordlist.Words() == std::vector<std::string>{"apple", "banana"});
    }

    SECTION("Carriage returns alone end lines") {
        auto wordlist = ParseText("1\talpha\r2\tbravo\r").Unwrap();
        REQUIRE(wordlist.Words() == std::vector<std::string>{"alpha", "bravo"});
    }

    SECTION("Mixed line endings") {
        auto wordlist = ParseText("1\talpha\r\n2\tbravo\r3\tcharlie\n\r\n4\tdelta").Unwrap();
        REQUIRE(wordlist.Words() == std::vector<std::string>{"alpha", "bravo", "charlie", "delta"});
    }

    SECTION("Unicode whitespace separates the index column") {
        // NBSP, then IDEOGRAPHIC SPACE padding
        auto wordlist = ParseText("1\xC2\xA0" "apple\n2\xE3\x80\x80" "banana\xE3\x80\x80\n").Unwrap();
        REQUIRE(wordlist.Words() == std::vector<std::string>{"apple", "banana"});
    }

    SECTION("Non-ASCII words are kept verbatim") {
        auto wordlist = ParseText("1\tcaf\xC3\xA9\n2\t\xC3\xBC" "ber\n").Unwrap();
        REQUIRE(wordlist.Words() == std::vector<std::string>{
            "caf\xC3\xA9", "\xC3\xBC" "ber"});
    }

    SECTION("Missing final newline") {
        auto wordlist = ParseText("apple\nbanana").Unwrap();
        REQUIRE(wordlist.Size() == 2);
        REQUIRE(wordlist.At(1) == "banana");
    }
}

TEST_CASE("Wordlist - Fingerprint", "[wordlist]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());

    SECTION("SHA-256 of the raw bytes") {
        auto wordlist = NatoWordlist();
        REQUIRE(wordlist.Fingerprint().Hex() == NATO_FINGERPRINT_HEX);
        REQUIRE(wordlist.Fingerprint().ShortForm() == "70499c...67f4eb");
    }

    SECTION("Bare word file") {
        auto wordlist = ParseText("apple\nbanana\n").Unwrap();
        REQUIRE(wordlist.Fingerprint().Hex() ==
                "ad4c2dd8abb59fc844e6f0b360786b5106a1c4e03b7f31c94a8bfacea783e618");
    }

    SECTION("Formatting differences change the fingerprint but not the words") {
        auto a = ParseText("apple\nbanana\n").Unwrap();
        auto b = ParseText("1 apple\n2 banana\n").Unwrap();
        REQUIRE(a.Words() == b.Words());
        REQUIRE_FALSE(a.Fingerprint() == b.Fingerprint());
    }
}

TEST_CASE("Wordlist - Validation", "[wordlist]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());

    SECTION("Empty content") {
        for (const auto* text : {"", "\n\n", "# only a comment\n", "   \t  \n"}) {
            auto result = ParseText(text);
            REQUIRE(result.IsErr());
            REQUIRE(result.UnwrapErr().type == VaultFailureType::EmptyWordlist);
        }
    }

    SECTION("Duplicates are counted, never named") {
        auto result = ParseText("apple\nbanana\napple\ncherry\nbanana\n");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == VaultFailureType::DuplicateWord);
        REQUIRE(result.UnwrapErr().message == "Wordlist has 2 duplicate words");
    }

    SECTION("Duplicate after stripping the index column") {
        auto result = ParseText("1\tapple\n2\tapple\n");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == VaultFailureType::DuplicateWord);
        REQUIRE(result.UnwrapErr().message == "Wordlist has 1 duplicate word");
    }

    SECTION("Ill-formed UTF-8") {
        for (const std::string_view text : {
                 std::string_view("apple\n\xFF\xFE\n"),
                 std::string_view("apple\nbanan\xC3"),
                 std::string_view("apple\n\xC0\xAF" "banana\n"),
                 std::string_view("apple\n\xED\xA0\x80\n")}) {
            auto result = ParseText(text);
            REQUIRE(result.IsErr());
            REQUIRE(result.UnwrapErr().type == VaultFailureType::InvalidEncoding);
        }
    }

    SECTION("Encoding failure reports the byte offset") {
        auto result = ParseText("apple\nbanana\n\x80\n");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().message == "Wordlist is not valid UTF-8 (byte offset 13)");
    }

    SECTION("Single word") {
        auto result = ParseText("lonely\n");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == VaultFailureType::WordlistSize);
    }
}

TEST_CASE("Wordlist - Loading from disk", "[wordlist]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());

    SECTION("Regular file") {
        TempFile file(NatoWordlistText());
        auto result = Wordlist::Load(file.Path());
        REQUIRE(result.IsOk());
        auto wordlist = std::move(result).Unwrap();
        REQUIRE(wordlist.Size() == 26);
        REQUIRE(wordlist.Fingerprint().Hex() == NATO_FINGERPRINT_HEX);
        REQUIRE(wordlist.SourceName() == file.Path().filename().string());
    }

    SECTION("Missing file") {
        auto result = Wordlist::Load(std::filesystem::temp_directory_path() / "vaultphrases-no-such-file.txt");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == VaultFailureType::FileAccess);
    }

    SECTION("Directory") {
        auto result = Wordlist::Load(std::filesystem::temp_directory_path());
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == VaultFailureType::FileAccess);
    }

    SECTION("Ill-formed UTF-8 in a file") {
        TempFile file("apple\n\xFF" "banana\n");
        auto result = Wordlist::Load(file.Path());
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == VaultFailureType::InvalidEncoding);
    }

    SECTION("Duplicates in a file") {
        TempFile file("apple\napple\n");
        auto result = Wordlist::Load(file.Path());
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == VaultFailureType::DuplicateWord);
    }
}
