#include <catch2/catch_test_macros.hpp>
#include "vaultphrases/crypto/sodium_interop.hpp"
#include "vaultphrases/crypto/scoped_wipe.hpp"
#include "vaultphrases/core/constants.hpp"
#include "helpers/wordlist_fixtures.hpp"
#include <algorithm>
#include <string>
#include <vector>
using namespace vaultphrases;
using namespace vaultphrases::crypto;
using namespace vaultphrases::test_helpers;
TEST_CASE("SodiumInterop - Initialization", "[sodium][crypto]") {
    SECTION("Initialize succeeds") {
        auto result = SodiumInterop::Initialize();
        REQUIRE(result.IsOk());
        REQUIRE(SodiumInterop::IsInitialized());
    }
    SECTION("Multiple Initialize calls are safe") {
        auto result1 = SodiumInterop::Initialize();
        auto result2 = SodiumInterop::Initialize();
        REQUIRE(result1.IsOk());
        REQUIRE(result2.IsOk());
    }
}

TEST_CASE("SodiumInterop - Secure Wipe", "[sodium][crypto][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Wipe empty buffer succeeds") {
        std::vector<uint8_t> buffer;
        REQUIRE(SodiumInterop::SecureWipe(std::span<uint8_t>(buffer)).IsOk());
    }
    SECTION("Wipe small buffer zeroes every byte") {
        std::vector<uint8_t> buffer(100, 0xFF);
        REQUIRE(SodiumInterop::SecureWipe(std::span<uint8_t>(buffer)).IsOk());
        REQUIRE(std::all_of(buffer.begin(), buffer.end(), [](uint8_t b) { return b == 0; }));
    }
    SECTION("Wipe large buffer zeroes every byte") {
        std::vector<uint8_t> buffer(Constants::SMALL_BUFFER_THRESHOLD * 10, 0xFF);
        REQUIRE(SodiumInterop::SecureWipe(std::span<uint8_t>(buffer)).IsOk());
        REQUIRE(std::all_of(buffer.begin(), buffer.end(), [](uint8_t b) { return b == 0; }));
    }
    SECTION("Wipe string keeps its length") {
        std::string text = "correct horse battery staple";
        const auto length = text.size();
        REQUIRE(SodiumInterop::SecureWipe(text).IsOk());
        REQUIRE(text.size() == length);
        REQUIRE(text.find_first_not_of('\0') == std::string::npos);
    }
}

TEST_CASE("SodiumInterop - Constant Time Comparison", "[sodium][crypto][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Equal buffers return true") {
        std::vector<uint8_t> a = {1, 2, 3, 4, 5};
        std::vector<uint8_t> b = {1, 2, 3, 4, 5};
        auto result = SodiumInterop::ConstantTimeEquals(a, b);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap());
    }
    SECTION("Different buffers return false") {
        std::vector<uint8_t> a = {1, 2, 3, 4, 5};
        std::vector<uint8_t> b = {1, 2, 3, 4, 6};
        auto result = SodiumInterop::ConstantTimeEquals(a, b);
        REQUIRE(result.IsOk());
        REQUIRE_FALSE(result.Unwrap());
    }
    SECTION("Different sizes return false") {
        std::vector<uint8_t> a = {1, 2, 3, 4, 5};
        std::vector<uint8_t> b = {1, 2, 3, 4};
        auto result = SodiumInterop::ConstantTimeEquals(a, b);
        REQUIRE(result.IsOk());
        REQUIRE_FALSE(result.Unwrap());
    }
}

TEST_CASE("SodiumInterop - SHA-256", "[sodium][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("FIPS 180-2 'abc' vector") {
        const auto input = ToBytes("abc");
        auto result = SodiumInterop::Sha256(input);
        REQUIRE(result.IsOk());
        REQUIRE(ToHex(result.Unwrap()) ==
                "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    }
    SECTION("Empty input") {
        auto result = SodiumInterop::Sha256({});
        REQUIRE(result.IsOk());
        REQUIRE(ToHex(result.Unwrap()) ==
                "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    }
}

TEST_CASE("ScopedWipe - Zeroes on scope exit", "[crypto][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Byte buffer") {
        std::vector<uint8_t> buffer(64, 0xAB);
        {
            ScopedWipe guard(buffer);
        }
        REQUIRE(std::all_of(buffer.begin(), buffer.end(), [](uint8_t b) { return b == 0; }));
    }
    SECTION("String on an early exit by exception") {
        std::string secret = "root phrase material";
        try {
            ScopedWipe guard(secret);
            throw std::runtime_error("abort");
        } catch (const std::runtime_error&) {
        }
        REQUIRE(secret.find_first_not_of('\0') == std::string::npos);
    }
    SECTION("WipeNow zeroes before scope exit") {
        std::string secret = "root phrase material";
        ScopedWipe guard(secret);
        guard.WipeNow();
        REQUIRE(secret.find_first_not_of('\0') == std::string::npos);
    }
}
