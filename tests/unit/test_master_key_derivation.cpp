#include <catch2/catch_test_macros.hpp>
#include "vaultphrases/crypto/master_key_derivation.hpp"
#include "vaultphrases/crypto/sodium_interop.hpp"
#include "helpers/wordlist_fixtures.hpp"

using namespace vaultphrases;
using namespace vaultphrases::crypto;
using namespace vaultphrases::test_helpers;
using vaultphrases::phrase::Normalizer;

namespace {

constexpr std::string_view TEST_MODE_MASTER_HEX =
    "30d853c509f28efb0b67ad776ea50d94a0a106a6ba4886534ff9c73b02e0ecc4";

std::string KeyHex(const models::MasterKey& key) {
    return key.WithReadAccess([](std::span<const uint8_t> bytes) { return ToHex(bytes); }).Unwrap();
}

}

TEST_CASE("MasterKeyDerivation - Test parameters", "[crypto][argon2]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto scheme = SchemeConfig::V1();

    SECTION("Recorded master key") {
        auto result = MasterKeyDerivation::DeriveFromBytes(
            ToBytes("correct horse battery staple"), KdfMode::Test, scheme);
        REQUIRE(result.IsOk());
        REQUIRE(KeyHex(result.Unwrap()) == TEST_MODE_MASTER_HEX);
    }

    SECTION("Normalization-insensitive differences give the same key") {
        auto secret = Normalizer::Normalize("  Correct HORSE\tbattery   Staple ").Unwrap();
        auto result = MasterKeyDerivation::DeriveMasterKey(secret, KdfMode::Test, scheme);
        REQUIRE(result.IsOk());
        REQUIRE(KeyHex(result.Unwrap()) == TEST_MODE_MASTER_HEX);
    }

    SECTION("Different phrases give different keys") {
        auto a = MasterKeyDerivation::DeriveFromBytes(ToBytes("phrase one"), KdfMode::Test, scheme).Unwrap();
        auto b = MasterKeyDerivation::DeriveFromBytes(ToBytes("phrase two"), KdfMode::Test, scheme).Unwrap();
        REQUIRE_FALSE(a.Equals(b).Unwrap());
    }

    SECTION("Empty secret is rejected") {
        auto result = MasterKeyDerivation::DeriveFromBytes({}, KdfMode::Test, scheme);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == VaultFailureType::EmptyInput);
    }
}

TEST_CASE("MasterKeyDerivation - Production parameters", "[crypto][argon2][.][slow]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto result = MasterKeyDerivation::DeriveFromBytes(
        ToBytes("correct horse battery staple"), KdfMode::Production, SchemeConfig::V1());
    REQUIRE(result.IsOk());
    REQUIRE(KeyHex(result.Unwrap()) ==
            "993ad4e731965509ab73b4d4aaacf06e4aa723f7f40846d70e9bb82eb402538d");
}
