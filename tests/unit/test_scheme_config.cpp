#include <catch2/catch_test_macros.hpp>
#include "vaultphrases/configuration/scheme_config.hpp"

using namespace vaultphrases;
using namespace vaultphrases::configuration;

TEST_CASE("SchemeConfig - V1 constants", "[config]") {
    constexpr auto scheme = SchemeConfig::V1();

    SECTION("Version tag and salt") {
        STATIC_REQUIRE(scheme.Version() == SchemeVersion::V1);
        REQUIRE(scheme.VersionTag() == "V1");
        REQUIRE(scheme.RootSalt() == "family-password-root-v1");
    }

    SECTION("Reserved label tags") {
        REQUIRE(scheme.HotLabelTag() == "HOT_PHRASE_V1");
        REQUIRE(scheme.ColdLabelTag() == "COLD_PHRASE_V1");
    }

    SECTION("Production Argon2id parameters") {
        constexpr auto params = scheme.KdfParameters(KdfMode::Production);
        STATIC_REQUIRE(params.memory_cost_kib == 262144);
        STATIC_REQUIRE(params.time_cost == 3);
        STATIC_REQUIRE(params.parallelism == 1);
        STATIC_REQUIRE(params.output_length == 32);
    }

    SECTION("Test Argon2id parameters are weaker and only selected explicitly") {
        constexpr auto test = scheme.KdfParameters(KdfMode::Test);
        constexpr auto production = scheme.KdfParameters(KdfMode::Production);
        REQUIRE(test == Argon2idParameters{8192, 1, 1, 32});
        REQUIRE(test.memory_cost_kib < production.memory_cost_kib);
        REQUIRE(test.time_cost < production.time_cost);
        REQUIRE_FALSE(test == production);
    }
}

TEST_CASE("SchemeConfig - Version resolution", "[config]") {
    SECTION("Current is V1") {
        REQUIRE(SchemeConfig::Current().Version() == SchemeVersion::V1);
        REQUIRE(SchemeConfig::ForVersion(SchemeVersion::V1).VersionTag() == "V1");
    }

    SECTION("FromTag resolves known tags") {
        auto result = SchemeConfig::FromTag("V1");
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap().RootSalt() == "family-password-root-v1");
    }

    SECTION("FromTag rejects unknown tags") {
        for (const auto* tag : {"V2", "v1", "", "V1 "}) {
            auto result = SchemeConfig::FromTag(tag);
            REQUIRE(result.IsErr());
            REQUIRE(result.UnwrapErr().type == VaultFailureType::UnsupportedScheme);
        }
    }

    SECTION("Mode names") {
        REQUIRE(ToString(KdfMode::Production) == "production");
        REQUIRE(ToString(KdfMode::Test) == "test");
    }
}
