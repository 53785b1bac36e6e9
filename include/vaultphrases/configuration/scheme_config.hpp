#pragma once

#include "vaultphrases/core/result.hpp"
#include "vaultphrases/core/failures.hpp"

#include <cstdint>
#include <string_view>

namespace vaultphrases::configuration {

/// Derivation scheme versions understood by this build.
///
/// A version fixes normalization, salt, Argon2id parameters, label tags and
/// the word encoding. Outputs produced under a version never change; any
/// incompatible change introduces a new enumerator instead.
enum class SchemeVersion : uint8_t {
    V1 = 1
};

/// Selects which Argon2id cost parameters a derivation uses.
///
/// There is deliberately no default: callers must name the mode so the weak
/// test parameters can never be picked up implicitly.
enum class KdfMode : uint8_t {
    Production = 0,
    Test = 1
};

/// Argon2id cost parameters.
struct Argon2idParameters {
    uint32_t memory_cost_kib;
    uint32_t time_cost;
    uint32_t parallelism;
    uint32_t output_length;

    [[nodiscard]] constexpr bool operator==(const Argon2idParameters&) const noexcept = default;
};

/// Immutable description of one derivation scheme version
///
/// The root salt is a public domain constant shared by every user. Outputs are
/// unique per user only through the root phrase itself, which is expected to
/// carry enough entropy on its own.
///
/// @example
/// ```cpp
/// constexpr auto scheme = SchemeConfig::Current();
/// auto params = scheme.KdfParameters(KdfMode::Production);
/// // params.memory_cost_kib == 262144
/// ```
class SchemeConfig {
public:
    // =========================================================================
    // Factory Methods
    // =========================================================================

    /// Version 1: salt "family-password-root-v1", 256 MiB / 3 passes / 1 lane.
    [[nodiscard]] static constexpr SchemeConfig V1() noexcept {
        return SchemeConfig(
            SchemeVersion::V1,
            "V1",
            "family-password-root-v1",
            Argon2idParameters{256 * 1024, 3, 1, 32},
            Argon2idParameters{8 * 1024, 1, 1, 32},
            "HOT_PHRASE_V1",
            "COLD_PHRASE_V1");
    }

    /// Scheme used for new derivations.
    [[nodiscard]] static constexpr SchemeConfig Current() noexcept {
        return V1();
    }

    [[nodiscard]] static constexpr SchemeConfig ForVersion(SchemeVersion version) noexcept {
        switch (version) {
            case SchemeVersion::V1:
                return V1();
        }
        return V1();
    }

    /// Resolve a textual version tag such as "V1" (case-sensitive).
    [[nodiscard]] static Result<SchemeConfig, VaultFailure> FromTag(std::string_view tag);

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] constexpr SchemeVersion Version() const noexcept {
        return version_;
    }

    [[nodiscard]] constexpr std::string_view VersionTag() const noexcept {
        return version_tag_;
    }

    [[nodiscard]] constexpr std::string_view RootSalt() const noexcept {
        return root_salt_;
    }

    [[nodiscard]] constexpr Argon2idParameters KdfParameters(KdfMode mode) const noexcept {
        return mode == KdfMode::Test ? test_params_ : production_params_;
    }

    [[nodiscard]] constexpr std::string_view HotLabelTag() const noexcept {
        return hot_label_tag_;
    }

    [[nodiscard]] constexpr std::string_view ColdLabelTag() const noexcept {
        return cold_label_tag_;
    }

private:
    constexpr SchemeConfig(
        SchemeVersion version,
        std::string_view version_tag,
        std::string_view root_salt,
        Argon2idParameters production_params,
        Argon2idParameters test_params,
        std::string_view hot_label_tag,
        std::string_view cold_label_tag) noexcept
        : version_(version)
        , version_tag_(version_tag)
        , root_salt_(root_salt)
        , production_params_(production_params)
        , test_params_(test_params)
        , hot_label_tag_(hot_label_tag)
        , cold_label_tag_(cold_label_tag) {}

    SchemeVersion version_;
    std::string_view version_tag_;
    std::string_view root_salt_;
    Argon2idParameters production_params_;
    Argon2idParameters test_params_;
    std::string_view hot_label_tag_;
    std::string_view cold_label_tag_;
};

[[nodiscard]] constexpr std::string_view ToString(KdfMode mode) noexcept {
    return mode == KdfMode::Test ? "test" : "production";
}

} // namespace vaultphrases::configuration
