#include "vaultphrases/configuration/scheme_config.hpp"
#include "vaultphrases/core/format.hpp"

namespace vaultphrases::configuration {

Result<SchemeConfig, VaultFailure> SchemeConfig::FromTag(std::string_view tag) {
    constexpr SchemeConfig known[] = {SchemeConfig::V1()};
    for (const auto& scheme : known) {
        if (scheme.VersionTag() == tag) {
            return Result<SchemeConfig, VaultFailure>::Ok(scheme);
        }
    }
    return Result<SchemeConfig, VaultFailure>::Err(
        VaultFailure::UnsupportedScheme(
            compat::format("Unknown derivation scheme version '{}'", tag)));
}

} // namespace vaultphrases::configuration
