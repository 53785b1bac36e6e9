#pragma once
#include "vaultphrases/configuration/scheme_config.hpp"
#include "vaultphrases/models/keys/derived_key.hpp"
#include "vaultphrases/phrase/normalizer.hpp"
#include "vaultphrases/core/result.hpp"
#include "vaultphrases/core/failures.hpp"
#include <cstdint>
#include <span>
namespace vaultphrases::crypto {
using configuration::Argon2idParameters;
using configuration::KdfMode;
using configuration::SchemeConfig;
using models::MasterKey;

/**
 * @brief Memory-hard root step: normalized root phrase -> 32-byte master key
 *
 * Argon2id over the normalized phrase bytes with the scheme's public salt.
 * The result depends on nothing but the phrase, the scheme version and the
 * mode; the mode must be named by the caller.
 */
class MasterKeyDerivation {
public:
    static Result<MasterKey, VaultFailure> DeriveMasterKey(
        const phrase::NormalizedSecret& secret,
        KdfMode mode,
        const SchemeConfig& scheme);

    /**
     * @brief Raw Argon2id over arbitrary secret bytes
     *
     * Fails with EmptyInput for an empty secret.
     */
    static Result<MasterKey, VaultFailure> DeriveFromBytes(
        std::span<const uint8_t> secret,
        KdfMode mode,
        const SchemeConfig& scheme);

private:
    static Result<Unit, VaultFailure> RunArgon2id(
        std::span<const uint8_t> secret,
        std::span<const uint8_t> salt,
        const Argon2idParameters& params,
        std::span<uint8_t> output);

    MasterKeyDerivation() = delete;
};
}
