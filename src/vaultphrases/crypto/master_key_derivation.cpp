#include "vaultphrases/crypto/master_key_derivation.hpp"
#include "vaultphrases/core/constants.hpp"
#include "vaultphrases/core/format.hpp"
#include "vaultphrases/debug/key_logger.hpp"
#include <argon2.h>

namespace vaultphrases::crypto {
    Result<MasterKey, VaultFailure> MasterKeyDerivation::DeriveMasterKey(
        const phrase::NormalizedSecret& secret,
        const KdfMode mode,
        const SchemeConfig& scheme) {
        auto derived = secret.WithReadAccess([&](std::span<const uint8_t> bytes) {
            return DeriveFromBytes(bytes, mode, scheme);
        });
        if (derived.IsErr()) {
            return Result<MasterKey, VaultFailure>::Err(std::move(derived).UnwrapErr());
        }
        return std::move(derived).Unwrap();
    }

    Result<MasterKey, VaultFailure> MasterKeyDerivation::DeriveFromBytes(
        const std::span<const uint8_t> secret,
        const KdfMode mode,
        const SchemeConfig& scheme) {
        if (secret.empty()) {
            return Result<MasterKey, VaultFailure>::Err(
                VaultFailure::EmptyInput(std::string(ErrorMessages::EMPTY_SECRET)));
        }

        const auto params = scheme.KdfParameters(mode);
        if (params.output_length != MasterKey::SIZE) {
            return Result<MasterKey, VaultFailure>::Err(
                VaultFailure::KeyDerivation(compat::format(
                    "Scheme {} requests a {}-byte master key, expected {}",
                    scheme.VersionTag(), params.output_length, MasterKey::SIZE)));
        }

        auto key_result = MasterKey::Allocate();
        if (key_result.IsErr()) {
            return key_result;
        }
        auto master_key = std::move(key_result).Unwrap();

        const auto salt = scheme.RootSalt();
        auto run_result = master_key.WithWriteAccess([&](std::span<uint8_t> output) {
            return RunArgon2id(
                secret,
                std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(salt.data()), salt.size()),
                params,
                output);
        });
        if (run_result.IsErr()) {
            return Result<MasterKey, VaultFailure>::Err(std::move(run_result).UnwrapErr());
        }
        auto argon_result = std::move(run_result).Unwrap();
        if (argon_result.IsErr()) {
            return Result<MasterKey, VaultFailure>::Err(std::move(argon_result).UnwrapErr());
        }

        [[maybe_unused]] auto trace = master_key.WithReadAccess([&](std::span<const uint8_t> key) {
            debug::LogMasterKeyDerived(configuration::ToString(mode), key);
            return unit;
        });
        return Result<MasterKey, VaultFailure>::Ok(std::move(master_key));
    }

    Result<Unit, VaultFailure> MasterKeyDerivation::RunArgon2id(
        const std::span<const uint8_t> secret,
        const std::span<const uint8_t> salt,
        const Argon2idParameters& params,
        const std::span<uint8_t> output) {
        const int rc = argon2id_hash_raw(
            params.time_cost,
            params.memory_cost_kib,
            params.parallelism,
            secret.data(), secret.size(),
            salt.data(), salt.size(),
            output.data(), output.size());
        if (rc != ARGON2_OK) {
            return Result<Unit, VaultFailure>::Err(
                VaultFailure::KeyDerivation(compat::format(
                    "Argon2id derivation failed: {}", argon2_error_message(rc))));
        }
        return Result<Unit, VaultFailure>::Ok(unit);
    }
}
