#include "vaultphrases/crypto/child_key_derivation.hpp"
#include "vaultphrases/debug/key_logger.hpp"

#include <openssl/evp.h>
#include <openssl/core_names.h>
#include <openssl/params.h>

namespace vaultphrases::crypto {

Result<ChildKey, VaultFailure> ChildKeyDerivation::DeriveChildKey(
    const MasterKey& master,
    const Label& label,
    const SchemeConfig& scheme) {

    auto encoded_result = label.Encode(scheme);
    if (encoded_result.IsErr()) {
        return Result<ChildKey, VaultFailure>::Err(std::move(encoded_result).UnwrapErr());
    }
    const auto label_bytes = std::move(encoded_result).Unwrap();

    auto child_result = ChildKey::Allocate();
    if (child_result.IsErr()) {
        return child_result;
    }
    auto child = std::move(child_result).Unwrap();

    auto mac_result = master.WithReadAccess([&](std::span<const uint8_t> master_bytes) {
        return child.WithWriteAccess([&](std::span<uint8_t> output) {
            return HmacSha256(master_bytes, label_bytes, output);
        });
    });
    if (mac_result.IsErr()) {
        return Result<ChildKey, VaultFailure>::Err(std::move(mac_result).UnwrapErr());
    }
    auto access_result = std::move(mac_result).Unwrap();
    if (access_result.IsErr()) {
        return Result<ChildKey, VaultFailure>::Err(std::move(access_result).UnwrapErr());
    }
    auto hmac_result = std::move(access_result).Unwrap();
    if (hmac_result.IsErr()) {
        return Result<ChildKey, VaultFailure>::Err(std::move(hmac_result).UnwrapErr());
    }

    [[maybe_unused]] auto trace = child.WithReadAccess([&](std::span<const uint8_t> key) {
        debug::LogChildKeyDerived(label.DisplayName(), key);
        return unit;
    });
    return Result<ChildKey, VaultFailure>::Ok(std::move(child));
}

Result<Unit, VaultFailure> ChildKeyDerivation::HmacSha256(
    std::span<const uint8_t> key,
    std::span<const uint8_t> message,
    std::span<uint8_t> output) {

    if (key.empty()) {
        return Result<Unit, VaultFailure>::Err(
            VaultFailure::KeyDerivation("HMAC key cannot be empty"));
    }
    if (output.size() != MAC_LEN) {
        return Result<Unit, VaultFailure>::Err(
            VaultFailure::KeyDerivation(
                "HMAC output buffer must be exactly " + std::to_string(MAC_LEN) + " bytes"));
    }

    EVP_MAC* mac = EVP_MAC_fetch(nullptr, "HMAC", nullptr);
    if (!mac) {
        return Result<Unit, VaultFailure>::Err(
            VaultFailure::KeyDerivation("Failed to fetch HMAC algorithm"));
    }

    EVP_MAC_CTX* ctx = EVP_MAC_CTX_new(mac);
    EVP_MAC_free(mac);
    if (!ctx) {
        return Result<Unit, VaultFailure>::Err(
            VaultFailure::KeyDerivation("Failed to create HMAC context"));
    }

    OSSL_PARAM params[2];
    params[0] = OSSL_PARAM_construct_utf8_string(
        OSSL_MAC_PARAM_DIGEST, const_cast<char*>("SHA256"), 0);
    params[1] = OSSL_PARAM_construct_end();

    size_t written = 0;
    const bool ok =
        EVP_MAC_init(ctx, key.data(), key.size(), params) == 1 &&
        EVP_MAC_update(ctx, message.data(), message.size()) == 1 &&
        EVP_MAC_final(ctx, output.data(), &written, output.size()) == 1;
    EVP_MAC_CTX_free(ctx);

    if (!ok || written != MAC_LEN) {
        return Result<Unit, VaultFailure>::Err(
            VaultFailure::KeyDerivation("HMAC-SHA256 computation failed"));
    }
    return Result<Unit, VaultFailure>::Ok(unit);
}

} // namespace vaultphrases::crypto
