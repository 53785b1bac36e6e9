#pragma once
#include "vaultphrases/crypto/sodium_secure_memory_handle.hpp"
#include "vaultphrases/core/constants.hpp"
#include "vaultphrases/core/result.hpp"
#include "vaultphrases/core/failures.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <type_traits>
namespace vaultphrases::models {
using crypto::SecureMemoryHandle;

/**
 * @brief Fixed-size secret key held in guarded memory
 *
 * The tag parameter keeps master keys and child keys distinct types so one
 * can never be passed where the other is expected. The key bytes never leave
 * the SecureMemoryHandle except through WithReadAccess, and are zeroed when
 * the key is destroyed.
 */
template<typename Tag, size_t KeySize>
class DerivedKey {
public:
    static constexpr size_t SIZE = KeySize;

    [[nodiscard]] static Result<DerivedKey, VaultFailure> Allocate() {
        auto handle_result = SecureMemoryHandle::Allocate(KeySize);
        if (handle_result.IsErr()) {
            return Result<DerivedKey, VaultFailure>::Err(
                VaultFailure::FromSodiumFailure(handle_result.UnwrapErr()));
        }
        return Result<DerivedKey, VaultFailure>::Ok(
            DerivedKey(std::move(handle_result).Unwrap()));
    }

    /// Import existing key bytes, e.g. a recorded test vector.
    [[nodiscard]] static Result<DerivedKey, VaultFailure> FromBytes(std::span<const uint8_t> bytes) {
        if (bytes.size() != KeySize) {
            return Result<DerivedKey, VaultFailure>::Err(
                VaultFailure::KeyDerivation(
                    "Key material must be exactly " + std::to_string(KeySize) +
                    " bytes, got " + std::to_string(bytes.size())));
        }
        auto key_result = Allocate();
        if (key_result.IsErr()) {
            return key_result;
        }
        auto key = std::move(key_result).Unwrap();
        auto write_result = key.handle_.Write(bytes);
        if (write_result.IsErr()) {
            return Result<DerivedKey, VaultFailure>::Err(
                VaultFailure::FromSodiumFailure(write_result.UnwrapErr()));
        }
        return Result<DerivedKey, VaultFailure>::Ok(std::move(key));
    }

    template<typename F>
    auto WithReadAccess(F&& func) const
        -> Result<std::invoke_result_t<F, std::span<const uint8_t>>, VaultFailure> {
        return handle_.WithReadAccess(std::forward<F>(func)).MapErr(&VaultFailure::FromSodiumFailure);
    }

    template<typename F>
    auto WithWriteAccess(F&& func)
        -> Result<std::invoke_result_t<F, std::span<uint8_t>>, VaultFailure> {
        return handle_.WithWriteAccess(std::forward<F>(func)).MapErr(&VaultFailure::FromSodiumFailure);
    }

    /// Constant-time comparison of two keys of the same kind.
    [[nodiscard]] Result<bool, VaultFailure> Equals(const DerivedKey& other) const {
        return handle_.ContentEquals(other.handle_).MapErr(&VaultFailure::FromSodiumFailure);
    }

    /// Zero the key in place ahead of destruction.
    Result<Unit, VaultFailure> Wipe() {
        return handle_.Wipe().MapErr(&VaultFailure::FromSodiumFailure);
    }

    [[nodiscard]] bool IsInvalid() const noexcept {
        return handle_.IsInvalid();
    }

    DerivedKey(DerivedKey&&) noexcept = default;
    DerivedKey& operator=(DerivedKey&&) noexcept = default;
    DerivedKey(const DerivedKey&) = delete;
    DerivedKey& operator=(const DerivedKey&) = delete;
    ~DerivedKey() = default;
private:
    explicit DerivedKey(SecureMemoryHandle handle) noexcept
        : handle_(std::move(handle)) {}
    SecureMemoryHandle handle_;
};

struct MasterKeyTag {};
struct ChildKeyTag {};

/// Argon2id output; sole descendant of the normalized root phrase.
using MasterKey = DerivedKey<MasterKeyTag, Constants::MASTER_KEY_SIZE>;
/// HMAC-SHA256(master key, label bytes).
using ChildKey = DerivedKey<ChildKeyTag, Constants::CHILD_KEY_SIZE>;
}
