#pragma once

#include "vaultphrases/core/result.hpp"
#include "vaultphrases/core/failures.hpp"
#include "vaultphrases/core/constants.hpp"

#include <sodium.h>
#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <string>

namespace vaultphrases::crypto {

using Sha256Digest = std::array<uint8_t, Constants::SHA_256_DIGEST_SIZE>;

/**
 * @brief Interop layer for libsodium
 *
 * Owns library initialization and exposes the primitives the derivation
 * pipeline needs: best-effort wiping, guarded allocations, constant-time
 * comparison and SHA-256.
 */
class SodiumInterop {
public:
    // ========================================================================
    // Initialization
    // ========================================================================

    /**
     * @brief Initialize libsodium
     *
     * Must be called before any other operation. Thread-safe and idempotent.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    // ========================================================================
    // Secure Memory Operations
    // ========================================================================

    /**
     * @brief Overwrite a buffer with zeros
     *
     * Best effort only: copies made by the allocator, the OS pager or a core
     * dump are outside the reach of this call.
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    /**
     * @brief Zero the characters of a string in place
     *
     * The string keeps its length so callers can confirm every byte was
     * cleared; only the contents are destroyed.
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::string& text);

    /**
     * @brief Constant-time comparison of two buffers
     *
     * @return Ok(true) if equal, Ok(false) if different
     */
    static Result<bool, SodiumFailure> ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b);

    // ========================================================================
    // Hashing
    // ========================================================================

    /**
     * @brief SHA-256 of a single buffer
     */
    static Result<Sha256Digest, SodiumFailure> Sha256(std::span<const uint8_t> data);

    // ========================================================================
    // Memory Allocation (Internal)
    // ========================================================================

    /**
     * @brief Allocate guarded memory using sodium_malloc
     *
     * The region is surrounded by guard pages and locked where the OS allows
     * it. sodium_free zeroes it before release.
     *
     * @return Pointer to secure memory, or nullptr on failure
     */
    static void* AllocateSecure(size_t size) noexcept;

    static void FreeSecure(void* ptr) noexcept;

    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    static void WipeSmallBuffer(std::span<uint8_t> buffer) noexcept;

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

} // namespace vaultphrases::crypto
