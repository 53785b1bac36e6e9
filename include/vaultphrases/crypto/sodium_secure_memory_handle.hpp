#pragma once

#include "vaultphrases/core/result.hpp"
#include "vaultphrases/core/failures.hpp"

#include <span>
#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace vaultphrases::crypto {

/**
 * @brief RAII owner of a libsodium guarded allocation
 *
 * Holds every sensitive buffer of a derivation: the normalized root phrase,
 * the master key and each child key. Memory comes from sodium_malloc:
 * - Guard pages before/after the region
 * - Locked in RAM where the OS permits
 * - Zeroed by sodium_free when the handle is destroyed or reassigned
 *
 * Move-only. The destructor runs on every exit path, including early error
 * returns, so a handle that goes out of scope never leaves its bytes behind
 * in the allocation it owned.
 *
 * Example:
 * @code
 * auto handle = SecureMemoryHandle::Allocate(32).Unwrap();
 * handle.WithWriteAccess([](std::span<uint8_t> out) {
 *     // ... derive into out ...
 * });
 * // zeroed and released when handle goes out of scope
 * @endcode
 */
class SecureMemoryHandle {
public:
    // ========================================================================
    // Construction / Destruction
    // ========================================================================

    /**
     * @brief Allocate secure memory
     *
     * The region starts zero-filled.
     *
     * @param size Number of bytes to allocate (non-zero)
     */
    static Result<SecureMemoryHandle, SodiumFailure> Allocate(size_t size);

    ~SecureMemoryHandle();

    SecureMemoryHandle() noexcept : data_(nullptr), size_(0) {}

    SecureMemoryHandle(SecureMemoryHandle&& other) noexcept;
    SecureMemoryHandle& operator=(SecureMemoryHandle&& other) noexcept;

    SecureMemoryHandle(const SecureMemoryHandle&) = delete;
    SecureMemoryHandle& operator=(const SecureMemoryHandle&) = delete;

    // ========================================================================
    // Memory Operations
    // ========================================================================

    /**
     * @brief Copy data into the region, zero-filling any remaining bytes
     */
    Result<Unit, SodiumFailure> Write(std::span<const uint8_t> data);

    /**
     * @brief Copy the whole region into a caller buffer
     */
    Result<Unit, SodiumFailure> Read(std::span<uint8_t> output) const;

    /**
     * @brief Zero the region without releasing it
     */
    Result<Unit, SodiumFailure> Wipe();

    /**
     * @brief Constant-time comparison of the contents of two handles
     */
    Result<bool, SodiumFailure> ContentEquals(const SecureMemoryHandle& other) const;

    /**
     * @brief Execute a function with read-only access to the region
     *
     * Avoids copying secrets out of guarded memory.
     */
    template<typename F>
    auto WithReadAccess(F&& func) const -> Result<std::invoke_result_t<F, std::span<const uint8_t>>, SodiumFailure> {
        using T = std::invoke_result_t<F, std::span<const uint8_t>>;
        if (IsInvalid()) {
            return Result<T, SodiumFailure>::Err(DisposedFailure());
        }
        return Result<T, SodiumFailure>::Ok(std::forward<F>(func)(ConstBytes()));
    }

    /**
     * @brief Execute a function with read-write access to the region
     *
     * Used by the derivation steps to write their output straight into
     * guarded memory.
     */
    template<typename F>
    auto WithWriteAccess(F&& func) -> Result<std::invoke_result_t<F, std::span<uint8_t>>, SodiumFailure> {
        using T = std::invoke_result_t<F, std::span<uint8_t>>;
        if (IsInvalid()) {
            return Result<T, SodiumFailure>::Err(DisposedFailure());
        }
        return Result<T, SodiumFailure>::Ok(std::forward<F>(func)(Bytes()));
    }

    // ========================================================================
    // State Queries
    // ========================================================================

    [[nodiscard]] bool IsInvalid() const noexcept {
        return data_ == nullptr;
    }

    [[nodiscard]] size_t Size() const noexcept {
        return size_;
    }

private:
    SecureMemoryHandle(uint8_t* data, size_t size) noexcept
        : data_(data), size_(size) {}

    std::span<uint8_t> Bytes() noexcept { return {data_, size_}; }
    std::span<const uint8_t> ConstBytes() const noexcept { return {data_, size_}; }

    static SodiumFailure DisposedFailure();

    void Release() noexcept;

    uint8_t* data_;
    size_t size_;
};

} // namespace vaultphrases::crypto
