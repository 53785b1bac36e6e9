#pragma once

#include <sodium.h>
#include <cstdint>
#include <span>
#include <string>

namespace vaultphrases::crypto {

/**
 * @brief Zeroes a caller-owned buffer when the enclosing scope exits
 *
 * Covers sensitive bytes that live outside SecureMemoryHandle, such as the
 * root phrase string handed in by the caller or a stack block holding
 * intermediate hash output. The guarded buffer must not be resized or
 * reallocated while the guard is alive.
 *
 * Zeroing is best effort: it clears this storage only, not copies the
 * runtime or the OS may have made elsewhere.
 */
class ScopedWipe {
public:
    explicit ScopedWipe(std::span<uint8_t> buffer) noexcept
        : buffer_(buffer) {}

    explicit ScopedWipe(std::string& text) noexcept
        : buffer_(reinterpret_cast<uint8_t*>(text.data()), text.size()) {}

    ~ScopedWipe() {
        WipeNow();
    }

    /// Zero immediately; the destructor wipes again, which is harmless.
    void WipeNow() noexcept {
        if (!buffer_.empty()) {
            sodium_memzero(buffer_.data(), buffer_.size());
        }
    }

    ScopedWipe(const ScopedWipe&) = delete;
    ScopedWipe& operator=(const ScopedWipe&) = delete;
    ScopedWipe(ScopedWipe&&) = delete;
    ScopedWipe& operator=(ScopedWipe&&) = delete;

private:
    std::span<uint8_t> buffer_;
};

} // namespace vaultphrases::crypto
