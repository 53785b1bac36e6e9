#pragma once

#include "vaultphrases/core/result.hpp"
#include "vaultphrases/core/failures.hpp"

#include <cstdint>
#include <span>

namespace vaultphrases::phrase {

/**
 * @brief Counter-mode expansion of a child key into unbiased word indices
 *
 * Position i is resolved independently of every other position:
 *
 *   block(i, r) = SHA-256(key || u32be(i) || u32be(r))      r = 0, 1, ...
 *
 * Each 32-byte block is read as four big-endian 64-bit lanes. The first lane
 * value v with v >= (2^64 mod N) is accepted and yields v mod N; values
 * below that bound are rejected so every index in [0, N) is equally likely.
 * When all four lanes of a block are rejected the next round is tried.
 *
 * The stream borrows the key bytes and holds no cursor state; IndexAt may be
 * called for any position in any order. Intermediate blocks are wiped.
 */
class WordIndexStream {
public:
    /**
     * @param key Child key bytes; must outlive the stream
     * @param alphabet_size Wordlist size N, at least 2
     */
    static Result<WordIndexStream, VaultFailure> Create(
        std::span<const uint8_t> key,
        uint64_t alphabet_size);

    [[nodiscard]] Result<uint64_t, VaultFailure> IndexAt(uint32_t position) const;

    [[nodiscard]] uint64_t AlphabetSize() const noexcept {
        return alphabet_size_;
    }

    /// Smallest accepted lane value, 2^64 mod N.
    [[nodiscard]] uint64_t RejectionBound() const noexcept {
        return rejection_bound_;
    }

private:
    WordIndexStream(std::span<const uint8_t> key, uint64_t alphabet_size) noexcept;

    std::span<const uint8_t> key_;
    uint64_t alphabet_size_;
    uint64_t rejection_bound_;
};

} // namespace vaultphrases::phrase
