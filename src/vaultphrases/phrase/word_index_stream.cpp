#include "vaultphrases/phrase/word_index_stream.hpp"
#include "vaultphrases/crypto/scoped_wipe.hpp"
#include "vaultphrases/core/constants.hpp"
#include "vaultphrases/core/format.hpp"
#include "vaultphrases/debug/key_logger.hpp"

#include <sodium.h>
#include <array>

namespace vaultphrases::phrase {

namespace {

void StoreU32BigEndian(const uint32_t value, std::span<uint8_t, 4> out) noexcept {
    out[0] = static_cast<uint8_t>(value >> 24);
    out[1] = static_cast<uint8_t>(value >> 16);
    out[2] = static_cast<uint8_t>(value >> 8);
    out[3] = static_cast<uint8_t>(value);
}

uint64_t LoadU64BigEndian(std::span<const uint8_t> lane) noexcept {
    uint64_t value = 0;
    for (size_t i = 0; i < Constants::STREAM_LANE_SIZE; ++i) {
        value = (value << 8) | lane[i];
    }
    return value;
}

} // namespace

WordIndexStream::WordIndexStream(std::span<const uint8_t> key, const uint64_t alphabet_size) noexcept
    : key_(key)
    , alphabet_size_(alphabet_size)
    , rejection_bound_((0 - alphabet_size) % alphabet_size) {}

Result<WordIndexStream, VaultFailure> WordIndexStream::Create(
    std::span<const uint8_t> key,
    const uint64_t alphabet_size) {

    if (key.empty()) {
        return Result<WordIndexStream, VaultFailure>::Err(
            VaultFailure::KeyDerivation("Word index stream requires a non-empty key"));
    }
    if (alphabet_size < PhraseConstants::MIN_WORDLIST_SIZE) {
        return Result<WordIndexStream, VaultFailure>::Err(
            VaultFailure::WordlistSize(compat::format(
                "Alphabet must contain at least {} words, got {}",
                PhraseConstants::MIN_WORDLIST_SIZE, alphabet_size)));
    }
    return Result<WordIndexStream, VaultFailure>::Ok(WordIndexStream(key, alphabet_size));
}

Result<uint64_t, VaultFailure> WordIndexStream::IndexAt(const uint32_t position) const {
    std::array<uint8_t, crypto_hash_sha256_BYTES> block{};
    std::array<uint8_t, 8> counter{};
    crypto::ScopedWipe block_guard(block);

    StoreU32BigEndian(position, std::span<uint8_t, 4>(counter.data(), 4));

    for (uint32_t round = 0; round < Constants::MAX_STREAM_ROUNDS; ++round) {
        StoreU32BigEndian(round, std::span<uint8_t, 4>(counter.data() + 4, 4));

        crypto_hash_sha256_state state;
        if (crypto_hash_sha256_init(&state) != 0 ||
            crypto_hash_sha256_update(&state, key_.data(), key_.size()) != 0 ||
            crypto_hash_sha256_update(&state, counter.data(), counter.size()) != 0 ||
            crypto_hash_sha256_final(&state, block.data()) != 0) {
            sodium_memzero(&state, sizeof(state));
            return Result<uint64_t, VaultFailure>::Err(
                VaultFailure::KeyDerivation("SHA-256 expansion of word index stream failed"));
        }
        sodium_memzero(&state, sizeof(state));

        for (size_t lane = 0; lane < Constants::STREAM_LANES_PER_BLOCK; ++lane) {
            const uint64_t value = LoadU64BigEndian(
                std::span<const uint8_t>(block).subspan(lane * Constants::STREAM_LANE_SIZE));
            if (value >= rejection_bound_) {
                const uint64_t index = value % alphabet_size_;
                debug::LogWordIndex(position, round + 1, index);
                return Result<uint64_t, VaultFailure>::Ok(index);
            }
        }
    }

    return Result<uint64_t, VaultFailure>::Err(
        VaultFailure::KeyDerivation(compat::format(
            "Word index stream exhausted {} rounds at position {}",
            Constants::MAX_STREAM_ROUNDS, position)));
}

} // namespace vaultphrases::phrase
