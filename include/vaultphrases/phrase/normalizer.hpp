#pragma once

#include "vaultphrases/crypto/sodium_secure_memory_handle.hpp"
#include "vaultphrases/core/result.hpp"
#include "vaultphrases/core/failures.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>

namespace vaultphrases::phrase {

using crypto::SecureMemoryHandle;

/// Advisory strength class of a root phrase. Never blocks derivation.
enum class StrengthLevel : uint8_t {
    Weak,
    Ok,
    Strong
};

struct PhraseStrength {
    StrengthLevel level;
    size_t word_count;
    size_t char_count;
};

[[nodiscard]] constexpr std::string_view ToString(StrengthLevel level) noexcept {
    switch (level) {
        case StrengthLevel::Weak: return "weak";
        case StrengthLevel::Ok: return "ok";
        case StrengthLevel::Strong: return "strong";
    }
    return "unknown";
}

/**
 * @brief Canonical UTF-8 bytes of a root phrase, held in guarded memory
 *
 * Consumed by master key derivation and zeroed on destruction.
 */
class NormalizedSecret {
public:
    [[nodiscard]] size_t Size() const noexcept {
        return handle_.Size();
    }

    template<typename F>
    auto WithReadAccess(F&& func) const
        -> Result<std::invoke_result_t<F, std::span<const uint8_t>>, VaultFailure> {
        using T = std::invoke_result_t<F, std::span<const uint8_t>>;
        auto result = handle_.WithReadAccess(std::forward<F>(func));
        if (result.IsErr()) {
            return Result<T, VaultFailure>::Err(
                VaultFailure::FromSodiumFailure(result.UnwrapErr()));
        }
        return Result<T, VaultFailure>::Ok(std::move(result).Unwrap());
    }

    NormalizedSecret(NormalizedSecret&&) noexcept = default;
    NormalizedSecret& operator=(NormalizedSecret&&) noexcept = default;
    NormalizedSecret(const NormalizedSecret&) = delete;
    NormalizedSecret& operator=(const NormalizedSecret&) = delete;

private:
    friend class Normalizer;
    explicit NormalizedSecret(SecureMemoryHandle handle) noexcept
        : handle_(std::move(handle)) {}
    SecureMemoryHandle handle_;
};

/**
 * @brief Root phrase canonicalization
 *
 * Input must be well-formed UTF-8. The phrase is lowercased with the full
 * Unicode case mapping of the root locale (so "ÉTÉ" becomes "été"), trimmed,
 * and every run of Unicode whitespace (including NBSP and U+3000) becomes one
 * ASCII space. The function is pure; only ill-formed input or an empty result
 * is an error.
 */
class Normalizer {
public:
    /**
     * @brief Normalize straight into guarded memory
     *
     * Intermediate UTF-16 copies are zeroed before return.
     *
     * @return Ok(secret), EmptyInput when nothing but whitespace remains,
     *         InvalidEncoding for ill-formed UTF-8
     */
    static Result<NormalizedSecret, VaultFailure> Normalize(std::string_view raw);

    /// Same transformation as Normalize, into an ordinary string (may be empty).
    static Result<std::string, VaultFailure> NormalizeText(std::string_view raw);

    /**
     * @brief Coarse strength classification of normalized phrase bytes
     *
     * The word count is the largest number of pieces obtained by splitting
     * on ' ', '-', '_' or ',' alone; characters are UTF-8 code points.
     */
    static PhraseStrength AssessStrength(std::span<const uint8_t> normalized);

private:
    Normalizer() = delete;
};

} // namespace vaultphrases::phrase
