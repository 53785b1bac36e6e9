#include "vaultphrases/phrase/normalizer.hpp"
#include "vaultphrases/crypto/scoped_wipe.hpp"
#include "vaultphrases/core/constants.hpp"
#include "vaultphrases/core/format.hpp"
#include "unicode_internal.hpp"

#include <sodium.h>
#include <unicode/ustring.h>
#include <unicode/utf16.h>
#include <unicode/utf8.h>

#include <algorithm>
#include <array>
#include <vector>

namespace vaultphrases::phrase {

namespace {

// "" selects the root locale: no Turkish or Lithuanian tailoring.
constexpr char ROOT_LOCALE[] = "";

/**
 * Lowercased UTF-16 copy of a root phrase. Zeroed on destruction; a
 * moved-from instance owns no buffer.
 */
class LoweredPhrase {
public:
    static Result<LoweredPhrase, VaultFailure> From(std::string_view raw);

    ~LoweredPhrase() {
        sodium_memzero(units_.data(), units_.size() * sizeof(UChar));
    }

    LoweredPhrase(LoweredPhrase&&) noexcept = default;
    LoweredPhrase& operator=(LoweredPhrase&&) = delete;
    LoweredPhrase(const LoweredPhrase&) = delete;
    LoweredPhrase& operator=(const LoweredPhrase&) = delete;

    /// Feeds every UTF-8 byte of the trimmed, space-collapsed form to sink.
    template<typename Sink>
    size_t Emit(Sink&& sink) const;

private:
    explicit LoweredPhrase(std::vector<UChar> units) noexcept
        : units_(std::move(units)) {}

    std::vector<UChar> units_;
};

Result<LoweredPhrase, VaultFailure> LoweredPhrase::From(std::string_view raw) {
    auto valid = detail::ValidateUtf8(raw, "Root phrase");
    if (valid.IsErr()) {
        return Result<LoweredPhrase, VaultFailure>::Err(std::move(valid).UnwrapErr());
    }

    // A UTF-8 sequence never yields more UTF-16 units than it has bytes
    std::vector<UChar> decoded(raw.size());
    crypto::ScopedWipe decoded_guard(std::span<uint8_t>(
        reinterpret_cast<uint8_t*>(decoded.data()), decoded.size() * sizeof(UChar)));

    const auto* bytes = reinterpret_cast<const uint8_t*>(raw.data());
    const auto length = static_cast<int32_t>(raw.size());
    int32_t in = 0;
    int32_t decoded_length = 0;
    while (in < length) {
        UChar32 c;
        U8_NEXT_UNSAFE(bytes, in, c);
        U16_APPEND_UNSAFE(decoded.data(), decoded_length, c);
    }

    UErrorCode status = U_ZERO_ERROR;
    const int32_t lowered_length = u_strToLower(
        nullptr, 0, decoded.data(), decoded_length, ROOT_LOCALE, &status);
    if (status == U_BUFFER_OVERFLOW_ERROR) {
        status = U_ZERO_ERROR;
    }
    if (U_FAILURE(status)) {
        return Result<LoweredPhrase, VaultFailure>::Err(VaultFailure::InvalidEncoding(
            compat::format("Root phrase case mapping failed: {}", u_errorName(status))));
    }

    LoweredPhrase lowered(std::vector<UChar>(static_cast<size_t>(lowered_length)));
    u_strToLower(lowered.units_.data(), lowered_length,
                 decoded.data(), decoded_length, ROOT_LOCALE, &status);
    if (U_FAILURE(status)) {
        return Result<LoweredPhrase, VaultFailure>::Err(VaultFailure::InvalidEncoding(
            compat::format("Root phrase case mapping failed: {}", u_errorName(status))));
    }
    return Result<LoweredPhrase, VaultFailure>::Ok(std::move(lowered));
}

template<typename Sink>
size_t LoweredPhrase::Emit(Sink&& sink) const {
    std::array<uint8_t, U8_MAX_LENGTH> encoded{};
    crypto::ScopedWipe encoded_guard(encoded);

    const auto length = static_cast<int32_t>(units_.size());
    size_t written = 0;
    bool pending_space = false;
    int32_t at = 0;
    while (at < length) {
        UChar32 c;
        U16_NEXT(units_.data(), at, length, c);
        if (detail::IsSeparatorSpace(c)) {
            pending_space = written > 0;
            continue;
        }
        if (pending_space) {
            sink(written++, ' ');
            pending_space = false;
        }
        int32_t encoded_length = 0;
        U8_APPEND_UNSAFE(encoded.data(), encoded_length, c);
        for (int32_t i = 0; i < encoded_length; ++i) {
            sink(written++, static_cast<char>(encoded[static_cast<size_t>(i)]));
        }
    }
    return written;
}

size_t CountPieces(std::span<const uint8_t> text, const char separator) {
    return 1 + static_cast<size_t>(
        std::count(text.begin(), text.end(), static_cast<uint8_t>(separator)));
}

} // namespace

Result<NormalizedSecret, VaultFailure> Normalizer::Normalize(std::string_view raw) {
    auto lowered_result = LoweredPhrase::From(raw);
    if (lowered_result.IsErr()) {
        return Result<NormalizedSecret, VaultFailure>::Err(std::move(lowered_result).UnwrapErr());
    }
    const auto& lowered = lowered_result.Unwrap();

    const size_t length = lowered.Emit([](size_t, char) {});
    if (length == 0) {
        return Result<NormalizedSecret, VaultFailure>::Err(
            VaultFailure::EmptyInput(std::string(ErrorMessages::EMPTY_ROOT_PHRASE)));
    }

    auto handle_result = SecureMemoryHandle::Allocate(length);
    if (handle_result.IsErr()) {
        return Result<NormalizedSecret, VaultFailure>::Err(
            VaultFailure::FromSodiumFailure(handle_result.UnwrapErr()));
    }
    auto handle = std::move(handle_result).Unwrap();

    auto write_result = handle.WithWriteAccess([&](std::span<uint8_t> out) {
        return lowered.Emit([&](size_t index, char c) {
            out[index] = static_cast<uint8_t>(c);
        });
    });
    if (write_result.IsErr()) {
        return Result<NormalizedSecret, VaultFailure>::Err(
            VaultFailure::FromSodiumFailure(write_result.UnwrapErr()));
    }

    return Result<NormalizedSecret, VaultFailure>::Ok(NormalizedSecret(std::move(handle)));
}

Result<std::string, VaultFailure> Normalizer::NormalizeText(std::string_view raw) {
    auto lowered_result = LoweredPhrase::From(raw);
    if (lowered_result.IsErr()) {
        return Result<std::string, VaultFailure>::Err(std::move(lowered_result).UnwrapErr());
    }
    std::string normalized;
    normalized.reserve(raw.size());
    lowered_result.Unwrap().Emit([&](size_t, char c) { normalized.push_back(c); });
    return Result<std::string, VaultFailure>::Ok(std::move(normalized));
}

PhraseStrength Normalizer::AssessStrength(std::span<const uint8_t> normalized) {
    size_t word_count = 0;
    if (!normalized.empty()) {
        for (const char separator : StrengthConstants::WORD_SEPARATORS) {
            word_count = std::max(word_count, CountPieces(normalized, separator));
        }
    }

    const auto char_count = static_cast<size_t>(std::count_if(
        normalized.begin(), normalized.end(),
        [](uint8_t byte) { return (byte & 0xC0) != 0x80; }));

    StrengthLevel level = StrengthLevel::Ok;
    if (word_count < StrengthConstants::WEAK_WORD_THRESHOLD ||
        char_count < StrengthConstants::WEAK_CHAR_THRESHOLD) {
        level = StrengthLevel::Weak;
    } else if (word_count >= StrengthConstants::STRONG_WORD_THRESHOLD &&
               char_count >= StrengthConstants::STRONG_CHAR_THRESHOLD) {
        level = StrengthLevel::Strong;
    }
    return PhraseStrength{level, word_count, char_count};
}

} // namespace vaultphrases::phrase
