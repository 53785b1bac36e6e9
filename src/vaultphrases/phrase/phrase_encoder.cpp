#include "vaultphrases/phrase/phrase_encoder.hpp"
#include "vaultphrases/phrase/word_index_stream.hpp"
#include "vaultphrases/core/constants.hpp"
#include "vaultphrases/core/format.hpp"

namespace vaultphrases::phrase {

std::string Passphrase::Joined() const {
    std::string joined;
    for (size_t i = 0; i < words.size(); ++i) {
        if (i > 0) {
            joined += delimiter;
        }
        joined += words[i];
    }
    return joined;
}

Result<Unit, VaultFailure> PhraseEncoder::ValidateWordCount(const int word_count) {
    if (word_count < PhraseConstants::MIN_WORD_COUNT ||
        word_count > PhraseConstants::MAX_WORD_COUNT) {
        return Result<Unit, VaultFailure>::Err(
            VaultFailure::InvalidWordCount(compat::format(
                "Word count must be between {} and {}, got {}",
                PhraseConstants::MIN_WORD_COUNT,
                PhraseConstants::MAX_WORD_COUNT,
                word_count)));
    }
    return Result<Unit, VaultFailure>::Ok(unit);
}

Result<std::vector<uint64_t>, VaultFailure> PhraseEncoder::EncodeIndices(
    std::span<const uint8_t> key,
    const uint64_t alphabet_size,
    const int word_count) {

    auto count_check = ValidateWordCount(word_count);
    if (count_check.IsErr()) {
        return Result<std::vector<uint64_t>, VaultFailure>::Err(std::move(count_check).UnwrapErr());
    }

    auto stream_result = WordIndexStream::Create(key, alphabet_size);
    if (stream_result.IsErr()) {
        return Result<std::vector<uint64_t>, VaultFailure>::Err(std::move(stream_result).UnwrapErr());
    }
    const auto& stream = stream_result.Unwrap();

    std::vector<uint64_t> indices;
    indices.reserve(static_cast<size_t>(word_count));
    for (uint32_t position = 0; position < static_cast<uint32_t>(word_count); ++position) {
        auto index_result = stream.IndexAt(position);
        if (index_result.IsErr()) {
            return Result<std::vector<uint64_t>, VaultFailure>::Err(std::move(index_result).UnwrapErr());
        }
        indices.push_back(index_result.Unwrap());
    }
    return Result<std::vector<uint64_t>, VaultFailure>::Ok(std::move(indices));
}

Result<Passphrase, VaultFailure> PhraseEncoder::Encode(
    const ChildKey& key,
    const Wordlist& wordlist,
    const int word_count,
    std::string_view delimiter) {

    auto access_result = key.WithReadAccess([&](std::span<const uint8_t> key_bytes) {
        return EncodeIndices(key_bytes, wordlist.Size(), word_count);
    });
    if (access_result.IsErr()) {
        return Result<Passphrase, VaultFailure>::Err(std::move(access_result).UnwrapErr());
    }
    auto indices_result = std::move(access_result).Unwrap();
    if (indices_result.IsErr()) {
        return Result<Passphrase, VaultFailure>::Err(std::move(indices_result).UnwrapErr());
    }

    Passphrase passphrase{{}, std::string(delimiter)};
    passphrase.words.reserve(static_cast<size_t>(word_count));
    for (const auto index : indices_result.Unwrap()) {
        passphrase.words.push_back(wordlist.At(static_cast<size_t>(index)));
    }
    return Result<Passphrase, VaultFailure>::Ok(std::move(passphrase));
}

} // namespace vaultphrases::phrase
