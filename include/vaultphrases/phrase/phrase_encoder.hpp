#pragma once

#include "vaultphrases/models/keys/derived_key.hpp"
#include "vaultphrases/phrase/wordlist.hpp"
#include "vaultphrases/core/result.hpp"
#include "vaultphrases/core/failures.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace vaultphrases::phrase {

using models::ChildKey;

/// Words selected for one label, in selection order. Repeats are allowed.
struct Passphrase {
    std::vector<std::string> words;
    std::string delimiter;

    [[nodiscard]] std::string Joined() const;

    [[nodiscard]] bool operator==(const Passphrase&) const = default;
};

class PhraseEncoder {
public:
    /**
     * @brief Child key -> human-readable passphrase
     *
     * Word i is wordlist[WordIndexStream(key, N).IndexAt(i)].
     *
     * @param word_count Number of words, 1..128
     * @param delimiter Joins the words; may be empty
     * @return InvalidWordCount outside the accepted range
     */
    static Result<Passphrase, VaultFailure> Encode(
        const ChildKey& key,
        const Wordlist& wordlist,
        int word_count,
        std::string_view delimiter);

    /// Index sequence for raw key bytes, used by Encode.
    static Result<std::vector<uint64_t>, VaultFailure> EncodeIndices(
        std::span<const uint8_t> key,
        uint64_t alphabet_size,
        int word_count);

    static Result<Unit, VaultFailure> ValidateWordCount(int word_count);

private:
    PhraseEncoder() = delete;
};

} // namespace vaultphrases::phrase
