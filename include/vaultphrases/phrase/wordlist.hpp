#pragma once

#include "vaultphrases/crypto/sodium_interop.hpp"
#include "vaultphrases/core/result.hpp"
#include "vaultphrases/core/failures.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace vaultphrases::phrase {

using crypto::Sha256Digest;

/// SHA-256 of the raw wordlist bytes, for manual comparison by the user.
struct WordlistFingerprint {
    Sha256Digest digest;

    /// Full lowercase hex digest.
    [[nodiscard]] std::string Hex() const;

    /// Display form "first6...last6" of the hex digest.
    [[nodiscard]] std::string ShortForm() const;

    [[nodiscard]] bool operator==(const WordlistFingerprint&) const = default;
};

/**
 * @brief Immutable, validated output alphabet of the phrase encoder
 *
 * Index order is file order. Accepted line formats:
 * - a bare word
 * - several whitespace-separated tokens ("index<TAB>word", EFF dice
 *   "11111 word", numbered lists), of which the last one is the word
 *
 * Content must be UTF-8. Lines end at LF, CR or CRLF and are trimmed of
 * Unicode whitespace; blank lines and lines starting with '#' are skipped.
 * The loader only exposes the fingerprint. Comparing it against a published
 * value is left to the user.
 */
class Wordlist {
public:
    /**
     * @brief Read and parse a wordlist file
     *
     * @return FileAccess if the path is missing, not a regular file or
     *         unreadable; otherwise the result of Parse
     */
    static Result<Wordlist, VaultFailure> Load(const std::filesystem::path& path);

    /**
     * @brief Parse raw wordlist bytes
     *
     * @param raw File contents; the fingerprint covers exactly these bytes
     * @param source_name Display name recorded in recovery kits
     * @return InvalidEncoding, EmptyWordlist, DuplicateWord or WordlistSize
     *         on invalid content
     */
    static Result<Wordlist, VaultFailure> Parse(
        std::span<const uint8_t> raw,
        std::string source_name = {});

    [[nodiscard]] size_t Size() const noexcept {
        return words_.size();
    }

    [[nodiscard]] const std::string& At(size_t index) const {
        return words_.at(index);
    }

    [[nodiscard]] const std::vector<std::string>& Words() const noexcept {
        return words_;
    }

    [[nodiscard]] const WordlistFingerprint& Fingerprint() const noexcept {
        return fingerprint_;
    }

    /// File name the list was loaded from, empty when parsed from memory.
    [[nodiscard]] const std::string& SourceName() const noexcept {
        return source_name_;
    }

private:
    Wordlist(std::vector<std::string> words, WordlistFingerprint fingerprint, std::string source_name)
        : words_(std::move(words))
        , fingerprint_(fingerprint)
        , source_name_(std::move(source_name)) {}

    std::vector<std::string> words_;
    WordlistFingerprint fingerprint_;
    std::string source_name_;
};

} // namespace vaultphrases::phrase
