#pragma once

#include "vaultphrases/configuration/scheme_config.hpp"
#include "vaultphrases/models/label.hpp"
#include "vaultphrases/phrase/normalizer.hpp"
#include "vaultphrases/phrase/phrase_encoder.hpp"
#include "vaultphrases/phrase/wordlist.hpp"
#include "vaultphrases/core/constants.hpp"
#include "vaultphrases/core/result.hpp"
#include "vaultphrases/core/failures.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace vaultphrases::derivation {

using configuration::KdfMode;
using configuration::SchemeConfig;
using models::Label;
using phrase::Passphrase;
using phrase::PhraseStrength;
using phrase::Wordlist;
using phrase::WordlistFingerprint;

// ============================================================================
// Request / Outcome
// ============================================================================

/// One passphrase to produce.
struct PhraseRequest {
    Label label;
    int word_count = PhraseConstants::DEFAULT_WORD_COUNT;
    std::string delimiter = std::string(PhraseConstants::DEFAULT_DELIMITER);
};

/**
 * @brief Which outputs one derivation produces, and under which KDF mode
 *
 * An empty phrase list derives the master key only, which lets a caller
 * confirm a root phrase is accepted without revealing anything.
 */
struct DerivationRequest {
    KdfMode mode;
    std::vector<PhraseRequest> phrases;

    [[nodiscard]] static DerivationRequest MasterOnly(KdfMode mode) {
        return DerivationRequest{mode, {}};
    }

    /// HOT then COLD, same word count and delimiter.
    [[nodiscard]] static DerivationRequest ReservedPair(
        KdfMode mode,
        int word_count = PhraseConstants::DEFAULT_WORD_COUNT,
        std::string_view delimiter = PhraseConstants::DEFAULT_DELIMITER) {
        DerivationRequest request{mode, {}};
        request.phrases.push_back(PhraseRequest{Label::Hot(), word_count, std::string(delimiter)});
        request.phrases.push_back(PhraseRequest{Label::Cold(), word_count, std::string(delimiter)});
        return request;
    }

    [[nodiscard]] static DerivationRequest Custom(
        KdfMode mode,
        Label label,
        int word_count = PhraseConstants::DEFAULT_WORD_COUNT,
        std::string_view delimiter = PhraseConstants::DEFAULT_DELIMITER) {
        DerivationRequest request{mode, {}};
        request.phrases.push_back(PhraseRequest{std::move(label), word_count, std::string(delimiter)});
        return request;
    }

    /// Request one more phrase under the same mode.
    DerivationRequest& Add(PhraseRequest phrase) {
        phrases.push_back(std::move(phrase));
        return *this;
    }
};

struct DerivedPhrase {
    std::string label_name;
    std::string scheme_version;
    Passphrase passphrase;
};

struct DerivationOutcome {
    PhraseStrength strength;
    std::vector<DerivedPhrase> phrases;
};

// ============================================================================
// Pipeline
// ============================================================================

/**
 * @brief Root phrase -> passphrases, end to end
 *
 * Pipeline per call:
 * 1. Validate every requested word count and label
 * 2. Normalize the root phrase into guarded memory, then zero the caller's copy
 * 3. Argon2id master key
 * 4. Per requested label: HMAC child key -> passphrase, child key zeroed
 *
 * Either every requested passphrase is returned or none is. The caller's
 * root phrase buffer is zeroed in place on every path, keeping its length.
 *
 * Example:
 * @code
 * auto system = VaultPhraseSystem::Load("eff_large_wordlist.txt", SchemeConfig::Current()).Unwrap();
 * std::cout << system.Fingerprint().ShortForm() << "\n";
 * auto outcome = system.Derive(root_phrase, DerivationRequest::ReservedPair(KdfMode::Production));
 * @endcode
 */
class VaultPhraseSystem {
public:
    static Result<VaultPhraseSystem, VaultFailure> Create(Wordlist wordlist, SchemeConfig scheme);

    static Result<VaultPhraseSystem, VaultFailure> Load(
        const std::filesystem::path& wordlist_path,
        SchemeConfig scheme);

    /// Shown to the user before any derived value.
    [[nodiscard]] const WordlistFingerprint& Fingerprint() const noexcept {
        return wordlist_.Fingerprint();
    }

    [[nodiscard]] const Wordlist& GetWordlist() const noexcept {
        return wordlist_;
    }

    [[nodiscard]] const SchemeConfig& Scheme() const noexcept {
        return scheme_;
    }

    Result<DerivationOutcome, VaultFailure> Derive(
        std::string& root_phrase,
        const DerivationRequest& request) const;

    /**
     * @brief Derive and discard the master key, reporting phrase strength
     *
     * Needs no wordlist. The caller's buffer is zeroed like Derive's.
     */
    static Result<PhraseStrength, VaultFailure> CheckRootPhrase(
        std::string& root_phrase,
        KdfMode mode,
        const SchemeConfig& scheme);

private:
    VaultPhraseSystem(Wordlist wordlist, SchemeConfig scheme)
        : wordlist_(std::move(wordlist))
        , scheme_(scheme) {}

    Result<Unit, VaultFailure> ValidateRequest(const DerivationRequest& request) const;

    Wordlist wordlist_;
    SchemeConfig scheme_;
};

} // namespace vaultphrases::derivation
