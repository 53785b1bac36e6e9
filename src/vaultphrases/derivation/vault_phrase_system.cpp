#include "vaultphrases/derivation/vault_phrase_system.hpp"
#include "vaultphrases/crypto/child_key_derivation.hpp"
#include "vaultphrases/crypto/master_key_derivation.hpp"
#include "vaultphrases/crypto/scoped_wipe.hpp"
#include "vaultphrases/crypto/sodium_interop.hpp"

namespace vaultphrases::derivation {

using crypto::ChildKeyDerivation;
using crypto::MasterKeyDerivation;
using crypto::ScopedWipe;
using crypto::SodiumInterop;
using phrase::Normalizer;
using phrase::PhraseEncoder;

Result<VaultPhraseSystem, VaultFailure> VaultPhraseSystem::Create(Wordlist wordlist, SchemeConfig scheme) {
    auto init_result = SodiumInterop::Initialize();
    if (init_result.IsErr()) {
        return Result<VaultPhraseSystem, VaultFailure>::Err(
            VaultFailure::FromSodiumFailure(init_result.UnwrapErr()));
    }
    return Result<VaultPhraseSystem, VaultFailure>::Ok(
        VaultPhraseSystem(std::move(wordlist), scheme));
}

Result<VaultPhraseSystem, VaultFailure> VaultPhraseSystem::Load(
    const std::filesystem::path& wordlist_path,
    SchemeConfig scheme) {
    auto wordlist_result = Wordlist::Load(wordlist_path);
    if (wordlist_result.IsErr()) {
        return Result<VaultPhraseSystem, VaultFailure>::Err(std::move(wordlist_result).UnwrapErr());
    }
    return Create(std::move(wordlist_result).Unwrap(), scheme);
}

Result<Unit, VaultFailure> VaultPhraseSystem::ValidateRequest(const DerivationRequest& request) const {
    for (const auto& phrase : request.phrases) {
        auto count_check = PhraseEncoder::ValidateWordCount(phrase.word_count);
        if (count_check.IsErr()) {
            return count_check;
        }
        auto label_check = phrase.label.Encode(scheme_);
        if (label_check.IsErr()) {
            return Result<Unit, VaultFailure>::Err(std::move(label_check).UnwrapErr());
        }
    }
    return Result<Unit, VaultFailure>::Ok(unit);
}

namespace {

/// Normalize, assess, Argon2id. The caller's buffer is zeroed once normalized.
Result<models::MasterKey, VaultFailure> MasterFromRootPhrase(
    std::string& root_phrase,
    const KdfMode mode,
    const SchemeConfig& scheme,
    PhraseStrength& strength) {

    ScopedWipe root_guard(root_phrase);
    auto secret_result = Normalizer::Normalize(root_phrase);
    root_guard.WipeNow();
    if (secret_result.IsErr()) {
        return Result<models::MasterKey, VaultFailure>::Err(std::move(secret_result).UnwrapErr());
    }

    // The normalized secret is released as soon as the master key exists.
    auto secret = std::move(secret_result).Unwrap();
    auto strength_result = secret.WithReadAccess([](std::span<const uint8_t> bytes) {
        return Normalizer::AssessStrength(bytes);
    });
    if (strength_result.IsErr()) {
        return Result<models::MasterKey, VaultFailure>::Err(std::move(strength_result).UnwrapErr());
    }
    strength = strength_result.Unwrap();
    return MasterKeyDerivation::DeriveMasterKey(secret, mode, scheme);
}

} // namespace

Result<PhraseStrength, VaultFailure> VaultPhraseSystem::CheckRootPhrase(
    std::string& root_phrase,
    const KdfMode mode,
    const SchemeConfig& scheme) {

    ScopedWipe root_guard(root_phrase);
    auto init_result = SodiumInterop::Initialize();
    if (init_result.IsErr()) {
        return Result<PhraseStrength, VaultFailure>::Err(
            VaultFailure::FromSodiumFailure(init_result.UnwrapErr()));
    }

    PhraseStrength strength{};
    auto master_result = MasterFromRootPhrase(root_phrase, mode, scheme, strength);
    if (master_result.IsErr()) {
        return Result<PhraseStrength, VaultFailure>::Err(std::move(master_result).UnwrapErr());
    }
    auto master_key = std::move(master_result).Unwrap();
    auto master_wipe = master_key.Wipe();
    if (master_wipe.IsErr()) {
        return Result<PhraseStrength, VaultFailure>::Err(std::move(master_wipe).UnwrapErr());
    }
    return Result<PhraseStrength, VaultFailure>::Ok(strength);
}

Result<DerivationOutcome, VaultFailure> VaultPhraseSystem::Derive(
    std::string& root_phrase,
    const DerivationRequest& request) const {

    ScopedWipe root_guard(root_phrase);

    auto validation = ValidateRequest(request);
    if (validation.IsErr()) {
        return Result<DerivationOutcome, VaultFailure>::Err(std::move(validation).UnwrapErr());
    }

    DerivationOutcome outcome{};
    auto master_result = MasterFromRootPhrase(root_phrase, request.mode, scheme_, outcome.strength);
    if (master_result.IsErr()) {
        return Result<DerivationOutcome, VaultFailure>::Err(std::move(master_result).UnwrapErr());
    }
    auto master_key = std::move(master_result).Unwrap();

    outcome.phrases.reserve(request.phrases.size());
    for (const auto& phrase : request.phrases) {
        auto child_result = ChildKeyDerivation::DeriveChildKey(master_key, phrase.label, scheme_);
        if (child_result.IsErr()) {
            return Result<DerivationOutcome, VaultFailure>::Err(std::move(child_result).UnwrapErr());
        }
        auto child_key = std::move(child_result).Unwrap();

        auto passphrase_result = PhraseEncoder::Encode(child_key, wordlist_, phrase.word_count, phrase.delimiter);
        auto wipe_result = child_key.Wipe();
        if (passphrase_result.IsErr()) {
            return Result<DerivationOutcome, VaultFailure>::Err(std::move(passphrase_result).UnwrapErr());
        }
        if (wipe_result.IsErr()) {
            return Result<DerivationOutcome, VaultFailure>::Err(std::move(wipe_result).UnwrapErr());
        }

        outcome.phrases.push_back(DerivedPhrase{
            phrase.label.DisplayName(),
            std::string(scheme_.VersionTag()),
            std::move(passphrase_result).Unwrap()});
    }

    auto master_wipe = master_key.Wipe();
    if (master_wipe.IsErr()) {
        return Result<DerivationOutcome, VaultFailure>::Err(std::move(master_wipe).UnwrapErr());
    }
    return Result<DerivationOutcome, VaultFailure>::Ok(std::move(outcome));
}

} // namespace vaultphrases::derivation
