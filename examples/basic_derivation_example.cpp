/**
 * @file basic_derivation_example.cpp
 * @brief Walks through one derivation step by step with the weak test parameters
 */

#include "vaultphrases/crypto/child_key_derivation.hpp"
#include "vaultphrases/crypto/master_key_derivation.hpp"
#include "vaultphrases/crypto/sodium_interop.hpp"
#include "vaultphrases/derivation/vault_phrase_system.hpp"
#include "vaultphrases/phrase/normalizer.hpp"
#include "vaultphrases/phrase/phrase_encoder.hpp"
#include "vaultphrases/phrase/wordlist.hpp"

#include <iostream>
#include <string>

using namespace vaultphrases;
using namespace vaultphrases::crypto;
using namespace vaultphrases::phrase;

namespace {

constexpr std::string_view kDemoWordlist =
    "1\talpha\n2\tbravo\n3\tcharlie\n4\tdelta\n5\techo\n6\tfoxtrot\n"
    "7\tgolf\n8\thotel\n9\tindia\n10\tjuliett\n11\tkilo\n12\tlima\n"
    "13\tmike\n14\tnovember\n15\toscar\n16\tpapa\n17\tquebec\n18\tromeo\n"
    "19\tsierra\n20\ttango\n21\tuniform\n22\tvictor\n23\twhiskey\n24\txray\n"
    "25\tyankee\n26\tzulu\n";

}

int main() {
    std::cout << "=== VaultPhrases - Basic Derivation Example ===" << std::endl;
    std::cout << std::endl;

    std::cout << "1. Initializing libsodium..." << std::endl;
    auto init_result = SodiumInterop::Initialize();
    if (init_result.IsErr()) {
        std::cerr << "Failed to initialize: "
                  << init_result.UnwrapErr().message << std::endl;
        return 1;
    }
    std::cout << "   Initialized" << std::endl;
    std::cout << std::endl;

    std::cout << "2. Parsing wordlist..." << std::endl;
    auto wordlist_result = Wordlist::Parse(
        std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(kDemoWordlist.data()), kDemoWordlist.size()),
        "nato.txt");
    if (wordlist_result.IsErr()) {
        std::cerr << "Failed to parse wordlist: " << wordlist_result.UnwrapErr().message << std::endl;
        return 1;
    }
    const auto wordlist = std::move(wordlist_result).Unwrap();
    std::cout << "   " << wordlist.Size() << " words, SHA256 "
              << wordlist.Fingerprint().ShortForm() << std::endl;
    std::cout << std::endl;

    std::cout << "3. Normalizing root phrase..." << std::endl;
    auto secret_result = Normalizer::Normalize("  Correct Horse\tBattery   Staple extra words here ");
    if (secret_result.IsErr()) {
        std::cerr << "Failed to normalize: " << secret_result.UnwrapErr().message << std::endl;
        return 1;
    }
    const auto secret = std::move(secret_result).Unwrap();
    std::cout << "   Normalized secret: " << secret.Size() << " bytes [SECURE]" << std::endl;
    std::cout << std::endl;

    const auto scheme = configuration::SchemeConfig::Current();

    std::cout << "4. Deriving master key (Argon2id, test parameters)..." << std::endl;
    auto master_result = MasterKeyDerivation::DeriveMasterKey(secret, configuration::KdfMode::Test, scheme);
    if (master_result.IsErr()) {
        std::cerr << "Failed to derive master key: " << master_result.UnwrapErr().message << std::endl;
        return 1;
    }
    const auto master = std::move(master_result).Unwrap();
    std::cout << "   Master key: [SECURE - stored in protected memory]" << std::endl;
    std::cout << std::endl;

    std::cout << "5. Deriving HOT and COLD passphrases..." << std::endl;
    for (const auto& label : {models::Label::Hot(), models::Label::Cold()}) {
        auto child_result = ChildKeyDerivation::DeriveChildKey(master, label, scheme);
        if (child_result.IsErr()) {
            std::cerr << "Failed to derive child key: " << child_result.UnwrapErr().message << std::endl;
            return 1;
        }
        auto phrase_result = PhraseEncoder::Encode(child_result.Unwrap(), wordlist, 6, "-");
        if (phrase_result.IsErr()) {
            std::cerr << "Failed to encode: " << phrase_result.UnwrapErr().message << std::endl;
            return 1;
        }
        std::cout << "   " << label.DisplayName() << ": " << phrase_result.Unwrap().Joined() << std::endl;
    }
    std::cout << std::endl;

    std::cout << "6. Same derivation through VaultPhraseSystem..." << std::endl;
    auto system_result = derivation::VaultPhraseSystem::Create(wordlist, scheme);
    if (system_result.IsErr()) {
        std::cerr << "Failed to create system: " << system_result.UnwrapErr().message << std::endl;
        return 1;
    }
    std::string root_phrase = "correct horse battery staple extra words here";
    auto outcome_result = system_result.Unwrap().Derive(
        root_phrase,
        derivation::DerivationRequest::ReservedPair(configuration::KdfMode::Test));
    if (outcome_result.IsErr()) {
        std::cerr << "Failed to derive: " << outcome_result.UnwrapErr().message << std::endl;
        return 1;
    }
    for (const auto& derived : outcome_result.Unwrap().phrases) {
        std::cout << "   " << derived.label_name << " (" << derived.scheme_version << "): "
                  << derived.passphrase.Joined() << std::endl;
    }
    std::cout << "   Root phrase buffer after derivation: "
              << (root_phrase.find_first_not_of('\0') == std::string::npos ? "zeroed" : "NOT zeroed")
              << std::endl;

    std::cout << std::endl;
    std::cout << "=== Example completed successfully ===" << std::endl;
    return 0;
}
