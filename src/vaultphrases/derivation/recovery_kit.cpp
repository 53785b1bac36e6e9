#include "vaultphrases/derivation/recovery_kit.hpp"
#include "vaultphrases/core/constants.hpp"
#include "vaultphrases/core/format.hpp"

namespace vaultphrases::derivation {

namespace {

constexpr std::string_view RULE =
    "===============================================================";

}

RecoveryKit::RecoveryKit(const SchemeConfig& scheme, const int word_count, std::string_view delimiter)
    : scheme_(scheme)
    , word_count_(word_count)
    , delimiter_(delimiter) {}

RecoveryKit& RecoveryKit::WithWordlist(const phrase::Wordlist& wordlist) {
    wordlist_ = WordlistSummary{
        wordlist.SourceName().empty() ? std::string("(in-memory)") : wordlist.SourceName(),
        wordlist.Size(),
        wordlist.Fingerprint().Hex()};
    return *this;
}

std::string RecoveryKit::Render() const {
    const auto params = scheme_.KdfParameters(configuration::KdfMode::Production);

    std::string out;
    out += compat::format("{}\n{:^63}\n{}\n\n", RULE, "RECOVERY KIT", RULE);
    out += "Put these details in your recovery kit:\n\n";
    out += compat::format("  VaultPhrases Version:    {}\n", ToolInfo::VERSION);
    out += compat::format("  Derivation Scheme:       {}\n\n", scheme_.VersionTag());

    out += "  Argon2id Parameters:\n";
    out += compat::format("    - Memory Cost:         {} MiB\n", params.memory_cost_kib / 1024);
    out += compat::format("    - Time Cost:           {} iterations\n", params.time_cost);
    out += compat::format("    - Parallelism:         {}\n", params.parallelism);
    out += compat::format("    - Hash Length:         {} bytes\n", params.output_length);
    out += compat::format("    - Root Salt:           {}\n\n", scheme_.RootSalt());

    out += "  Child Derivation Labels:\n";
    out += compat::format("    - HOT Label:           {}\n", scheme_.HotLabelTag());
    out += compat::format("    - COLD Label:          {}\n", scheme_.ColdLabelTag());
    out += compat::format("    - Custom Prefix:       {}\n\n", LabelConstants::CUSTOM_PREFIX);

    out += "  Passphrase Configuration:\n";
    out += compat::format("    - Words per Phrase:    {}\n", word_count_);
    out += compat::format("    - Delimiter:           '{}'\n\n", delimiter_);

    out += "  Wordlist Information:\n";
    if (wordlist_) {
        out += compat::format("    - Wordlist File:       {}\n", wordlist_->file_name);
        out += compat::format("    - Word Count:          {}\n", wordlist_->word_count);
        out += compat::format("    - SHA256 Hash:         {}\n\n", wordlist_->fingerprint_hex);
    } else {
        out += "    - No wordlist specified (use --wordlist to include)\n\n";
    }

    out += compat::format("{}\n\n", RULE);
    out += "Recovery Instructions:\n";
    out += "  - Store this information securely offline\n";
    out += "  - You need your root phrase + this info to recover passphrases\n";
    out += "  - Keep the wordlist file backed up, especially a custom one\n";
    out += "  - Verify the wordlist SHA256 hash before recovery\n";
    return out;
}

}
