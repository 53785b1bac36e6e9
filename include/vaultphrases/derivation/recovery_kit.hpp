#pragma once

#include "vaultphrases/configuration/scheme_config.hpp"
#include "vaultphrases/phrase/wordlist.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace vaultphrases::derivation {

using configuration::SchemeConfig;

/**
 * @brief Printable record of everything needed to reproduce passphrases
 *        later, except the root phrase itself
 *
 * Contains no secret material: scheme version, production Argon2id
 * parameters and salt, label tags, encoding settings and the wordlist
 * identity.
 */
class RecoveryKit {
public:
    struct WordlistSummary {
        std::string file_name;
        size_t word_count;
        std::string fingerprint_hex;
    };

    RecoveryKit(const SchemeConfig& scheme, int word_count, std::string_view delimiter);

    RecoveryKit& WithWordlist(const phrase::Wordlist& wordlist);

    [[nodiscard]] std::string Render() const;

private:
    SchemeConfig scheme_;
    int word_count_;
    std::string delimiter_;
    std::optional<WordlistSummary> wordlist_;
};

}
