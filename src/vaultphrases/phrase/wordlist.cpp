#include "vaultphrases/phrase/wordlist.hpp"
#include "vaultphrases/core/constants.hpp"
#include "vaultphrases/core/format.hpp"
#include "unicode_internal.hpp"

#include <sodium.h>
#include <unicode/utf8.h>

#include <fstream>
#include <iterator>
#include <optional>
#include <string_view>
#include <system_error>
#include <unordered_set>

namespace vaultphrases::phrase {

namespace {

/**
 * Word contributed by one line: the last whitespace-separated token, or
 * nothing for a blank line or one whose first non-space character is '#'.
 * The line must already be valid UTF-8.
 */
std::optional<std::string_view> WordOfLine(std::string_view line) {
    const auto* bytes = reinterpret_cast<const uint8_t*>(line.data());
    const auto length = static_cast<int32_t>(line.size());
    int32_t token_start = -1;
    int32_t last_start = -1;
    int32_t last_end = -1;
    int32_t at = 0;
    while (at < length) {
        const int32_t offset = at;
        UChar32 c;
        U8_NEXT_UNSAFE(bytes, at, c);
        if (detail::IsSeparatorSpace(c)) {
            if (token_start >= 0) {
                last_start = token_start;
                last_end = offset;
                token_start = -1;
            }
            continue;
        }
        if (token_start < 0) {
            if (last_start < 0 && c == PhraseConstants::COMMENT_MARKER) {
                return std::nullopt;
            }
            token_start = offset;
        }
    }
    if (token_start >= 0) {
        last_start = token_start;
        last_end = length;
    }
    if (last_start < 0) {
        return std::nullopt;
    }
    return line.substr(static_cast<size_t>(last_start), static_cast<size_t>(last_end - last_start));
}

/// Lines end at "\n", "\r" or "\r\n".
std::vector<std::string> ExtractWords(std::string_view text) {
    std::vector<std::string> words;
    size_t line_start = 0;
    while (line_start <= text.size()) {
        const size_t line_end = text.find_first_of("\r\n", line_start);
        const auto word = WordOfLine(text.substr(
            line_start,
            line_end == std::string_view::npos ? std::string_view::npos : line_end - line_start));
        if (word) {
            words.emplace_back(*word);
        }

        if (line_end == std::string_view::npos) {
            break;
        }
        line_start = line_end + 1;
        if (text[line_end] == '\r' && line_start < text.size() && text[line_start] == '\n') {
            ++line_start;
        }
    }
    return words;
}

} // namespace

std::string WordlistFingerprint::Hex() const {
    std::string hex(digest.size() * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), digest.data(), digest.size());
    hex.pop_back();
    return hex;
}

std::string WordlistFingerprint::ShortForm() const {
    const auto hex = Hex();
    constexpr size_t n = PhraseConstants::FINGERPRINT_SHORT_CHARS;
    return compat::format("{}...{}", hex.substr(0, n), hex.substr(hex.size() - n));
}

Result<Wordlist, VaultFailure> Wordlist::Load(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Result<Wordlist, VaultFailure>::Err(
            VaultFailure::FileAccess(compat::format("Wordlist file not found: {}", path.string())));
    }
    if (!std::filesystem::is_regular_file(path, ec)) {
        return Result<Wordlist, VaultFailure>::Err(
            VaultFailure::FileAccess(compat::format("Wordlist path is not a file: {}", path.string())));
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Result<Wordlist, VaultFailure>::Err(
            VaultFailure::FileAccess(compat::format("Failed to open wordlist file: {}", path.string())));
    }
    std::vector<uint8_t> raw(
        (std::istreambuf_iterator<char>(file)),
        std::istreambuf_iterator<char>());
    if (file.bad()) {
        return Result<Wordlist, VaultFailure>::Err(
            VaultFailure::FileAccess(compat::format("Failed to read wordlist file: {}", path.string())));
    }

    return Parse(raw, path.filename().string());
}

Result<Wordlist, VaultFailure> Wordlist::Parse(
    std::span<const uint8_t> raw,
    std::string source_name) {

    auto init_result = crypto::SodiumInterop::Initialize();
    if (init_result.IsErr()) {
        return Result<Wordlist, VaultFailure>::Err(
            VaultFailure::FromSodiumFailure(init_result.UnwrapErr()));
    }

    auto digest_result = crypto::SodiumInterop::Sha256(raw);
    if (digest_result.IsErr()) {
        return Result<Wordlist, VaultFailure>::Err(
            VaultFailure::FromSodiumFailure(digest_result.UnwrapErr()));
    }

    const std::string_view text(reinterpret_cast<const char*>(raw.data()), raw.size());
    auto valid = detail::ValidateUtf8(text, "Wordlist");
    if (valid.IsErr()) {
        return Result<Wordlist, VaultFailure>::Err(std::move(valid).UnwrapErr());
    }

    auto words = ExtractWords(text);

    if (words.empty()) {
        return Result<Wordlist, VaultFailure>::Err(
            VaultFailure::EmptyWordlist(std::string(ErrorMessages::EMPTY_WORDLIST)));
    }

    std::unordered_set<std::string_view> seen;
    seen.reserve(words.size());
    size_t duplicates = 0;
    for (const auto& word : words) {
        if (!seen.insert(word).second) {
            ++duplicates;
        }
    }
    if (duplicates > 0) {
        return Result<Wordlist, VaultFailure>::Err(
            VaultFailure::DuplicateWord(compat::format(
                "Wordlist has {} duplicate {}", duplicates, duplicates == 1 ? "word" : "words")));
    }

    if (words.size() < PhraseConstants::MIN_WORDLIST_SIZE ||
        words.size() > PhraseConstants::MAX_WORDLIST_SIZE) {
        return Result<Wordlist, VaultFailure>::Err(
            VaultFailure::WordlistSize(compat::format(
                "Wordlist must contain between {} and {} words, got {}",
                PhraseConstants::MIN_WORDLIST_SIZE,
                PhraseConstants::MAX_WORDLIST_SIZE,
                words.size())));
    }

    return Result<Wordlist, VaultFailure>::Ok(Wordlist(
        std::move(words),
        WordlistFingerprint{std::move(digest_result).Unwrap()},
        std::move(source_name)));
}

} // namespace vaultphrases::phrase
