#pragma once
#include "vaultphrases/phrase/wordlist.hpp"
#include "vaultphrases/core/result.hpp"
#include "vaultphrases/core/failures.hpp"
#include <sodium.h>
#include <array>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace vaultphrases::test_helpers {

using phrase::Wordlist;

inline const std::vector<std::string>& NatoWords() {
    static const std::vector<std::string> words = {
        "alpha", "bravo", "charlie", "delta", "echo", "foxtrot", "golf",
        "hotel", "india", "juliett", "kilo", "lima", "mike", "november",
        "oscar", "papa", "quebec", "romeo", "sierra", "tango", "uniform",
        "victor", "whiskey", "xray", "yankee", "zulu"};
    return words;
}

/// "1\talpha\n2\tbravo\n...26\tzulu\n"
inline std::string NatoWordlistText() {
    std::string text;
    const auto& words = NatoWords();
    for (size_t i = 0; i < words.size(); ++i) {
        text += std::to_string(i + 1) + "\t" + words[i] + "\n";
    }
    return text;
}

inline constexpr std::string_view NATO_FINGERPRINT_HEX =
    "70499c2fe1ff3ad9661f64513835ff269d0f732b9c2e4fd556a8b9bd1b67f4eb";

inline std::vector<uint8_t> ToBytes(std::string_view text) {
    return {text.begin(), text.end()};
}

inline std::vector<uint8_t> FromHex(std::string_view hex) {
    std::vector<uint8_t> bytes(hex.size() / 2);
    size_t written = 0;
    if (sodium_hex2bin(bytes.data(), bytes.size(), hex.data(), hex.size(),
                       nullptr, &written, nullptr) != 0) {
        return {};
    }
    bytes.resize(written);
    return bytes;
}

inline std::string ToHex(std::span<const uint8_t> bytes) {
    std::string hex(bytes.size() * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), bytes.data(), bytes.size());
    hex.pop_back();
    return hex;
}

/// 0x00, 0x01, ..., 0x1f
inline std::vector<uint8_t> SequentialKey() {
    std::vector<uint8_t> key(32);
    for (size_t i = 0; i < key.size(); ++i) {
        key[i] = static_cast<uint8_t>(i);
    }
    return key;
}

inline Result<Wordlist, VaultFailure> ParseText(std::string_view text, std::string name = {}) {
    const auto raw = ToBytes(text);
    return Wordlist::Parse(raw, std::move(name));
}

inline Wordlist NatoWordlist() {
    return ParseText(NatoWordlistText(), "nato.txt").Unwrap();
}

/// File in the temp directory, removed when the object goes out of scope.
class TempFile {
public:
    explicit TempFile(std::string_view contents, std::string_view suffix = ".txt") {
        std::array<uint8_t, 8> nonce{};
        randombytes_buf(nonce.data(), nonce.size());
        std::string name = "vaultphrases-test-";
        for (const auto byte : nonce) {
            static constexpr char hex_chars[] = "0123456789abcdef";
            name.push_back(hex_chars[byte >> 4]);
            name.push_back(hex_chars[byte & 0x0F]);
        }
        name += suffix;
        path_ = std::filesystem::temp_directory_path() / name;
        std::ofstream out(path_, std::ios::binary);
        out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    }

    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    [[nodiscard]] const std::filesystem::path& Path() const noexcept {
        return path_;
    }

private:
    std::filesystem::path path_;
};

}
