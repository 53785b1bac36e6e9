#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
namespace vaultphrases {
struct ToolInfo {
    static constexpr std::string_view NAME = "vaultphrases";
    static constexpr std::string_view VERSION = "0.1.0";
};
struct Constants {
    static constexpr size_t MASTER_KEY_SIZE = 32;
    static constexpr size_t CHILD_KEY_SIZE = 32;
    static constexpr size_t SHA_256_DIGEST_SIZE = 32;
    static constexpr size_t HMAC_SHA_256_SIZE = 32;
    static constexpr size_t SMALL_BUFFER_THRESHOLD = 1024;
    static constexpr size_t STREAM_LANE_SIZE = 8;
    static constexpr size_t STREAM_LANES_PER_BLOCK = SHA_256_DIGEST_SIZE / STREAM_LANE_SIZE;
    static constexpr uint32_t MAX_STREAM_ROUNDS = 1u << 16;
};
struct PhraseConstants {
    static constexpr int DEFAULT_WORD_COUNT = 6;
    static constexpr int MIN_WORD_COUNT = 1;
    static constexpr int MAX_WORD_COUNT = 128;
    static constexpr std::string_view DEFAULT_DELIMITER = "-";
    static constexpr size_t MIN_WORDLIST_SIZE = 2;
    static constexpr size_t MAX_WORDLIST_SIZE = 0xFFFFFFFFu;
    static constexpr char COMMENT_MARKER = '#';
    static constexpr size_t FINGERPRINT_SHORT_CHARS = 6;
};
struct StrengthConstants {
    static constexpr size_t WEAK_WORD_THRESHOLD = 6;
    static constexpr size_t WEAK_CHAR_THRESHOLD = 40;
    static constexpr size_t STRONG_WORD_THRESHOLD = 12;
    static constexpr size_t STRONG_CHAR_THRESHOLD = 60;
    static constexpr std::string_view WORD_SEPARATORS = " -_,";
};
struct LabelConstants {
    static constexpr std::string_view CUSTOM_PREFIX = "CUSTOM:";
    static constexpr std::string_view HOT_DISPLAY_NAME = "HOT";
    static constexpr std::string_view COLD_DISPLAY_NAME = "COLD";
};
struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view HANDLE_DISPOSED = "Handle disposed";
    static constexpr std::string_view CONSTANT_TIME_COMPARISON_FAILED = "Constant-time comparison failed";
    static constexpr std::string_view FAILED_TO_ALLOCATE_SECURE_MEMORY = "Failed to allocate secure memory: ";
    static constexpr std::string_view DATA_EXCEEDS_BUFFER = "Data size exceeds buffer size";
    static constexpr std::string_view EMPTY_ROOT_PHRASE = "Root phrase is empty after normalization";
    static constexpr std::string_view EMPTY_SECRET = "Secret for master key derivation is empty";
    static constexpr std::string_view EMPTY_CUSTOM_LABEL = "Custom label is empty";
    static constexpr std::string_view EMPTY_WORDLIST = "Wordlist contains no words";
};
}
