#pragma once
#include <string>
#include <string_view>
namespace vaultphrases {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    BufferTooLarge,
    AllocationFailed,
    ComparisonFailed,
    HashFailed,
    InvalidOperation
};
enum class VaultFailureType {
    EmptyInput,
    EmptyLabel,
    ReservedLabel,
    InvalidWordCount,
    EmptyWordlist,
    DuplicateWord,
    WordlistSize,
    FileAccess,
    InvalidEncoding,
    KeyDerivation,
    SecureMemory,
    UnsupportedScheme
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure ComparisonFailed(std::string msg) {
        return {SodiumFailureType::ComparisonFailed, std::move(msg)};
    }
    static SodiumFailure HashFailed(std::string msg) {
        return {SodiumFailureType::HashFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};

/**
 * @brief Failure reported by every derivation-facing operation
 *
 * Messages describe structure only (sizes, counts, file paths). They never
 * carry the root phrase, key bytes or words of a derived passphrase.
 */
class VaultFailure {
public:
    VaultFailureType type;
    std::string message;
    VaultFailure(const VaultFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static VaultFailure EmptyInput(std::string msg) {
        return {VaultFailureType::EmptyInput, std::move(msg)};
    }
    static VaultFailure EmptyLabel(std::string msg) {
        return {VaultFailureType::EmptyLabel, std::move(msg)};
    }
    static VaultFailure ReservedLabel(std::string msg) {
        return {VaultFailureType::ReservedLabel, std::move(msg)};
    }
    static VaultFailure InvalidWordCount(std::string msg) {
        return {VaultFailureType::InvalidWordCount, std::move(msg)};
    }
    static VaultFailure EmptyWordlist(std::string msg) {
        return {VaultFailureType::EmptyWordlist, std::move(msg)};
    }
    static VaultFailure DuplicateWord(std::string msg) {
        return {VaultFailureType::DuplicateWord, std::move(msg)};
    }
    static VaultFailure WordlistSize(std::string msg) {
        return {VaultFailureType::WordlistSize, std::move(msg)};
    }
    static VaultFailure FileAccess(std::string msg) {
        return {VaultFailureType::FileAccess, std::move(msg)};
    }
    static VaultFailure InvalidEncoding(std::string msg) {
        return {VaultFailureType::InvalidEncoding, std::move(msg)};
    }
    static VaultFailure KeyDerivation(std::string msg) {
        return {VaultFailureType::KeyDerivation, std::move(msg)};
    }
    static VaultFailure SecureMemory(std::string msg) {
        return {VaultFailureType::SecureMemory, std::move(msg)};
    }
    static VaultFailure UnsupportedScheme(std::string msg) {
        return {VaultFailureType::UnsupportedScheme, std::move(msg)};
    }
    static VaultFailure FromSodiumFailure(const SodiumFailure& sf) {
        if (sf.type == SodiumFailureType::HashFailed) {
            return KeyDerivation(sf.message);
        }
        return SecureMemory(sf.message);
    }
};
[[nodiscard]] constexpr std::string_view ToString(const VaultFailureType type) noexcept {
    switch (type) {
        case VaultFailureType::EmptyInput: return "EmptyInput";
        case VaultFailureType::EmptyLabel: return "EmptyLabel";
        case VaultFailureType::ReservedLabel: return "ReservedLabel";
        case VaultFailureType::InvalidWordCount: return "InvalidWordCount";
        case VaultFailureType::EmptyWordlist: return "EmptyWordlist";
        case VaultFailureType::DuplicateWord: return "DuplicateWord";
        case VaultFailureType::WordlistSize: return "WordlistSize";
        case VaultFailureType::FileAccess: return "FileAccess";
        case VaultFailureType::InvalidEncoding: return "InvalidEncoding";
        case VaultFailureType::KeyDerivation: return "KeyDerivation";
        case VaultFailureType::SecureMemory: return "SecureMemory";
        case VaultFailureType::UnsupportedScheme: return "UnsupportedScheme";
    }
    return "Unknown";
}
}
