#pragma once

/**
 * @file key_logger.hpp
 * @brief Debug tracing of derived key material.
 *
 * SECURITY WARNING: This module prints master keys and child keys to stdout.
 * Only enable VAULTPHRASES_DEBUG_KEYS to compare intermediate values against
 * recorded test vectors or another implementation of the scheme.
 * NEVER enable in release builds.
 *
 * Enable via CMake: -DVAULTPHRASES_DEBUG_KEYS=ON
 */

#include <cstdint>
#include <cstdio>
#include <span>
#include <string>
#include <string_view>

namespace vaultphrases::debug {

#ifdef VAULTPHRASES_DEBUG_KEYS

inline std::string ToHex(std::span<const uint8_t> data) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(data.size() * 2);
    for (const auto byte : data) {
        result.push_back(hex_chars[(byte >> 4) & 0x0F]);
        result.push_back(hex_chars[byte & 0x0F]);
    }
    return result;
}

// ============================================================================
// Core logging macros
// ============================================================================

#define VP_LOG_KEY(operation, key_name, data) \
    do { \
        fprintf(stdout, "[VP-DEBUG] %s %s: %s\n", \
            operation, \
            key_name, \
            ::vaultphrases::debug::ToHex(data).c_str()); \
        fflush(stdout); \
    } while(0)

#define VP_LOG_VALUE(operation, name, value) \
    do { \
        fprintf(stdout, "[VP-DEBUG] %s %s: %s\n", \
            operation, \
            name, \
            std::to_string(value).c_str()); \
        fflush(stdout); \
    } while(0)

#define VP_LOG_SECTION(section_name) \
    do { \
        fprintf(stdout, "[VP-DEBUG] ========== %s ==========\n", section_name); \
        fflush(stdout); \
    } while(0)

// ============================================================================
// Derivation steps
// ============================================================================

inline void LogMasterKeyDerived(std::string_view mode, std::span<const uint8_t> master_key) {
    VP_LOG_SECTION("MASTER KEY");
    VP_LOG_KEY(std::string(mode).c_str(), "master_key", master_key);
}

inline void LogChildKeyDerived(const std::string& label, std::span<const uint8_t> child_key) {
    VP_LOG_SECTION("CHILD KEY");
    VP_LOG_KEY(label.c_str(), "child_key", child_key);
}

inline void LogWordIndex(uint32_t position, uint32_t rounds, uint64_t index) {
    char name[48];
    snprintf(name, sizeof(name), "word_index[%u] (rounds %u)", position, rounds);
    VP_LOG_VALUE("ENCODE", name, index);
}

#else // !VAULTPHRASES_DEBUG_KEYS

#define VP_LOG_KEY(operation, key_name, data) ((void)0)
#define VP_LOG_VALUE(operation, name, value) ((void)0)
#define VP_LOG_SECTION(section_name) ((void)0)

inline void LogMasterKeyDerived(std::string_view, std::span<const uint8_t>) {}
inline void LogChildKeyDerived(const std::string&, std::span<const uint8_t>) {}
inline void LogWordIndex(uint32_t, uint32_t, uint64_t) {}

#endif // VAULTPHRASES_DEBUG_KEYS

} // namespace vaultphrases::debug
