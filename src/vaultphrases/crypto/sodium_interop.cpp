#include "vaultphrases/crypto/sodium_interop.hpp"

namespace vaultphrases::crypto {

namespace {

using UnitResult = Result<Unit, SodiumFailure>;

SodiumFailure NotInitialized(const std::string_view operation) {
    return SodiumFailure::InitializationFailed(
        std::string(operation) + ": " + std::string(ErrorMessages::NOT_INITIALIZED));
}

} // namespace

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, [] {
        const bool ready = sodium_init() >= 0;
        initialized_.store(ready, std::memory_order_release);
    });
    if (IsInitialized()) {
        return UnitResult::Ok(unit);
    }
    return UnitResult::Err(SodiumFailure::InitializationFailed(
        std::string(ErrorMessages::SODIUM_INIT_FAILED)));
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

// ============================================================================
// Wiping
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<uint8_t> buffer) {
    if (buffer.size() > MAX_BUFFER_SIZE) {
        return UnitResult::Err(SodiumFailure::BufferTooLarge(
            "Refusing to wipe " + std::to_string(buffer.size()) +
            " bytes (limit " + std::to_string(MAX_BUFFER_SIZE) + ")"));
    }
    if (buffer.empty()) {
        return UnitResult::Ok(unit);
    }

    if (buffer.size() > Constants::SMALL_BUFFER_THRESHOLD) {
        sodium_memzero(buffer.data(), buffer.size());
    } else {
        WipeSmallBuffer(buffer);
    }
    return UnitResult::Ok(unit);
}

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::string& text) {
    auto* first = reinterpret_cast<uint8_t*>(text.data());
    return SecureWipe(std::span<uint8_t>(first, text.size()));
}

void SodiumInterop::WipeSmallBuffer(std::span<uint8_t> buffer) noexcept {
    volatile uint8_t* cursor = buffer.data();
    for (size_t remaining = buffer.size(); remaining > 0; --remaining) {
        *cursor++ = 0;
    }
}

Result<bool, SodiumFailure> SodiumInterop::ConstantTimeEquals(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) {
    if (!IsInitialized()) {
        return Result<bool, SodiumFailure>::Err(SodiumFailure::ComparisonFailed(
            std::string(ErrorMessages::CONSTANT_TIME_COMPARISON_FAILED) + ": " +
            std::string(ErrorMessages::NOT_INITIALIZED)));
    }
    // Lengths are public (key and digest sizes), only contents need constant time
    if (a.size() != b.size()) {
        return Result<bool, SodiumFailure>::Ok(false);
    }
    const bool equal = a.empty() || sodium_memcmp(a.data(), b.data(), a.size()) == 0;
    return Result<bool, SodiumFailure>::Ok(equal);
}

// ============================================================================
// Hashing
// ============================================================================

Result<Sha256Digest, SodiumFailure> SodiumInterop::Sha256(std::span<const uint8_t> data) {
    if (!IsInitialized()) {
        return Result<Sha256Digest, SodiumFailure>::Err(NotInitialized("SHA-256"));
    }
    Sha256Digest digest{};
    if (crypto_hash_sha256(digest.data(), data.data(), data.size()) != 0) {
        return Result<Sha256Digest, SodiumFailure>::Err(
            SodiumFailure::HashFailed("crypto_hash_sha256 failed"));
    }
    return Result<Sha256Digest, SodiumFailure>::Ok(digest);
}

// ============================================================================
// Guarded allocation
// ============================================================================

void* SodiumInterop::AllocateSecure(const size_t size) noexcept {
    return IsInitialized() ? sodium_malloc(size) : nullptr;
}

void SodiumInterop::FreeSecure(void* ptr) noexcept {
    // sodium_free accepts nullptr
    sodium_free(ptr);
}

} // namespace vaultphrases::crypto
