#include "vaultphrases/crypto/sodium_secure_memory_handle.hpp"
#include "vaultphrases/crypto/sodium_interop.hpp"
#include "vaultphrases/core/constants.hpp"

#include <algorithm>
#include <utility>

namespace vaultphrases::crypto {

using HandleResult = Result<SecureMemoryHandle, SodiumFailure>;
using UnitResult = Result<Unit, SodiumFailure>;

SodiumFailure SecureMemoryHandle::DisposedFailure() {
    return SodiumFailure::InvalidOperation(std::string(ErrorMessages::HANDLE_DISPOSED));
}

// ============================================================================
// Lifetime
// ============================================================================

HandleResult SecureMemoryHandle::Allocate(const size_t size) {
    if (!SodiumInterop::IsInitialized()) {
        return HandleResult::Err(SodiumFailure::InitializationFailed(
            std::string(ErrorMessages::NOT_INITIALIZED)));
    }
    if (size == 0) {
        return HandleResult::Err(SodiumFailure::AllocationFailed(
            "Secure region size must be non-zero"));
    }

    auto* region = static_cast<uint8_t*>(SodiumInterop::AllocateSecure(size));
    if (region == nullptr) {
        return HandleResult::Err(SodiumFailure::AllocationFailed(
            std::string(ErrorMessages::FAILED_TO_ALLOCATE_SECURE_MEMORY) +
            std::to_string(size) + " bytes"));
    }

    SecureMemoryHandle handle(region, size);
    // sodium_malloc fills new regions with 0xdb
    sodium_memzero(region, size);
    return HandleResult::Ok(std::move(handle));
}

SecureMemoryHandle::~SecureMemoryHandle() {
    Release();
}

SecureMemoryHandle::SecureMemoryHandle(SecureMemoryHandle&& other) noexcept
    : data_(std::exchange(other.data_, nullptr))
    , size_(std::exchange(other.size_, 0)) {}

SecureMemoryHandle& SecureMemoryHandle::operator=(SecureMemoryHandle&& other) noexcept {
    if (this == &other) {
        return *this;
    }
    Release();
    data_ = std::exchange(other.data_, nullptr);
    size_ = std::exchange(other.size_, 0);
    return *this;
}

void SecureMemoryHandle::Release() noexcept {
    if (data_ == nullptr) {
        return;
    }
    sodium_memzero(data_, size_);
    SodiumInterop::FreeSecure(data_);
    data_ = nullptr;
    size_ = 0;
}

// ============================================================================
// Contents
// ============================================================================

UnitResult SecureMemoryHandle::Write(std::span<const uint8_t> data) {
    if (IsInvalid()) {
        return UnitResult::Err(DisposedFailure());
    }
    if (data.size() > size_) {
        return UnitResult::Err(SodiumFailure::BufferTooSmall(
            std::string(ErrorMessages::DATA_EXCEEDS_BUFFER) + " (" +
            std::to_string(data.size()) + " > " + std::to_string(size_) + ")"));
    }

    const auto region = Bytes();
    const auto tail = std::copy(data.begin(), data.end(), region.begin());
    const auto filled = static_cast<size_t>(tail - region.begin());
    if (filled < size_) {
        sodium_memzero(region.data() + filled, size_ - filled);
    }
    return UnitResult::Ok(unit);
}

UnitResult SecureMemoryHandle::Read(std::span<uint8_t> output) const {
    if (IsInvalid()) {
        return UnitResult::Err(DisposedFailure());
    }
    if (output.size() < size_) {
        return UnitResult::Err(SodiumFailure::BufferTooSmall(
            "Read needs " + std::to_string(size_) + " bytes, got " +
            std::to_string(output.size())));
    }
    std::ranges::copy(ConstBytes(), output.begin());
    return UnitResult::Ok(unit);
}

UnitResult SecureMemoryHandle::Wipe() {
    if (IsInvalid()) {
        return UnitResult::Err(DisposedFailure());
    }
    return SodiumInterop::SecureWipe(Bytes());
}

Result<bool, SodiumFailure> SecureMemoryHandle::ContentEquals(const SecureMemoryHandle& other) const {
    if (IsInvalid() || other.IsInvalid()) {
        return Result<bool, SodiumFailure>::Err(DisposedFailure());
    }
    return SodiumInterop::ConstantTimeEquals(ConstBytes(), other.ConstBytes());
}

} // namespace vaultphrases::crypto
