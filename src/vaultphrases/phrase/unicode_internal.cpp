#include "unicode_internal.hpp"
#include "vaultphrases/core/format.hpp"

#include <unicode/uchar.h>
#include <unicode/utf8.h>

namespace vaultphrases::phrase::detail {

bool IsSeparatorSpace(const UChar32 c) noexcept {
    return u_isUWhiteSpace(c) || (c >= 0x1C && c <= 0x1F);
}

Result<Unit, VaultFailure> ValidateUtf8(std::string_view text, std::string_view subject) {
    if (text.size() > MAX_UNICODE_INPUT_BYTES) {
        return Result<Unit, VaultFailure>::Err(VaultFailure::InvalidEncoding(
            compat::format("{} exceeds {} bytes", subject, MAX_UNICODE_INPUT_BYTES)));
    }

    const auto* bytes = reinterpret_cast<const uint8_t*>(text.data());
    const auto length = static_cast<int32_t>(text.size());
    int32_t offset = 0;
    while (offset < length) {
        const int32_t start = offset;
        UChar32 c;
        U8_NEXT(bytes, offset, length, c);
        if (c < 0) {
            return Result<Unit, VaultFailure>::Err(VaultFailure::InvalidEncoding(
                compat::format("{} is not valid UTF-8 (byte offset {})", subject, start)));
        }
    }
    return Result<Unit, VaultFailure>::Ok(unit);
}

} // namespace vaultphrases::phrase::detail
