/**
 * @file unicode_internal.hpp
 * @brief Unicode helpers shared by the normalizer and the wordlist parser
 *
 * This header is NOT part of the public API. It keeps ICU types out of the
 * installed headers.
 */

#pragma once

#include "vaultphrases/core/result.hpp"
#include "vaultphrases/core/failures.hpp"

#include <unicode/umachine.h>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string_view>

namespace vaultphrases::phrase::detail {

inline constexpr size_t MAX_UNICODE_INPUT_BYTES =
    static_cast<size_t>(std::numeric_limits<int32_t>::max());

/**
 * @brief Whitespace that trims and splits phrases and wordlist lines
 *
 * The Unicode White_Space property (ASCII blanks, NBSP, U+2000..U+200A,
 * U+3000, ...) plus the information separators U+001C..U+001F.
 */
[[nodiscard]] bool IsSeparatorSpace(UChar32 c) noexcept;

/**
 * @brief Reject anything that is not well-formed UTF-8
 *
 * Overlong forms, encoded surrogates, values above U+10FFFF and truncated
 * sequences all fail with InvalidEncoding. The message names the subject
 * and the byte offset only.
 */
Result<Unit, VaultFailure> ValidateUtf8(std::string_view text, std::string_view subject);

} // namespace vaultphrases::phrase::detail
