#pragma once

#include "vaultphrases/configuration/scheme_config.hpp"
#include "vaultphrases/models/keys/derived_key.hpp"
#include "vaultphrases/models/label.hpp"
#include "vaultphrases/core/result.hpp"
#include "vaultphrases/core/failures.hpp"
#include "vaultphrases/core/constants.hpp"

#include <cstdint>
#include <span>

namespace vaultphrases::crypto {

using configuration::SchemeConfig;
using models::ChildKey;
using models::Label;
using models::MasterKey;

/**
 * @brief Domain-separated child keys: HMAC-SHA256(master key, label bytes)
 *
 * Reserved labels reproduce the outputs of earlier releases bit for bit
 * (the HMAC message is the bare tag). Custom labels are prefixed, see Label.
 * The full 32-byte HMAC output is the child key.
 */
class ChildKeyDerivation {
public:
    /**
     * @brief Derive the child key for one label
     *
     * @param master Master key from MasterKeyDerivation
     * @param label Reserved or custom label
     * @param scheme Scheme version whose label tags apply
     * @return Ok(child_key), or the label's encoding failure
     */
    static Result<ChildKey, VaultFailure> DeriveChildKey(
        const MasterKey& master,
        const Label& label,
        const SchemeConfig& scheme);

    /**
     * @brief HMAC-SHA256 into a caller buffer of exactly 32 bytes
     */
    static Result<Unit, VaultFailure> HmacSha256(
        std::span<const uint8_t> key,
        std::span<const uint8_t> message,
        std::span<uint8_t> output);

    static constexpr size_t MAC_LEN = Constants::HMAC_SHA_256_SIZE;

private:
    ChildKeyDerivation() = delete;
};

} // namespace vaultphrases::crypto
