#pragma once
#include "vaultphrases/configuration/scheme_config.hpp"
#include "vaultphrases/core/result.hpp"
#include "vaultphrases/core/failures.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
namespace vaultphrases::models {
using configuration::SchemeConfig;

enum class ReservedLabel : uint8_t {
    Hot,
    Cold
};

/**
 * @brief Domain-separation label for child key derivation
 *
 * Either a reserved tag owned by the scheme (HOT, COLD) or a custom label
 * chosen by the user. The two encode into disjoint byte sets:
 * reserved labels encode as their literal tag ("HOT_PHRASE_V1"), custom
 * labels as "CUSTOM:" followed by the user text. No reserved tag starts with
 * the custom prefix, so no custom text can reproduce a reserved encoding.
 */
class Label {
public:
    [[nodiscard]] static Label Hot() noexcept {
        return Label(ReservedLabel::Hot);
    }

    [[nodiscard]] static Label Cold() noexcept {
        return Label(ReservedLabel::Cold);
    }

    /**
     * @brief Build a custom label
     *
     * The text is used verbatim. Fails with EmptyLabel when it is empty or
     * whitespace only.
     */
    [[nodiscard]] static Result<Label, VaultFailure> Custom(std::string_view text);

    [[nodiscard]] bool IsReserved() const noexcept {
        return std::holds_alternative<ReservedLabel>(value_);
    }

    /// "HOT", "COLD" or the custom text.
    [[nodiscard]] std::string DisplayName() const;

    /**
     * @brief Bytes fed to HMAC for this label under a scheme version
     *
     * Fails with ReservedLabel if a custom encoding would equal a reserved
     * tag of the scheme.
     */
    [[nodiscard]] Result<std::vector<uint8_t>, VaultFailure> Encode(const SchemeConfig& scheme) const;

    /// Reject an encoded custom label equal to any reserved tag of the scheme.
    [[nodiscard]] static Result<Unit, VaultFailure> CheckNoReservedCollision(
        std::span<const uint8_t> encoded,
        const SchemeConfig& scheme);

    [[nodiscard]] bool operator==(const Label& other) const = default;
private:
    explicit Label(ReservedLabel reserved) noexcept : value_(reserved) {}
    explicit Label(std::string custom) : value_(std::move(custom)) {}
    std::variant<ReservedLabel, std::string> value_;
};
}
