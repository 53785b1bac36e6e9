#include "vaultphrases/models/label.hpp"
#include "vaultphrases/core/constants.hpp"
#include "vaultphrases/core/format.hpp"

#include <algorithm>
#include <cctype>

namespace vaultphrases::models {

namespace {

bool IsBlank(std::string_view text) {
    return std::all_of(text.begin(), text.end(), [](char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    });
}

std::vector<uint8_t> ToBytes(std::string_view text) {
    return {text.begin(), text.end()};
}

} // namespace

Result<Label, VaultFailure> Label::Custom(std::string_view text) {
    if (text.empty() || IsBlank(text)) {
        return Result<Label, VaultFailure>::Err(
            VaultFailure::EmptyLabel(std::string(ErrorMessages::EMPTY_CUSTOM_LABEL)));
    }
    return Result<Label, VaultFailure>::Ok(Label(std::string(text)));
}

std::string Label::DisplayName() const {
    if (const auto* reserved = std::get_if<ReservedLabel>(&value_)) {
        return std::string(*reserved == ReservedLabel::Hot
            ? LabelConstants::HOT_DISPLAY_NAME
            : LabelConstants::COLD_DISPLAY_NAME);
    }
    return std::get<std::string>(value_);
}

Result<std::vector<uint8_t>, VaultFailure> Label::Encode(const SchemeConfig& scheme) const {
    if (const auto* reserved = std::get_if<ReservedLabel>(&value_)) {
        return Result<std::vector<uint8_t>, VaultFailure>::Ok(ToBytes(
            *reserved == ReservedLabel::Hot ? scheme.HotLabelTag() : scheme.ColdLabelTag()));
    }

    const auto& text = std::get<std::string>(value_);
    std::vector<uint8_t> encoded;
    encoded.reserve(LabelConstants::CUSTOM_PREFIX.size() + text.size());
    encoded.insert(encoded.end(), LabelConstants::CUSTOM_PREFIX.begin(), LabelConstants::CUSTOM_PREFIX.end());
    encoded.insert(encoded.end(), text.begin(), text.end());

    auto collision_check = CheckNoReservedCollision(encoded, scheme);
    if (collision_check.IsErr()) {
        return Result<std::vector<uint8_t>, VaultFailure>::Err(
            std::move(collision_check).UnwrapErr());
    }
    return Result<std::vector<uint8_t>, VaultFailure>::Ok(std::move(encoded));
}

Result<Unit, VaultFailure> Label::CheckNoReservedCollision(
    std::span<const uint8_t> encoded,
    const SchemeConfig& scheme) {
    for (const auto tag : {scheme.HotLabelTag(), scheme.ColdLabelTag()}) {
        if (std::equal(encoded.begin(), encoded.end(), tag.begin(), tag.end())) {
            return Result<Unit, VaultFailure>::Err(
                VaultFailure::ReservedLabel(
                    compat::format("Custom label collides with reserved label {}", tag)));
        }
    }
    return Result<Unit, VaultFailure>::Ok(unit);
}

} // namespace vaultphrases::models
