#pragma once

#include <combopanel/content/DisplayConfigs.hpp>

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace CP::Content {

enum class FieldType {
    Text,
    Numerical,
    Percentage,
    Boolean,
};

enum class FieldPurpose {
    Caption,
    Value,
    Unit,
    SecondaryValue,
    Status,
    Other,
};

// Describes one value a data source publishes, e.g. "group1_1_usage".
struct FieldMetadata {
    std::string  id;
    std::string  name;
    std::string  description;
    FieldType    type    = FieldType::Numerical;
    FieldPurpose purpose = FieldPurpose::Value;

    auto operator==(FieldMetadata const&) const -> bool = default;
};

/**
 * Picks a display type for a slot from the fields its source publishes:
 *   no fields                                -> Text
 *   only text fields                         -> Text
 *   a percentage field and a Value purpose   -> Bar
 *   numbers, no percentage, some text        -> Text
 *   anything else                            -> Bar
 */
[[nodiscard]] auto SuggestDisplayType(std::span<FieldMetadata const> fields) -> ContentDisplayType;

// Fields whose id starts with "{slot_name}_".
[[nodiscard]] auto FieldsForSlot(std::span<FieldMetadata const> fields, std::string_view slot_name) -> std::vector<FieldMetadata>;

} // namespace CP::Content
