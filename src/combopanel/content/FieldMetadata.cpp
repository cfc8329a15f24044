#include <combopanel/content/FieldMetadata.hpp>

#include <algorithm>

namespace CP::Content {

auto SuggestDisplayType(std::span<FieldMetadata const> fields) -> ContentDisplayType {
    if (fields.empty()) {
        return ContentDisplayType::Text;
    }

    auto has_type = [&](FieldType type) {
        return std::ranges::any_of(fields, [type](FieldMetadata const& f) { return f.type == type; });
    };
    auto const all_text          = std::ranges::all_of(fields, [](FieldMetadata const& f) { return f.type == FieldType::Text; });
    auto const has_percentage    = has_type(FieldType::Percentage);
    auto const has_numerical     = has_type(FieldType::Numerical);
    auto const has_value_purpose = std::ranges::any_of(fields, [](FieldMetadata const& f) { return f.purpose == FieldPurpose::Value; });

    if (all_text) {
        return ContentDisplayType::Text;
    }
    if (has_percentage && has_value_purpose) {
        return ContentDisplayType::Bar;
    }
    if (has_numerical && !has_percentage && has_type(FieldType::Text)) {
        return ContentDisplayType::Text;
    }
    return ContentDisplayType::Bar;
}

auto FieldsForSlot(std::span<FieldMetadata const> fields, std::string_view slot_name) -> std::vector<FieldMetadata> {
    std::string prefix{slot_name};
    prefix.push_back('_');

    std::vector<FieldMetadata> out;
    for (auto const& field : fields) {
        if (field.id.starts_with(prefix)) {
            out.push_back(field);
        }
    }
    return out;
}

} // namespace CP::Content
