#include <combopanel/content/DisplayConfigs.hpp>

#include <array>
#include <utility>

namespace CP::Content {

namespace {

constexpr std::array<std::pair<ContentDisplayType, std::string_view>, 8> kDisplayTypeIds{{
    {ContentDisplayType::Bar, "bar"},
    {ContentDisplayType::Text, "text"},
    {ContentDisplayType::Graph, "graph"},
    {ContentDisplayType::LevelBar, "level_bar"},
    {ContentDisplayType::CoreBars, "core_bars"},
    {ContentDisplayType::Static, "static"},
    {ContentDisplayType::Arc, "arc"},
    {ContentDisplayType::Speedometer, "speedometer"},
}};

} // namespace

auto DisplayTypeId(ContentDisplayType type) -> std::string_view {
    for (auto const& [value, id] : kDisplayTypeIds) {
        if (value == type) {
            return id;
        }
    }
    return "bar";
}

auto ParseDisplayType(std::string_view id) -> Expected<ContentDisplayType> {
    for (auto const& [value, name] : kDisplayTypeIds) {
        if (name == id) {
            return value;
        }
    }
    return std::unexpected(Error{Error::Code::InvalidType, "unknown display type '" + std::string(id) + "'"});
}

} // namespace CP::Content
