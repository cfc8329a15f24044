#include <combopanel/serialization/ComboJson.hpp>

#include "serialization/JsonDetail.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>

namespace CP::Serialization {
namespace {

using Detail::find_key;
using Detail::orientation_id;
using Detail::read_array;
using Detail::read_boolean;
using Detail::read_number;
using Detail::read_object;
using Detail::read_orientation;
using Detail::read_string;
using Detail::read_uint32;
using Detail::read_uint64;

[[nodiscard]] auto make_error(Error::Code code, std::string_view field, std::string_view detail) -> Error {
    std::string message;
    message.reserve(field.size() + detail.size() + 2);
    message.append(field);
    if (!detail.empty()) {
        message.append(": ");
        message.append(detail);
    }
    return Error{code, std::move(message)};
}

[[nodiscard]] auto parse_document(std::string_view text, std::string_view what) -> Expected<Json> {
    auto json = Json::parse(text, nullptr, false);
    if (json.is_discarded()) {
        cp_log("Rejected " + std::string(what) + ": invalid JSON", "Config");
        return std::unexpected(make_error(Error::Code::MalformedInput, what, "invalid JSON"));
    }
    if (!json.is_object()) {
        cp_log("Rejected " + std::string(what) + ": top level is not an object", "Config");
        return std::unexpected(make_error(Error::Code::MalformedInput, what, "must be a JSON object"));
    }
    return json;
}

[[nodiscard]] auto dump(Json const& json, bool pretty) -> std::string {
    return pretty ? json.dump(2) : json.dump();
}

[[nodiscard]] auto read_counts(Json const& array) -> std::vector<std::uint32_t> {
    std::vector<std::uint32_t> counts;
    for (auto const& entry : array) {
        if (entry.is_number_unsigned() || (entry.is_number_integer() && entry.get<std::int64_t>() >= 0)) {
            counts.push_back(std::clamp<std::uint32_t>(static_cast<std::uint32_t>(std::min<std::uint64_t>(entry.get<std::uint64_t>(), Source::kMaxGroupItems)),
                                                       Source::kMinGroupItems, Source::kMaxGroupItems));
        } else {
            Detail::log_wrong_kind("group_item_counts[]", "a non-negative integer");
            counts.push_back(Source::kMinGroupItems);
        }
    }
    return counts;
}

[[nodiscard]] auto read_weights(Json const& array) -> std::vector<double> {
    std::vector<double> weights;
    for (auto const& entry : array) {
        if (entry.is_number() && entry.get<double>() > 0.0) {
            weights.push_back(entry.get<double>());
        } else {
            Detail::log_wrong_kind("group_size_weights[]", "a positive number");
            weights.push_back(1.0);
        }
    }
    return weights;
}

[[nodiscard]] auto read_orientations(Json const& array, Layout::SplitOrientation fallback) -> std::vector<Layout::SplitOrientation> {
    std::vector<Layout::SplitOrientation> orientations;
    for (auto const& entry : array) {
        auto wrapper = Json{{"orientation", entry}};
        orientations.push_back(read_orientation(wrapper, "orientation", fallback));
    }
    return orientations;
}

[[nodiscard]] auto slot_to_json(Source::SlotConfig const& slot) -> Json {
    return Json{
        {"source_id", slot.source_id},
        {"caption_override", slot.caption_override},
        {"source_config", slot.source_config.is_object() ? slot.source_config : Json::object()},
    };
}

[[nodiscard]] auto slot_from_json(Json const& json) -> Source::SlotConfig {
    Source::SlotConfig slot;
    if (!json.is_object()) {
        Detail::log_wrong_kind("slot", "an object");
        return slot;
    }
    slot.source_id        = read_string(json, "source_id", "");
    slot.caption_override = read_string(json, "caption_override", "");
    if (auto const* config = read_object(json, "source_config")) {
        slot.source_config = *config;
    }
    return slot;
}

} // namespace

auto layoutToJson(Layout::ComboLayoutConfig const& layout) -> Json {
    auto orientations = Json::array();
    for (auto orientation : layout.group_item_orientations) {
        orientations.push_back(std::string(orientation_id(orientation)));
    }
    return Json{
        {"layout_orientation", std::string(orientation_id(layout.layout_orientation))},
        {"group_item_counts", layout.group_item_counts},
        {"group_size_weights", layout.group_size_weights},
        {"group_item_orientations", std::move(orientations)},
        {"divider_width", layout.divider_width},
        {"divider_padding", layout.divider_padding},
        {"item_spacing", layout.item_spacing},
        {"content_padding", layout.content_padding},
    };
}

auto layoutFromJson(Json const& json) -> Layout::ComboLayoutConfig {
    Layout::ComboLayoutConfig layout;
    if (!json.is_object()) {
        Detail::log_wrong_kind("layout", "an object");
        return layout;
    }
    layout.layout_orientation = read_orientation(json, "layout_orientation", layout.layout_orientation);

    auto const* counts            = read_array(json, "group_item_counts");
    layout.group_item_counts      = counts == nullptr ? std::vector<std::uint32_t>{} : read_counts(*counts);
    auto const* weights           = read_array(json, "group_size_weights");
    layout.group_size_weights     = weights == nullptr ? std::vector<double>{} : read_weights(*weights);
    auto const* orientations      = read_array(json, "group_item_orientations");
    layout.group_item_orientations = orientations == nullptr ? std::vector<Layout::SplitOrientation>{}
                                                             : read_orientations(*orientations, layout.layout_orientation);

    layout.divider_width   = read_number(json, "divider_width", layout.divider_width);
    layout.divider_padding = read_number(json, "divider_padding", layout.divider_padding);
    layout.item_spacing    = read_number(json, "item_spacing", layout.item_spacing);
    layout.content_padding = read_number(json, "content_padding", layout.content_padding);
    layout.primary_count   = read_uint32(json, "primary_count", 0);
    layout.secondary_count = read_uint32(json, "secondary_count", 0);
    return layout;
}

auto sourceConfigToJson(Source::ComboSourceConfig const& source) -> Json {
    auto groups = Json::array();
    for (auto const& group : source.groups) {
        groups.push_back(Json{{"item_count", group.item_count}, {"size_weight", group.size_weight}});
    }
    auto slots = Json::object();
    for (auto const& [name, slot] : source.slots) {
        slots[name] = slot_to_json(slot);
    }
    return Json{
        {"mode", source.mode},
        {"groups", std::move(groups)},
        {"slots", std::move(slots)},
        {"update_interval_ms", source.update_interval_ms},
    };
}

auto sourceConfigFromJson(Json const& json) -> Source::ComboSourceConfig {
    Source::ComboSourceConfig source;
    source.groups.clear();
    if (!json.is_object()) {
        Detail::log_wrong_kind("source", "an object");
        return source;
    }
    source.mode = read_string(json, "mode", source.mode);
    if (auto const* groups = read_array(json, "groups")) {
        for (auto const& entry : *groups) {
            Source::GroupConfig group;
            if (!entry.is_object()) {
                Detail::log_wrong_kind("groups[]", "an object");
            } else {
                group.item_count  = std::clamp(read_uint32(entry, "item_count", group.item_count), Source::kMinGroupItems, Source::kMaxGroupItems);
                group.size_weight = read_number(entry, "size_weight", group.size_weight);
            }
            source.groups.push_back(group);
        }
    }
    source.primary_count   = read_uint32(json, "primary_count", 0);
    source.secondary_count = read_uint32(json, "secondary_count", 0);
    if (auto const* slots = read_object(json, "slots")) {
        for (auto const& [name, entry] : slots->items()) {
            source.slots.emplace(name, slot_from_json(entry));
        }
    }
    source.update_interval_ms = read_uint64(json, "update_interval_ms", source.update_interval_ms);
    return source;
}

auto panelToJson(Panel::ComboPanelConfig const& panel) -> Json {
    auto items = Json::object();
    for (auto const& [name, item] : panel.content_items.items()) {
        items[name] = contentItemToJson(item);
    }
    return Json{
        {"style", std::string(Theme::StyleId(panel.style))},
        {"theme", themeToJson(panel.theme)},
        {"layout", layoutToJson(panel.layout)},
        {"content_items", std::move(items)},
        {"animation_enabled", panel.animation_enabled},
        {"animation_speed", panel.animation_speed},
    };
}

auto panelFromJson(Json const& json) -> Panel::ComboPanelConfig {
    Panel::ComboPanelConfig panel;
    if (!json.is_object()) {
        Detail::log_wrong_kind("panel", "an object");
        return panel;
    }
    auto const style_id = read_string(json, "style", std::string(Theme::StyleId(panel.style)));
    if (auto style = Theme::ParseComboStyle(style_id)) {
        panel.style = *style;
    } else {
        Detail::log_wrong_kind("style", "a known combo style");
    }

    auto const defaults = Theme::DefaultThemeFor(panel.style);
    auto const* theme   = read_object(json, "theme");
    panel.theme         = theme == nullptr ? defaults : themeFromJson(*theme, defaults);

    if (auto const* layout = read_object(json, "layout")) {
        panel.layout = layoutFromJson(*layout);
    }

    Content::ContentItemRegistry::Map items;
    if (auto const* content = read_object(json, "content_items")) {
        for (auto const& [name, entry] : content->items()) {
            items.emplace(name, contentItemFromJson(entry));
        }
    }
    panel.content_items     = Content::ContentItemRegistry{std::move(items)};
    panel.animation_enabled = read_boolean(json, "animation_enabled", panel.animation_enabled);
    panel.animation_speed   = read_number(json, "animation_speed", panel.animation_speed);
    return panel;
}

auto serializePanel(PanelDocument const& document, bool pretty) -> std::string {
    auto json = panelToJson(document.panel);
    if (document.source) {
        json["source"] = sourceConfigToJson(*document.source);
    }
    return dump(json, pretty);
}

auto deserializePanel(std::string_view text) -> Expected<PanelDocument> {
    auto json = parse_document(text, "panel");
    if (!json) {
        return std::unexpected(json.error());
    }

    PanelDocument document;
    document.panel = panelFromJson(*json);
    document.panel.migrate_legacy();

    if (auto const* source = read_object(*json, "source")) {
        auto config = sourceConfigFromJson(*source);
        config.migrate_legacy();
        document.panel.layout.sync_to_source(config);
        document.source = std::move(config);
    }
    return document;
}

auto serializeSourceConfig(Source::ComboSourceConfig const& source, bool pretty) -> std::string {
    return dump(sourceConfigToJson(source), pretty);
}

auto deserializeSourceConfig(std::string_view text) -> Expected<Source::ComboSourceConfig> {
    auto json = parse_document(text, "source");
    if (!json) {
        return std::unexpected(json.error());
    }
    auto source = sourceConfigFromJson(*json);
    source.migrate_legacy();
    return source;
}

auto loadPanelFile(std::filesystem::path const& path) -> Expected<PanelDocument> {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return std::unexpected(make_error(Error::Code::IoFailure, path.string(), "cannot open for reading"));
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    if (input.bad()) {
        return std::unexpected(make_error(Error::Code::IoFailure, path.string(), "read failed"));
    }
    return deserializePanel(buffer.str());
}

auto savePanelFile(std::filesystem::path const& path, PanelDocument const& document) -> Expected<void> {
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output) {
        return std::unexpected(make_error(Error::Code::IoFailure, path.string(), "cannot open for writing"));
    }
    output << serializePanel(document, true) << '\n';
    output.flush();
    if (!output) {
        return std::unexpected(make_error(Error::Code::IoFailure, path.string(), "write failed"));
    }
    return {};
}

} // namespace CP::Serialization
