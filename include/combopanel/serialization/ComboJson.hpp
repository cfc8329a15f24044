#pragma once

#include <combopanel/content/DisplayConfigs.hpp>
#include <combopanel/core/Error.hpp>
#include <combopanel/layout/ComboLayoutConfig.hpp>
#include <combopanel/panel/ComboPanelConfig.hpp>
#include <combopanel/source/ComboSourceConfig.hpp>
#include <combopanel/theme/ComboTheme.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace CP::Serialization {

using Json = nlohmann::json;

/*
 * Value codecs. The *FromJson readers never fail: missing keys take their
 * defaults and keys of the wrong kind are replaced by defaults and logged.
 */
[[nodiscard]] auto colorToJson(Theme::Color const& color) -> Json;
[[nodiscard]] auto colorFromJson(Json const& json) -> Theme::Color;
[[nodiscard]] auto colorSourceToJson(Theme::ColorSource const& source) -> Json;
[[nodiscard]] auto colorSourceFromJson(Json const& json, Theme::ColorSource const& fallback) -> Theme::ColorSource;
[[nodiscard]] auto fontSourceToJson(Theme::FontSource const& source) -> Json;
[[nodiscard]] auto fontSourceFromJson(Json const& json, Theme::FontSource const& fallback) -> Theme::FontSource;
[[nodiscard]] auto colorStopsToJson(std::vector<Theme::ColorStopSource> const& stops) -> Json;
[[nodiscard]] auto colorStopsFromJson(Json const& json, std::vector<Theme::ColorStopSource> const& fallback) -> std::vector<Theme::ColorStopSource>;
[[nodiscard]] auto gradientToJson(Theme::LinearGradientSourceConfig const& gradient) -> Json;
[[nodiscard]] auto gradientFromJson(Json const& json) -> Theme::LinearGradientSourceConfig;
[[nodiscard]] auto themeToJson(Theme::ComboThemeConfig const& theme) -> Json;
[[nodiscard]] auto themeFromJson(Json const& json, Theme::ComboThemeConfig const& defaults) -> Theme::ComboThemeConfig;

[[nodiscard]] auto contentItemToJson(Content::ContentItemConfig const& item) -> Json;
[[nodiscard]] auto contentItemFromJson(Json const& json) -> Content::ContentItemConfig;

[[nodiscard]] auto layoutToJson(Layout::ComboLayoutConfig const& layout) -> Json;
// Does not migrate; group_item_counts stays empty when the key is missing.
[[nodiscard]] auto layoutFromJson(Json const& json) -> Layout::ComboLayoutConfig;
[[nodiscard]] auto sourceConfigToJson(Source::ComboSourceConfig const& source) -> Json;
// Does not migrate; groups stays empty when the key is missing.
[[nodiscard]] auto sourceConfigFromJson(Json const& json) -> Source::ComboSourceConfig;
[[nodiscard]] auto panelToJson(Panel::ComboPanelConfig const& panel) -> Json;
[[nodiscard]] auto panelFromJson(Json const& json) -> Panel::ComboPanelConfig;

// A panel file: the panel plus, optionally, the source feeding it.
struct PanelDocument {
    Panel::ComboPanelConfig                  panel{};
    std::optional<Source::ComboSourceConfig> source{};
};

/*
 * Document entry points. Text that is not JSON, or whose top level is not an
 * object, fails with MalformedInput. Legacy migration runs on every load, and
 * a panel loaded together with its source has its layout synced to it.
 */
[[nodiscard]] auto serializePanel(PanelDocument const& document, bool pretty = false) -> std::string;
[[nodiscard]] auto deserializePanel(std::string_view text) -> Expected<PanelDocument>;
[[nodiscard]] auto serializeSourceConfig(Source::ComboSourceConfig const& source, bool pretty = false) -> std::string;
[[nodiscard]] auto deserializeSourceConfig(std::string_view text) -> Expected<Source::ComboSourceConfig>;

[[nodiscard]] auto loadPanelFile(std::filesystem::path const& path) -> Expected<PanelDocument>;
[[nodiscard]] auto savePanelFile(std::filesystem::path const& path, PanelDocument const& document) -> Expected<void>;

} // namespace CP::Serialization
