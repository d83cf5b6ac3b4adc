#pragma once

#include "core/inspiration.hpp"
#include "core/theme.hpp"
#include "storage/data_validator.hpp"
#include <QString>
#include <optional>
#include <vector>

namespace sparkle::cli {

// One theme per line: "<icon> <name> (<count>)", in the order given.
[[nodiscard]] QString format_themes(const std::vector<Theme>& themes);

// { "themes": [{ "name", "icon", "color", "description", "createdAt",
//                "lastUsed", "inspirationCount" }] }
[[nodiscard]] QString format_themes_json(const std::vector<Theme>& themes);

// One note per line: "#<id> [<theme>] <content>"; line breaks in the
// content are flattened.
[[nodiscard]] QString format_inspirations(const std::vector<Inspiration>& inspirations);

// { "inspirations": [{ "id", "content", "theme", "createdAt", "wordCount" }] }
[[nodiscard]] QString format_inspirations_json(const std::vector<Inspiration>& inspirations);

[[nodiscard]] QString format_report_json(const storage::ValidationReport& report);

// "0xAARRGGBB"
[[nodiscard]] QString format_color(uint32_t color);

// Accepts "0xAARRGGBB", "#AARRGGBB" or "#RRGGBB" (opaque).
[[nodiscard]] std::optional<uint32_t> parse_color(const QString& text);

// "name", "recent" or "count".
[[nodiscard]] std::optional<ThemeOrder> parse_theme_order(const QString& text);

} // namespace sparkle::cli
