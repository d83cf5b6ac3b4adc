#pragma once

#include "core/types.hpp"
#include "core/result.hpp"
#include <cstdint>
#include <string>
#include <string_view>

namespace sparkle {

inline constexpr size_t MAX_THEME_NAME_LENGTH = 50;

// Content of the placeholder rows the legacy schema used to track themes.
// Never valid as a theme name and dropped by the schema migration.
inline constexpr std::string_view THEME_MARKER = "__THEME_MARKER__";

// "Uncategorized"
inline constexpr std::string_view DEFAULT_THEME_NAME = "未分类";

inline constexpr std::string_view DEFAULT_THEME_ICON = "💡";
inline constexpr uint32_t DEFAULT_THEME_COLOR = 0xFF4A90E2;

/**
 * ThemeOrder - Sort orders supported when listing themes.
 */
enum class ThemeOrder {
    Name,              // ascending
    LastUsed,          // most recent first
    InspirationCount   // largest first
};

/**
 * Theme - A user-defined category applied to inspirations.
 *
 * `name` is the primary key. `inspiration_count` and `last_used` are cached
 * aggregates kept in step by the IntegrityCoordinator.
 */
struct Theme {
    std::string name;
    std::string icon{DEFAULT_THEME_ICON};
    uint32_t color = DEFAULT_THEME_COLOR;
    std::string description;
    Timestamp created_at;
    Timestamp last_used;
    int inspiration_count = 0;

    bool operator==(const Theme&) const = default;
};

/**
 * Validate a theme name: not blank, at most MAX_THEME_NAME_LENGTH code
 * points, and not containing THEME_MARKER.
 */
[[nodiscard]] NameValidation validate_theme_name(std::string_view name);

// ============================================================================
// Pure transformation functions
// ============================================================================

[[nodiscard]] inline Theme create_theme(std::string name, Timestamp now) {
    return Theme{
        .name = std::move(name),
        .created_at = now,
        .last_used = now,
    };
}

[[nodiscard]] inline Theme with_icon(Theme theme, std::string icon) {
    theme.icon = std::move(icon);
    return theme;
}

[[nodiscard]] inline Theme with_color(Theme theme, uint32_t color) {
    theme.color = color;
    return theme;
}

[[nodiscard]] inline Theme with_description(Theme theme, std::string description) {
    theme.description = std::move(description);
    return theme;
}

} // namespace sparkle
