#pragma once

#include "core/types.hpp"
#include "core/result.hpp"
#include <cstdint>
#include <string>
#include <string_view>

namespace sparkle {

inline constexpr size_t MAX_CONTENT_LENGTH = 500;

/**
 * Inspiration - A single short note, always filed under exactly one theme.
 */
struct Inspiration {
    int64_t id = 0;            // assigned by the store on insert
    std::string content;
    std::string theme_name;
    Timestamp created_at;
    int word_count = 0;        // supplied by the caller, never recomputed

    bool operator==(const Inspiration&) const = default;
};

/**
 * Validate note content: not blank and at most MAX_CONTENT_LENGTH code points.
 * Never returns Invalid.
 */
[[nodiscard]] NameValidation validate_content(std::string_view content);

/**
 * Word count as the app displays it: whitespace-separated runs of Latin text
 * count as one word each, every CJK character counts as one word.
 */
[[nodiscard]] int count_words(std::string_view text);

// Empty or whitespace only (ideographic and no-break spaces included).
[[nodiscard]] bool is_blank(std::string_view text);

// First `max_code_points` code points of `text`, never splitting a sequence.
[[nodiscard]] std::string preview(std::string_view text, size_t max_code_points);

[[nodiscard]] inline Inspiration create_inspiration(
    std::string content,
    std::string theme_name,
    Timestamp now
) {
    int words = count_words(content);
    return Inspiration{
        .id = 0,
        .content = std::move(content),
        .theme_name = std::move(theme_name),
        .created_at = now,
        .word_count = words
    };
}

[[nodiscard]] inline Inspiration with_theme(Inspiration inspiration, std::string theme_name) {
    inspiration.theme_name = std::move(theme_name);
    return inspiration;
}

[[nodiscard]] inline Inspiration with_content(Inspiration inspiration, std::string content) {
    inspiration.word_count = count_words(content);
    inspiration.content = std::move(content);
    return inspiration;
}

} // namespace sparkle
