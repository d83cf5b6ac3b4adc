#include "core/theme.hpp"
#include "core/inspiration.hpp"

namespace sparkle {

namespace {

// Decode one UTF-8 sequence starting at `i`. Malformed bytes decode as
// themselves so that length checks never under-count.
char32_t next_code_point(std::string_view s, size_t& i) {
    auto byte = static_cast<unsigned char>(s[i]);
    size_t len = 1;
    char32_t cp = byte;
    if (byte >= 0xF0 && byte < 0xF8) {
        len = 4;
        cp = byte & 0x07;
    } else if (byte >= 0xE0) {
        len = 3;
        cp = byte & 0x0F;
    } else if (byte >= 0xC0) {
        len = 2;
        cp = byte & 0x1F;
    }
    if (len == 1 || i + len > s.size()) {
        ++i;
        return byte;
    }
    for (size_t k = 1; k < len; ++k) {
        auto cont = static_cast<unsigned char>(s[i + k]);
        if ((cont & 0xC0) != 0x80) {
            ++i;
            return byte;
        }
        cp = (cp << 6) | (cont & 0x3F);
    }
    i += len;
    return cp;
}

bool is_space(char32_t cp) {
    return cp == U' ' || cp == U'\t' || cp == U'\n' || cp == U'\r' ||
           cp == U'\f' || cp == U'\v' || cp == 0x00A0 || cp == 0x3000;
}

bool is_cjk(char32_t cp) {
    return (cp >= 0x4E00 && cp <= 0x9FFF) ||   // unified ideographs
           (cp >= 0x3400 && cp <= 0x4DBF) ||   // extension A
           (cp >= 0x3040 && cp <= 0x30FF) ||   // kana
           (cp >= 0xAC00 && cp <= 0xD7AF) ||   // hangul
           (cp >= 0xF900 && cp <= 0xFAFF);
}

struct TextShape {
    size_t code_points = 0;
    bool blank = true;
};

TextShape shape_of(std::string_view s) {
    TextShape shape;
    size_t i = 0;
    while (i < s.size()) {
        char32_t cp = next_code_point(s, i);
        ++shape.code_points;
        if (!is_space(cp)) shape.blank = false;
    }
    return shape;
}

} // namespace

NameValidation validate_theme_name(std::string_view name) {
    auto shape = shape_of(name);
    if (shape.blank) return NameValidation::Empty;
    if (shape.code_points > MAX_THEME_NAME_LENGTH) return NameValidation::TooLong;
    if (name.find(THEME_MARKER) != std::string_view::npos) return NameValidation::Invalid;
    return NameValidation::Valid;
}

NameValidation validate_content(std::string_view content) {
    auto shape = shape_of(content);
    if (shape.blank) return NameValidation::Empty;
    if (shape.code_points > MAX_CONTENT_LENGTH) return NameValidation::TooLong;
    return NameValidation::Valid;
}

bool is_blank(std::string_view text) {
    return shape_of(text).blank;
}

std::string preview(std::string_view text, size_t max_code_points) {
    size_t i = 0;
    size_t taken = 0;
    while (i < text.size() && taken < max_code_points) {
        next_code_point(text, i);
        ++taken;
    }
    return std::string(text.substr(0, i));
}

int count_words(std::string_view text) {
    int words = 0;
    bool in_word = false;
    size_t i = 0;
    while (i < text.size()) {
        char32_t cp = next_code_point(text, i);
        if (is_space(cp)) {
            in_word = false;
        } else if (is_cjk(cp)) {
            ++words;
            in_word = false;
        } else if (!in_word) {
            ++words;
            in_word = true;
        }
    }
    return words;
}

} // namespace sparkle
