#include <sprig/html/check.h>
#include <algorithm>

namespace sprig::html {

namespace {

char ascii_lower(char c) {
    if (c >= 'A' && c <= 'Z') {
        return static_cast<char>(c - 'A' + 'a');
    }
    return c;
}

bool ascii_iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(),
                      [](char x, char y) { return ascii_lower(x) == ascii_lower(y); });
}

// https://html.spec.whatwg.org/multipage/syntax.html#cdata-rcdata-restrictions
bool ends_closing_tag(char c) {
    switch (c) {
        case '\t':
        case '\n':
        case '\f':
        case '\r':
        case ' ':
        case '>':
        case '/':
            return true;
        default:
            return false;
    }
}

} // anonymous namespace

bool is_ascii_alpha(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool is_ascii_alphanumeric(char c) {
    return is_ascii_alpha(c) || (c >= '0' && c <= '9');
}

bool is_valid_tag_name(std::string_view name) {
    if (name.empty() || !is_ascii_alpha(name.front())) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), is_ascii_alphanumeric);
}

bool is_valid_attribute_name(std::string_view name) {
    if (name.empty() || !is_ascii_alpha(name.front())) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](char c) {
        return is_ascii_alphanumeric(c) || c == '-' || c == '_';
    });
}

bool is_valid_raw_text(std::string_view tag_name, std::string_view text) {
    size_t pos = text.find("</");
    while (pos != std::string_view::npos) {
        size_t start = pos + 2;
        std::string_view candidate = text.substr(start, tag_name.size());

        if (ascii_iequals(candidate, tag_name)) {
            size_t trailing = start + candidate.size();
            // "</name" at the very end of the text is left alone.
            if (trailing < text.size() && ends_closing_tag(text[trailing])) {
                return false;
            }
        }

        pos = text.find("</", start);
    }
    return true;
}

} // namespace sprig::html
