#pragma once
#include <string_view>

namespace sprig::html {

bool is_ascii_alpha(char c);
bool is_ascii_alphanumeric(char c);

// Tag names are restricted to [A-Za-z][A-Za-z0-9]*. The standard allows more,
// but this subset parses the same way in every insertion mode.
bool is_valid_tag_name(std::string_view name);

// Attribute names: [A-Za-z][A-Za-z0-9_-]*
bool is_valid_attribute_name(std::string_view name);

// True unless `text` contains "</" followed by `tag_name` (ASCII
// case-insensitive) and then one of tab, LF, FF, CR, space, '>' or '/'.
// A candidate that runs into the end of the text is not a match.
bool is_valid_raw_text(std::string_view tag_name, std::string_view text);

} // namespace sprig::html
