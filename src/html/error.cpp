#include <sprig/html/error.h>
#include <sprig/html/element.h>
#include <cstdio>

namespace sprig::html {

namespace {

std::string quoted(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20 || c == 0x7f) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u{%x}", static_cast<unsigned char>(c));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    out += '"';
    return out;
}

std::string describe(ErrorCause cause, const std::string& detail) {
    switch (cause) {
        case ErrorCause::Format:          return "sink rejected write";
        case ErrorCause::InvalidTagName:  return "Invalid tag name " + quoted(detail);
        case ErrorCause::InvalidAttrName: return "Invalid attribute name " + quoted(detail);
        case ErrorCause::InvalidChild:    return "Invalid child";
        case ErrorCause::InvalidRawText:  return "Invalid raw text " + quoted(detail);
    }
    return "unknown error";
}

} // anonymous namespace

const char* cause_name(ErrorCause cause) {
    switch (cause) {
        case ErrorCause::Format:          return "format";
        case ErrorCause::InvalidTagName:  return "invalid_tag_name";
        case ErrorCause::InvalidAttrName: return "invalid_attr_name";
        case ErrorCause::InvalidChild:    return "invalid_child";
        case ErrorCause::InvalidRawText:  return "invalid_raw_text";
    }
    return "unknown";
}

RenderError::RenderError(ErrorCause cause, std::string detail)
    : std::runtime_error(cause_name(cause))
    , cause_(cause)
    , detail_(std::move(detail)) {
    update_message();
}

void RenderError::at(std::size_t index, const Content& child) {
    PathSegment segment;
    segment.index = index;
    if (const Element* element = child.as_element()) {
        segment.tag_name = element->name();
    }
    reverse_path_.push_back(std::move(segment));
    update_message();
}

std::string RenderError::path() const {
    if (reverse_path_.empty()) {
        return "/";
    }
    std::string result;
    for (auto it = reverse_path_.rbegin(); it != reverse_path_.rend(); ++it) {
        result += '/';
        result += std::to_string(it->index);
        if (it->tag_name) {
            result += '(';
            result += *it->tag_name;
            result += ')';
        }
    }
    return result;
}

const char* RenderError::what() const noexcept {
    return message_.c_str();
}

void RenderError::update_message() {
    message_ = "Render error at " + path() + ": " + describe(cause_, detail_);
}

} // namespace sprig::html
