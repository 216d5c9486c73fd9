#pragma once
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace sprig::html {

class Content;

enum class ErrorCause {
    Format,           // the sink refused a write
    InvalidTagName,
    InvalidAttrName,
    InvalidChild,     // content not permitted by the parent's kind
    InvalidRawText    // raw text would close its own element early
};

const char* cause_name(ErrorCause cause);

struct PathSegment {
    std::size_t index = 0;
    std::optional<std::string> tag_name;  // set when the child is an element
};

// Thrown by the renderer. Each enclosing element frame calls at() while the
// error unwinds, so reverse_path() lists the innermost segment first.
class RenderError : public std::runtime_error {
public:
    explicit RenderError(ErrorCause cause, std::string detail = std::string());

    ErrorCause cause() const { return cause_; }

    // Offending tag name, attribute name or raw text. Empty for Format and
    // InvalidChild.
    const std::string& detail() const { return detail_; }

    const std::vector<PathSegment>& reverse_path() const { return reverse_path_; }

    void at(std::size_t index, const Content& child);

    // "/1(input)/0", or "/" when the failing node is the one rendered.
    std::string path() const;

    // "Render error at /1(input)/0: Invalid child"
    const char* what() const noexcept override;

private:
    void update_message();

    ErrorCause cause_;
    std::string detail_;
    std::vector<PathSegment> reverse_path_;
    std::string message_;
};

} // namespace sprig::html
