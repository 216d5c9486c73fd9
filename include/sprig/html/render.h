#pragma once
#include <sprig/html/element.h>
#include <sprig/html/error.h>
#include <sprig/html/sink.h>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace sprig::html {

// Depth-first serializer. Validates tag and attribute names, enforces each
// element kind's content model and escapes text on the way out. Any failure
// throws RenderError; output already written to the sink is then partial and
// must be discarded by the caller.
//
// The renderer never mutates the tree, so one tree may be rendered from
// several threads at once, each with its own Renderer and Sink.
class Renderer {
public:
    explicit Renderer(Sink& sink) : sink_(sink) {}

    void render(const Document& document);
    void render(const Element& element);
    void render(const Content& content);
    void render(const std::vector<Content>& contents);

private:
    void write(std::string_view data);
    void write_text(std::string_view text);
    void write_comment(std::string_view text);
    void write_attribute_value(std::string_view value);

    // Dispatches one child according to the parent's kind.
    void render_child(const Element& parent, const Content& child);

    Sink& sink_;
};

// Convenience wrappers
void render(const Document& document, Sink& sink);
void render(const Element& element, Sink& sink);
void render(const Content& content, Sink& sink);
void render(const Document& document, std::ostream& out);

std::string render_to_string(const Document& document);
std::string render_to_string(const Element& element);
std::string render_to_string(const Content& content);
std::string render_to_string(const std::vector<Content>& contents);

// The three escaping disciplines, exposed for callers assembling markup by
// hand. escape_comment() returns the comment body without the "<!--" and
// "-->" delimiters; escape_attribute_value() includes the surrounding quotes.
std::string escape_text(std::string_view text);
std::string escape_comment(std::string_view text);
std::string escape_attribute_value(std::string_view value);

} // namespace sprig::html
