#include <sprig/html/render.h>
#include <sprig/html/check.h>
#include <sprig/core/config.h>

namespace sprig::html {

namespace {

// Splits `text` into unchanged runs and replacements, handing each piece to
// `emit`. `replacement_for` returns nullptr for characters that pass through.
template<typename Replace, typename Emit>
void escape_runs(std::string_view text, Replace&& replacement_for, Emit&& emit) {
    size_t run_start = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        const char* replacement = replacement_for(text[i]);
        if (!replacement) continue;
        if (i > run_start) {
            emit(text.substr(run_start, i - run_start));
        }
        emit(std::string_view(replacement));
        run_start = i + 1;
    }
    if (run_start < text.size()) {
        emit(text.substr(run_start));
    }
}

// Text only ever lands in the data or RCDATA tokenizer states, where '&' and
// '<' are the only significant characters. '>' is escaped for symmetry.
const char* text_replacement(char c) {
    switch (c) {
        case '&': return "&amp;";
        case '<': return "&lt;";
        case '>': return "&gt;";
        default:  return nullptr;
    }
}

// Values are always double-quoted, so only '"' can end them early.
const char* attribute_value_replacement(char c) {
    return c == '"' ? "&quot;" : nullptr;
}

void replace_all(std::string& s, std::string_view from, std::string_view to) {
    size_t pos = s.find(from);
    while (pos != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos = s.find(from, pos + to.size());
    }
}

// A comment must not start with ">" or "->", must not contain "<!--", "-->"
// or "--!>", and must not end with "<!-".
// https://html.spec.whatwg.org/multipage/syntax.html#comments
//
// The replacements are lossy. Their exact output is part of the format.
std::string mangle_comment(std::string_view text) {
    std::string result(text);
    replace_all(result, "<!--", "<!==");
    replace_all(result, "-->", "==>");
    replace_all(result, "--!>", "==!>");

    std::string_view view(result);
    if (view.starts_with(">") || view.starts_with("->")) {
        result.insert(result.begin(), ' ');
    }
    if (std::string_view(result).ends_with("<!-")) {
        result += ' ';
    }
    return result;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Renderer
// ---------------------------------------------------------------------------

void Renderer::write(std::string_view data) {
    if (!sink_.write(data)) {
        throw RenderError(ErrorCause::Format);
    }
}

void Renderer::write_text(std::string_view text) {
    escape_runs(text, text_replacement, [this](std::string_view piece) { write(piece); });
}

void Renderer::write_comment(std::string_view text) {
    write("<!--");
    write(mangle_comment(text));
    write("-->");
}

void Renderer::write_attribute_value(std::string_view value) {
    write("\"");
    escape_runs(value, attribute_value_replacement,
                [this](std::string_view piece) { write(piece); });
    write("\"");
}

void Renderer::render(const Document& document) {
    write(core::config::kDoctype);
    render(document.root());
}

void Renderer::render(const std::vector<Content>& contents) {
    for (const auto& content : contents) {
        render(content);
    }
}

void Renderer::render(const Content& content) {
    switch (content.type()) {
        case Content::Type::Raw:
            write(content.data());
            break;
        case Content::Type::Text:
            write_text(content.data());
            break;
        case Content::Type::Comment:
            write_comment(content.data());
            break;
        case Content::Type::Element:
            render(*content.as_element());
            break;
    }
}

void Renderer::render(const Element& element) {
    const std::string& name = element.name();

    if (!is_valid_tag_name(name)) {
        throw RenderError(ErrorCause::InvalidTagName, name);
    }
    for (const auto& [attr_name, value] : element.attributes()) {
        if (!is_valid_attribute_name(attr_name)) {
            throw RenderError(ErrorCause::InvalidAttrName, attr_name);
        }
    }

    // Opening tag. Empty values use the boolean attribute shorthand.
    write("<");
    write(name);
    for (const auto& [attr_name, value] : element.attributes()) {
        write(" ");
        write(attr_name);
        if (!value.empty()) {
            write("=");
            write_attribute_value(value);
        }
    }

    const auto& children = element.children();
    if (children.empty()) {
        switch (element.kind()) {
            case ElementKind::Void:
                write(">");
                break;
            case ElementKind::Foreign:
                write(" />");
                break;
            case ElementKind::Template:
            case ElementKind::RawText:
            case ElementKind::EscapableRawText:
            case ElementKind::Normal:
                write("></");
                write(name);
                write(">");
                break;
        }
        return;
    }
    write(">");

    for (size_t i = 0; i < children.size(); ++i) {
        try {
            render_child(element, children[i]);
        } catch (RenderError& e) {
            e.at(i, children[i]);
            throw;
        }
    }

    if (element.kind() != ElementKind::Void) {
        write("</");
        write(name);
        write(">");
    }
}

void Renderer::render_child(const Element& parent, const Content& child) {
    switch (parent.kind()) {
        case ElementKind::Void:
            throw RenderError(ErrorCause::InvalidChild);

        case ElementKind::RawText:
            switch (child.type()) {
                case Content::Type::Raw:
                    write(child.data());
                    return;
                case Content::Type::Text:
                    if (!is_valid_raw_text(parent.name(), child.data())) {
                        throw RenderError(ErrorCause::InvalidRawText, child.data());
                    }
                    write(child.data());
                    return;
                case Content::Type::Comment:
                case Content::Type::Element:
                    throw RenderError(ErrorCause::InvalidChild);
            }
            break;

        case ElementKind::EscapableRawText:
            switch (child.type()) {
                case Content::Type::Raw:
                case Content::Type::Text:
                    render(child);
                    return;
                case Content::Type::Comment:
                case Content::Type::Element:
                    throw RenderError(ErrorCause::InvalidChild);
            }
            break;

        case ElementKind::Template:
        case ElementKind::Foreign:
        case ElementKind::Normal:
            render(child);
            return;
    }
}

// ---------------------------------------------------------------------------
// Convenience wrappers
// ---------------------------------------------------------------------------

void render(const Document& document, Sink& sink) {
    Renderer(sink).render(document);
}

void render(const Element& element, Sink& sink) {
    Renderer(sink).render(element);
}

void render(const Content& content, Sink& sink) {
    Renderer(sink).render(content);
}

void render(const Document& document, std::ostream& out) {
    StreamSink sink(out);
    Renderer(sink).render(document);
}

std::string render_to_string(const Document& document) {
    StringSink sink;
    Renderer(sink).render(document);
    return sink.take();
}

std::string render_to_string(const Element& element) {
    StringSink sink;
    Renderer(sink).render(element);
    return sink.take();
}

std::string render_to_string(const Content& content) {
    StringSink sink;
    Renderer(sink).render(content);
    return sink.take();
}

std::string render_to_string(const std::vector<Content>& contents) {
    StringSink sink;
    Renderer(sink).render(contents);
    return sink.take();
}

std::string escape_text(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    escape_runs(text, text_replacement, [&out](std::string_view piece) { out.append(piece); });
    return out;
}

std::string escape_comment(std::string_view text) {
    return mangle_comment(text);
}

std::string escape_attribute_value(std::string_view value) {
    std::string out = "\"";
    escape_runs(value, attribute_value_replacement,
                [&out](std::string_view piece) { out.append(piece); });
    out += '"';
    return out;
}

} // namespace sprig::html
