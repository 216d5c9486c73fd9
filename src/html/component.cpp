#include <sprig/html/component.h>

namespace sprig::html {

void append_to(Element& element, Content content) {
    element.append_child(std::move(content));
}

void append_to(Element& element, Element child) {
    element.append_child(Content::from_element(std::move(child)));
}

void append_to(Element& element, const Attr& attr) {
    attr.apply_to(element);
}

void append_to(Element& element, const char* text) {
    element.append_child(Content::text(text));
}

void append_to(Element& element, std::string text) {
    element.append_child(Content::text(std::move(text)));
}

void append_to(Element& element, std::string_view text) {
    element.append_child(Content::text(std::string(text)));
}

} // namespace sprig::html
