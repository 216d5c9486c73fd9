#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sprig::html {

// https://html.spec.whatwg.org/multipage/syntax.html#elements-2
enum class ElementKind {
    Void,
    Template,
    RawText,
    EscapableRawText,
    Foreign,
    Normal
};

const char* kind_name(ElementKind kind);

class Element;
class Document;

// One node of renderable material. Copying a Content deep-copies a nested
// element; there is never any sharing between trees.
class Content {
public:
    enum class Type {
        Raw,      // written verbatim
        Text,     // escaped according to the parent element's kind
        Comment,  // mangled into a safe comment body
        Element
    };

    static Content raw(std::string data);
    static Content text(std::string data);
    static Content comment(std::string data);
    static Content from_element(Element element);
    static Content doctype();

    Content(const Content& other);
    Content(Content&& other) noexcept;
    Content& operator=(const Content& other);
    Content& operator=(Content&& other) noexcept;
    ~Content();

    Type type() const { return type_; }
    bool is_element() const { return type_ == Type::Element; }

    // Payload of Raw, Text and Comment content; empty for elements.
    const std::string& data() const { return data_; }

    // Null unless type() == Type::Element.
    const Element* as_element() const { return element_.get(); }
    Element* as_element() { return element_.get(); }

private:
    Content(Type type, std::string data, std::unique_ptr<Element> element);

    Type type_;
    std::string data_;
    std::unique_ptr<Element> element_;
};

class Element {
public:
    // Names are ASCII-lowercased unless the kind is Foreign.
    Element(std::string_view name, ElementKind kind);

    static Element normal(std::string_view name);

    const std::string& name() const { return name_; }
    ElementKind kind() const { return kind_; }

    // Attributes
    // Sorted by name, which makes the rendered attribute order canonical.
    const std::map<std::string, std::string>& attributes() const { return attributes_; }
    void set_attribute(std::string_view name, std::string value);
    std::optional<std::string> attribute(std::string_view name) const;
    bool has_attribute(std::string_view name) const;
    void remove_attribute(std::string_view name);

    // Children
    const std::vector<Content>& children() const { return children_; }
    void append_child(Content child);
    size_t child_count() const { return children_.size(); }

    // Applies each component via append_to() in order.
    template<typename... Components>
    Element& add(Components&&... components) {
        (append_to(*this, std::forward<Components>(components)), ...);
        return *this;
    }

    template<typename... Components>
    Element with(Components&&... components) && {
        add(std::forward<Components>(components)...);
        return std::move(*this);
    }

    Document into_document() &&;

    // Attribute names follow the same casing rule as the tag name.
    std::string normalize_attribute_name(std::string_view name) const;

private:
    std::string name_;
    ElementKind kind_;
    std::map<std::string, std::string> attributes_;
    std::vector<Content> children_;
};

// A full page. Renders as the doctype followed by the root element.
class Document {
public:
    explicit Document(Element root);

    const Element& root() const { return root_; }
    Element& root() { return root_; }

private:
    Element root_;
};

// An attribute used as a builder component.
class Attr {
public:
    enum class Mode {
        Set,     // insert or replace
        Append   // join onto an existing value with separator()
    };

    static Attr set(std::string name, std::string value);
    static Attr set(std::string name, long long value);
    static Attr yes(std::string name);
    static Attr append(std::string name, std::string value, std::string separator);

    static Attr id(std::string value);
    static Attr class_(std::string value);
    static Attr data(std::string_view name, std::string value);

    const std::string& name() const { return name_; }
    const std::string& value() const { return value_; }
    const std::string& separator() const { return separator_; }
    Mode mode() const { return mode_; }

    void apply_to(Element& element) const;

private:
    Attr(std::string name, std::string value, Mode mode, std::string separator);

    std::string name_;
    std::string value_;
    Mode mode_;
    std::string separator_;
};

} // namespace sprig::html

#include <sprig/html/component.h>
