#include <sprig/html/element.h>
#include <sprig/core/config.h>
#include <algorithm>

namespace sprig::html {

namespace {

std::string to_ascii_lower(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(), [](char c) {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    });
    return result;
}

} // anonymous namespace

const char* kind_name(ElementKind kind) {
    switch (kind) {
        case ElementKind::Void:             return "void";
        case ElementKind::Template:         return "template";
        case ElementKind::RawText:          return "raw-text";
        case ElementKind::EscapableRawText: return "escapable-raw-text";
        case ElementKind::Foreign:          return "foreign";
        case ElementKind::Normal:           return "normal";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// Content
// ---------------------------------------------------------------------------

Content::Content(Type type, std::string data, std::unique_ptr<Element> element)
    : type_(type)
    , data_(std::move(data))
    , element_(std::move(element)) {}

Content Content::raw(std::string data) {
    return Content(Type::Raw, std::move(data), nullptr);
}

Content Content::text(std::string data) {
    return Content(Type::Text, std::move(data), nullptr);
}

Content Content::comment(std::string data) {
    return Content(Type::Comment, std::move(data), nullptr);
}

Content Content::from_element(Element element) {
    return Content(Type::Element, std::string(), std::make_unique<Element>(std::move(element)));
}

Content Content::doctype() {
    return raw(core::config::kDoctype);
}

Content::Content(const Content& other)
    : type_(other.type_)
    , data_(other.data_)
    , element_(other.element_ ? std::make_unique<Element>(*other.element_) : nullptr) {}

Content::Content(Content&& other) noexcept = default;

Content& Content::operator=(const Content& other) {
    if (this != &other) {
        Content copy(other);
        *this = std::move(copy);
    }
    return *this;
}

Content& Content::operator=(Content&& other) noexcept = default;

Content::~Content() = default;

// ---------------------------------------------------------------------------
// Element
// ---------------------------------------------------------------------------

Element::Element(std::string_view name, ElementKind kind)
    : name_(kind == ElementKind::Foreign ? std::string(name) : to_ascii_lower(name))
    , kind_(kind) {}

Element Element::normal(std::string_view name) {
    return Element(name, ElementKind::Normal);
}

std::string Element::normalize_attribute_name(std::string_view name) const {
    if (kind_ == ElementKind::Foreign) {
        return std::string(name);
    }
    return to_ascii_lower(name);
}

void Element::set_attribute(std::string_view name, std::string value) {
    attributes_[normalize_attribute_name(name)] = std::move(value);
}

std::optional<std::string> Element::attribute(std::string_view name) const {
    auto it = attributes_.find(normalize_attribute_name(name));
    if (it != attributes_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool Element::has_attribute(std::string_view name) const {
    return attributes_.count(normalize_attribute_name(name)) > 0;
}

void Element::remove_attribute(std::string_view name) {
    attributes_.erase(normalize_attribute_name(name));
}

void Element::append_child(Content child) {
    children_.push_back(std::move(child));
}

Document Element::into_document() && {
    return Document(std::move(*this));
}

// ---------------------------------------------------------------------------
// Document
// ---------------------------------------------------------------------------

Document::Document(Element root)
    : root_(std::move(root)) {}

// ---------------------------------------------------------------------------
// Attr
// ---------------------------------------------------------------------------

Attr::Attr(std::string name, std::string value, Mode mode, std::string separator)
    : name_(std::move(name))
    , value_(std::move(value))
    , mode_(mode)
    , separator_(std::move(separator)) {}

Attr Attr::set(std::string name, std::string value) {
    return Attr(std::move(name), std::move(value), Mode::Set, std::string());
}

Attr Attr::set(std::string name, long long value) {
    return set(std::move(name), std::to_string(value));
}

Attr Attr::yes(std::string name) {
    return set(std::move(name), std::string());
}

Attr Attr::append(std::string name, std::string value, std::string separator) {
    return Attr(std::move(name), std::move(value), Mode::Append, std::move(separator));
}

Attr Attr::id(std::string value) {
    return set("id", std::move(value));
}

Attr Attr::class_(std::string value) {
    return append("class", std::move(value), " ");
}

Attr Attr::data(std::string_view name, std::string value) {
    std::string full = "data-";
    full += name;
    return set(std::move(full), std::move(value));
}

void Attr::apply_to(Element& element) const {
    if (mode_ == Mode::Append) {
        if (auto existing = element.attribute(name_)) {
            element.set_attribute(name_, *existing + separator_ + value_);
            return;
        }
    }
    element.set_attribute(name_, value_);
}

} // namespace sprig::html
