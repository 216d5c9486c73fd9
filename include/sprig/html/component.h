#pragma once
#include <sprig/html/element.h>
#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

// Builder components: everything that can be passed to Element::add(),
// Element::with() or a tag constructor. Composite shapes expand in order.

namespace sprig::html {

void append_to(Element& element, Content content);
void append_to(Element& element, Element child);
void append_to(Element& element, const Attr& attr);

// Plain strings become Text content.
void append_to(Element& element, const char* text);
void append_to(Element& element, std::string text);
void append_to(Element& element, std::string_view text);

template<typename T>
void append_to(Element& element, const std::vector<T>& components);

template<typename T>
void append_to(Element& element, std::vector<T>&& components);

template<typename T, std::size_t N>
void append_to(Element& element, const std::array<T, N>& components);

template<typename T>
void append_to(Element& element, const std::optional<T>& component);

template<typename T>
void append_to(Element& element, std::optional<T>&& component);

template<typename... Ts>
void append_to(Element& element, const std::tuple<Ts...>& components);

template<typename T>
void append_to(Element& element, const std::vector<T>& components) {
    for (const auto& component : components) {
        append_to(element, component);
    }
}

template<typename T>
void append_to(Element& element, std::vector<T>&& components) {
    for (auto& component : components) {
        append_to(element, std::move(component));
    }
}

template<typename T, std::size_t N>
void append_to(Element& element, const std::array<T, N>& components) {
    for (const auto& component : components) {
        append_to(element, component);
    }
}

template<typename T>
void append_to(Element& element, const std::optional<T>& component) {
    if (component) {
        append_to(element, *component);
    }
}

template<typename T>
void append_to(Element& element, std::optional<T>&& component) {
    if (component) {
        append_to(element, std::move(*component));
    }
}

template<typename... Ts>
void append_to(Element& element, const std::tuple<Ts...>& components) {
    std::apply([&element](const auto&... component) {
        (append_to(element, component), ...);
    }, components);
}

} // namespace sprig::html
