#pragma once
#include <sprig/html/element.h>
#include <string>
#include <string_view>
#include <utility>

// Helpers for common attributes. Attributes that hold token lists append to
// an existing value instead of replacing it.
// https://developer.mozilla.org/en-US/docs/Web/HTML/Attributes
namespace sprig::html::attrs {

inline Attr accesskey(std::string value) { return Attr::append("accesskey", std::move(value), " "); }
inline Attr action(std::string value) { return Attr::set("action", std::move(value)); }
inline Attr alt(std::string value) { return Attr::set("alt", std::move(value)); }
inline Attr async_() { return Attr::yes("async"); }
inline Attr autocomplete(std::string value) { return Attr::append("autocomplete", std::move(value), " "); }
inline Attr autofocus() { return Attr::yes("autofocus"); }
inline Attr charset(std::string value) { return Attr::set("charset", std::move(value)); }
inline Attr checked() { return Attr::yes("checked"); }
inline Attr class_(std::string value) { return Attr::append("class", std::move(value), " "); }
inline Attr content(std::string value) { return Attr::set("content", std::move(value)); }
inline Attr defer() { return Attr::yes("defer"); }
inline Attr dir(std::string value) { return Attr::set("dir", std::move(value)); }
inline Attr disabled() { return Attr::yes("disabled"); }
inline Attr for_(std::string value) { return Attr::set("for", std::move(value)); }
inline Attr height(std::string value) { return Attr::set("height", std::move(value)); }
inline Attr height(long long value) { return Attr::set("height", value); }
inline Attr hidden() { return Attr::yes("hidden"); }
inline Attr href(std::string value) { return Attr::set("href", std::move(value)); }
inline Attr id(std::string value) { return Attr::set("id", std::move(value)); }
inline Attr lang(std::string value) { return Attr::set("lang", std::move(value)); }
inline Attr max(std::string value) { return Attr::set("max", std::move(value)); }
inline Attr max(long long value) { return Attr::set("max", value); }
inline Attr method(std::string value) { return Attr::set("method", std::move(value)); }
inline Attr min(std::string value) { return Attr::set("min", std::move(value)); }
inline Attr min(long long value) { return Attr::set("min", value); }
inline Attr multiple() { return Attr::yes("multiple"); }
inline Attr name(std::string value) { return Attr::set("name", std::move(value)); }
inline Attr placeholder(std::string value) { return Attr::set("placeholder", std::move(value)); }
inline Attr readonly() { return Attr::yes("readonly"); }
inline Attr rel(std::string value) { return Attr::append("rel", std::move(value), " "); }
inline Attr required() { return Attr::yes("required"); }
inline Attr selected() { return Attr::yes("selected"); }
inline Attr src(std::string value) { return Attr::set("src", std::move(value)); }
inline Attr style(std::string value) { return Attr::append("style", std::move(value), "; "); }
inline Attr tabindex(std::string value) { return Attr::set("tabindex", std::move(value)); }
inline Attr tabindex(long long value) { return Attr::set("tabindex", value); }
inline Attr target(std::string value) { return Attr::set("target", std::move(value)); }
inline Attr title(std::string value) { return Attr::set("title", std::move(value)); }
inline Attr type(std::string value) { return Attr::set("type", std::move(value)); }
inline Attr value(std::string value) { return Attr::set("value", std::move(value)); }
inline Attr width(std::string value) { return Attr::set("width", std::move(value)); }
inline Attr width(long long value) { return Attr::set("width", value); }

// data-* attributes
inline Attr data(std::string_view name, std::string value) { return Attr::data(name, std::move(value)); }

} // namespace sprig::html::attrs
