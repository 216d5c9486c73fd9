#pragma once
#include <sprig/html/element.h>
#include <utility>

// Defines `fn(components...)` returning an element named `tag` of the given
// ElementKind, with every component applied in order.
#define SPRIG_DEFINE_ELEMENT(fn, tag, kind)                                     \
    template<typename... Components>                                           \
    ::sprig::html::Element fn(Components&&... components) {                    \
        return ::sprig::html::Element(tag, ::sprig::html::ElementKind::kind)   \
            .with(std::forward<Components>(components)...);                    \
    }

// Constructors for every non-deprecated HTML element.
// https://developer.mozilla.org/en-US/docs/Web/HTML/Element
namespace sprig::html::tags {

// Main root
SPRIG_DEFINE_ELEMENT(html, "html", Normal)

// Document metadata
SPRIG_DEFINE_ELEMENT(base, "base", Void)
SPRIG_DEFINE_ELEMENT(head, "head", Normal)
SPRIG_DEFINE_ELEMENT(link, "link", Void)
SPRIG_DEFINE_ELEMENT(meta, "meta", Void)
SPRIG_DEFINE_ELEMENT(style, "style", RawText)
SPRIG_DEFINE_ELEMENT(title, "title", EscapableRawText)

// Sectioning root
SPRIG_DEFINE_ELEMENT(body, "body", Normal)

// Content sectioning
SPRIG_DEFINE_ELEMENT(address, "address", Normal)
SPRIG_DEFINE_ELEMENT(article, "article", Normal)
SPRIG_DEFINE_ELEMENT(aside, "aside", Normal)
SPRIG_DEFINE_ELEMENT(footer, "footer", Normal)
SPRIG_DEFINE_ELEMENT(header, "header", Normal)
SPRIG_DEFINE_ELEMENT(h1, "h1", Normal)
SPRIG_DEFINE_ELEMENT(h2, "h2", Normal)
SPRIG_DEFINE_ELEMENT(h3, "h3", Normal)
SPRIG_DEFINE_ELEMENT(h4, "h4", Normal)
SPRIG_DEFINE_ELEMENT(h5, "h5", Normal)
SPRIG_DEFINE_ELEMENT(h6, "h6", Normal)
SPRIG_DEFINE_ELEMENT(hgroup, "hgroup", Normal)
SPRIG_DEFINE_ELEMENT(main, "main", Normal)
SPRIG_DEFINE_ELEMENT(nav, "nav", Normal)
SPRIG_DEFINE_ELEMENT(section, "section", Normal)
SPRIG_DEFINE_ELEMENT(search, "search", Normal)

// Text content
SPRIG_DEFINE_ELEMENT(blockquote, "blockquote", Normal)
SPRIG_DEFINE_ELEMENT(dd, "dd", Normal)
SPRIG_DEFINE_ELEMENT(div, "div", Normal)
SPRIG_DEFINE_ELEMENT(dl, "dl", Normal)
SPRIG_DEFINE_ELEMENT(dt, "dt", Normal)
SPRIG_DEFINE_ELEMENT(figcaption, "figcaption", Normal)
SPRIG_DEFINE_ELEMENT(figure, "figure", Normal)
SPRIG_DEFINE_ELEMENT(hr, "hr", Void)
SPRIG_DEFINE_ELEMENT(li, "li", Normal)
SPRIG_DEFINE_ELEMENT(menu, "menu", Normal)
SPRIG_DEFINE_ELEMENT(ol, "ol", Normal)
SPRIG_DEFINE_ELEMENT(p, "p", Normal)
SPRIG_DEFINE_ELEMENT(pre, "pre", Normal)
SPRIG_DEFINE_ELEMENT(ul, "ul", Normal)

// Inline text semantics
SPRIG_DEFINE_ELEMENT(a, "a", Normal)
SPRIG_DEFINE_ELEMENT(abbr, "abbr", Normal)
SPRIG_DEFINE_ELEMENT(b, "b", Normal)
SPRIG_DEFINE_ELEMENT(bdi, "bdi", Normal)
SPRIG_DEFINE_ELEMENT(bdo, "bdo", Normal)
SPRIG_DEFINE_ELEMENT(br, "br", Void)
SPRIG_DEFINE_ELEMENT(cite, "cite", Normal)
SPRIG_DEFINE_ELEMENT(code, "code", Normal)
SPRIG_DEFINE_ELEMENT(data, "data", Normal)
SPRIG_DEFINE_ELEMENT(dfn, "dfn", Normal)
SPRIG_DEFINE_ELEMENT(em, "em", Normal)
SPRIG_DEFINE_ELEMENT(i, "i", Normal)
SPRIG_DEFINE_ELEMENT(kbd, "kbd", Normal)
SPRIG_DEFINE_ELEMENT(mark, "mark", Normal)
SPRIG_DEFINE_ELEMENT(q, "q", Normal)
SPRIG_DEFINE_ELEMENT(rp, "rp", Normal)
SPRIG_DEFINE_ELEMENT(rt, "rt", Normal)
SPRIG_DEFINE_ELEMENT(ruby, "ruby", Normal)
SPRIG_DEFINE_ELEMENT(s, "s", Normal)
SPRIG_DEFINE_ELEMENT(samp, "samp", Normal)
SPRIG_DEFINE_ELEMENT(small, "small", Normal)
SPRIG_DEFINE_ELEMENT(span, "span", Normal)
SPRIG_DEFINE_ELEMENT(strong, "strong", Normal)
SPRIG_DEFINE_ELEMENT(sub, "sub", Normal)
SPRIG_DEFINE_ELEMENT(sup, "sup", Normal)
SPRIG_DEFINE_ELEMENT(time, "time", Normal)
SPRIG_DEFINE_ELEMENT(u, "u", Normal)
SPRIG_DEFINE_ELEMENT(var, "var", Normal)
SPRIG_DEFINE_ELEMENT(wbr, "wbr", Void)

// Image and multimedia
SPRIG_DEFINE_ELEMENT(area, "area", Void)
SPRIG_DEFINE_ELEMENT(audio, "audio", Normal)
SPRIG_DEFINE_ELEMENT(img, "img", Void)
SPRIG_DEFINE_ELEMENT(map, "map", Normal)
SPRIG_DEFINE_ELEMENT(track, "track", Void)
SPRIG_DEFINE_ELEMENT(video, "video", Normal)

// Embedded content
SPRIG_DEFINE_ELEMENT(embed, "embed", Void)
SPRIG_DEFINE_ELEMENT(fencedframe, "fencedframe", Normal)
SPRIG_DEFINE_ELEMENT(iframe, "iframe", Normal)
SPRIG_DEFINE_ELEMENT(object, "object", Normal)
SPRIG_DEFINE_ELEMENT(picture, "picture", Normal)
SPRIG_DEFINE_ELEMENT(portal, "portal", Normal)
SPRIG_DEFINE_ELEMENT(source, "source", Void)

// SVG and MathML
SPRIG_DEFINE_ELEMENT(svg, "svg", Foreign)
SPRIG_DEFINE_ELEMENT(math, "math", Foreign)

// Scripting
SPRIG_DEFINE_ELEMENT(canvas, "canvas", Normal)
SPRIG_DEFINE_ELEMENT(noscript, "noscript", Normal)
SPRIG_DEFINE_ELEMENT(script, "script", RawText)

// Demarcating edits
SPRIG_DEFINE_ELEMENT(del, "del", Normal)
SPRIG_DEFINE_ELEMENT(ins, "ins", Normal)

// Table content
SPRIG_DEFINE_ELEMENT(caption, "caption", Normal)
SPRIG_DEFINE_ELEMENT(col, "col", Void)
SPRIG_DEFINE_ELEMENT(colgroup, "colgroup", Normal)
SPRIG_DEFINE_ELEMENT(table, "table", Normal)
SPRIG_DEFINE_ELEMENT(tbody, "tbody", Normal)
SPRIG_DEFINE_ELEMENT(td, "td", Normal)
SPRIG_DEFINE_ELEMENT(tfoot, "tfoot", Normal)
SPRIG_DEFINE_ELEMENT(th, "th", Normal)
SPRIG_DEFINE_ELEMENT(thead, "thead", Normal)
SPRIG_DEFINE_ELEMENT(tr, "tr", Normal)

// Forms
SPRIG_DEFINE_ELEMENT(button, "button", Normal)
SPRIG_DEFINE_ELEMENT(datalist, "datalist", Normal)
SPRIG_DEFINE_ELEMENT(fieldset, "fieldset", Normal)
SPRIG_DEFINE_ELEMENT(form, "form", Normal)
SPRIG_DEFINE_ELEMENT(input, "input", Void)
SPRIG_DEFINE_ELEMENT(label, "label", Normal)
SPRIG_DEFINE_ELEMENT(legend, "legend", Normal)
SPRIG_DEFINE_ELEMENT(meter, "meter", Normal)
SPRIG_DEFINE_ELEMENT(optgroup, "optgroup", Normal)
SPRIG_DEFINE_ELEMENT(option, "option", Normal)
SPRIG_DEFINE_ELEMENT(output, "output", Normal)
SPRIG_DEFINE_ELEMENT(progress, "progress", Normal)
SPRIG_DEFINE_ELEMENT(select, "select", Normal)
SPRIG_DEFINE_ELEMENT(textarea, "textarea", EscapableRawText)

// Interactive elements
SPRIG_DEFINE_ELEMENT(details, "details", Normal)
SPRIG_DEFINE_ELEMENT(dialog, "dialog", Normal)
SPRIG_DEFINE_ELEMENT(summary, "summary", Normal)

// Web Components
SPRIG_DEFINE_ELEMENT(slot, "slot", Normal)
SPRIG_DEFINE_ELEMENT(template_, "template", Template)

} // namespace sprig::html::tags
