#include <sprig/html/render.h>
#include <sprig/html/tags.h>
#include <sprig/html/attrs.h>
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace sprig::html;
using namespace sprig::html::tags;

namespace {

// Runs `fn` and returns the RenderError it throws.
template<typename Fn>
RenderError expect_render_error(Fn&& fn) {
    try {
        fn();
    } catch (const RenderError& e) {
        return e;
    }
    ADD_FAILURE() << "expected RenderError";
    return RenderError(ErrorCause::Format);
}

} // namespace

// ---------------------------------------------------------------------------
// 1. Whole documents
// ---------------------------------------------------------------------------
TEST(HtmlRender, SimpleWebsite) {
    std::string page = render_to_string(
        html(
            head(title("Hello")),
            body(h1("Hello"), p("Hello ", em("world"), "!")))
        .into_document());

    EXPECT_EQ(page,
              "<!DOCTYPE html><html>"
              "<head><title>Hello</title></head>"
              "<body><h1>Hello</h1><p>Hello <em>world</em>!</p></body>"
              "</html>");
}

TEST(HtmlRender, DocumentIsDoctypeThenRoot) {
    Document doc = html().into_document();
    std::vector<Content> equivalent = {Content::doctype(), Content::from_element(html())};
    EXPECT_EQ(render_to_string(doc), render_to_string(equivalent));
    EXPECT_EQ(render_to_string(doc), "<!DOCTYPE html><html></html>");
}

TEST(HtmlRender, RenderingIsDeterministic) {
    Document doc = html(
        Attr::set("lang", "en"),
        body(Attr::set("class", "x"), Attr::set("id", "y"), div("a", Content::comment("b")))
    ).into_document();
    EXPECT_EQ(render_to_string(doc), render_to_string(doc));
}

// ---------------------------------------------------------------------------
// 2. Void elements
// ---------------------------------------------------------------------------
TEST(HtmlRender, VoidAndNormalEmptyForms) {
    EXPECT_EQ(render_to_string(head()), "<head></head>");
    EXPECT_EQ(render_to_string(input()), "<input>");
    EXPECT_EQ(render_to_string(br()), "<br>");
}

TEST(HtmlRender, VoidWithAnyChildFails) {
    for (Content child : {Content::raw(""), Content::text("x"), Content::comment("c"),
                          Content::from_element(p())}) {
        Element el = input();
        el.append_child(child);
        RenderError e = expect_render_error([&] { render_to_string(el); });
        EXPECT_EQ(e.cause(), ErrorCause::InvalidChild);
    }
}

TEST(HtmlRender, VoidWithElementChildPath) {
    RenderError e = expect_render_error([] { render_to_string(input(p())); });
    EXPECT_EQ(e.cause(), ErrorCause::InvalidChild);
    EXPECT_EQ(e.path(), "/0(p)");
}

// ---------------------------------------------------------------------------
// 3. Raw text elements
// ---------------------------------------------------------------------------
TEST(HtmlRender, RawTextIsNotEscaped) {
    EXPECT_EQ(render_to_string(script("foo <script> & </style> bar")),
              "<script>foo <script> & </style> bar</script>");
    EXPECT_EQ(render_to_string(style("a > b { color: red }")),
              "<style>a > b { color: red }</style>");
}

TEST(HtmlRender, RawTextClosingTagFails) {
    RenderError e = expect_render_error([] { render_to_string(script("hello </script> world")); });
    EXPECT_EQ(e.cause(), ErrorCause::InvalidRawText);
    EXPECT_EQ(e.detail(), "hello </script> world");
    EXPECT_EQ(e.path(), "/0");

    EXPECT_THROW(render_to_string(script("hello </ScRiPt ... world")), RenderError);
}

TEST(HtmlRender, RawTextUnterminatedClosingTagAtEnd) {
    EXPECT_EQ(render_to_string(script("x </script")), "<script>x </script</script>");
}

TEST(HtmlRender, RawTextAcceptsRawContent) {
    Element el = script(Content::raw("</script><b>"));
    EXPECT_EQ(render_to_string(el), "<script></script><b></script>");
}

TEST(HtmlRender, RawTextRejectsCommentsAndElements) {
    RenderError comment = expect_render_error([] { render_to_string(script(Content::comment("c"))); });
    EXPECT_EQ(comment.cause(), ErrorCause::InvalidChild);
    EXPECT_EQ(comment.path(), "/0");

    RenderError element = expect_render_error([] { render_to_string(style("ok", span())); });
    EXPECT_EQ(element.cause(), ErrorCause::InvalidChild);
    EXPECT_EQ(element.path(), "/1(span)");
}

// ---------------------------------------------------------------------------
// 4. Escapable raw text elements
// ---------------------------------------------------------------------------
TEST(HtmlRender, EscapableRawTextIsEscaped) {
    EXPECT_EQ(render_to_string(textarea("foo <p> & bar")),
              "<textarea>foo &lt;p&gt; &amp; bar</textarea>");
}

TEST(HtmlRender, EscapableRawTextHasNoClosingTagCheck) {
    EXPECT_EQ(render_to_string(title("</title>")), "<title>&lt;/title&gt;</title>");
    EXPECT_EQ(render_to_string(textarea(Content::raw("<b>"))), "<textarea><b></textarea>");
}

TEST(HtmlRender, EscapableRawTextRejectsElements) {
    EXPECT_THROW(render_to_string(textarea(p())), RenderError);
    RenderError e = expect_render_error([] { render_to_string(title(Content::comment("x"))); });
    EXPECT_EQ(e.cause(), ErrorCause::InvalidChild);
}

// ---------------------------------------------------------------------------
// 5. Foreign and template elements
// ---------------------------------------------------------------------------
TEST(HtmlRender, ForeignEmptySelfCloses) {
    EXPECT_EQ(render_to_string(Element("circle", ElementKind::Foreign)), "<circle />");
    Element path("path", ElementKind::Foreign);
    path.set_attribute("d", "M0 0");
    EXPECT_EQ(render_to_string(path), "<path d=\"M0 0\" />");
}

TEST(HtmlRender, ForeignChildrenAreRenderedLikeNormal) {
    Element text = Element("text", ElementKind::Foreign).with("a < b", Content::comment("c"));
    EXPECT_EQ(render_to_string(text), "<text>a &lt; b<!--c--></text>");
}

TEST(HtmlRender, TemplateBehavesLikeNormal) {
    EXPECT_EQ(render_to_string(template_()), "<template></template>");
    EXPECT_EQ(render_to_string(template_(li("x & y"))), "<template><li>x &amp; y</li></template>");
}

// ---------------------------------------------------------------------------
// 6. Attributes
// ---------------------------------------------------------------------------
TEST(HtmlRender, AttributesInSortedOrder) {
    Element el = input(
        Attr::set("name", "tentacles"),
        Attr::set("type", "number"),
        Attr::set("min", 10),
        Attr::set("max", 100));
    EXPECT_EQ(render_to_string(el), R"(<input max="100" min="10" name="tentacles" type="number">)");
}

TEST(HtmlRender, EmptyValueUsesShorthand) {
    EXPECT_EQ(render_to_string(input(Attr::set("name", "horns"), Attr::yes("checked"))),
              R"(<input checked name="horns">)");
}

TEST(HtmlRender, AttributeValueEscapesOnlyQuotes) {
    Element el = div(Attr::set("title", R"(say "hi" & <bye>)"));
    EXPECT_EQ(render_to_string(el), R"(<div title="say &quot;hi&quot; & <bye>"></div>)");
}

TEST(HtmlRender, AlwaysLowercase) {
    EXPECT_EQ(render_to_string(Element::normal("HTML").with(Attr::set("LANG", "EN"))),
              R"(<html lang="EN"></html>)");
}

TEST(HtmlRender, InvalidAttributeNameFails) {
    Element el = div();
    el.set_attribute("b c", "1");
    el.set_attribute("a b", "2");
    RenderError e = expect_render_error([&] { render_to_string(el); });
    EXPECT_EQ(e.cause(), ErrorCause::InvalidAttrName);
    EXPECT_EQ(e.detail(), "a b");
    EXPECT_EQ(e.path(), "/");
}

TEST(HtmlRender, InvalidTagNameFails) {
    RenderError e = expect_render_error([] { render_to_string(Element::normal("my-el")); });
    EXPECT_EQ(e.cause(), ErrorCause::InvalidTagName);
    EXPECT_EQ(e.detail(), "my-el");

    RenderError nested = expect_render_error([] {
        render_to_string(div(span(), Element::normal("1x")));
    });
    EXPECT_EQ(nested.path(), "/1(1x)");
}

// ---------------------------------------------------------------------------
// 7. Text, raw and comment content
// ---------------------------------------------------------------------------
TEST(HtmlRender, TextIsEscaped) {
    EXPECT_EQ(render_to_string(p("a < b && c > d \"q\" 'a'")),
              "<p>a &lt; b &amp;&amp; c &gt; d \"q\" 'a'</p>");
}

TEST(HtmlRender, RawIsVerbatim) {
    EXPECT_EQ(render_to_string(p(Content::raw("<b>&amp;</b>"))), "<p><b>&amp;</b></p>");
}

TEST(HtmlRender, CommentsAreDelimitedAndMangled) {
    EXPECT_EQ(render_to_string(div(Content::comment("note"))), "<div><!--note--></div>");
    EXPECT_EQ(render_to_string(div(Content::comment("a --> b"))), "<div><!--a ==> b--></div>");
}

TEST(HtmlRender, ContentRendersAlone) {
    EXPECT_EQ(render_to_string(Content::text("&")), "&amp;");
    EXPECT_EQ(render_to_string(Content::raw("&")), "&");
    EXPECT_EQ(render_to_string(Content::comment("x")), "<!--x-->");
}

// ---------------------------------------------------------------------------
// 8. Error paths
// ---------------------------------------------------------------------------
TEST(HtmlRender, FormInputPath) {
    RenderError e = expect_render_error([] {
        render_to_string(form("greeting: ", input("hello")));
    });
    EXPECT_EQ(e.cause(), ErrorCause::InvalidChild);
    EXPECT_EQ(e.path(), "/1(input)/0");
}

TEST(HtmlRender, DeepPathThroughDocument) {
    Document doc = html(head(), body(div("x", ul(li(), li(script("</script>")))))).into_document();
    RenderError e = expect_render_error([&] { render_to_string(doc); });
    EXPECT_EQ(e.cause(), ErrorCause::InvalidRawText);
    EXPECT_EQ(e.path(), "/1(body)/0(div)/1(ul)/1(li)/0(script)/0");
}

// ---------------------------------------------------------------------------
// 9. Escaping helpers
// ---------------------------------------------------------------------------
TEST(HtmlEscape, Text) {
    EXPECT_EQ(escape_text(""), "");
    EXPECT_EQ(escape_text("plain"), "plain");
    EXPECT_EQ(escape_text("<&>"), "&lt;&amp;&gt;");
    EXPECT_EQ(escape_text("&amp;"), "&amp;amp;");
    EXPECT_EQ(escape_text("caf\xc3\xa9 \"'"), "caf\xc3\xa9 \"'");
}

TEST(HtmlEscape, AttributeValue) {
    EXPECT_EQ(escape_attribute_value(""), "\"\"");
    EXPECT_EQ(escape_attribute_value("a\"b"), "\"a&quot;b\"");
    EXPECT_EQ(escape_attribute_value("<&>'"), "\"<&>'\"");
}

TEST(HtmlEscape, CommentReplacements) {
    EXPECT_EQ(escape_comment("hello"), "hello");
    EXPECT_EQ(escape_comment("<!--x"), "<!==x");
    EXPECT_EQ(escape_comment("x-->"), "x==>");
    EXPECT_EQ(escape_comment("x--!>"), "x==!>");
    EXPECT_EQ(escape_comment("<!-->"), "<!==>");
}

TEST(HtmlEscape, CommentEdges) {
    EXPECT_EQ(escape_comment(">x"), " >x");
    EXPECT_EQ(escape_comment("->x"), " ->x");
    EXPECT_EQ(escape_comment("x<!-"), "x<!- ");
    EXPECT_EQ(escape_comment("-->"), "==>");
    EXPECT_EQ(escape_comment(""), "");
}
