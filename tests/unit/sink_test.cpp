#include <sprig/html/sink.h>
#include <sprig/html/render.h>
#include <sprig/html/tags.h>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <utility>

using namespace sprig::html;
using namespace sprig::html::tags;

namespace {

// Accepts writes until it sees one containing `poison`.
class PoisonSink : public Sink {
public:
    explicit PoisonSink(std::string poison) : poison_(std::move(poison)) {}

    bool write(std::string_view data) override {
        if (data.find(poison_) != std::string_view::npos) {
            rejected_ = true;
            return false;
        }
        if (rejected_) {
            ++writes_after_reject_;
        }
        accepted_.append(data);
        return true;
    }

    const std::string& accepted() const { return accepted_; }
    int writes_after_reject() const { return writes_after_reject_; }

private:
    std::string poison_;
    std::string accepted_;
    bool rejected_ = false;
    int writes_after_reject_ = 0;
};

} // namespace

// ---------------------------------------------------------------------------
// 1. StringSink
// ---------------------------------------------------------------------------
TEST(StringSink, AppendsEveryWrite) {
    StringSink sink;
    EXPECT_TRUE(sink.write("<p"));
    EXPECT_TRUE(sink.write(""));
    EXPECT_TRUE(sink.write(">"));
    EXPECT_EQ(sink.str(), "<p>");
    EXPECT_EQ(sink.take(), "<p>");
}

TEST(StringSink, RenderIntoExistingBuffer) {
    StringSink sink;
    sink.write("prefix:");
    render(p("x"), sink);
    render(Content::comment("y"), sink);
    EXPECT_EQ(sink.str(), "prefix:<p>x</p><!--y-->");
}

// ---------------------------------------------------------------------------
// 2. StreamSink
// ---------------------------------------------------------------------------
TEST(StreamSink, WritesThrough) {
    std::ostringstream out;
    render(html(body("a & b")).into_document(), out);
    EXPECT_EQ(out.str(), "<!DOCTYPE html><html><body>a &amp; b</body></html>");
}

TEST(StreamSink, FailedStreamRaisesFormat) {
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    StreamSink sink(out);
    EXPECT_FALSE(sink.write("x"));

    try {
        render(div(), sink);
        FAIL() << "expected RenderError";
    } catch (const RenderError& e) {
        EXPECT_EQ(e.cause(), ErrorCause::Format);
        EXPECT_EQ(e.path(), "/");
    }
}

// ---------------------------------------------------------------------------
// 3. Sink failures inside the tree
// ---------------------------------------------------------------------------
TEST(SinkFailure, PathPointsAtFailingChild) {
    PoisonSink sink("boom");
    try {
        render(div(span("ok"), p("boom")), sink);
        FAIL() << "expected RenderError";
    } catch (const RenderError& e) {
        EXPECT_EQ(e.cause(), ErrorCause::Format);
        EXPECT_EQ(e.path(), "/1(p)/0");
        EXPECT_STREQ(e.what(), "Render error at /1(p)/0: sink rejected write");
    }
    EXPECT_EQ(sink.accepted(), "<div><span>ok</span><p>");
    EXPECT_EQ(sink.writes_after_reject(), 0);
}

TEST(SinkFailure, AttributeWriteFailure) {
    PoisonSink sink("secret");
    EXPECT_THROW(render(div(Attr::set("title", "secret")), sink), RenderError);
    EXPECT_EQ(sink.writes_after_reject(), 0);
}
