#pragma once
#include <ostream>
#include <string>
#include <string_view>

namespace sprig::html {

// Append-only destination for rendered text. write() returns false when the
// data could not be accepted; the renderer then aborts with a Format error.
class Sink {
public:
    virtual ~Sink() = default;
    virtual bool write(std::string_view data) = 0;
};

class StringSink : public Sink {
public:
    bool write(std::string_view data) override;

    const std::string& str() const { return buffer_; }
    std::string take() { return std::move(buffer_); }

private:
    std::string buffer_;
};

// Writes through to a std::ostream; a stream in a failed state rejects writes.
class StreamSink : public Sink {
public:
    explicit StreamSink(std::ostream& stream) : stream_(stream) {}

    bool write(std::string_view data) override;

private:
    std::ostream& stream_;
};

} // namespace sprig::html
