#include <sprig/html/sink.h>

namespace sprig::html {

bool StringSink::write(std::string_view data) {
    buffer_.append(data);
    return true;
}

bool StreamSink::write(std::string_view data) {
    if (!stream_) {
        return false;
    }
    stream_.write(data.data(), static_cast<std::streamsize>(data.size()));
    return static_cast<bool>(stream_);
}

} // namespace sprig::html
