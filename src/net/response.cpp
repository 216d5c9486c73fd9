#include <sprig/net/response.h>
#include <algorithm>
#include <cctype>
#include <sstream>
#include <zlib.h>

namespace sprig::net {

namespace {

// Try to inflate data with a specific windowBits setting.
// Returns true on success and fills 'output'; false on error.
bool try_inflate(const std::vector<uint8_t>& compressed, int window_bits,
                 std::vector<uint8_t>& output) {
    z_stream strm{};
    if (inflateInit2(&strm, window_bits) != Z_OK) return false;

    strm.avail_in = static_cast<uInt>(compressed.size());
    strm.next_in = const_cast<Bytef*>(compressed.data());

    output.clear();
    output.reserve(compressed.size() * 4);

    uint8_t buffer[32768];
    int ret;
    do {
        strm.avail_out = sizeof(buffer);
        strm.next_out = buffer;
        ret = inflate(&strm, Z_NO_FLUSH);
        if (ret == Z_STREAM_ERROR || ret == Z_DATA_ERROR ||
            ret == Z_MEM_ERROR || ret == Z_NEED_DICT || ret == Z_BUF_ERROR) {
            inflateEnd(&strm);
            return false;
        }
        size_t have = sizeof(buffer) - strm.avail_out;
        output.insert(output.end(), buffer, buffer + have);
    } while (ret != Z_STREAM_END);

    inflateEnd(&strm);
    return true;
}

} // anonymous namespace

std::string Response::body_as_string() const {
    return std::string(body.begin(), body.end());
}

std::vector<uint8_t> Response::decoded_body() const {
    auto ce = headers.get("content-encoding");
    if (!ce.has_value() || body.empty()) {
        return body;
    }

    std::string encoding = *ce;
    std::transform(encoding.begin(), encoding.end(), encoding.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (encoding.find("gzip") == std::string::npos &&
        encoding.find("deflate") == std::string::npos) {
        return body;
    }

    std::vector<uint8_t> result;
    // 15 + 32 enables automatic gzip / zlib-wrapped deflate detection
    if (try_inflate(body, 15 + 32, result)) {
        return result;
    }
    if (try_inflate(body, -15, result)) {
        return result;
    }
    return body;
}

std::vector<uint8_t> Response::serialize() const {
    std::ostringstream oss;
    oss << "HTTP/1.1 " << status << " " << status_text << "\r\n";
    for (const auto& [name, value] : headers) {
        if (name == "content-length") continue;
        oss << name << ": " << value << "\r\n";
    }
    oss << "content-length: " << body.size() << "\r\n";
    oss << "\r\n";

    std::string head = oss.str();
    std::vector<uint8_t> out(head.begin(), head.end());
    out.insert(out.end(), body.begin(), body.end());
    return out;
}

std::optional<std::vector<uint8_t>> gzip_compress(std::string_view data, int level) {
    z_stream strm{};
    // 15 + 16 selects the gzip wrapper
    if (deflateInit2(&strm, level, Z_DEFLATED, 15 + 16, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        return std::nullopt;
    }

    strm.avail_in = static_cast<uInt>(data.size());
    strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));

    std::vector<uint8_t> output;
    output.reserve(deflateBound(&strm, static_cast<uLong>(data.size())));

    uint8_t buffer[32768];
    int ret;
    do {
        strm.avail_out = sizeof(buffer);
        strm.next_out = buffer;
        ret = deflate(&strm, Z_FINISH);
        if (ret == Z_STREAM_ERROR) {
            deflateEnd(&strm);
            return std::nullopt;
        }
        size_t have = sizeof(buffer) - strm.avail_out;
        output.insert(output.end(), buffer, buffer + have);
    } while (ret != Z_STREAM_END);

    deflateEnd(&strm);
    return output;
}

} // namespace sprig::net
