#pragma once
#include <sprig/net/header_map.h>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sprig::net {

struct Response {
    uint16_t status = 200;
    std::string status_text = "OK";
    HeaderMap headers;
    std::vector<uint8_t> body;

    std::string body_as_string() const;

    // Body with any gzip/deflate content-encoding removed. Returns the raw
    // body when there is no encoding or it cannot be inflated.
    std::vector<uint8_t> decoded_body() const;

    // HTTP/1.1 wire form. content-length is always taken from body.size().
    std::vector<uint8_t> serialize() const;
};

// gzip-wrapped deflate of `data`. nullopt if zlib reports an error.
std::optional<std::vector<uint8_t>> gzip_compress(std::string_view data, int level);

} // namespace sprig::net
