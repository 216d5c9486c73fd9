#pragma once
#include <sprig/core/config.h>
#include <sprig/core/diagnostics.h>
#include <sprig/html/element.h>
#include <sprig/net/response.h>
#include <cstddef>
#include <string>

namespace sprig::net {

struct HtmlResponseOptions {
    // Accept-Encoding value from the request; empty means identity only.
    std::string accept_encoding;
    size_t gzip_min_bytes = core::config::kDefaultGzipMinBytes;
    int gzip_level = core::config::kDefaultGzipLevel;
};

// Renders `document` into a 200 text/html response, or a 500 text/plain
// response carrying the render error's message. Only whole documents are
// accepted so a doctype-less fragment cannot be served by accident.
//
// When `diagnostics` is non-null the outcome is reported there under module
// "html_response", stage "render".
Response html_response(const html::Document& document,
                       const HtmlResponseOptions& options = {},
                       core::DiagnosticEmitter* diagnostics = nullptr);

// True if an Accept-Encoding value allows gzip ("gzip" or "*" with a
// non-zero q value).
bool accepts_gzip(const std::string& accept_encoding);

} // namespace sprig::net
