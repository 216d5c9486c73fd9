#include <sprig/net/html_response.h>
#include <sprig/html/render.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

namespace sprig::net {

namespace {

constexpr const char kModule[] = "html_response";
constexpr const char kStage[] = "render";

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

void emit(core::DiagnosticEmitter* diagnostics, core::Severity severity,
          const std::string& message) {
    if (diagnostics) {
        diagnostics->emit(severity, kModule, kStage, message);
    }
}

Response error_response(const html::RenderError& error) {
    Response response;
    response.status = 500;
    response.status_text = "Internal Server Error";
    response.headers.set("content-type", core::config::kErrorContentType);
    std::string message = error.what();
    response.body.assign(message.begin(), message.end());
    return response;
}

} // anonymous namespace

bool accepts_gzip(const std::string& accept_encoding) {
    std::istringstream list(accept_encoding);
    std::string item;
    while (std::getline(list, item, ',')) {
        std::string coding = item;
        double quality = 1.0;

        auto semi = item.find(';');
        if (semi != std::string::npos) {
            coding = item.substr(0, semi);
            std::string params = lowercase(trim(item.substr(semi + 1)));
            if (params.rfind("q=", 0) == 0) {
                quality = std::strtod(params.c_str() + 2, nullptr);
            }
        }

        coding = lowercase(trim(coding));
        if ((coding == "gzip" || coding == "*") && quality > 0.0) {
            return true;
        }
    }
    return false;
}

Response html_response(const html::Document& document,
                       const HtmlResponseOptions& options,
                       core::DiagnosticEmitter* diagnostics) {
    std::string page;
    try {
        page = html::render_to_string(document);
    } catch (const html::RenderError& e) {
        emit(diagnostics, core::Severity::Error, e.what());
        return error_response(e);
    }

    Response response;
    response.status = 200;
    response.status_text = "OK";
    response.headers.set("content-type", core::config::kHtmlContentType);

    bool gzipped = false;
    if (page.size() >= options.gzip_min_bytes && accepts_gzip(options.accept_encoding)) {
        if (auto compressed = gzip_compress(page, options.gzip_level)) {
            response.body = std::move(*compressed);
            response.headers.set("content-encoding", "gzip");
            response.headers.set("vary", "accept-encoding");
            gzipped = true;
        } else {
            emit(diagnostics, core::Severity::Warning,
                 "gzip compression failed, sending identity body");
        }
    }
    if (!gzipped) {
        response.body.assign(page.begin(), page.end());
    }

    emit(diagnostics, core::Severity::Info,
         "rendered " + std::to_string(page.size()) + " bytes" +
         (gzipped ? " (gzip " + std::to_string(response.body.size()) + " bytes)" : ""));
    return response;
}

} // namespace sprig::net
