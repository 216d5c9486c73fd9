#pragma once
#include <cstddef>

namespace sprig::core::config {

inline constexpr const char kDoctype[] = "<!DOCTYPE html>";

inline constexpr const char kHtmlContentType[] = "text/html; charset=utf-8";
inline constexpr const char kErrorContentType[] = "text/plain; charset=utf-8";

// Bodies smaller than this are not worth a gzip round trip.
inline constexpr std::size_t kDefaultGzipMinBytes = 1024;
inline constexpr int kDefaultGzipLevel = 6;

} // namespace sprig::core::config
