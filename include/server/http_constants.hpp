#pragma once

#include <string>
#include <string_view>

namespace ingestgate::http {

inline constexpr const char* kJsonContentType = "application/json";
inline constexpr const char* kMetricsContentType = "text/plain; version=0.0.4; charset=utf-8";

inline constexpr std::string_view kServiceName = "ingestgate";
inline constexpr std::string_view kServiceVersion = "1.0.0";

// std::string because cpp-httplib route patterns take const std::string&
inline const std::string kIngestPattern = R"(/ingest/([^/]+))";
inline const std::string kFlushPattern = R"(/flush/([^/]+))";
inline const std::string kTableHealthPattern = R"(/health/([^/]+))";

} // namespace ingestgate::http
