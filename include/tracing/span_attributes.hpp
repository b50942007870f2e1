#pragma once

#include <string_view>

namespace haproxyotel::attr {

// OpenTelemetry HTTP semantic conventions
inline constexpr std::string_view kHttpRequestMethod      = "http.request.method";
inline constexpr std::string_view kHttpResponseStatusCode = "http.response.status_code";
inline constexpr std::string_view kHttpRequestHeaderHost  = "http.request.header.host";
inline constexpr std::string_view kUrlPath                = "url.path";
inline constexpr std::string_view kUrlQuery               = "url.query";
inline constexpr std::string_view kNetworkPeerAddress     = "network.peer.address";

// Proxy-specific
inline constexpr std::string_view kServerName       = "haproxy.server.name";
inline constexpr std::string_view kFrontendName     = "haproxy.frontend.name";
inline constexpr std::string_view kBackendName      = "haproxy.backend.name";
inline constexpr std::string_view kTerminationState = "haproxy.termination_state";

} // namespace haproxyotel::attr
