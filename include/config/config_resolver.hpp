#pragma once

#include "config/config_types.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace haproxyotel {

/// Reads one override variable; nullopt when unset
using EnvLookup = std::function<std::optional<std::string>(std::string_view)>;

/// EnvLookup backed by the process environment
[[nodiscard]] EnvLookup process_env();

// Override variable names
inline constexpr std::string_view kEnvTracesProtocol = "OTEL_EXPORTER_OTLP_TRACES_PROTOCOL";
inline constexpr std::string_view kEnvProtocol       = "OTEL_EXPORTER_OTLP_PROTOCOL";
inline constexpr std::string_view kEnvTracesEndpoint = "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT";
inline constexpr std::string_view kEnvEndpoint       = "OTEL_EXPORTER_OTLP_ENDPOINT";
inline constexpr std::string_view kEnvTracesSampler  = "OTEL_TRACES_SAMPLER";
inline constexpr std::string_view kEnvPropagators    = "OTEL_PROPAGATORS";
inline constexpr std::string_view kEnvLogLevel       = "OTEL_LOG_LEVEL";
inline constexpr std::string_view kEnvServiceName    = "OTEL_SERVICE_NAME";

inline constexpr std::string_view kDefaultServiceName  = "haproxy";
inline constexpr std::string_view kDefaultHttpEndpoint = "http://localhost:4318";
inline constexpr std::string_view kDefaultGrpcEndpoint = "http://localhost:4317";
inline constexpr std::string_view kTracesPath          = "v1/traces";

// ============================================================================
// Name parsing (never throws; nullopt = unrecognized)
// ============================================================================

[[nodiscard]] std::optional<Protocol> parse_protocol(std::string_view s);
[[nodiscard]] std::optional<SamplerKind> parse_sampler(std::string_view s);
[[nodiscard]] std::optional<PropagatorKind> parse_propagator(std::string_view s);
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view s);

/**
 * @brief Build the traces URL for a base endpoint
 *
 * HTTP protocols get trailing slashes trimmed and "/v1/traces" appended;
 * gRPC endpoints are returned unchanged.
 */
[[nodiscard]] std::string build_traces_endpoint(std::string_view base, Protocol protocol);

/**
 * @brief Layered configuration resolution
 *
 * Every setting walks the same chain, highest first:
 *   explicit module option > signal-specific override > general override > default
 * An empty or unrecognized value at any layer is skipped. Unrecognized
 * values are reported with a WARN line; resolution itself never fails.
 */
class ConfigResolver {
public:
    explicit ConfigResolver(EnvLookup env = process_env());

    [[nodiscard]] ResolvedConfig resolve(const ModuleOptions& options) const;

    [[nodiscard]] Resolved<std::string> resolve_service_name(const ModuleOptions& options) const;
    [[nodiscard]] Resolved<Protocol> resolve_protocol(const ModuleOptions& options) const;
    [[nodiscard]] Resolved<std::string> resolve_endpoint(const ModuleOptions& options,
                                                         Protocol protocol) const;
    [[nodiscard]] Resolved<SamplerKind> resolve_sampler(const ModuleOptions& options) const;
    [[nodiscard]] Resolved<PropagatorKind> resolve_propagator(const ModuleOptions& options) const;
    [[nodiscard]] Resolved<LogLevel> resolve_log_level(const ModuleOptions& options) const;

private:
    [[nodiscard]] std::optional<std::string> env(std::string_view name) const;

    EnvLookup env_;
};

/// One-line startup diagnostic
[[nodiscard]] std::string describe(const ResolvedConfig& config);

} // namespace haproxyotel
