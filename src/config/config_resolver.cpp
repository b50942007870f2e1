#include "config/config_resolver.hpp"
#include "core/utils.hpp"

#include <array>
#include <cstdlib>
#include <format>
#include <unordered_map>

namespace haproxyotel {

namespace {

struct Layer {
    Provenance provenance;
    std::string_view source;                 // for diagnostics
    std::optional<std::string> value;
};

/**
 * @brief Walk the layers in order, returning the first recognized value
 *
 * Empty values count as unset. Non-empty values the parser rejects are
 * logged and skipped so the next layer gets a chance.
 */
template<typename T, typename Parse>
Resolved<T> resolve_layered(std::string_view setting, std::array<Layer, 3> layers,
                            T fallback, Parse parse) {
    for (auto& layer : layers) {
        auto value = utils::non_empty(std::move(layer.value));
        if (!value) continue;

        if (auto parsed = parse(*value)) {
            return {std::move(*parsed), layer.provenance};
        }
        utils::log::warn(std::format("Unrecognized {} '{}' from {}, falling back",
                                     setting, *value, layer.source));
    }
    return {std::move(fallback), Provenance::DEFAULT};
}

std::optional<std::string> identity(const std::string& s) {
    return s;
}

std::string normalize_name(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (const char c : utils::to_lower(s)) {
        if (c != '_' && c != '-' && c != ' ') out += c;
    }
    return out;
}

/// OTEL_PROPAGATORS is a comma list; the first recognized entry wins
std::optional<PropagatorKind> parse_propagator_list(std::string_view s) {
    for (const auto& entry : utils::split(std::string(s), ',')) {
        if (auto kind = parse_propagator(utils::trim(entry))) {
            return kind;
        }
    }
    return std::nullopt;
}

} // anonymous namespace

// ============================================================================
// Environment
// ============================================================================

EnvLookup process_env() {
    return [](std::string_view name) -> std::optional<std::string> {
        const char* value = std::getenv(std::string(name).c_str());
        if (!value) return std::nullopt;
        return std::string(value);
    };
}

// ============================================================================
// Name parsing
// ============================================================================

std::optional<Protocol> parse_protocol(std::string_view s) {
    static const std::unordered_map<std::string, Protocol> lookup = {
        {"grpc",          Protocol::GRPC},
        {"http/protobuf", Protocol::HTTP_PROTOBUF},
        {"http/json",     Protocol::HTTP_JSON},
        // Legacy single-word values
        {"binary",        Protocol::HTTP_PROTOBUF},
        {"json",          Protocol::HTTP_JSON},
    };

    const auto it = lookup.find(utils::to_lower(utils::trim(std::string(s))));
    return (it != lookup.end()) ? std::make_optional(it->second) : std::nullopt;
}

std::optional<SamplerKind> parse_sampler(std::string_view s) {
    static const std::unordered_map<std::string, SamplerKind> lookup = {
        {"alwayson",            SamplerKind::ALWAYS_ON},
        {"alwaysoff",           SamplerKind::ALWAYS_OFF},
        {"parentbased",         SamplerKind::PARENT_BASED},
        {"parentbasedalwayson", SamplerKind::PARENT_BASED},
        {"silenton",            SamplerKind::SILENT_ON},
    };

    const auto it = lookup.find(normalize_name(s));
    return (it != lookup.end()) ? std::make_optional(it->second) : std::nullopt;
}

std::optional<PropagatorKind> parse_propagator(std::string_view s) {
    static const std::unordered_map<std::string, PropagatorKind> lookup = {
        {"w3c",          PropagatorKind::W3C},
        {"tracecontext", PropagatorKind::W3C},
        {"zipkin",       PropagatorKind::ZIPKIN},
        {"b3multi",      PropagatorKind::ZIPKIN},
        {"b3",           PropagatorKind::ZIPKIN},
        {"jaeger",       PropagatorKind::JAEGER},
    };

    const auto it = lookup.find(utils::to_lower(s));
    return (it != lookup.end()) ? std::make_optional(it->second) : std::nullopt;
}

std::optional<LogLevel> parse_log_level(std::string_view s) {
    static const std::unordered_map<std::string, LogLevel> lookup = {
        {"error",   LogLevel::ERROR},
        {"warn",    LogLevel::WARN},
        {"info",    LogLevel::INFO},
        {"debug",   LogLevel::DEBUG},
        // Synonyms
        {"warning", LogLevel::WARN},
        {"trace",   LogLevel::DEBUG},
        {"fatal",   LogLevel::ERROR},
        {"none",    LogLevel::ERROR},
    };

    const auto it = lookup.find(utils::to_lower(utils::trim(std::string(s))));
    return (it != lookup.end()) ? std::make_optional(it->second) : std::nullopt;
}

std::string build_traces_endpoint(std::string_view base, Protocol protocol) {
    if (protocol == Protocol::GRPC) {
        return std::string(base);
    }
    while (!base.empty() && base.back() == '/') {
        base.remove_suffix(1);
    }
    return std::format("{}/{}", base, kTracesPath);
}

// ============================================================================
// ConfigResolver
// ============================================================================

ConfigResolver::ConfigResolver(EnvLookup env)
    : env_(std::move(env)) {}

std::optional<std::string> ConfigResolver::env(std::string_view name) const {
    return env_ ? env_(name) : std::nullopt;
}

ResolvedConfig ConfigResolver::resolve(const ModuleOptions& options) const {
    ResolvedConfig config;
    config.service_name = resolve_service_name(options);
    config.protocol = resolve_protocol(options);
    config.endpoint = resolve_endpoint(options, config.protocol.value);
    config.propagator = resolve_propagator(options);
    config.sampler = resolve_sampler(options);
    config.log_level = resolve_log_level(options);
    return config;
}

Resolved<std::string> ConfigResolver::resolve_service_name(const ModuleOptions& options) const {
    return resolve_layered<std::string>("service name", {{
        {Provenance::EXPLICIT,    "module config", options.name},
        {Provenance::SIGNAL_ENV,  "",              std::nullopt},
        {Provenance::GENERAL_ENV, kEnvServiceName, env(kEnvServiceName)},
    }}, std::string(kDefaultServiceName), identity);
}

Resolved<Protocol> ConfigResolver::resolve_protocol(const ModuleOptions& options) const {
    return resolve_layered<Protocol>("protocol", {{
        {Provenance::EXPLICIT,    "module config",    options.otlp.protocol},
        {Provenance::SIGNAL_ENV,  kEnvTracesProtocol, env(kEnvTracesProtocol)},
        {Provenance::GENERAL_ENV, kEnvProtocol,       env(kEnvProtocol)},
    }}, Protocol::HTTP_PROTOBUF, parse_protocol);
}

Resolved<std::string> ConfigResolver::resolve_endpoint(const ModuleOptions& options,
                                                       Protocol protocol) const {
    const std::string_view fallback =
        (protocol == Protocol::GRPC) ? kDefaultGrpcEndpoint : kDefaultHttpEndpoint;

    auto resolved = resolve_layered<std::string>("endpoint", {{
        {Provenance::EXPLICIT,    "module config",    options.otlp.endpoint},
        {Provenance::SIGNAL_ENV,  kEnvTracesEndpoint, env(kEnvTracesEndpoint)},
        {Provenance::GENERAL_ENV, kEnvEndpoint,       env(kEnvEndpoint)},
    }}, std::string(fallback), identity);

    // A signal-specific endpoint is already the full traces URL
    if (resolved.provenance != Provenance::SIGNAL_ENV) {
        resolved.value = build_traces_endpoint(resolved.value, protocol);
    }
    return resolved;
}

Resolved<SamplerKind> ConfigResolver::resolve_sampler(const ModuleOptions& options) const {
    return resolve_layered<SamplerKind>("sampler", {{
        {Provenance::EXPLICIT,    "module config",   options.sampler},
        {Provenance::SIGNAL_ENV,  kEnvTracesSampler, env(kEnvTracesSampler)},
        {Provenance::GENERAL_ENV, "",                std::nullopt},
    }}, SamplerKind::PARENT_BASED, parse_sampler);
}

Resolved<PropagatorKind> ConfigResolver::resolve_propagator(const ModuleOptions& options) const {
    return resolve_layered<PropagatorKind>("propagator", {{
        {Provenance::EXPLICIT,    "module config", options.propagator},
        {Provenance::SIGNAL_ENV,  "",              std::nullopt},
        {Provenance::GENERAL_ENV, kEnvPropagators, env(kEnvPropagators)},
    }}, PropagatorKind::W3C, parse_propagator_list);
}

Resolved<LogLevel> ConfigResolver::resolve_log_level(const ModuleOptions& options) const {
    return resolve_layered<LogLevel>("log level", {{
        {Provenance::EXPLICIT,    "module config", options.log_level},
        {Provenance::SIGNAL_ENV,  "",              std::nullopt},
        {Provenance::GENERAL_ENV, kEnvLogLevel,    env(kEnvLogLevel)},
    }}, LogLevel::INFO, parse_log_level);
}

// ============================================================================
// Diagnostics
// ============================================================================

std::string describe(const ResolvedConfig& config) {
    return std::format(
        "OpenTelemetry initialized: service={} protocol={} ({}) endpoint={} ({}) "
        "propagator={} ({}) sampler={} ({}) log_level={} ({})",
        config.service_name.value,
        to_string(config.protocol.value), to_string(config.protocol.provenance),
        config.endpoint.value, to_string(config.endpoint.provenance),
        to_string(config.propagator.value), to_string(config.propagator.provenance),
        to_string(config.sampler.value), to_string(config.sampler.provenance),
        to_string(config.log_level.value), to_string(config.log_level.provenance));
}

} // namespace haproxyotel
