#pragma once

#include "core/utils.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace haproxyotel {

// ============================================================================
// Enumerations
// ============================================================================

/// OTLP wire protocol
enum class Protocol : uint8_t {
    GRPC,
    HTTP_PROTOBUF,
    HTTP_JSON
};

/// Sampling strategy; SILENT_ON samples but never injects x-b3-sampled
enum class SamplerKind : uint8_t {
    ALWAYS_ON,
    ALWAYS_OFF,
    PARENT_BASED,
    SILENT_ON
};

enum class PropagatorKind : uint8_t {
    W3C,
    ZIPKIN,        // B3 multi-header
    JAEGER
};

using LogLevel = utils::log::Level;

/// Which configuration layer produced a resolved value
enum class Provenance : uint8_t {
    EXPLICIT,        // module configuration
    SIGNAL_ENV,      // signal-specific override (names "traces")
    GENERAL_ENV,     // general override
    DEFAULT
};

[[nodiscard]] constexpr const char* to_string(Protocol p) {
    switch (p) {
        case Protocol::GRPC:          return "grpc";
        case Protocol::HTTP_PROTOBUF: return "http/protobuf";
        case Protocol::HTTP_JSON:     return "http/json";
    }
    return "unknown";
}

[[nodiscard]] constexpr const char* to_string(SamplerKind s) {
    switch (s) {
        case SamplerKind::ALWAYS_ON:    return "always_on";
        case SamplerKind::ALWAYS_OFF:   return "always_off";
        case SamplerKind::PARENT_BASED: return "parentbased_always_on";
        case SamplerKind::SILENT_ON:    return "silent_on";
    }
    return "unknown";
}

[[nodiscard]] constexpr const char* to_string(PropagatorKind p) {
    switch (p) {
        case PropagatorKind::W3C:       return "w3c";
        case PropagatorKind::ZIPKIN:    return "zipkin";
        case PropagatorKind::JAEGER:    return "jaeger";
    }
    return "unknown";
}

[[nodiscard]] constexpr const char* to_string(LogLevel l) {
    switch (l) {
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO:  return "info";
        case LogLevel::WARN:  return "warn";
        case LogLevel::ERROR: return "error";
    }
    return "unknown";
}

[[nodiscard]] constexpr const char* to_string(Provenance p) {
    switch (p) {
        case Provenance::EXPLICIT:    return "explicit-config";
        case Provenance::SIGNAL_ENV:  return "signal-specific";
        case Provenance::GENERAL_ENV: return "general";
        case Provenance::DEFAULT:     return "default";
    }
    return "unknown";
}

// ============================================================================
// ModuleOptions - explicit configuration (host table or TOML file)
// ============================================================================

struct OtlpOptions {
    std::optional<std::string> endpoint;
    std::optional<std::string> protocol;   // "grpc", "http/protobuf", "http/json", legacy "binary"/"json"
};

struct ModuleOptions {
    std::optional<std::string> name;       // service name, "haproxy" when unset
    std::optional<std::string> sampler;    // "AlwaysOn", "SilentOn", "AlwaysOff", "ParentBased"
    std::optional<std::string> propagator; // "w3c", "jaeger", "zipkin"
    std::optional<std::string> log_level;
    OtlpOptions otlp;
};

// ============================================================================
// ResolvedConfig - immutable snapshot shared by all worker threads
// ============================================================================

template<typename T>
struct Resolved {
    T value;
    Provenance provenance = Provenance::DEFAULT;
};

struct ResolvedConfig {
    Resolved<std::string> service_name;
    Resolved<Protocol> protocol;
    Resolved<std::string> endpoint;       // final traces URL (suffix already applied)
    Resolved<PropagatorKind> propagator;
    Resolved<SamplerKind> sampler;
    Resolved<LogLevel> log_level;
};

} // namespace haproxyotel
