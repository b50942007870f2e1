#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"
#include "tracing/propagation.hpp"
#include "tracing/span_lifecycle.hpp"

#include <opentelemetry/sdk/trace/exporter.h>
#include <opentelemetry/sdk/trace/sampler.h>
#include <opentelemetry/sdk/trace/tracer_provider.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace haproxyotel {

/**
 * @brief Everything the hooks need from an initialized tracing SDK
 *
 * Copies share the same provider. The provider owns the batch processor
 * and its export thread; finished spans are queued there and the request
 * path never waits on the collector.
 */
struct TracingPipeline {
    std::shared_ptr<opentelemetry::sdk::trace::TracerProvider> provider;
    TracerPtr tracer;
    PropagatorPtr propagator;
    SamplerKind sampler = SamplerKind::PARENT_BASED;

    /// Flush queued spans and stop the export thread
    bool shutdown();
};

/**
 * @brief Builds the export pipeline from a resolved configuration
 *
 * Construction failures are reported as BOOTSTRAP_ERROR; the caller decides
 * whether that is fatal. On success the provider and propagator are also
 * installed as the SDK globals.
 */
class ExporterBootstrap {
public:
    /// Build and install a pipeline exporting over OTLP
    [[nodiscard]] static Result<TracingPipeline> init(const ResolvedConfig& config);

    /// Build and install a pipeline around a caller-supplied exporter
    [[nodiscard]] static Result<TracingPipeline> init(
        const ResolvedConfig& config,
        std::unique_ptr<opentelemetry::sdk::trace::SpanExporter> exporter);

    /**
     * @brief Process-wide single initialization
     *
     * The first successful pipeline is kept and returned to every later
     * caller; a failed attempt is not remembered.
     */
    [[nodiscard]] static Result<TracingPipeline> init_once(const ResolvedConfig& config);

    /// nullopt when usable; otherwise why the URL cannot be exported to
    [[nodiscard]] static std::optional<std::string> validate_endpoint(std::string_view url);

    [[nodiscard]] static std::unique_ptr<opentelemetry::sdk::trace::Sampler> make_sampler(
        SamplerKind kind);

    /// Map the module level onto the SDK's internal diagnostics level
    static void apply_sdk_log_level(LogLevel level);

private:
    [[nodiscard]] static Result<std::unique_ptr<opentelemetry::sdk::trace::SpanExporter>>
    make_exporter(const ResolvedConfig& config);
};

} // namespace haproxyotel
