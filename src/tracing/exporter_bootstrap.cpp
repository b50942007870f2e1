#include "tracing/exporter_bootstrap.hpp"
#include "core/utils.hpp"

#include <opentelemetry/context/propagation/global_propagator.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/common/global_log_handler.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/samplers/always_off_factory.h>
#include <opentelemetry/sdk/trace/samplers/always_on_factory.h>
#include <opentelemetry/sdk/trace/samplers/parent_factory.h>
#include <opentelemetry/trace/provider.h>

#include <exception>
#include <format>
#include <mutex>

namespace haproxyotel {

namespace otel = opentelemetry;
namespace sdktrace = opentelemetry::sdk::trace;
namespace otlp = opentelemetry::exporter::otlp;
namespace internal_log = opentelemetry::sdk::common::internal_log;

// ============================================================================
// TracingPipeline
// ============================================================================

bool TracingPipeline::shutdown() {
    if (!provider) return true;
    provider->ForceFlush();
    return provider->Shutdown();
}

// ============================================================================
// Building blocks
// ============================================================================

std::optional<std::string> ExporterBootstrap::validate_endpoint(std::string_view url) {
    const auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) {
        return std::format("endpoint '{}' has no scheme", url);
    }

    const auto scheme = utils::to_lower(url.substr(0, scheme_end));
    if (scheme != "http" && scheme != "https") {
        return std::format("endpoint '{}' has unsupported scheme '{}'", url, scheme);
    }

    auto authority = url.substr(scheme_end + 3);
    authority = authority.substr(0, authority.find_first_of("/?#"));
    // Strip userinfo and port
    if (const auto at = authority.rfind('@'); at != std::string_view::npos) {
        authority = authority.substr(at + 1);
    }
    std::string_view host = authority;
    if (!host.empty() && host.front() == '[') {
        const auto close = host.find(']');
        if (close == std::string_view::npos) {
            return std::format("endpoint '{}' has an unterminated IPv6 address", url);
        }
        host = host.substr(1, close - 1);
    } else {
        host = host.substr(0, host.find(':'));
    }

    if (host.empty()) {
        return std::format("endpoint '{}' has no host", url);
    }
    return std::nullopt;
}

std::unique_ptr<sdktrace::Sampler> ExporterBootstrap::make_sampler(SamplerKind kind) {
    switch (kind) {
        case SamplerKind::ALWAYS_ON:
        case SamplerKind::SILENT_ON:
            // SILENT_ON only differs at header injection
            return sdktrace::AlwaysOnSamplerFactory::Create();
        case SamplerKind::ALWAYS_OFF:
            return sdktrace::AlwaysOffSamplerFactory::Create();
        case SamplerKind::PARENT_BASED:
            break;
    }
    return sdktrace::ParentBasedSamplerFactory::Create(
        std::shared_ptr<sdktrace::Sampler>(sdktrace::AlwaysOnSamplerFactory::Create()));
}

void ExporterBootstrap::apply_sdk_log_level(LogLevel level) {
    auto sdk_level = internal_log::LogLevel::Info;
    switch (level) {
        case LogLevel::DEBUG: sdk_level = internal_log::LogLevel::Debug; break;
        case LogLevel::INFO:  sdk_level = internal_log::LogLevel::Info; break;
        case LogLevel::WARN:  sdk_level = internal_log::LogLevel::Warning; break;
        case LogLevel::ERROR: sdk_level = internal_log::LogLevel::Error; break;
    }
    internal_log::GlobalLogHandler::SetLogLevel(sdk_level);
}

Result<std::unique_ptr<sdktrace::SpanExporter>> ExporterBootstrap::make_exporter(
    const ResolvedConfig& config) {
    using ExporterResult = Result<std::unique_ptr<sdktrace::SpanExporter>>;

    const auto& endpoint = config.endpoint.value;
    if (auto problem = validate_endpoint(endpoint)) {
        return ExporterResult::error(ErrorCategory::BOOTSTRAP_ERROR, *problem);
    }

    try {
        switch (config.protocol.value) {
            case Protocol::GRPC: {
                otlp::OtlpGrpcExporterOptions opts;
                opts.endpoint = endpoint;
                opts.use_ssl_credentials = utils::starts_with_icase(endpoint, "https://");
                return ExporterResult::ok(otlp::OtlpGrpcExporterFactory::Create(opts));
            }
            case Protocol::HTTP_PROTOBUF:
            case Protocol::HTTP_JSON: {
                otlp::OtlpHttpExporterOptions opts;
                opts.url = endpoint;
                opts.content_type = config.protocol.value == Protocol::HTTP_JSON
                    ? otlp::HttpRequestContentType::kJson
                    : otlp::HttpRequestContentType::kBinary;
                return ExporterResult::ok(otlp::OtlpHttpExporterFactory::Create(opts));
            }
        }
    } catch (const std::exception& e) {
        return ExporterResult::error(ErrorCategory::BOOTSTRAP_ERROR,
            std::format("cannot create {} exporter: {}", to_string(config.protocol.value), e.what()));
    }
    return ExporterResult::error(ErrorCategory::BOOTSTRAP_ERROR, "unknown export protocol");
}

// ============================================================================
// Pipeline assembly
// ============================================================================

Result<TracingPipeline> ExporterBootstrap::init(const ResolvedConfig& config) {
    auto exporter = make_exporter(config);
    if (exporter.is_error()) {
        return Result<TracingPipeline>::error(exporter.error_category(), exporter.error_message());
    }
    return init(config, std::move(exporter.value()));
}

Result<TracingPipeline> ExporterBootstrap::init(
    const ResolvedConfig& config, std::unique_ptr<sdktrace::SpanExporter> exporter) {
    if (!exporter) {
        return Result<TracingPipeline>::error(ErrorCategory::BOOTSTRAP_ERROR, "no span exporter");
    }

    apply_sdk_log_level(config.log_level.value);

    sdktrace::BatchSpanProcessorOptions batch_opts;
    auto processor = sdktrace::BatchSpanProcessorFactory::Create(std::move(exporter), batch_opts);

    auto resource = otel::sdk::resource::Resource::Create({
        {"service.name", config.service_name.value}
    });

    TracingPipeline pipeline;
    pipeline.provider = std::make_shared<sdktrace::TracerProvider>(
        std::move(processor), resource, make_sampler(config.sampler.value));
    pipeline.tracer = pipeline.provider->GetTracer(
        otel::nostd::string_view(kTracerName.data(), kTracerName.size()));
    pipeline.propagator = make_propagator(config.propagator.value);
    pipeline.sampler = config.sampler.value;

    otel::trace::Provider::SetTracerProvider(
        otel::nostd::shared_ptr<otel::trace::TracerProvider>(pipeline.provider));
    otel::context::propagation::GlobalTextMapPropagator::SetGlobalPropagator(pipeline.propagator);

    utils::log::debug(std::format("Tracing pipeline ready ({} exporter, batch processor)",
                                  to_string(config.protocol.value)));
    return Result<TracingPipeline>::ok(std::move(pipeline));
}

Result<TracingPipeline> ExporterBootstrap::init_once(const ResolvedConfig& config) {
    static std::mutex mutex;
    static std::optional<TracingPipeline> installed;

    std::lock_guard lock(mutex);
    if (installed) {
        utils::log::debug("Tracing pipeline already initialized, reusing it");
        return Result<TracingPipeline>::ok(*installed);
    }

    auto result = init(config);
    if (result.is_ok()) {
        installed = result.value();
    }
    return result;
}

} // namespace haproxyotel
