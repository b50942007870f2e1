#include <catch2/catch_test_macros.hpp>
#include "tracing/exporter_bootstrap.hpp"
#include "config/config_resolver.hpp"

#include <opentelemetry/exporters/memory/in_memory_span_exporter.h>
#include <opentelemetry/sdk/common/global_log_handler.h>
#include <opentelemetry/trace/provider.h>

using namespace haproxyotel;

namespace {

ResolvedConfig config_for(std::string endpoint, Protocol protocol = Protocol::HTTP_PROTOBUF) {
    ResolvedConfig config;
    config.service_name = {"bootstrap-test", Provenance::EXPLICIT};
    config.protocol = {protocol, Provenance::EXPLICIT};
    config.endpoint = {std::move(endpoint), Provenance::EXPLICIT};
    config.propagator = {PropagatorKind::W3C, Provenance::DEFAULT};
    config.sampler = {SamplerKind::ALWAYS_ON, Provenance::EXPLICIT};
    config.log_level = {LogLevel::ERROR, Provenance::EXPLICIT};
    return config;
}

std::string description(SamplerKind kind) {
    auto sampler = ExporterBootstrap::make_sampler(kind);
    auto desc = sampler->GetDescription();
    return std::string(desc.data(), desc.size());
}

} // anonymous namespace

// ============================================================================
// Endpoint validation
// ============================================================================

TEST_CASE("ExporterBootstrap: accepts http and https endpoints", "[bootstrap]") {
    CHECK_FALSE(ExporterBootstrap::validate_endpoint("http://localhost:4318/v1/traces").has_value());
    CHECK_FALSE(ExporterBootstrap::validate_endpoint("https://otel.example.com").has_value());
    CHECK_FALSE(ExporterBootstrap::validate_endpoint("HTTP://collector:4317").has_value());
    CHECK_FALSE(ExporterBootstrap::validate_endpoint("http://[::1]:4318").has_value());
    CHECK_FALSE(ExporterBootstrap::validate_endpoint("http://user@collector:4318").has_value());
}

TEST_CASE("ExporterBootstrap: rejects malformed endpoints", "[bootstrap]") {
    CHECK(ExporterBootstrap::validate_endpoint("localhost:4318").has_value());
    CHECK(ExporterBootstrap::validate_endpoint("ftp://collector").has_value());
    CHECK(ExporterBootstrap::validate_endpoint("http://").has_value());
    CHECK(ExporterBootstrap::validate_endpoint("http://:4318/v1/traces").has_value());
    CHECK(ExporterBootstrap::validate_endpoint("http://[::1").has_value());
    CHECK(ExporterBootstrap::validate_endpoint("").has_value());
}

// ============================================================================
// Samplers
// ============================================================================

TEST_CASE("ExporterBootstrap: sampler per strategy", "[bootstrap][sampling]") {
    CHECK(description(SamplerKind::ALWAYS_ON) == "AlwaysOnSampler");
    CHECK(description(SamplerKind::SILENT_ON) == "AlwaysOnSampler");
    CHECK(description(SamplerKind::ALWAYS_OFF) == "AlwaysOffSampler");
    CHECK(description(SamplerKind::PARENT_BASED) == "ParentBased{AlwaysOnSampler}");
}

// ============================================================================
// Pipeline
// ============================================================================

TEST_CASE("ExporterBootstrap: invalid endpoint fails initialization", "[bootstrap]") {
    auto result = ExporterBootstrap::init(config_for("not a url"));
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::BOOTSTRAP_ERROR);
    CHECK(result.error_message().find("not a url") != std::string::npos);
}

TEST_CASE("ExporterBootstrap: missing exporter fails initialization", "[bootstrap]") {
    auto result = ExporterBootstrap::init(config_for("http://localhost:4318/v1/traces"), nullptr);
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::BOOTSTRAP_ERROR);
}

TEST_CASE("ExporterBootstrap: batch pipeline delivers spans on shutdown", "[bootstrap]") {
    auto exporter = std::make_unique<opentelemetry::exporter::memory::InMemorySpanExporter>();
    auto data = exporter->GetData();

    auto result = ExporterBootstrap::init(config_for("http://localhost:4318/v1/traces"),
                                          std::move(exporter));
    REQUIRE(result.is_ok());
    auto& pipeline = result.value();
    REQUIRE(pipeline.provider);
    CHECK(pipeline.sampler == SamplerKind::ALWAYS_ON);

    // Installed as the global provider
    auto global = opentelemetry::trace::Provider::GetTracerProvider();
    CHECK(global.get() == static_cast<opentelemetry::trace::TracerProvider*>(pipeline.provider.get()));

    auto span = pipeline.tracer->StartSpan("batched");
    span->End();

    CHECK(pipeline.shutdown());
    auto spans = data->GetSpans();
    REQUIRE(spans.size() == 1);
    CHECK(std::string(spans[0]->GetName()) == "batched");

    const auto& resource_attrs = spans[0]->GetResource().GetAttributes();
    REQUIRE(resource_attrs.contains("service.name"));
    CHECK(opentelemetry::nostd::get<std::string>(resource_attrs.at("service.name")) ==
          "bootstrap-test");
}

TEST_CASE("ExporterBootstrap: OTLP/HTTP exporter builds for a valid endpoint", "[bootstrap]") {
    auto result = ExporterBootstrap::init(config_for("http://localhost:4318/v1/traces",
                                                     Protocol::HTTP_JSON));
    REQUIRE(result.is_ok());
    CHECK(static_cast<bool>(result.value().tracer));
    result.value().shutdown();
}

TEST_CASE("ExporterBootstrap: SDK log level follows module level", "[bootstrap]") {
    using opentelemetry::sdk::common::internal_log::GlobalLogHandler;
    using SdkLevel = opentelemetry::sdk::common::internal_log::LogLevel;

    ExporterBootstrap::apply_sdk_log_level(LogLevel::DEBUG);
    CHECK(GlobalLogHandler::GetLogLevel() == SdkLevel::Debug);
    ExporterBootstrap::apply_sdk_log_level(LogLevel::WARN);
    CHECK(GlobalLogHandler::GetLogLevel() == SdkLevel::Warning);
    ExporterBootstrap::apply_sdk_log_level(LogLevel::ERROR);
    CHECK(GlobalLogHandler::GetLogLevel() == SdkLevel::Error);
}
