#include "tracing/propagation.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <opentelemetry/trace/propagation/b3_propagator.h>
#include <opentelemetry/trace/propagation/http_trace_context.h>
#include <opentelemetry/trace/propagation/jaeger.h>

#include <format>
#include <memory>

namespace haproxyotel {

namespace otel = opentelemetry;
namespace propagation = opentelemetry::trace::propagation;

static constexpr std::string_view kHostHeader    = "host";
static constexpr std::string_view kB3SampledHeader = "x-b3-sampled";

PropagatorPtr make_propagator(PropagatorKind kind) {
    switch (kind) {
        // Multi-header only, so silent sampling can drop x-b3-sampled.
        // Extraction still understands the single "b3" header.
        case PropagatorKind::ZIPKIN:
            return PropagatorPtr(std::make_unique<propagation::B3PropagatorMultiHeader>());
        case PropagatorKind::JAEGER:
            return PropagatorPtr(std::make_unique<propagation::JaegerPropagator>());
        case PropagatorKind::W3C:
            break;
    }
    return PropagatorPtr(std::make_unique<propagation::HttpTraceContext>());
}

bool is_propagation_header(std::string_view name) {
    return utils::iequals(name, kHostHeader)
        || utils::iequals(name, "traceparent")
        || utils::iequals(name, "tracestate")
        || utils::iequals(name, "b3")
        || utils::starts_with_icase(name, "x-b3")
        || utils::starts_with_icase(name, "uber");
}

// ============================================================================
// ExtractCarrier
// ============================================================================

ExtractCarrier ExtractCarrier::from_request(const ITransaction& txn) {
    ExtractCarrier carrier;
    txn.for_each_request_header([&carrier](std::string_view name, std::string_view value) {
        if (is_propagation_header(name)) {
            carrier.add(name, value);
        }
    });
    return carrier;
}

void ExtractCarrier::add(std::string_view name, std::string_view value) {
    headers_.insert_or_assign(utils::to_lower(name), std::string(value));
}

otel::nostd::string_view ExtractCarrier::Get(otel::nostd::string_view key) const noexcept {
    const auto it = headers_.find(utils::to_lower(std::string_view(key.data(), key.size())));
    if (it == headers_.end()) return "";
    return it->second;
}

// ============================================================================
// InjectCarrier
// ============================================================================

void InjectCarrier::Set(otel::nostd::string_view key, otel::nostd::string_view value) noexcept {
    const std::string_view name(key.data(), key.size());
    if (suppress_sampled_ && utils::iequals(name, kB3SampledHeader)) {
        return;
    }
    try {
        msg_.set_header(name, std::string_view(value.data(), value.size()));
    } catch (const HostError& e) {
        ++failed_writes_;
        utils::log::warn(std::format("Cannot inject header '{}': {}", name, e.what()));
    }
}

} // namespace haproxyotel
