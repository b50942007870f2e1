#include <catch2/catch_test_macros.hpp>
#include "tracing/propagation.hpp"
#include "tracing/span_lifecycle.hpp"
#include "config/config_resolver.hpp"
#include "tracing/trace_correlator.hpp"
#include "mocks/mock_transaction.hpp"
#include "mocks/test_tracer.hpp"

#include <opentelemetry/trace/context.h>

using namespace haproxyotel;
using namespace haproxyotel::testing;

namespace trace_api = opentelemetry::trace;

namespace {

constexpr const char* kTraceparent = "00-4bf92f3577b34da6a3ce929d0e0e4736-00f067aa0ba902b7-01";

TraceContext context_with_span(TestTracer& t) {
    auto span = t.tracer->StartSpan("outer");
    TraceContext ctx;
    auto result = trace_api::SetSpan(ctx, span);
    span->End();
    return result;
}

} // anonymous namespace

// ============================================================================
// Header allow-list
// ============================================================================

TEST_CASE("Propagation: allow-list accepts trace headers", "[propagation]") {
    CHECK(is_propagation_header("host"));
    CHECK(is_propagation_header("traceparent"));
    CHECK(is_propagation_header("TraceState"));
    CHECK(is_propagation_header("b3"));
    CHECK(is_propagation_header("X-B3-TraceId"));
    CHECK(is_propagation_header("x-b3-flags"));
    CHECK(is_propagation_header("uber-trace-id"));
    CHECK(is_propagation_header("uberctx-tenant"));
}

TEST_CASE("Propagation: allow-list rejects everything else", "[propagation]") {
    CHECK_FALSE(is_propagation_header("cookie"));
    CHECK_FALSE(is_propagation_header("authorization"));
    CHECK_FALSE(is_propagation_header("b3-extra"));
    CHECK_FALSE(is_propagation_header("x-forwarded-for"));
}

TEST_CASE("Propagation: carrier only sees allow-listed headers", "[propagation]") {
    MockTransaction txn;
    txn.headers.emplace_back("traceparent", kTraceparent);
    txn.headers.emplace_back("cookie", "session=secret");
    txn.headers.emplace_back("authorization", "Bearer x");

    auto carrier = ExtractCarrier::from_request(txn);
    CHECK(carrier.headers().size() == 2);
    CHECK(carrier.headers().contains("host"));
    CHECK(carrier.headers().contains("traceparent"));
    CHECK(carrier.Get("cookie").empty());
}

TEST_CASE("Propagation: carrier lookups ignore case", "[propagation]") {
    ExtractCarrier carrier;
    carrier.add("x-b3-traceid", "abc");
    CHECK(std::string(carrier.Get("X-B3-TraceId").data(), carrier.Get("X-B3-TraceId").size()) == "abc");
}

// ============================================================================
// Extraction
// ============================================================================

TEST_CASE("Propagation: W3C parent extracted from request", "[propagation]") {
    MockTransaction txn;
    txn.headers.emplace_back("traceparent", kTraceparent);

    auto carrier = ExtractCarrier::from_request(txn);
    auto propagator = make_propagator(PropagatorKind::W3C);
    TraceContext empty;
    auto ctx = propagator->Extract(carrier, empty);

    auto span_ctx = trace_api::GetSpan(ctx)->GetContext();
    REQUIRE(span_ctx.IsValid());
    CHECK(span_ctx.IsRemote());
    CHECK(trace_id_hex(span_ctx.trace_id()) == "4bf92f3577b34da6a3ce929d0e0e4736");
}

TEST_CASE("Propagation: no trace headers gives no parent", "[propagation]") {
    MockTransaction txn;
    auto carrier = ExtractCarrier::from_request(txn);
    auto propagator = make_propagator(PropagatorKind::W3C);
    TraceContext empty;
    auto ctx = propagator->Extract(carrier, empty);

    CHECK_FALSE(trace_api::GetSpan(ctx)->GetContext().IsValid());
}

// ============================================================================
// Injection
// ============================================================================

TEST_CASE("Propagation: W3C injection writes traceparent", "[propagation]") {
    TestTracer t;
    auto ctx = context_with_span(t);

    MockHttpMessage request;
    InjectCarrier carrier(request, false);
    make_propagator(PropagatorKind::W3C)->Inject(carrier, ctx);

    CHECK(request.has_header("traceparent"));
    CHECK(carrier.failed_writes() == 0);
}

TEST_CASE("Propagation: B3 multi-header injection writes three headers", "[propagation]") {
    TestTracer t;
    auto ctx = context_with_span(t);

    MockHttpMessage request;
    InjectCarrier carrier(request, false);
    make_propagator(PropagatorKind::ZIPKIN)->Inject(carrier, ctx);

    CHECK(request.headers.size() == 3);
    CHECK(request.has_header("X-B3-TraceId"));
    CHECK(request.has_header("X-B3-SpanId"));
    CHECK(request.has_header("X-B3-Sampled"));
}

TEST_CASE("Propagation: silent sampling drops the sampled header", "[propagation]") {
    TestTracer t;
    auto ctx = context_with_span(t);

    MockHttpMessage request;
    InjectCarrier carrier(request, true);
    make_propagator(PropagatorKind::ZIPKIN)->Inject(carrier, ctx);

    CHECK(request.headers.size() == 2);
    CHECK(request.has_header("X-B3-TraceId"));
    CHECK(request.has_header("X-B3-SpanId"));
    CHECK_FALSE(request.has_header("X-B3-Sampled"));
}

TEST_CASE("Propagation: b3 from the environment keeps silent sampling silent", "[propagation][sampling]") {
    ConfigResolver resolver([](std::string_view name) -> std::optional<std::string> {
        if (name == "OTEL_PROPAGATORS") return "b3";
        if (name == "OTEL_TRACES_SAMPLER") return "silent_on";
        return std::nullopt;
    });
    auto config = resolver.resolve(ModuleOptions{});
    REQUIRE(config.propagator.value == PropagatorKind::ZIPKIN);
    REQUIRE(config.sampler.value == SamplerKind::SILENT_ON);

    TestTracer t(config.sampler.value, config.propagator.value);
    MockTransaction txn;
    t.lifecycle->start_server_span(txn);

    MockHttpMessage request;
    auto client = t.lifecycle->start_client_span(txn, request);
    REQUIRE(client.has_value());

    CHECK(request.headers.size() == 2);
    CHECK(request.has_header("X-B3-TraceId"));
    CHECK(request.has_header("X-B3-SpanId"));
    CHECK_FALSE(request.has_header("X-B3-Sampled"));
    CHECK_FALSE(request.has_header("b3"));

    SpanLifecycle::end_client_span(*client);
    t.lifecycle->complete_server_span(txn);
}

TEST_CASE("Propagation: zipkin extraction accepts the single b3 header", "[propagation]") {
    ExtractCarrier carrier;
    carrier.add("b3", "4bf92f3577b34da6a3ce929d0e0e4736-00f067aa0ba902b7-1");

    TraceContext parent;
    auto ctx = make_propagator(PropagatorKind::ZIPKIN)->Extract(carrier, parent);
    auto span_ctx = trace_api::GetSpan(ctx)->GetContext();
    REQUIRE(span_ctx.IsValid());
    CHECK(hex(span_ctx.span_id()) == "00f067aa0ba902b7");
}

TEST_CASE("Propagation: failed header write is counted, not thrown", "[propagation]") {
    TestTracer t;
    auto ctx = context_with_span(t);

    MockHttpMessage request;
    request.reject_header_writes = true;
    InjectCarrier carrier(request, false);
    make_propagator(PropagatorKind::W3C)->Inject(carrier, ctx);

    CHECK(carrier.failed_writes() >= 1);
    CHECK(request.headers.empty());
}
