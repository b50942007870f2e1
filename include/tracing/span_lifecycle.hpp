#pragma once

#include "cache/trace_cache.hpp"
#include "config/config_types.hpp"
#include "host/transaction.hpp"
#include "tracing/propagation.hpp"
#include "tracing/trace_correlator.hpp"

#include <opentelemetry/nostd/shared_ptr.h>
#include <opentelemetry/trace/span.h>
#include <opentelemetry/trace/tracer.h>

#include <optional>
#include <string_view>

namespace haproxyotel {

using TracerPtr = opentelemetry::nostd::shared_ptr<opentelemetry::trace::Tracer>;
using SpanPtr = opentelemetry::nostd::shared_ptr<opentelemetry::trace::Span>;

inline constexpr std::string_view kTracerName     = "haproxy-otel";
inline constexpr std::string_view kClientSpanName = "upstream";

/**
 * @brief Client span of one proxying attempt
 *
 * Owned by the filter instance of the stream; never stored in the cache.
 */
struct ClientSpan {
    TraceContext context;   // cached server context with the client span set
    SpanPtr span;
    bool ended = false;
};

/**
 * @brief Span lifecycle driven by the proxy's callback sequence
 *
 * Per request:
 *   NoTrace --start_server_span--> ServerSpanOpen
 *           --start_client_span / complete_client_span--> (zero or more attempts)
 *           --complete_server_span--> ServerSpanClosed
 *
 * Callbacks share nothing but the transaction variables, so each step
 * rebuilds the request state from them and from the trace cache. A request
 * without a server span turns every other step into a no-op.
 */
class SpanLifecycle {
public:
    SpanLifecycle(TracerPtr tracer, PropagatorPtr propagator,
                  SamplerKind sampler, ITraceCache& cache);

    /// Open the server span for an incoming request (action on request arrival)
    void start_server_span(ITransaction& txn);

    /**
     * @brief Open a client span for the upstream request and inject headers
     * @return nullopt when the request has no active trace
     */
    [[nodiscard]] std::optional<ClientSpan> start_client_span(ITransaction& txn,
                                                              IHttpMessage& request);

    /// Record the upstream response on the client span and close it
    void complete_client_span(ClientSpan& client, ITransaction& txn,
                              const IHttpMessage& response);

    /// Close a client span without response data (no-op once ended)
    static void end_client_span(ClientSpan& client);

    /// Close the server span; only the owning transaction does anything
    void complete_server_span(ITransaction& txn);

    /// Copy a transaction variable onto the request's active span
    void set_span_attribute(ITransaction& txn, std::string_view name,
                            std::string_view var_name);

    [[nodiscard]] TraceCorrelator& correlator() { return correlator_; }
    [[nodiscard]] SamplerKind sampler() const { return sampler_; }

private:
    TracerPtr tracer_;
    PropagatorPtr propagator_;
    SamplerKind sampler_;
    TraceCorrelator correlator_;
};

} // namespace haproxyotel
