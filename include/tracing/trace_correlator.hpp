#pragma once

#include "cache/trace_cache.hpp"
#include "host/transaction.hpp"

#include <opentelemetry/trace/trace_id.h>

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace haproxyotel {

// Transaction-scoped variables shared by every callback of one request
inline constexpr std::string_view kTraceIdVar    = "txn.otel_trace_id";
inline constexpr std::string_view kServerSpanVar = "txn.__otel_server_span";

/// Lowercase hex form of a trace id (32 chars), used as the cache key
[[nodiscard]] std::string trace_id_hex(const opentelemetry::trace::TraceId& trace_id);

// ============================================================================
// RequestTraceState - per-request lifecycle state, rebuilt on each callback
// ============================================================================

struct NoTrace {};

struct ServerSpanOpen {
    std::string trace_key;
    bool owns_server_span = false;   // this transaction must close the server span
    TraceContext context;
};

/// Key recorded but no cache entry: closed, or reclaimed by eviction
struct ServerSpanClosed {
    std::string trace_key;
};

using RequestTraceState = std::variant<NoTrace, ServerSpanOpen, ServerSpanClosed>;

/**
 * @brief Joins the trace cache with the transaction's own variables
 *
 * The trace id is written into the transaction when the server span is
 * stored, so later callbacks for the same request can recover the cache
 * key with no other linkage.
 */
class TraceCorrelator {
public:
    explicit TraceCorrelator(ITraceCache& cache) : cache_(cache) {}

    /// Non-destructive lookup of the request's context
    [[nodiscard]] std::optional<TraceContext> get(const ITransaction& txn) const;

    /// Record the key in the transaction, then publish the context
    void store(ITransaction& txn, const opentelemetry::trace::TraceId& trace_id,
               TraceContext context);

    /// Take the context out of the cache; nullopt on every call after the first
    [[nodiscard]] std::optional<TraceContext> remove(const ITransaction& txn);

    /// Mark this transaction as the one that closes the server span
    void mark_server_span_owner(ITransaction& txn);
    [[nodiscard]] bool owns_server_span(const ITransaction& txn) const;

    [[nodiscard]] RequestTraceState load_state(const ITransaction& txn) const;

    [[nodiscard]] ITraceCache& cache() { return cache_; }

private:
    [[nodiscard]] static std::optional<std::string> trace_key(const ITransaction& txn);

    ITraceCache& cache_;
};

} // namespace haproxyotel
