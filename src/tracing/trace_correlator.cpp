#include "tracing/trace_correlator.hpp"

#include <opentelemetry/nostd/span.h>

namespace haproxyotel {

namespace otel = opentelemetry;

std::string trace_id_hex(const otel::trace::TraceId& trace_id) {
    char buf[2 * otel::trace::TraceId::kSize];
    trace_id.ToLowerBase16(otel::nostd::span<char, 2 * otel::trace::TraceId::kSize>(
        buf, 2 * otel::trace::TraceId::kSize));
    return std::string(buf, sizeof(buf));
}

// ============================================================================
// TraceCorrelator
// ============================================================================

std::optional<std::string> TraceCorrelator::trace_key(const ITransaction& txn) {
    auto key = txn.get_var_string(kTraceIdVar);
    if (!key || key->empty()) return std::nullopt;
    return key;
}

std::optional<TraceContext> TraceCorrelator::get(const ITransaction& txn) const {
    const auto key = trace_key(txn);
    if (!key) return std::nullopt;
    return cache_.get(*key);
}

void TraceCorrelator::store(ITransaction& txn, const otel::trace::TraceId& trace_id,
                            TraceContext context) {
    auto key = trace_id_hex(trace_id);
    txn.set_var(kTraceIdVar, key);
    cache_.store(key, std::move(context));
}

std::optional<TraceContext> TraceCorrelator::remove(const ITransaction& txn) {
    const auto key = trace_key(txn);
    if (!key) return std::nullopt;
    return cache_.remove(*key);
}

void TraceCorrelator::mark_server_span_owner(ITransaction& txn) {
    txn.set_var(kServerSpanVar, true);
}

bool TraceCorrelator::owns_server_span(const ITransaction& txn) const {
    return txn.get_var_bool(kServerSpanVar).value_or(false);
}

RequestTraceState TraceCorrelator::load_state(const ITransaction& txn) const {
    auto key = trace_key(txn);
    if (!key) return NoTrace{};

    auto context = cache_.get(*key);
    if (!context) return ServerSpanClosed{std::move(*key)};

    return ServerSpanOpen{std::move(*key), owns_server_span(txn), std::move(*context)};
}

} // namespace haproxyotel
