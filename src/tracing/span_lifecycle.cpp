#include "tracing/span_lifecycle.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "tracing/span_attributes.hpp"

#include <opentelemetry/trace/context.h>
#include <opentelemetry/trace/span_startoptions.h>

#include <format>
#include <variant>

namespace haproxyotel {

namespace otel = opentelemetry;
namespace trace_api = opentelemetry::trace;

namespace {

constexpr int64_t kFirstServerErrorStatus = 500;

otel::nostd::string_view sv(std::string_view s) {
    return otel::nostd::string_view(s.data(), s.size());
}

struct PathQuery {
    std::string path;
    std::string query;
};

// Split "/a/b?x=1" on the first '?'; the query is empty when absent
PathQuery split_path_query(std::string_view pathq) {
    const auto pos = pathq.find('?');
    if (pos == std::string_view::npos) {
        return {std::string(pathq), {}};
    }
    return {std::string(pathq.substr(0, pos)), std::string(pathq.substr(pos + 1))};
}

} // anonymous namespace

SpanLifecycle::SpanLifecycle(TracerPtr tracer, PropagatorPtr propagator,
                             SamplerKind sampler, ITraceCache& cache)
    : tracer_(std::move(tracer)),
      propagator_(std::move(propagator)),
      sampler_(sampler),
      correlator_(cache) {}

// ============================================================================
// Server span
// ============================================================================

void SpanLifecycle::start_server_span(ITransaction& txn) {
    // Host accessors first: a failure here leaves nothing behind
    auto carrier = ExtractCarrier::from_request(txn);
    const auto method = require_string(txn, fetch::kMethod);
    const auto pathq = require_string(txn, fetch::kPathQuery);
    const auto peer = require_string(txn, fetch::kSource);

    const auto host_it = carrier.headers().find("host");
    const std::string host = host_it != carrier.headers().end() ? host_it->second : std::string{};
    const auto [path, query] = split_path_query(pathq);

    // Same request started twice: end the replaced span, the new one wins
    const auto state = correlator_.load_state(txn);
    if (const auto* open = std::get_if<ServerSpanOpen>(&state)) {
        utils::log::debug(std::format("Server span for trace {} restarted", open->trace_key));
        if (auto previous = correlator_.remove(txn)) {
            trace_api::GetSpan(*previous)->End();
        }
    }

    TraceContext empty;
    const TraceContext remote = propagator_->Extract(carrier, empty);

    trace_api::StartSpanOptions options;
    options.kind = trace_api::SpanKind::kServer;
    options.parent = remote;

    const auto name = std::format("{} {}", method, host);
    auto span = tracer_->StartSpan(
        sv(name),
        {{sv(attr::kHttpRequestMethod), sv(method)},
         {sv(attr::kUrlPath), sv(path)},
         {sv(attr::kUrlQuery), sv(query)},
         {sv(attr::kHttpRequestHeaderHost), sv(host)},
         {sv(attr::kNetworkPeerAddress), sv(peer)}},
        options);

    TraceContext parent = remote;
    TraceContext context = trace_api::SetSpan(parent, span);

    correlator_.mark_server_span_owner(txn);
    correlator_.store(txn, span->GetContext().trace_id(), std::move(context));
}

void SpanLifecycle::complete_server_span(ITransaction& txn) {
    if (!correlator_.owns_server_span(txn)) {
        return;
    }

    // Taken out before touching the host so a second completion finds nothing
    auto context = correlator_.remove(txn);
    if (!context) {
        utils::log::debug("Server span already closed or evicted");
        return;
    }
    auto span = trace_api::GetSpan(*context);

    try {
        const int64_t status = txn.fetch_integer(fetch::kTxnStatus).value_or(0);
        span->SetAttribute(sv(attr::kHttpResponseStatusCode), status);
        if (status < kFirstServerErrorStatus) {
            span->SetStatus(trace_api::StatusCode::kOk);
        } else {
            span->SetStatus(trace_api::StatusCode::kError, "5xx status code");
        }

        const auto frontend = require_string(txn, fetch::kFrontendName);
        const auto backend = require_string(txn, fetch::kBackendName);
        const auto term_state = txn.fetch_string(fetch::kTerminationState).value_or("");
        span->SetAttribute(sv(attr::kFrontendName), sv(frontend));
        span->SetAttribute(sv(attr::kBackendName), sv(backend));
        span->SetAttribute(sv(attr::kTerminationState), sv(term_state));
    } catch (const HostError& e) {
        span->SetStatus(trace_api::StatusCode::kError, sv(e.what()));
        span->End();
        throw;
    }

    span->End();
}

// ============================================================================
// Client span
// ============================================================================

std::optional<ClientSpan> SpanLifecycle::start_client_span(ITransaction& txn,
                                                           IHttpMessage& request) {
    auto state = correlator_.load_state(txn);
    auto* open = std::get_if<ServerSpanOpen>(&state);
    if (!open) {
        if (const auto* closed = std::get_if<ServerSpanClosed>(&state)) {
            utils::log::debug(std::format("Trace {} already completed or evicted, skipping client span",
                                          closed->trace_key));
        } else {
            utils::log::debug("No active trace for request, skipping client span");
        }
        return std::nullopt;
    }

    const auto method = require_string(txn, fetch::kMethod);
    const auto pathq = require_string(txn, fetch::kPathQuery);
    const auto [path, query] = split_path_query(pathq);

    trace_api::StartSpanOptions options;
    options.kind = trace_api::SpanKind::kClient;
    options.parent = open->context;

    auto span = tracer_->StartSpan(
        sv(kClientSpanName),
        {{sv(attr::kHttpRequestMethod), sv(method)},
         {sv(attr::kUrlPath), sv(path)},
         {sv(attr::kUrlQuery), sv(query)}},
        options);

    ClientSpan client{trace_api::SetSpan(open->context, span), span, false};

    InjectCarrier carrier(request, sampler_ == SamplerKind::SILENT_ON);
    propagator_->Inject(carrier, client.context);
    if (carrier.failed_writes() > 0) {
        utils::log::warn(std::format("{} propagation header(s) not written upstream",
                                     carrier.failed_writes()));
    }

    return client;
}

void SpanLifecycle::complete_client_span(ClientSpan& client, ITransaction& txn,
                                         const IHttpMessage& response) {
    if (client.ended) {
        return;
    }

    client.span->AddEvent("received response headers");

    const auto status = response.status_line();
    client.span->SetAttribute(sv(attr::kHttpResponseStatusCode), status.code);
    if (status.code < kFirstServerErrorStatus) {
        client.span->SetStatus(trace_api::StatusCode::kOk);
    } else {
        client.span->SetStatus(trace_api::StatusCode::kError, sv(status.reason));
    }

    const auto server = require_string(txn, fetch::kServerName);
    client.span->SetAttribute(sv(attr::kServerName), sv(server));

    end_client_span(client);
}

void SpanLifecycle::end_client_span(ClientSpan& client) {
    if (client.ended || !client.span) {
        return;
    }
    client.span->End();
    client.ended = true;
}

// ============================================================================
// Operator attributes
// ============================================================================

void SpanLifecycle::set_span_attribute(ITransaction& txn, std::string_view name,
                                       std::string_view var_name) {
    const auto value = txn.get_var_string(var_name);
    if (!value) {
        utils::log::debug(std::format("Variable '{}' unset, attribute '{}' skipped",
                                      var_name, name));
        return;
    }

    auto state = correlator_.load_state(txn);
    auto* open = std::get_if<ServerSpanOpen>(&state);
    if (!open) {
        if (const auto* closed = std::get_if<ServerSpanClosed>(&state)) {
            utils::log::debug(std::format("Trace {} already completed or evicted, attribute '{}' dropped",
                                          closed->trace_key, name));
        }
        return;
    }
    trace_api::GetSpan(open->context)->SetAttribute(sv(name), sv(*value));
}

} // namespace haproxyotel
