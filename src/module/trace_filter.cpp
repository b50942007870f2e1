#include "module/trace_filter.hpp"
#include "core/utils.hpp"

#include <format>

namespace haproxyotel {

TraceFilter::TraceFilter(std::shared_ptr<SpanLifecycle> lifecycle, Options options)
    : lifecycle_(std::move(lifecycle)), options_(options) {}

TraceFilter::Options TraceFilter::parse_args(std::string_view args) {
    Options options;
    for (const auto& arg : utils::split(std::string(args), ';')) {
        const auto eq = arg.find('=');
        if (eq == std::string::npos) continue;

        const auto name = utils::trim(arg.substr(0, eq));
        const auto value = utils::to_lower(utils::trim(arg.substr(eq + 1)));
        if (name == "start_client_span") {
            // Anything but an explicit "false" keeps client spans on
            options.start_client_span = value != "false";
        } else {
            utils::log::warn(std::format("Unknown filter argument '{}' ignored", name));
        }
    }
    return options;
}

FilterResult TraceFilter::http_headers(ITransaction& txn, IHttpMessage& msg) {
    if (!options_.start_client_span) {
        return FilterResult::CONTINUE;
    }
    if (msg.is_response()) {
        on_response_headers(txn, msg);
    } else {
        on_request_headers(txn, msg);
    }
    return FilterResult::CONTINUE;
}

void TraceFilter::on_request_headers(ITransaction& txn, IHttpMessage& msg) {
    // One attempt in flight at a time
    if (client_) {
        SpanLifecycle::end_client_span(*client_);
        client_.reset();
    }
    client_ = lifecycle_->start_client_span(txn, msg);
}

void TraceFilter::on_response_headers(ITransaction& txn, const IHttpMessage& msg) {
    if (!client_span_open()) {
        return;
    }
    lifecycle_->complete_client_span(*client_, txn, msg);
}

FilterResult TraceFilter::end_analyze(ITransaction& txn, bool response_channel) {
    if (!response_channel) {
        return FilterResult::CONTINUE;
    }

    // Upstream never answered: close the attempt without response data
    if (client_) {
        SpanLifecycle::end_client_span(*client_);
        client_.reset();
    }

    lifecycle_->complete_server_span(txn);
    return FilterResult::CONTINUE;
}

} // namespace haproxyotel
