#pragma once

#include "host/registrar.hpp"
#include "tracing/span_lifecycle.hpp"

#include <memory>
#include <optional>
#include <string_view>

namespace haproxyotel {

/**
 * @brief "opentelemetry-trace" filter: client spans plus server span close
 *
 * Declared per backend as `filter lua.opentelemetry-trace "start_client_span=false"`.
 * Arguments are `;`-separated `name=value` pairs; unknown names are ignored.
 */
class TraceFilter : public IFilter {
public:
    struct Options {
        bool start_client_span = true;
    };

    TraceFilter(std::shared_ptr<SpanLifecycle> lifecycle, Options options);

    [[nodiscard]] static Options parse_args(std::string_view args);

    FilterResult http_headers(ITransaction& txn, IHttpMessage& msg) override;
    FilterResult end_analyze(ITransaction& txn, bool response_channel) override;

    [[nodiscard]] const Options& options() const { return options_; }
    [[nodiscard]] bool client_span_open() const { return client_ && !client_->ended; }

private:
    void on_request_headers(ITransaction& txn, IHttpMessage& msg);
    void on_response_headers(ITransaction& txn, const IHttpMessage& msg);

    std::shared_ptr<SpanLifecycle> lifecycle_;
    Options options_;
    std::optional<ClientSpan> client_;
};

} // namespace haproxyotel
