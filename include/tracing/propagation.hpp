#pragma once

#include "config/config_types.hpp"
#include "host/transaction.hpp"

#include <opentelemetry/context/propagation/text_map_propagator.h>
#include <opentelemetry/nostd/shared_ptr.h>
#include <opentelemetry/nostd/string_view.h>

#include <string>
#include <string_view>
#include <unordered_map>

namespace haproxyotel {

using PropagatorPtr =
    opentelemetry::nostd::shared_ptr<opentelemetry::context::propagation::TextMapPropagator>;

/// Build the text-map codec for a propagation format
[[nodiscard]] PropagatorPtr make_propagator(PropagatorKind kind);

/// True for headers the propagators may look at (host plus trace headers)
[[nodiscard]] bool is_propagation_header(std::string_view name);

/**
 * @brief Read-only carrier holding only allow-listed request headers
 *
 * Names are stored lowercase and lookups ignore case, since propagators
 * ask for "X-B3-TraceId" while the host hands over "x-b3-traceid".
 */
class ExtractCarrier : public opentelemetry::context::propagation::TextMapCarrier {
public:
    /// Collect the allow-listed subset of the transaction's request headers
    [[nodiscard]] static ExtractCarrier from_request(const ITransaction& txn);

    void add(std::string_view name, std::string_view value);

    opentelemetry::nostd::string_view Get(
        opentelemetry::nostd::string_view key) const noexcept override;

    void Set(opentelemetry::nostd::string_view /*key*/,
             opentelemetry::nostd::string_view /*value*/) noexcept override {}

    [[nodiscard]] const std::unordered_map<std::string, std::string>& headers() const {
        return headers_;
    }

private:
    std::unordered_map<std::string, std::string> headers_;
};

/**
 * @brief Write-only carrier setting headers on an outgoing request
 *
 * With suppress_sampled set, the B3 "x-b3-sampled" header is dropped so
 * downstream sees the trace linkage without being told to sample.
 */
class InjectCarrier : public opentelemetry::context::propagation::TextMapCarrier {
public:
    InjectCarrier(IHttpMessage& msg, bool suppress_sampled)
        : msg_(msg), suppress_sampled_(suppress_sampled) {}

    opentelemetry::nostd::string_view Get(
        opentelemetry::nostd::string_view /*key*/) const noexcept override {
        return "";
    }

    void Set(opentelemetry::nostd::string_view key,
             opentelemetry::nostd::string_view value) noexcept override;

    /// Header write failures seen during injection
    [[nodiscard]] size_t failed_writes() const { return failed_writes_; }

private:
    IHttpMessage& msg_;
    bool suppress_sampled_;
    size_t failed_writes_ = 0;
};

} // namespace haproxyotel
