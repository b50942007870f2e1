#include "module/otel_module.hpp"
#include "cache/trace_cache.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "module/trace_filter.hpp"
#include "tracing/exporter_bootstrap.hpp"

#include <format>

namespace haproxyotel {

void register_module(IRegistrar& registrar, const ModuleOptions& options, EnvLookup env) {
    const ConfigResolver resolver(std::move(env));
    const auto config = resolver.resolve(options);
    utils::log::set_level(config.log_level.value);

    auto pipeline = ExporterBootstrap::init_once(config);
    if (pipeline.is_error()) {
        utils::log::error(std::format("OpenTelemetry initialization failed: {}",
                                      pipeline.error_message()));
        throw RegistrationError(pipeline.error_message());
    }
    utils::log::info(describe(config));

    const auto& p = pipeline.value();
    install_hooks(registrar, std::make_shared<SpanLifecycle>(
        p.tracer, p.propagator, p.sampler, global_trace_cache()));
}

void register_module_table(IRegistrar& registrar, const nlohmann::json& table, EnvLookup env) {
    register_module(registrar, ConfigLoader::from_json(table), std::move(env));
}

void install_hooks(IRegistrar& registrar, std::shared_ptr<SpanLifecycle> lifecycle) {
    registrar.register_action(std::string(kStartServerSpanAction),
        {ActionPhase::HTTP_REQ}, 0,
        [lifecycle](ITransaction& txn, const std::vector<std::string>& /*args*/) {
            lifecycle->start_server_span(txn);
        });

    registrar.register_action(std::string(kSetSpanAttributeAction),
        {ActionPhase::HTTP_REQ, ActionPhase::HTTP_RES, ActionPhase::HTTP_AFTER_RES}, 2,
        [lifecycle](ITransaction& txn, const std::vector<std::string>& args) {
            if (args.size() < 2) {
                utils::log::warn(std::format("{} expects 2 arguments, got {}",
                                             kSetSpanAttributeAction, args.size()));
                return;
            }
            lifecycle->set_span_attribute(txn, args[0], args[1]);
        });

    registrar.register_action(std::string(kEndServerSpanAction),
        {ActionPhase::HTTP_RES, ActionPhase::HTTP_AFTER_RES}, 0,
        [lifecycle](ITransaction& txn, const std::vector<std::string>& /*args*/) {
            lifecycle->complete_server_span(txn);
        });

    registrar.register_filter(std::string(kTraceFilterName),
        [lifecycle](std::string_view args) -> std::unique_ptr<IFilter> {
            return std::make_unique<TraceFilter>(lifecycle, TraceFilter::parse_args(args));
        });
}

} // namespace haproxyotel
