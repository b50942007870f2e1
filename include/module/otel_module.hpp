#pragma once

#include "config/config_loader.hpp"
#include "config/config_resolver.hpp"
#include "config/config_types.hpp"
#include "host/registrar.hpp"
#include "tracing/span_lifecycle.hpp"

#include <memory>

namespace haproxyotel {

// Names the proxy configuration refers to
inline constexpr std::string_view kStartServerSpanAction = "start_server_span";
inline constexpr std::string_view kSetSpanAttributeAction = "set_span_attribute_var";
inline constexpr std::string_view kEndServerSpanAction = "end_server_span";
inline constexpr std::string_view kTraceFilterName = "opentelemetry-trace";

/**
 * @brief Module entry point, called once while the proxy loads its config
 *
 * Resolves the options against the environment, brings the exporter up and
 * registers the actions and the filter. Throws RegistrationError when the
 * exporter cannot be built; nothing is registered in that case.
 */
void register_module(IRegistrar& registrar, const ModuleOptions& options,
                     EnvLookup env = process_env());

/// Same as register_module, taking the host's option table as handed over
void register_module_table(IRegistrar& registrar, const nlohmann::json& table,
                           EnvLookup env = process_env());

/// Wire the lifecycle transitions to the host's hook points
void install_hooks(IRegistrar& registrar, std::shared_ptr<SpanLifecycle> lifecycle);

} // namespace haproxyotel
