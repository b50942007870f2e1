#pragma once

#include "config/config_types.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace haproxyotel {

// ============================================================================
// ConfigLoader - Extract ModuleOptions from a host table or a TOML file
// ============================================================================

/**
 * Recognized keys (all optional):
 *
 *   name       = "haproxy"          # service name
 *   sampler    = "ParentBased"      # AlwaysOn | AlwaysOff | ParentBased | SilentOn
 *   propagator = "w3c"              # w3c | zipkin | b3 | jaeger
 *   log_level  = "info"
 *
 *   [otlp]
 *   endpoint = "http://collector:4318"
 *   protocol = "http/protobuf"      # grpc | http/protobuf | http/json
 *
 * String values may reference ${ENV_VAR}.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        ModuleOptions options;

        static LoadResult ok(ModuleOptions opts) {
            LoadResult result;
            result.success = true;
            result.options = std::move(opts);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load options from a TOML file
     * @param config_path Path to the module TOML file
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load options from TOML content
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Options from the host configuration table
     *
     * The embedding passes its option table as a JSON object. Keys whose
     * value is not a string are treated as absent.
     */
    [[nodiscard]] static ModuleOptions from_json(const nlohmann::json& table);
};

} // namespace haproxyotel
