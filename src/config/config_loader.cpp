#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>

#include <cstdlib>
#include <format>
#include <fstream>
#include <stdexcept>

namespace haproxyotel {

static constexpr std::string_view kName       = "name";
static constexpr std::string_view kSampler    = "sampler";
static constexpr std::string_view kPropagator = "propagator";
static constexpr std::string_view kLogLevel   = "log_level";
static constexpr std::string_view kOtlp       = "otlp";
static constexpr std::string_view kEndpoint   = "endpoint";
static constexpr std::string_view kProtocol   = "protocol";

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

std::optional<std::string> toml_optional_string(const toml::table& tbl, std::string_view key) {
    if (const auto* v = tbl[key].as_string()) {
        return expand_env_vars(v->get());
    }
    return std::nullopt;
}

std::optional<std::string> json_optional_string(const nlohmann::json& tbl, std::string_view key) {
    const auto it = tbl.find(std::string(key));
    if (it == tbl.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

} // anonymous namespace

// ============================================================================
// TOML
// ============================================================================

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    std::ifstream file(config_path);
    if (!file.is_open()) {
        return LoadResult::error(std::format("Cannot open config file: {}", config_path));
    }

    std::string buffer((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
    return load_from_string(buffer);
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto root = toml::parse(toml_content);

        ModuleOptions options;
        options.name = toml_optional_string(root, kName);
        options.sampler = toml_optional_string(root, kSampler);
        options.propagator = toml_optional_string(root, kPropagator);
        options.log_level = toml_optional_string(root, kLogLevel);

        if (const auto* otlp = root[kOtlp].as_table()) {
            options.otlp.endpoint = toml_optional_string(*otlp, kEndpoint);
            options.otlp.protocol = toml_optional_string(*otlp, kProtocol);
        }
        return LoadResult::ok(std::move(options));

    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("TOML parse error: {}", e.description()));
    } catch (const std::runtime_error& e) {
        return LoadResult::error(e.what());
    }
}

// ============================================================================
// Host table
// ============================================================================

ModuleOptions ConfigLoader::from_json(const nlohmann::json& table) {
    ModuleOptions options;
    if (!table.is_object()) {
        utils::log::warn("Module options are not a table, using defaults");
        return options;
    }

    options.name = json_optional_string(table, kName);
    options.sampler = json_optional_string(table, kSampler);
    options.propagator = json_optional_string(table, kPropagator);
    options.log_level = json_optional_string(table, kLogLevel);

    const auto otlp = table.find(std::string(kOtlp));
    if (otlp != table.end() && otlp->is_object()) {
        options.otlp.endpoint = json_optional_string(*otlp, kEndpoint);
        options.otlp.protocol = json_optional_string(*otlp, kProtocol);
    }
    return options;
}

} // namespace haproxyotel
