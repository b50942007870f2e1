#include "config/config_loader.hpp"
#include "config/config_resolver.hpp"
#include "core/utils.hpp"
#include "tracing/exporter_bootstrap.hpp"

#include <cstdlib>
#include <format>
#include <iostream>
#include <string>

using namespace haproxyotel;

// =========================================================================
// haproxyotel-check: resolve module options the way the proxy would
// =========================================================================

static void print_usage(const char* argv0) {
    std::cerr << std::format("usage: {} [config.toml]\n", argv0);
}

int main(int argc, char* argv[]) {
    if (argc > 2) {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    ModuleOptions options;
    if (argc == 2) {
        const std::string config_file = argv[1];
        if (config_file == "-h" || config_file == "--help") {
            print_usage(argv[0]);
            return EXIT_SUCCESS;
        }

        utils::log::info(std::format("Loading module options from {}", config_file));
        auto loaded = ConfigLoader::load_from_file(config_file);
        if (!loaded.success) {
            utils::log::error(loaded.error_message);
            return EXIT_FAILURE;
        }
        options = std::move(loaded.options);
    }

    const ConfigResolver resolver;
    const auto config = resolver.resolve(options);

    if (auto problem = ExporterBootstrap::validate_endpoint(config.endpoint.value)) {
        utils::log::error(*problem);
        return EXIT_FAILURE;
    }

    std::cout << describe(config) << '\n';
    return EXIT_SUCCESS;
}
