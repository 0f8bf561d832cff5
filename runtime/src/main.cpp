#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "faastel/core/config/configuration.hpp"
#include "faastel/core/logging/logger.hpp"
#include "faastel/core/network/asio_http_transport.hpp"
#include "faastel/core/observability/exporter.hpp"
#include "faastel/core/observability/span.hpp"
#include "faastel/functions/builtin.hpp"
#include "faastel/runtime/handler.hpp"
#include "faastel/runtime/invoker.hpp"

namespace {

struct InvokeOptions {
    std::filesystem::path config_path{"config/faastel.toml"};
    std::string function{"demo"};
    std::string event_source;   // file path, "-" for stdin, empty for {}
    std::string request_id;
    std::string function_version{"$LATEST"};
    std::string function_arn;
    std::chrono::milliseconds timeout{30000};
    std::string log_level;
    bool show_help{false};
};

void print_usage(std::ostream& out) {
    out << "usage: faastel-invoke [options]\n"
        << "  -c, --config <path>        configuration file (env FAASTEL_CONFIG_PATH)\n"
        << "  -f, --function <name>      function to run (demo, api)\n"
        << "  -e, --event <path|->       event payload file, '-' reads stdin\n"
        << "      --request-id <id>      request identifier (generated when omitted)\n"
        << "      --arn <arn>            invoked function ARN\n"
        << "      --version <v>          function version\n"
        << "      --timeout-ms <ms>      invocation budget (default 30000)\n"
        << "  -l, --log-level <level>    trace|debug|info|warn|error|critical\n";
}

InvokeOptions parse_options(int argc, char** argv) {
    InvokeOptions options;
    if (const char* env = std::getenv("FAASTEL_CONFIG_PATH")) {
        options.config_path = env;
    }

    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument("missing value for " + std::string{arg});
            }
            return argv[++i];
        };

        if (arg == "--config" || arg == "-c") {
            options.config_path = next();
        } else if (arg == "--function" || arg == "-f") {
            options.function = next();
        } else if (arg == "--event" || arg == "-e") {
            options.event_source = next();
        } else if (arg == "--request-id") {
            options.request_id = next();
        } else if (arg == "--arn") {
            options.function_arn = next();
        } else if (arg == "--version") {
            options.function_version = next();
        } else if (arg == "--timeout-ms") {
            options.timeout = std::chrono::milliseconds(std::stol(next()));
        } else if (arg == "--log-level" || arg == "-l") {
            options.log_level = next();
        } else if (arg == "--help" || arg == "-h") {
            options.show_help = true;
        } else {
            throw std::invalid_argument("unknown option: " + std::string{arg});
        }
    }
    return options;
}

nlohmann::json read_event(const std::string& source) {
    if (source.empty()) {
        return nlohmann::json::object();
    }
    if (source == "-") {
        return nlohmann::json::parse(std::cin);
    }
    std::ifstream file(source);
    if (!file) {
        throw std::runtime_error("cannot open event file: " + source);
    }
    return nlohmann::json::parse(file);
}

}  // namespace

int main(int argc, char** argv) {
    using namespace faastel;

    try {
        InvokeOptions options = parse_options(argc, argv);
        if (options.show_help) {
            print_usage(std::cout);
            return 0;
        }

        core::config::Configuration configuration;
        if (std::filesystem::exists(options.config_path)) {
            configuration = core::config::Configuration::load_from_file(options.config_path);
        }
        configuration.overlay_environment(core::config::Configuration::default_environment_bindings());
        if (!options.log_level.empty()) {
            configuration.set("logging.level", options.log_level);
        }

        auto log_config = core::logging::LogConfig::from_configuration(configuration);
        core::logging::initialize_logging(log_config);
        auto logger = core::logging::create_logger("faastel-invoke", log_config);
        if (!configuration.source_path().empty()) {
            logger->debug("[invoke] configuration loaded from " + configuration.source_path().string());
        }

        runtime::HandlerRegistry registry;
        functions::register_builtin_functions(registry);
        registry.configure_all(configuration);

        auto handler = registry.find(options.function);
        if (!handler) {
            std::cerr << "unknown function '" << options.function << "'" << std::endl;
            print_usage(std::cerr);
            return 2;
        }

        auto export_config = core::observability::ExportConfig::from_configuration(configuration);
        if (export_config.function_name.empty()) {
            export_config.function_name = options.function;
        }

        auto transport = std::make_shared<core::network::AsioHttpTransport>(logger, export_config.verify_tls);
        const std::string ca_file = configuration.get_string("export.ca_file");
        if (!ca_file.empty()) {
            transport->set_ca_file(ca_file);
        }

        std::string request_id = options.request_id;
        if (request_id.empty()) {
            request_id = core::observability::Span::generate_id() + core::observability::Span::generate_id();
        }

        auto context = runtime::InvocationContext::with_timeout(
            request_id, export_config.function_name, options.timeout, options.function_version, options.function_arn);
        nlohmann::json event = read_event(options.event_source);

        runtime::Invoker invoker(export_config, transport, logger);
        auto response = invoker.invoke(*handler, event, context);

        std::cout << response.result_for(event).dump(2) << std::endl;
        core::logging::shutdown_logging();
        return response.status_code >= 500 ? 1 : 0;
    } catch (const std::exception& ex) {
        std::cerr << "faastel-invoke failed: " << ex.what() << std::endl;
        return 1;
    }
}
