#include "faastel/core/config/configuration.hpp"
#include "faastel/core/logging/logger.hpp"
#include "faastel/functions/builtin.hpp"
#include "faastel/runtime/handler.hpp"
#include "faastel/runtime/invoker.hpp"

#include <chrono>
#include <iostream>

// Runs every built-in function once with export disabled.
int main() {
    using namespace faastel;

    core::config::Configuration configuration;
    configuration.set("functions.simulated_latency_ms", "0");

    auto logger = core::logging::create_logger("faastel-smoke");
    runtime::HandlerRegistry registry;
    functions::register_builtin_functions(registry);
    registry.configure_all(configuration);
    std::cout << "Registered functions: " << registry.names().size() << std::endl;

    runtime::Invoker invoker(core::observability::ExportConfig{}, nullptr, logger);
    for (const auto& name : registry.names()) {
        auto handler = registry.find(name);
        auto context = runtime::InvocationContext::with_timeout(
            "smoke-" + name, name, std::chrono::seconds(5));
        auto response = invoker.invoke(*handler, nlohmann::json{{"source", "smoke"}}, context);
        if (response.status_code != 200) {
            std::cerr << name << " returned " << response.status_code << std::endl;
            return 1;
        }
    }

    std::cout << "Smoke test completed" << std::endl;
    return 0;
}
