#include "faastel/functions/builtin.hpp"

#include <thread>

#include "faastel/functions/api_function.hpp"
#include "faastel/functions/demo_function.hpp"

namespace faastel::functions {

void register_builtin_functions(runtime::HandlerRegistry& registry) {
    registry.emplace_handler<DemoFunction>();
    registry.emplace_handler<ApiFunction>();
}

void simulate_latency(std::chrono::milliseconds delay) {
    if (delay.count() > 0) {
        std::this_thread::sleep_for(delay);
    }
}

}  // namespace faastel::functions
