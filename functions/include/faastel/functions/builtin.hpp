#pragma once

#include <chrono>

#include "faastel/runtime/handler.hpp"

namespace faastel::functions {

// Registers the demo and api functions
void register_builtin_functions(runtime::HandlerRegistry& registry);

// Stand-in for downstream latency; no-op for zero
void simulate_latency(std::chrono::milliseconds delay);

}  // namespace faastel::functions
