#pragma once

#include <memory>

#include <nlohmann/json.hpp>

#include "faastel/core/logging/logger.hpp"
#include "faastel/core/network/http_transport.hpp"
#include "faastel/core/observability/exporter.hpp"
#include "faastel/runtime/handler.hpp"
#include "faastel/runtime/invocation.hpp"

namespace faastel::runtime {

/**
 * @brief Invocation boundary: gives each call its own Telemetry, runs the
 * handler under a root span and flushes before returning.
 *
 * Business exceptions are recorded on the root span and turned into the
 * handler's error response; export failures never reach the caller. By
 * default one invocation costs exactly one POST to the sink.
 */
class Invoker {
public:
    Invoker(core::observability::ExportConfig config,
            core::network::HttpTransportPtr transport,
            std::shared_ptr<core::logging::Logger> logger);

    InvocationResponse invoke(FunctionHandler& handler,
                              const nlohmann::json& event,
                              const InvocationContext& context);

    // Outcome of the final flush of the most recent invoke()
    [[nodiscard]] const core::observability::FlushResult& last_flush() const noexcept { return last_flush_; }
    [[nodiscard]] const core::observability::ExportConfig& export_config() const noexcept {
        return exporter_->config();
    }

private:
    void finish(core::observability::Telemetry& telemetry, const InvocationContext& context);

    std::shared_ptr<core::observability::Exporter> exporter_;
    std::shared_ptr<core::logging::Logger> logger_;
    core::observability::FlushResult last_flush_;
};

}  // namespace faastel::runtime
