#pragma once

#include <chrono>
#include <string>

#include "faastel/runtime/handler.hpp"

namespace faastel::functions {

/**
 * @brief HTTP-triggered sample: API-gateway request handling with a simulated
 * external API call, request counter and response-time histogram.
 */
class ApiFunction : public runtime::FunctionHandler {
public:
    std::string_view name() const noexcept override { return "api"; }
    std::string root_span_name() const override { return "api_gateway_handler"; }

    void configure(const core::config::Configuration& configuration) override;

    runtime::InvocationResponse handle(const nlohmann::json& event,
                                       const runtime::InvocationContext& context,
                                       core::observability::Telemetry& telemetry,
                                       const core::observability::SpanHandle& root) override;

    runtime::InvocationResponse on_error(const std::exception& error,
                                         const nlohmann::json& event,
                                         const runtime::InvocationContext& context,
                                         core::observability::Telemetry& telemetry) override;

private:
    nlohmann::json process_api_request(const nlohmann::json& event,
                                       const std::string& request_id,
                                       core::observability::Telemetry& telemetry,
                                       const core::observability::SpanHandle& parent);
    nlohmann::json external_api_call(const std::string& request_id,
                                     core::observability::Telemetry& telemetry,
                                     const core::observability::SpanHandle& parent);

    std::chrono::milliseconds latency_{0};
    std::string region_;
};

}  // namespace faastel::functions
