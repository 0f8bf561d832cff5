#pragma once

#include <chrono>
#include <string>

#include "faastel/runtime/handler.hpp"

namespace faastel::functions {

/**
 * @brief Event-triggered sample: a business-logic span with simulated
 * DynamoDB and S3 children, request counter and processing-time histogram.
 *
 * An event with "fail": true makes the business logic throw.
 */
class DemoFunction : public runtime::FunctionHandler {
public:
    std::string_view name() const noexcept override { return "demo"; }
    std::string root_span_name() const override { return "lambda_handler"; }

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
    nlohmann::json process_business_logic(const nlohmann::json& event,
                                          const runtime::InvocationContext& context,
                                          core::observability::Telemetry& telemetry,
                                          const core::observability::SpanHandle& parent);
    nlohmann::json dynamodb_operation(const std::string& request_id,
                                      core::observability::Telemetry& telemetry,
                                      const core::observability::SpanHandle& parent);
    nlohmann::json s3_operation(const std::string& request_id,
                                core::observability::Telemetry& telemetry,
                                const core::observability::SpanHandle& parent);

    std::chrono::milliseconds latency_{0};
    std::string region_;
};

}  // namespace faastel::functions
