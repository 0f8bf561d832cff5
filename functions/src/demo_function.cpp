#include "faastel/functions/demo_function.hpp"

#include "faastel/core/observability/span.hpp"
#include "faastel/functions/builtin.hpp"

namespace faastel::functions {
namespace {

using core::observability::ScopedSpan;
using core::observability::SpanHandle;
using core::observability::StatusCode;
using core::observability::Telemetry;
using nlohmann::json;

int64_t unix_seconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

int64_t elapsed_ms(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - since).count();
}

bool wants_failure(const json& event) {
    if (!event.is_object()) {
        return false;
    }
    auto it = event.find("fail");
    return it != event.end() && it->is_boolean() && it->get<bool>();
}

std::string event_source(const json& event) {
    if (event.is_object()) {
        auto it = event.find("source");
        if (it != event.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return "unknown";
}

}  // namespace

void DemoFunction::configure(const core::config::Configuration& configuration) {
    latency_ = std::chrono::milliseconds(configuration.get_int("functions.simulated_latency_ms", 0));
    region_ = configuration.get_string("runtime.region");
}

runtime::InvocationResponse DemoFunction::handle(const json& event,
                                                 const runtime::InvocationContext& context,
                                                 Telemetry& telemetry,
                                                 const SpanHandle& root) {
    root->set_attribute("faas.execution", context.request_id());
    root->set_attribute("faas.id", context.function_name());
    root->set_attribute("faas.version", context.function_version());
    root->set_attribute("cloud.account.id", context.account_id());
    root->set_attribute("cloud.region", region_);

    const std::string payload = event.dump(-1, ' ', false, json::error_handler_t::replace);
    telemetry.info("Lambda function invocation started", {
        {"function_name", context.function_name()},
        {"function_version", context.function_version()},
        {"remaining_time_ms", context.remaining_time().count()},
        {"event_source", event_source(event)},
        {"event_size", payload.size()},
    });

    const auto started = std::chrono::steady_clock::now();
    json result = process_business_logic(event, context, telemetry, root);

    telemetry.info("Lambda function execution completed successfully", {
        {"result", result},
        {"execution_duration_ms", elapsed_ms(started)},
    });

    runtime::InvocationResponse response;
    response.status_code = 200;
    response.headers["Content-Type"] = "application/json";
    response.headers["X-Request-ID"] = context.request_id();
    response.body = {
        {"message", "Function executed successfully"},
        {"requestId", context.request_id()},
        {"result", result},
        {"timestamp", core::observability::format_timestamp(std::chrono::system_clock::now())},
    };

    root->set_attribute("lambda.execution.success", true);
    root->set_attribute("response.status_code", response.status_code);
    return response;
}

runtime::InvocationResponse DemoFunction::on_error(const std::exception& error,
                                                   const json& /*event*/,
                                                   const runtime::InvocationContext& context,
                                                   Telemetry& telemetry) {
    telemetry.error("Lambda function execution failed", {
        {"error_message", error.what()},
        {"error_type", core::observability::exception_type_name(error)},
        {"function_name", context.function_name()},
    });
    return runtime::internal_error_response(context.request_id());
}

json DemoFunction::process_business_logic(const json& event,
                                          const runtime::InvocationContext& context,
                                          Telemetry& telemetry,
                                          const SpanHandle& parent) {
    ScopedSpan span = telemetry.scoped_span(parent, "process_business_logic");
    const auto started = std::chrono::steady_clock::now();
    const std::string& request_id = context.request_id();
    const auto input_size = static_cast<int64_t>(event.dump(-1, ' ', false, json::error_handler_t::replace).size());

    span->set_attribute("request.id", request_id);
    span->set_attribute("input.type", event.type_name());
    span->set_attribute("input.size", input_size);

    try {
        json db_result = dynamodb_operation(request_id, telemetry, span.get());
        if (wants_failure(event)) {
            throw runtime::BusinessLogicError("simulated failure requested by event");
        }
        json s3_result = s3_operation(request_id, telemetry, span.get());

        simulate_latency(latency_);
        const auto processing_time = elapsed_ms(started);

        telemetry.metrics().increment("demo_requests_total", 1.0,
                                      {{"status", "success"}, {"function", context.function_name()}});
        telemetry.metrics().observe("demo_processing_duration_ms", static_cast<double>(processing_time),
                                    {{"operation", "business_logic"}});

        const json operations = json::array({"dynamodb", "s3", "processing"});
        telemetry.info("Business logic processing completed successfully", {
            {"processing_time_ms", processing_time},
            {"input_size", input_size},
            {"operations_completed", operations},
            {"db_result", db_result},
            {"s3_result", s3_result},
        });

        span->set_attribute("processing.duration_ms", processing_time);
        span->set_attribute("processing.status", "success");
        span->set_attribute("operations.count", 3);
        span.set_status(StatusCode::ok);

        return {
            {"request_id", request_id},
            {"processing_time_ms", processing_time},
            {"result", "Business logic completed successfully"},
            {"operations", operations},
            {"db_result", db_result},
            {"s3_result", s3_result},
        };
    } catch (const std::exception& e) {
        telemetry.metrics().increment("demo_requests_total", 1.0,
                                      {{"status", "error"}, {"function", context.function_name()}});
        telemetry.error("Business logic processing failed", {
            {"error_message", e.what()},
            {"error_type", core::observability::exception_type_name(e)},
            {"processing_time_ms", elapsed_ms(started)},
        });
        span.fail(e);
        throw;
    }
}

json DemoFunction::dynamodb_operation(const std::string& request_id, Telemetry& telemetry, const SpanHandle& parent) {
    ScopedSpan span = telemetry.scoped_span(parent, "dynamodb_operation");
    span->set_attribute("db.system", "dynamodb");
    span->set_attribute("db.operation", "put_item");
    span->set_attribute("db.table", "demo-table");
    span->set_attribute("request.id", request_id);

    simulate_latency(latency_);

    json result = {
        {"item_id", "item_" + std::to_string(unix_seconds())},
        {"request_id", request_id},
        {"status", "created"},
    };

    span->set_attribute("db.item_id", result["item_id"].get<std::string>());
    span->set_attribute("db.operation.status", "success");
    span.set_status(StatusCode::ok);
    return result;
}

json DemoFunction::s3_operation(const std::string& request_id, Telemetry& telemetry, const SpanHandle& parent) {
    ScopedSpan span = telemetry.scoped_span(parent, "s3_operation");
    span->set_attribute("aws.service", "s3");
    span->set_attribute("aws.operation", "put_object");
    span->set_attribute("aws.bucket", "demo-bucket");
    span->set_attribute("request.id", request_id);

    simulate_latency(latency_);

    json result = {
        {"object_key", "logs/" + request_id + ".json"},
        {"bucket", "demo-bucket"},
        {"size", 1024},
    };

    span->set_attribute("aws.s3.object_key", result["object_key"].get<std::string>());
    span->set_attribute("aws.s3.object_size", 1024);
    span.set_status(StatusCode::ok);
    return result;
}

}  // namespace faastel::functions
