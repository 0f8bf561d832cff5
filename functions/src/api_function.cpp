#include "faastel/functions/api_function.hpp"

#include <algorithm>

#include "faastel/core/observability/span.hpp"
#include "faastel/functions/builtin.hpp"

namespace faastel::functions {
namespace {

using core::observability::ScopedSpan;
using core::observability::SpanHandle;
using core::observability::StatusCode;
using core::observability::Telemetry;
using nlohmann::json;

const json& member(const json& object, const char* key) {
    static const json null_value;
    if (!object.is_object()) {
        return null_value;
    }
    auto it = object.find(key);
    return it == object.end() ? null_value : *it;
}

std::string string_member(const json& object, const char* key, const std::string& fallback) {
    const json& value = member(object, key);
    return value.is_string() ? value.get<std::string>() : fallback;
}

json object_member(const json& object, const char* key) {
    const json& value = member(object, key);
    return value.is_object() ? value : json::object();
}

std::string now_text() {
    return core::observability::format_timestamp(std::chrono::system_clock::now());
}

int64_t response_time_ms(const Telemetry& telemetry) {
    auto root = telemetry.root();
    if (!root) {
        return 0;
    }
    auto elapsed = std::chrono::system_clock::now() - root->start_time();
    return std::max<int64_t>(0, std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
}

bool wants_failure(const json& event) {
    const json& fail = member(event, "fail");
    if (fail.is_boolean() && fail.get<bool>()) {
        return true;
    }
    return string_member(member(event, "queryStringParameters"), "fail", "") == "true";
}

}  // namespace

void ApiFunction::configure(const core::config::Configuration& configuration) {
    latency_ = std::chrono::milliseconds(configuration.get_int("functions.simulated_latency_ms", 0));
    region_ = configuration.get_string("runtime.region");
}

runtime::InvocationResponse ApiFunction::handle(const json& event,
                                                const runtime::InvocationContext& context,
                                                Telemetry& telemetry,
                                                const SpanHandle& root) {
    const std::string method = string_member(event, "httpMethod", "UNKNOWN");
    const std::string path = string_member(event, "path", "/");
    const json query_params = object_member(event, "queryStringParameters");
    const json headers = object_member(event, "headers");
    const std::string user_agent = string_member(headers, "User-Agent", "unknown");
    const json& request_context = member(event, "requestContext");
    const std::string source_ip = string_member(member(request_context, "identity"), "sourceIp", "unknown");

    root->set_attribute("http.method", method);
    root->set_attribute("http.route", path);
    root->set_attribute("http.scheme", "https");
    root->set_attribute("http.user_agent", user_agent);
    root->set_attribute("http.client_ip", source_ip);
    root->set_attribute("faas.execution", context.request_id());
    root->set_attribute("faas.id", context.function_name());
    root->set_attribute("cloud.region", region_);

    telemetry.info("API request received", {
        {"http_method", method},
        {"http_path", path},
        {"query_params", query_params},
        {"user_agent", user_agent},
        {"source_ip", source_ip},
        {"api_gateway_request_id", string_member(request_context, "requestId", "")},
        {"headers_count", headers.size()},
    });

    json processing_result = process_api_request(event, context.request_id(), telemetry, root);
    const auto response_time = response_time_ms(telemetry);

    telemetry.metrics().increment("api_requests_total", 1.0, {{"method", method}, {"path", path}, {"status", "200"}});
    telemetry.metrics().observe("api_response_time_ms", static_cast<double>(response_time),
                                {{"method", method}, {"path", path}});

    runtime::InvocationResponse response;
    response.status_code = 200;
    response.headers["Content-Type"] = "application/json";
    response.headers["Access-Control-Allow-Origin"] = "*";
    response.headers["X-Request-ID"] = context.request_id();
    response.headers["X-Response-Time"] = std::to_string(response_time) + "ms";
    response.body = {
        {"message", "API request processed successfully"},
        {"requestId", context.request_id()},
        {"method", method},
        {"path", path},
        {"queryParams", query_params},
        {"processingResult", processing_result},
        {"responseTime", response_time},
        {"timestamp", now_text()},
    };

    telemetry.info("API request processed successfully", {
        {"response_time_ms", response_time},
        {"status_code", response.status_code},
        {"external_data_id", processing_result["external_data"]["id"]},
        {"response_size", response.body.dump().size()},
    });

    root->set_attribute("http.status_code", response.status_code);
    root->set_attribute("http.response_time_ms", response_time);
    root->set_attribute("api.success", true);
    return response;
}

runtime::InvocationResponse ApiFunction::on_error(const std::exception& error,
                                                  const json& event,
                                                  const runtime::InvocationContext& context,
                                                  Telemetry& telemetry) {
    const std::string method = string_member(event, "httpMethod", "UNKNOWN");
    const std::string path = string_member(event, "path", "/");
    const auto response_time = response_time_ms(telemetry);

    telemetry.metrics().increment("api_requests_total", 1.0, {{"method", method}, {"path", path}, {"status", "500"}});
    telemetry.error("API request failed", {
        {"error_message", error.what()},
        {"error_type", core::observability::exception_type_name(error)},
        {"response_time_ms", response_time},
        {"http_method", method},
        {"http_path", path},
    });

    auto response = runtime::internal_error_response(context.request_id());
    response.headers["Access-Control-Allow-Origin"] = "*";
    return response;
}

json ApiFunction::process_api_request(const json& event,
                                      const std::string& request_id,
                                      Telemetry& telemetry,
                                      const SpanHandle& parent) {
    ScopedSpan span = telemetry.scoped_span(parent, "process_api_request");
    span->set_attribute("processing.type", "api_business_logic");
    span->set_attribute("request.id", request_id);

    try {
        json external_data = external_api_call(request_id, telemetry, span.get());
        if (wants_failure(event)) {
            throw runtime::BusinessLogicError("simulated failure requested by event");
        }
        simulate_latency(latency_);

        span->set_attribute("processing.success", true);
        span->set_attribute("external.data.id", external_data["id"].get<int64_t>());
        span.set_status(StatusCode::ok);

        return {
            {"processed_at", now_text()},
            {"external_data", external_data},
            {"request_processed", true},
        };
    } catch (const std::exception& e) {
        span.fail(e);
        throw;
    }
}

json ApiFunction::external_api_call(const std::string& request_id, Telemetry& telemetry, const SpanHandle& parent) {
    ScopedSpan span = telemetry.scoped_span(parent, "external_api_call");
    span->set_attribute("http.method", "GET");
    span->set_attribute("http.url", "https://api.example.com/data");
    span->set_attribute("external.service", "example-api");
    span->set_attribute("request.id", request_id);

    simulate_latency(latency_);

    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    json mock = {
        {"id", static_cast<int64_t>(seconds % 1000)},
        {"data", "Sample data for request " + request_id},
        {"timestamp", now_text()},
        {"status", "success"},
    };

    span->set_attribute("http.status_code", 200);
    span->set_attribute("external.response.id", mock["id"].get<int64_t>());
    span->set_attribute("external.response.status", "success");
    span.set_status(StatusCode::ok);
    return mock;
}

}  // namespace faastel::functions
