#include "faastel/runtime/invocation.hpp"

#include <algorithm>
#include <cctype>

#include "faastel/core/observability/events.hpp"

namespace faastel::runtime {

InvocationContext::InvocationContext(std::string request_id,
                                     std::string function_name,
                                     std::string function_version,
                                     std::string invoked_function_arn,
                                     Clock::time_point deadline)
    : request_id_(std::move(request_id)),
      function_name_(std::move(function_name)),
      function_version_(std::move(function_version)),
      invoked_function_arn_(std::move(invoked_function_arn)),
      deadline_(deadline) {
}

InvocationContext InvocationContext::with_timeout(std::string request_id,
                                                  std::string function_name,
                                                  std::chrono::milliseconds timeout,
                                                  std::string function_version,
                                                  std::string invoked_function_arn) {
    return InvocationContext(std::move(request_id), std::move(function_name), std::move(function_version),
                             std::move(invoked_function_arn), Clock::now() + timeout);
}

std::chrono::milliseconds InvocationContext::remaining_time() const {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline_ - Clock::now());
    return std::max(left, std::chrono::milliseconds::zero());
}

std::string InvocationContext::account_id() const {
    std::size_t start = 0;
    for (int field = 0; field < 4; ++field) {
        auto colon = invoked_function_arn_.find(':', start);
        if (colon == std::string::npos) {
            return {};
        }
        start = colon + 1;
    }
    auto end = invoked_function_arn_.find(':', start);
    return invoked_function_arn_.substr(start, end == std::string::npos ? std::string::npos : end - start);
}

std::string InvocationResponse::header(const std::string& name) const {
    for (const auto& [key, value] : headers) {
        if (key.size() == name.size() &&
            std::equal(key.begin(), key.end(), name.begin(), [](char a, char b) {
                return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
            })) {
            return value;
        }
    }
    return {};
}

nlohmann::json InvocationResponse::to_json() const {
    return nlohmann::json{
        {"statusCode", status_code},
        {"headers", headers},
        {"body", body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)},
    };
}

nlohmann::json InvocationResponse::result_for(const nlohmann::json& event) const {
    return is_http_event(event) ? to_json() : body;
}

InvocationResponse internal_error_response(const std::string& request_id) {
    InvocationResponse response;
    response.status_code = 500;
    response.headers["Content-Type"] = "application/json";
    response.headers["X-Request-ID"] = request_id;
    response.body = {
        {"error", "Internal server error"},
        {"requestId", request_id},
        {"timestamp", core::observability::format_timestamp(std::chrono::system_clock::now())},
    };
    return response;
}

bool is_http_event(const nlohmann::json& event) {
    return event.is_object() && (event.contains("httpMethod") || event.contains("requestContext"));
}

}  // namespace faastel::runtime
