#pragma once

#include <chrono>
#include <map>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace faastel::runtime {

/**
 * @brief What the runtime tells a handler about the current invocation
 */
class InvocationContext {
public:
    using Clock = std::chrono::steady_clock;

    InvocationContext(std::string request_id,
                      std::string function_name,
                      std::string function_version,
                      std::string invoked_function_arn,
                      Clock::time_point deadline);

    static InvocationContext with_timeout(std::string request_id,
                                          std::string function_name,
                                          std::chrono::milliseconds timeout,
                                          std::string function_version = "$LATEST",
                                          std::string invoked_function_arn = {});

    [[nodiscard]] const std::string& request_id() const noexcept { return request_id_; }
    [[nodiscard]] const std::string& function_name() const noexcept { return function_name_; }
    [[nodiscard]] const std::string& function_version() const noexcept { return function_version_; }
    [[nodiscard]] const std::string& invoked_function_arn() const noexcept { return invoked_function_arn_; }
    [[nodiscard]] Clock::time_point deadline() const noexcept { return deadline_; }

    // Never negative
    [[nodiscard]] std::chrono::milliseconds remaining_time() const;

    // Fifth ':'-separated field of the ARN (arn:aws:lambda:<region>:<account>:function:<name>)
    [[nodiscard]] std::string account_id() const;

private:
    std::string request_id_;
    std::string function_name_;
    std::string function_version_;
    std::string invoked_function_arn_;
    Clock::time_point deadline_;
};

/**
 * @brief Handler output in the HTTP-trigger shape: {statusCode, headers, body}
 */
struct InvocationResponse {
    int status_code{200};
    std::map<std::string, std::string> headers;
    nlohmann::json body = nlohmann::json::object();

    [[nodiscard]] std::string header(const std::string& name) const;

    // body is rendered as a JSON string, the way HTTP integrations expect it
    [[nodiscard]] nlohmann::json to_json() const;

    /**
     * @brief What goes back to the runtime for this event: the to_json()
     * envelope for HTTP-triggered events, the plain body object otherwise.
     */
    [[nodiscard]] nlohmann::json result_for(const nlohmann::json& event) const;
};

// Generic 500 body: {"error":"Internal server error","requestId":...,"timestamp":...}
InvocationResponse internal_error_response(const std::string& request_id);

// API-gateway style events carry httpMethod or requestContext
bool is_http_event(const nlohmann::json& event);

/**
 * @brief Failure raised by business logic; recorded on the active span and
 * re-raised to the invocation boundary
 */
class BusinessLogicError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace faastel::runtime
