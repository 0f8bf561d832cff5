#pragma once

#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "faastel/core/config/configuration.hpp"
#include "faastel/core/observability/telemetry.hpp"
#include "faastel/runtime/invocation.hpp"

namespace faastel::runtime {

/**
 * @brief An instrumented function. The invoker opens the root span (named by
 * root_span_name()) before handle() and ends it afterwards.
 */
class FunctionHandler {
public:
    virtual ~FunctionHandler() = default;

    virtual std::string_view name() const noexcept = 0;
    virtual std::string root_span_name() const = 0;

    virtual void configure(const core::config::Configuration& configuration) = 0;

    /**
     * @param root the open root span; child spans hang off it
     * @throws any exception raised by the business logic
     */
    virtual InvocationResponse handle(const nlohmann::json& event,
                                      const InvocationContext& context,
                                      core::observability::Telemetry& telemetry,
                                      const core::observability::SpanHandle& root) = 0;

    /**
     * @brief Builds the response for a failed handle(). The exception has
     * already been recorded on the root span. Default: error log + generic 500.
     */
    virtual InvocationResponse on_error(const std::exception& error,
                                        const nlohmann::json& event,
                                        const InvocationContext& context,
                                        core::observability::Telemetry& telemetry);
};

using FunctionHandlerPtr = std::shared_ptr<FunctionHandler>;

class HandlerRegistry {
public:
    HandlerRegistry() = default;

    // A second handler with the same name is rejected
    void register_handler(FunctionHandlerPtr handler);

    template <typename HandlerType, typename... Args>
    HandlerType& emplace_handler(Args&&... args) {
        auto handler = std::make_shared<HandlerType>(std::forward<Args>(args)...);
        register_handler(handler);
        return *handler;
    }

    // Keeps a copy, so handlers registered later get the same settings
    void configure_all(const core::config::Configuration& configuration);

    [[nodiscard]] FunctionHandlerPtr find(std::string_view name) const;
    [[nodiscard]] std::vector<std::string> names() const;
    [[nodiscard]] bool empty() const;

private:
    std::vector<FunctionHandlerPtr> handlers_;
    std::optional<core::config::Configuration> configuration_;
    mutable std::mutex mutex_;
};

}  // namespace faastel::runtime
