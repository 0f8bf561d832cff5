#include "faastel/runtime/handler.hpp"

#include <stdexcept>

#include "faastel/core/observability/span.hpp"

namespace faastel::runtime {

InvocationResponse FunctionHandler::on_error(const std::exception& error,
                                             const nlohmann::json& /*event*/,
                                             const InvocationContext& context,
                                             core::observability::Telemetry& telemetry) {
    telemetry.error("Function execution failed", {
        {"error_message", error.what()},
        {"error_type", core::observability::exception_type_name(error)},
        {"function_name", context.function_name()},
    });
    return internal_error_response(context.request_id());
}

void HandlerRegistry::register_handler(FunctionHandlerPtr handler) {
    if (!handler) {
        throw std::invalid_argument("handler is null");
    }

    std::lock_guard lock{mutex_};
    for (const auto& existing : handlers_) {
        if (existing->name() == handler->name()) {
            throw std::invalid_argument("handler already registered: " + std::string{handler->name()});
        }
    }

    handlers_.push_back(std::move(handler));
    if (configuration_) {
        handlers_.back()->configure(*configuration_);
    }
}

void HandlerRegistry::configure_all(const core::config::Configuration& configuration) {
    std::lock_guard lock{mutex_};
    configuration_ = configuration;
    for (auto& handler : handlers_) {
        handler->configure(*configuration_);
    }
}

FunctionHandlerPtr HandlerRegistry::find(std::string_view name) const {
    std::lock_guard lock{mutex_};
    for (const auto& handler : handlers_) {
        if (handler->name() == name) {
            return handler;
        }
    }
    return nullptr;
}

std::vector<std::string> HandlerRegistry::names() const {
    std::lock_guard lock{mutex_};
    std::vector<std::string> result;
    result.reserve(handlers_.size());
    for (const auto& handler : handlers_) {
        result.emplace_back(handler->name());
    }
    return result;
}

bool HandlerRegistry::empty() const {
    std::lock_guard lock{mutex_};
    return handlers_.empty();
}

}  // namespace faastel::runtime
