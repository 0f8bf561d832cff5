#include "faastel/runtime/invoker.hpp"

#include "faastel/core/observability/telemetry.hpp"

namespace faastel::runtime {

using core::observability::FlushScope;
using core::observability::StatusCode;
using core::observability::Telemetry;

Invoker::Invoker(core::observability::ExportConfig config,
                 core::network::HttpTransportPtr transport,
                 std::shared_ptr<core::logging::Logger> logger)
    : exporter_(std::make_shared<core::observability::Exporter>(std::move(config), std::move(transport), logger)),
      logger_(std::move(logger)) {
    if (logger_ && !exporter_->config().enabled()) {
        logger_->info("[invoke] sink credentials not configured, telemetry export disabled");
    }
}

InvocationResponse Invoker::invoke(FunctionHandler& handler,
                                   const nlohmann::json& event,
                                   const InvocationContext& context) {
    Telemetry telemetry(exporter_, logger_, [&context]() { return context.remaining_time(); });
    auto root = telemetry.begin_invocation(context.request_id(), handler.root_span_name());

    if (logger_) {
        logger_->debug("[invoke] " + std::string{handler.name()} + " request " + context.request_id() +
                       " with " + std::to_string(context.remaining_time().count()) + "ms left");
    }

    InvocationResponse response;
    try {
        response = handler.handle(event, context, telemetry, root);
        telemetry.end_span(root, StatusCode::ok);
    } catch (const std::exception& e) {
        if (logger_) logger_->error("[invoke] " + std::string{handler.name()} + " failed: " + e.what());
        root->record_exception(e);
        try {
            response = handler.on_error(e, event, context, telemetry);
        } catch (const std::exception& secondary) {
            if (logger_) logger_->error("[invoke] error handler failed: " + std::string{secondary.what()});
            response = internal_error_response(context.request_id());
        } catch (...) {
            if (logger_) logger_->error("[invoke] error handler failed with a non-standard exception");
            response = internal_error_response(context.request_id());
        }
        root->set_attribute("response.status_code", response.status_code);
        telemetry.end_span(root, StatusCode::error, e.what());
    } catch (...) {
        telemetry.end_span(root, StatusCode::error, "unknown exception");
        finish(telemetry, context);
        throw;
    }

    if (response.header("X-Request-ID").empty()) {
        response.headers["X-Request-ID"] = context.request_id();
    }

    finish(telemetry, context);
    return response;
}

void Invoker::finish(Telemetry& telemetry, const InvocationContext& context) {
    auto open = telemetry.context().live_span_count();
    if (open > 0 && logger_) {
        logger_->warn("[invoke] " + std::to_string(open) + " spans still open at invocation end, not exported");
    }

    last_flush_ = telemetry.flush(context.remaining_time(), FlushScope::events_and_metrics);
    if (logger_) {
        logger_->info("[invoke] request " + context.request_id() + " flushed " +
                      std::to_string(last_flush_.record_count) + " records: " +
                      core::observability::to_string(last_flush_.status));
        logger_->flush();
    }
    core::logging::flush_all();
}

}  // namespace faastel::runtime
