#include "faastel/core/observability/exporter.hpp"

#include <algorithm>

#include "faastel/core/config/configuration.hpp"
#include "faastel/core/observability/wire_format.hpp"
#include "faastel/core/security/basic_auth.hpp"

namespace faastel::core::observability {
namespace {

std::string without_trailing_slash(std::string text) {
    while (!text.empty() && text.back() == '/') {
        text.pop_back();
    }
    return text;
}

constexpr std::size_t kMaxDiagnosticLength = 512;

}  // namespace

bool ExportConfig::enabled() const noexcept {
    return !base_endpoint.empty() && !organization.empty() && !username.empty() && !password.empty();
}

std::string ExportConfig::ingest_url() const {
    return without_trailing_slash(base_endpoint) + "/api/" + organization + "/" +
           (stream.empty() ? std::string{"default"} : stream) + "/_json";
}

ExportConfig ExportConfig::from_configuration(const config::Configuration& config) {
    ExportConfig result;
    result.base_endpoint = config.get_string("export.base_endpoint");
    result.organization = config.get_string("export.organization");
    result.stream = config.get_string("export.stream", "default");
    result.username = config.get_string("export.username");
    result.password = config.get_string("export.password");
    result.service_name = config.get_string("export.service_name", "faastel-function");
    result.function_name = config.get_string("export.function_name");
    result.request_timeout = std::chrono::milliseconds(config.get_int("export.request_timeout_ms", 2000));
    result.deadline_margin = std::chrono::milliseconds(config.get_int("export.deadline_margin_ms", 100));
    result.flush_on_span_end = config.get_bool("export.flush_on_span_end", false);
    result.verify_tls = config.get_bool("export.verify_tls", true);
    return result;
}

const char* to_string(DeliveryErrorKind kind) noexcept {
    switch (kind) {
        case DeliveryErrorKind::transient: return "transient";
        case DeliveryErrorKind::permanent: return "permanent";
    }
    return "transient";
}

const char* to_string(FlushStatus status) noexcept {
    switch (status) {
        case FlushStatus::delivered: return "delivered";
        case FlushStatus::skipped:   return "skipped";
        case FlushStatus::failed:    return "failed";
    }
    return "failed";
}

FlushResult FlushResult::delivered(std::size_t records) {
    return FlushResult{FlushStatus::delivered, records, std::nullopt};
}

FlushResult FlushResult::skipped(std::size_t records) {
    return FlushResult{FlushStatus::skipped, records, std::nullopt};
}

FlushResult FlushResult::failed(std::size_t records, DeliveryError error) {
    return FlushResult{FlushStatus::failed, records, std::move(error)};
}

Exporter::Exporter(ExportConfig config, network::HttpTransportPtr transport, std::shared_ptr<logging::Logger> logger)
    : config_(std::move(config)), transport_(std::move(transport)), logger_(std::move(logger)) {
    if (config_.enabled()) {
        authorization_ = security::BasicCredentials(config_.username, config_.password).authorization_header();
        url_ = config_.ingest_url();
    }
}

std::optional<DeliveryErrorKind> Exporter::classify_status(int status) noexcept {
    if (status >= 200 && status < 300) {
        return std::nullopt;
    }
    if (status >= 500 || status == 408 || status == 429) {
        return DeliveryErrorKind::transient;
    }
    return DeliveryErrorKind::permanent;
}

FlushResult Exporter::flush(const std::vector<TelemetryEvent>& batch, std::chrono::milliseconds budget) {
    try {
        return deliver(batch, budget);
    } catch (const std::exception& e) {
        if (logger_) logger_->error("[export] flush aborted: " + std::string{e.what()});
        return FlushResult::failed(batch.size(), DeliveryError{DeliveryErrorKind::transient, 0, e.what(), {}});
    }
}

FlushResult Exporter::deliver(const std::vector<TelemetryEvent>& batch, std::chrono::milliseconds budget) {
    if (!config_.enabled()) {
        if (logger_) {
            logger_->debug("[export] sink not configured, skipping " + std::to_string(batch.size()) + " records");
        }
        return FlushResult::skipped(batch.size());
    }
    if (batch.empty()) {
        return FlushResult::delivered(0);
    }
    if (!transport_) {
        if (logger_) logger_->error("[export] no transport available");
        return FlushResult::failed(batch.size(),
            DeliveryError{DeliveryErrorKind::permanent, 0, "no transport", {}});
    }

    const auto timeout = std::min(config_.request_timeout, budget - config_.deadline_margin);
    if (timeout.count() <= 0) {
        if (logger_) {
            logger_->warn("[export] deadline exhausted (" + std::to_string(budget.count()) +
                          "ms left), dropping " + std::to_string(batch.size()) + " records");
        }
        return FlushResult::failed(batch.size(),
            DeliveryError{DeliveryErrorKind::transient, 0, "deadline exhausted",
                          std::make_error_code(std::errc::timed_out)});
    }

    network::HttpRequest request;
    request.method = "POST";
    request.url = url_;
    request.headers = {
        {"Content-Type", "application/json"},
        {"Authorization", authorization_},
    };
    request.body = to_wire_batch(batch, RecordEnvelope{config_.service_name, config_.function_name});

    network::HttpResponse response;
    auto ec = transport_->send(request, timeout, response);
    if (ec) {
        if (logger_) {
            logger_->warn("[export] delivery of " + std::to_string(batch.size()) + " records failed: " + ec.message());
        }
        return FlushResult::failed(batch.size(),
            DeliveryError{DeliveryErrorKind::transient, 0, ec.message(), ec});
    }

    auto kind = classify_status(response.status);
    if (!kind) {
        if (logger_) {
            logger_->debug("[export] delivered " + std::to_string(batch.size()) + " records (HTTP " +
                           std::to_string(response.status) + ")");
        }
        return FlushResult::delivered(batch.size());
    }

    std::string diagnostic = response.body.substr(0, kMaxDiagnosticLength);
    if (logger_) {
        logger_->warn("[export] sink rejected " + std::to_string(batch.size()) + " records with HTTP " +
                      std::to_string(response.status) + " (" + to_string(*kind) + "): " + diagnostic);
    }
    return FlushResult::failed(batch.size(), DeliveryError{*kind, response.status, std::move(diagnostic), {}});
}

}  // namespace faastel::core::observability
