#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include "faastel/core/logging/logger.hpp"
#include "faastel/core/network/http_transport.hpp"
#include "faastel/core/observability/events.hpp"

namespace faastel::core {

namespace config {
class Configuration;
}

namespace observability {

/**
 * @brief Sink connection settings (export.* keys)
 */
struct ExportConfig {
    std::string base_endpoint;
    std::string organization;
    std::string stream{"default"};
    std::string username;
    std::string password;
    std::string service_name{"faastel-function"};
    std::string function_name;
    std::chrono::milliseconds request_timeout{2000};
    std::chrono::milliseconds deadline_margin{100};
    bool flush_on_span_end{false};
    bool verify_tls{true};

    // Export runs only when endpoint, organization and credentials are all present
    [[nodiscard]] bool enabled() const noexcept;

    // <base_endpoint>/api/<organization>/<stream>/_json
    [[nodiscard]] std::string ingest_url() const;

    static ExportConfig from_configuration(const config::Configuration& config);
};

enum class DeliveryErrorKind {
    transient,
    permanent
};

const char* to_string(DeliveryErrorKind kind) noexcept;

struct DeliveryError {
    DeliveryErrorKind kind{DeliveryErrorKind::transient};
    int http_status{0};       // 0 when no response was received
    std::string diagnostic;   // response body or error description
    std::error_code cause;    // transport error, if any
};

enum class FlushStatus {
    delivered,
    skipped,
    failed
};

const char* to_string(FlushStatus status) noexcept;

struct FlushResult {
    FlushStatus status{FlushStatus::delivered};
    std::size_t record_count{0};
    std::optional<DeliveryError> error;

    [[nodiscard]] bool ok() const noexcept { return status != FlushStatus::failed; }

    static FlushResult delivered(std::size_t records);
    static FlushResult skipped(std::size_t records);
    static FlushResult failed(std::size_t records, DeliveryError error);
};

/**
 * @brief Ships one batch per call to the ingestion endpoint.
 *
 * One attempt, no retry. flush() reports failures through FlushResult and
 * the local log; it never throws.
 */
class Exporter {
public:
    Exporter(ExportConfig config, network::HttpTransportPtr transport, std::shared_ptr<logging::Logger> logger);

    /**
     * @param batch events to deliver (already drained from their buffer)
     * @param budget remaining invocation time; the request timeout is
     *        min(request_timeout, budget - deadline_margin)
     */
    FlushResult flush(const std::vector<TelemetryEvent>& batch, std::chrono::milliseconds budget);

    [[nodiscard]] const ExportConfig& config() const noexcept { return config_; }

    // 2xx -> nullopt; 5xx, 408, 429 -> transient; anything else -> permanent
    static std::optional<DeliveryErrorKind> classify_status(int status) noexcept;

private:
    FlushResult deliver(const std::vector<TelemetryEvent>& batch, std::chrono::milliseconds budget);

    ExportConfig config_;
    network::HttpTransportPtr transport_;
    std::shared_ptr<logging::Logger> logger_;
    std::string authorization_;
    std::string url_;
};

}  // namespace observability
}  // namespace faastel::core
