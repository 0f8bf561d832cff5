#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "faastel/core/observability/events.hpp"

namespace faastel::core::observability {

// Fields stamped on every record of a batch
struct RecordEnvelope {
    std::string service;
    std::string function_name;
};

/**
 * @brief Renders one event as a sink record.
 *
 * Log records carry timestamp, level, message, service, function_name and
 * request_id with their metadata object merged at top level (metadata keys
 * win). Spans and metrics add a "type" field and their own fields.
 */
nlohmann::json to_wire_record(const TelemetryEvent& event, const RecordEnvelope& envelope);

// JSON array body for one POST
std::string to_wire_batch(const std::vector<TelemetryEvent>& batch, const RecordEnvelope& envelope);

}  // namespace faastel::core::observability
