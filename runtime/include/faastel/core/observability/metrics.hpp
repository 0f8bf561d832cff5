#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "faastel/core/logging/logger.hpp"
#include "faastel/core/observability/events.hpp"
#include "faastel/core/observability/exporter.hpp"

namespace faastel::core::observability {

struct HistogramState {
    uint64_t count{0};
    double sum{0.0};
    double min{0.0};
    double max{0.0};
    std::vector<uint64_t> bucket_counts;  // bucket_bounds.size() + 1 entries, last is overflow
};

/**
 * @brief In-process counters and histograms keyed by (name, label set).
 *
 * Values are cumulative for the aggregator's lifetime; snapshot() does not
 * reset them. All operations are internally locked.
 */
class MetricsAggregator {
public:
    explicit MetricsAggregator(std::shared_ptr<logging::Logger> logger,
                               std::vector<double> bucket_bounds = default_bucket_bounds());

    MetricsAggregator(const MetricsAggregator&) = delete;
    MetricsAggregator& operator=(const MetricsAggregator&) = delete;

    void set_correlation_id(std::string correlation_id);

    // Negative or non-finite deltas are rejected with a warning
    bool increment(const std::string& name, double delta = 1.0, const Labels& labels = {});

    // Non-finite values are rejected with a warning
    bool observe(const std::string& name, double value, const Labels& labels = {});

    [[nodiscard]] double counter_value(const std::string& name, const Labels& labels = {}) const;
    [[nodiscard]] std::optional<HistogramState> histogram(const std::string& name, const Labels& labels = {}) const;
    [[nodiscard]] std::size_t series_count() const;
    [[nodiscard]] const std::vector<double>& bucket_bounds() const noexcept { return bucket_bounds_; }

    // One MetricData per series, counters first, each group ordered by (name, labels)
    [[nodiscard]] std::vector<MetricData> snapshot() const;

    // Exports the current snapshot; failures are logged and reported, never thrown
    FlushResult flush(Exporter& exporter, std::chrono::milliseconds budget);

    static std::vector<double> default_bucket_bounds();

private:
    using SeriesKey = std::pair<std::string, Labels>;

    std::shared_ptr<logging::Logger> logger_;
    const std::vector<double> bucket_bounds_;

    mutable std::mutex mutex_;
    std::string correlation_id_;
    std::map<SeriesKey, double> counters_;
    std::map<SeriesKey, HistogramState> histograms_;
};

}  // namespace faastel::core::observability
