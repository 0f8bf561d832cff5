#include "faastel/core/observability/metrics.hpp"

#include <algorithm>
#include <cmath>

namespace faastel::core::observability {
namespace {

std::vector<double> sorted_unique(std::vector<double> bounds) {
    std::sort(bounds.begin(), bounds.end());
    bounds.erase(std::unique(bounds.begin(), bounds.end()), bounds.end());
    return bounds;
}

}  // namespace

MetricsAggregator::MetricsAggregator(std::shared_ptr<logging::Logger> logger, std::vector<double> bucket_bounds)
    : logger_(std::move(logger)), bucket_bounds_(sorted_unique(std::move(bucket_bounds))) {
}

std::vector<double> MetricsAggregator::default_bucket_bounds() {
    return {0, 5, 10, 25, 50, 75, 100, 250, 500, 750, 1000, 2500, 5000, 7500, 10000};
}

void MetricsAggregator::set_correlation_id(std::string correlation_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    correlation_id_ = std::move(correlation_id);
}

bool MetricsAggregator::increment(const std::string& name, double delta, const Labels& labels) {
    if (!std::isfinite(delta) || delta < 0.0) {
        if (logger_) logger_->warn("[metrics] rejected delta " + std::to_string(delta) + " for counter " + name);
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    counters_[SeriesKey{name, labels}] += delta;
    return true;
}

bool MetricsAggregator::observe(const std::string& name, double value, const Labels& labels) {
    if (!std::isfinite(value)) {
        if (logger_) logger_->warn("[metrics] rejected non-finite observation for histogram " + name);
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto& state = histograms_[SeriesKey{name, labels}];
    if (state.bucket_counts.empty()) {
        state.bucket_counts.assign(bucket_bounds_.size() + 1, 0);
    }
    if (state.count == 0) {
        state.min = value;
        state.max = value;
    } else {
        state.min = std::min(state.min, value);
        state.max = std::max(state.max, value);
    }
    ++state.count;
    state.sum += value;

    // Bucket i covers (bounds[i-1], bounds[i]]
    auto bucket = std::lower_bound(bucket_bounds_.begin(), bucket_bounds_.end(), value) - bucket_bounds_.begin();
    ++state.bucket_counts[static_cast<std::size_t>(bucket)];
    return true;
}

double MetricsAggregator::counter_value(const std::string& name, const Labels& labels) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counters_.find(SeriesKey{name, labels});
    return it == counters_.end() ? 0.0 : it->second;
}

std::optional<HistogramState> MetricsAggregator::histogram(const std::string& name, const Labels& labels) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = histograms_.find(SeriesKey{name, labels});
    if (it == histograms_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t MetricsAggregator::series_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return counters_.size() + histograms_.size();
}

std::vector<MetricData> MetricsAggregator::snapshot() const {
    const auto now = std::chrono::system_clock::now();
    std::vector<MetricData> points;

    std::lock_guard<std::mutex> lock(mutex_);
    points.reserve(counters_.size() + histograms_.size());

    for (const auto& [key, value] : counters_) {
        MetricData point;
        point.name = key.first;
        point.kind = MetricKind::counter;
        point.labels = key.second;
        point.correlation_id = correlation_id_;
        point.timestamp = now;
        point.value = value;
        points.push_back(std::move(point));
    }

    for (const auto& [key, state] : histograms_) {
        MetricData point;
        point.name = key.first;
        point.kind = MetricKind::histogram;
        point.labels = key.second;
        point.correlation_id = correlation_id_;
        point.timestamp = now;
        point.count = state.count;
        point.sum = state.sum;
        point.min = state.min;
        point.max = state.max;
        point.bucket_bounds = bucket_bounds_;
        point.bucket_counts = state.bucket_counts;
        points.push_back(std::move(point));
    }
    return points;
}

FlushResult MetricsAggregator::flush(Exporter& exporter, std::chrono::milliseconds budget) {
    std::vector<TelemetryEvent> batch;
    for (auto& point : snapshot()) {
        batch.emplace_back(std::move(point));
    }

    auto result = exporter.flush(batch, budget);
    if (!result.ok() && logger_) {
        logger_->warn("[metrics] flush of " + std::to_string(batch.size()) + " series failed: " +
                      (result.error ? result.error->diagnostic : std::string{"unknown"}));
    }
    return result;
}

}  // namespace faastel::core::observability
