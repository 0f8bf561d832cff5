#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <thread>

#include "faastel/core/observability/metrics.hpp"
#include "support/recording_transport.hpp"

using namespace faastel::core::observability;

namespace {

std::shared_ptr<faastel::core::logging::Logger> test_logger() {
    return std::make_shared<faastel::core::logging::Logger>("metrics-test");
}

}  // namespace

TEST_CASE("Counters aggregate by name and label set", "[observability][metrics]") {
    MetricsAggregator metrics(test_logger());

    SECTION("two increments of one aggregate to two") {
        metrics.increment("x", 1, {});
        metrics.increment("x", 1, {});
        REQUIRE(metrics.counter_value("x") == 2.0);
        REQUIRE(metrics.series_count() == 1);
    }

    SECTION("label order does not split a series") {
        metrics.increment("requests", 1, {{"status", "200"}, {"method", "GET"}});
        metrics.increment("requests", 2, {{"method", "GET"}, {"status", "200"}});
        REQUIRE(metrics.counter_value("requests", {{"method", "GET"}, {"status", "200"}}) == 3.0);
        REQUIRE(metrics.series_count() == 1);
    }

    SECTION("different labels are different series") {
        metrics.increment("requests", 1, {{"status", "200"}});
        metrics.increment("requests", 1, {{"status", "500"}});
        REQUIRE(metrics.series_count() == 2);
        REQUIRE(metrics.counter_value("requests", {{"status", "500"}}) == 1.0);
    }

    SECTION("negative and non-finite deltas are rejected") {
        metrics.increment("x", 5);
        REQUIRE_FALSE(metrics.increment("x", -1));
        REQUIRE_FALSE(metrics.increment("x", std::numeric_limits<double>::quiet_NaN()));
        REQUIRE_FALSE(metrics.increment("x", std::numeric_limits<double>::infinity()));
        REQUIRE(metrics.counter_value("x") == 5.0);
    }

    SECTION("unknown series reads as zero") {
        REQUIRE(metrics.counter_value("missing") == 0.0);
        REQUIRE_FALSE(metrics.histogram("missing").has_value());
    }
}

TEST_CASE("Histograms track count, sum, extremes and buckets", "[observability][metrics]") {
    MetricsAggregator metrics(test_logger(), {100.0, 10.0, 10.0});
    REQUIRE(metrics.bucket_bounds() == std::vector<double>{10.0, 100.0});

    metrics.observe("latency_ms", 4.0);
    metrics.observe("latency_ms", 10.0);
    metrics.observe("latency_ms", 55.0);
    metrics.observe("latency_ms", 250.0);
    REQUIRE_FALSE(metrics.observe("latency_ms", std::numeric_limits<double>::quiet_NaN()));

    auto state = metrics.histogram("latency_ms");
    REQUIRE(state.has_value());
    REQUIRE(state->count == 4);
    REQUIRE(state->sum == 319.0);
    REQUIRE(state->min == 4.0);
    REQUIRE(state->max == 250.0);
    // (-inf, 10], (10, 100], (100, +inf)
    REQUIRE(state->bucket_counts == std::vector<uint64_t>{2, 1, 1});
}

TEST_CASE("Default bucket bounds", "[observability][metrics]") {
    auto bounds = MetricsAggregator::default_bucket_bounds();
    REQUIRE(bounds.front() == 0.0);
    REQUIRE(bounds.back() == 10000.0);
    REQUIRE(std::is_sorted(bounds.begin(), bounds.end()));
}

TEST_CASE("Snapshot renders every series without resetting", "[observability][metrics]") {
    MetricsAggregator metrics(test_logger());
    metrics.set_correlation_id("req-7");
    metrics.increment("b_total", 1, {{"k", "v"}});
    metrics.increment("a_total", 3);
    metrics.observe("duration_ms", 12.0, {{"operation", "business_logic"}});

    auto points = metrics.snapshot();
    REQUIRE(points.size() == 3);
    REQUIRE(points[0].name == "a_total");
    REQUIRE(points[0].kind == MetricKind::counter);
    REQUIRE(points[0].value == 3.0);
    REQUIRE(points[1].name == "b_total");
    REQUIRE(points[1].labels.at("k") == "v");
    REQUIRE(points[2].kind == MetricKind::histogram);
    REQUIRE(points[2].count == 1);
    REQUIRE(points[2].bucket_counts.size() == points[2].bucket_bounds.size() + 1);
    for (const auto& point : points) {
        REQUIRE(point.correlation_id == "req-7");
    }

    metrics.increment("a_total", 1);
    REQUIRE(metrics.snapshot()[0].value == 4.0);
}

TEST_CASE("Metrics flush goes through the exporter and never throws", "[observability][metrics]") {
    auto transport = std::make_shared<faastel::test::RecordingTransport>();
    ExportConfig config;
    config.base_endpoint = "http://sink.local";
    config.organization = "acme";
    config.username = "u";
    config.password = "p";
    Exporter exporter(config, transport, test_logger());

    MetricsAggregator metrics(test_logger());
    metrics.set_correlation_id("req-8");
    metrics.increment("demo_requests_total", 1, {{"status", "success"}});

    SECTION("delivered") {
        auto result = metrics.flush(exporter, std::chrono::seconds(10));
        REQUIRE(result.status == FlushStatus::delivered);
        auto batch = transport->batch();
        REQUIRE(batch.size() == 1);
        REQUIRE(batch[0]["type"] == "metric");
        REQUIRE(batch[0]["request_id"] == "req-8");
    }

    SECTION("sink failure is reported, not raised") {
        transport->status = 500;
        FlushResult result;
        REQUIRE_NOTHROW(result = metrics.flush(exporter, std::chrono::seconds(10)));
        REQUIRE(result.status == FlushStatus::failed);
        REQUIRE(metrics.counter_value("demo_requests_total", {{"status", "success"}}) == 1.0);
    }
}

TEST_CASE("Concurrent increments are not lost", "[observability][metrics]") {
    MetricsAggregator metrics(test_logger());
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&metrics]() {
            for (int i = 0; i < 500; ++i) {
                metrics.increment("hits");
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    REQUIRE(metrics.counter_value("hits") == 2000.0);
}
