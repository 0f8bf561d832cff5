#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

#include "faastel/functions/demo_function.hpp"
#include "faastel/runtime/invoker.hpp"
#include "support/recording_transport.hpp"

using namespace faastel;
using core::observability::ExportConfig;
using core::observability::FlushStatus;
using test::RecordingTransport;

namespace {

ExportConfig acme_lambda_sink() {
    ExportConfig config;
    config.base_endpoint = "https://sink.example.com";
    config.organization = "acme";
    config.stream = "lambda";
    config.username = "ingest@acme.test";
    config.password = "pw";
    config.function_name = "demo-fn";
    return config;
}

runtime::InvocationContext demo_context(const std::string& request_id) {
    return runtime::InvocationContext::with_timeout(
        request_id, "demo-fn", std::chrono::seconds(30), "$LATEST",
        "arn:aws:lambda:us-east-1:111122223333:function:demo-fn");
}

std::shared_ptr<core::logging::Logger> test_logger() {
    return std::make_shared<core::logging::Logger>("invoker-test");
}

std::vector<nlohmann::json> records_of_type(const nlohmann::json& batch, const std::string& type) {
    std::vector<nlohmann::json> found;
    for (const auto& record : batch) {
        if (record.value("type", "log") == type) {
            found.push_back(record);
        }
    }
    return found;
}

class ThrowsNonStandard : public runtime::FunctionHandler {
public:
    std::string_view name() const noexcept override { return "odd"; }
    std::string root_span_name() const override { return "odd_handler"; }
    void configure(const core::config::Configuration&) override {}
    runtime::InvocationResponse handle(const nlohmann::json&, const runtime::InvocationContext&,
                                       core::observability::Telemetry& telemetry,
                                       const core::observability::SpanHandle&) override {
        telemetry.info("about to fail oddly");
        throw 42;
    }
};

class ErrorHandlerThrowsNonStandard : public runtime::FunctionHandler {
public:
    std::string_view name() const noexcept override { return "fragile"; }
    std::string root_span_name() const override { return "fragile_handler"; }
    void configure(const core::config::Configuration&) override {}
    runtime::InvocationResponse handle(const nlohmann::json&, const runtime::InvocationContext&,
                                       core::observability::Telemetry&,
                                       const core::observability::SpanHandle&) override {
        throw std::runtime_error("downstream unavailable");
    }
    runtime::InvocationResponse on_error(const std::exception&, const nlohmann::json&,
                                         const runtime::InvocationContext&,
                                         core::observability::Telemetry&) override {
        throw 42;
    }
};

}  // namespace

TEST_CASE("Successful invocation exports one batch", "[runtime][invoker][e2e]") {
    auto transport = std::make_shared<RecordingTransport>();
    runtime::Invoker invoker(acme_lambda_sink(), transport, test_logger());
    functions::DemoFunction demo;

    auto response = invoker.invoke(demo, {{"test", "manual"}}, demo_context("corr-123"));

    REQUIRE(response.status_code == 200);
    REQUIRE(response.header("X-Request-ID") == "corr-123");
    REQUIRE(response.body["requestId"] == "corr-123");
    REQUIRE(response.body["message"] == "Function executed successfully");

    REQUIRE(transport->call_count() == 1);
    REQUIRE(transport->requests[0].url == "https://sink.example.com/api/acme/lambda/_json");
    REQUIRE(invoker.last_flush().status == FlushStatus::delivered);

    auto batch = transport->batch();
    auto started = test::records_with_message(batch, "Lambda function invocation started");
    REQUIRE(started.size() == 1);
    REQUIRE(started[0]["request_id"] == "corr-123");
    REQUIRE(started[0]["level"] == "info");
    REQUIRE(started[0]["function_name"] == "demo-fn");
    REQUIRE(started[0]["event_source"] == "unknown");

    SECTION("every record shares the invocation's correlation id") {
        for (const auto& record : batch) {
            REQUIRE(record["request_id"] == "corr-123");
        }
    }

    SECTION("span tree hangs off the root") {
        auto spans = records_of_type(batch, "span");
        REQUIRE(spans.size() == 4);

        auto root = test::records_with_message(batch, "lambda_handler");
        REQUIRE(root.size() == 1);
        REQUIRE_FALSE(root[0].contains("parent_span_id"));
        REQUIRE(root[0]["status"] == "ok");
        REQUIRE(root[0]["attributes"]["cloud.account.id"] == "111122223333");
        REQUIRE(root[0]["attributes"]["faas.execution"] == "corr-123");

        auto business = test::records_with_message(batch, "process_business_logic");
        REQUIRE(business.at(0)["parent_span_id"] == root[0]["span_id"]);
        auto db = test::records_with_message(batch, "dynamodb_operation");
        REQUIRE(db.at(0)["parent_span_id"] == business[0]["span_id"]);
        REQUIRE(db.at(0)["attributes"]["db.system"] == "dynamodb");
    }

    SECTION("metrics ride in the same POST") {
        auto metrics = records_of_type(batch, "metric");
        REQUIRE(metrics.size() == 2);
        auto counter = test::records_with_message(batch, "demo_requests_total");
        REQUIRE(counter.at(0)["value"] == 1.0);
        REQUIRE(counter.at(0)["labels"]["status"] == "success");
    }
}

TEST_CASE("Failing business logic yields a recorded 500", "[runtime][invoker][e2e]") {
    auto transport = std::make_shared<RecordingTransport>();
    runtime::Invoker invoker(acme_lambda_sink(), transport, test_logger());
    functions::DemoFunction demo;

    auto response = invoker.invoke(demo, {{"fail", true}}, demo_context("corr-err"));

    REQUIRE(response.status_code == 500);
    REQUIRE(response.header("X-Request-ID") == "corr-err");
    REQUIRE(response.body["error"] == "Internal server error");
    REQUIRE(response.body["requestId"] == "corr-err");
    REQUIRE_FALSE(response.body.contains("error_message"));

    REQUIRE(transport->call_count() == 1);
    auto batch = transport->batch();

    auto failed = test::records_with_message(batch, "Lambda function execution failed");
    REQUIRE(failed.size() == 1);
    REQUIRE(failed[0]["level"] == "error");
    REQUIRE(failed[0]["request_id"] == "corr-err");
    REQUIRE(failed[0]["error_message"] == "simulated failure requested by event");

    auto root = test::records_with_message(batch, "lambda_handler");
    REQUIRE(root.size() == 1);
    REQUIRE(root[0]["status"] == "error");
    REQUIRE(root[0]["level"] == "error");
    REQUIRE(root[0]["exceptions"].size() == 1);
    REQUIRE(root[0]["exceptions"][0]["type"] == "faastel::runtime::BusinessLogicError");

    auto business = test::records_with_message(batch, "process_business_logic");
    REQUIRE(business.at(0)["status"] == "error");
    REQUIRE(test::records_with_message(batch, "Business logic processing failed").size() == 1);
    REQUIRE(test::records_with_message(batch, "s3_operation").empty());

    auto counter = test::records_with_message(batch, "demo_requests_total");
    REQUIRE(counter.at(0)["labels"]["status"] == "error");
}

TEST_CASE("Sink failures do not change the invocation result", "[runtime][invoker]") {
    auto transport = std::make_shared<RecordingTransport>();
    transport->status = 500;
    runtime::Invoker invoker(acme_lambda_sink(), transport, test_logger());
    functions::DemoFunction demo;

    auto response = invoker.invoke(demo, {{"test", "manual"}}, demo_context("corr-500"));

    REQUIRE(response.status_code == 200);
    REQUIRE(invoker.last_flush().status == FlushStatus::failed);
    REQUIRE(invoker.last_flush().error->kind == core::observability::DeliveryErrorKind::transient);
    REQUIRE(transport->call_count() == 1);
}

TEST_CASE("Unconfigured sink never touches the transport", "[runtime][invoker]") {
    auto transport = std::make_shared<RecordingTransport>();
    runtime::Invoker invoker(ExportConfig{}, transport, test_logger());
    functions::DemoFunction demo;

    runtime::InvocationResponse response;
    REQUIRE_NOTHROW(response = invoker.invoke(demo, {{"test", "manual"}}, demo_context("corr-off")));
    REQUIRE(response.status_code == 200);
    REQUIRE(invoker.last_flush().status == FlushStatus::skipped);
    REQUIRE(transport->call_count() == 0);
}

TEST_CASE("Non-standard exceptions are flushed then rethrown", "[runtime][invoker]") {
    auto transport = std::make_shared<RecordingTransport>();
    runtime::Invoker invoker(acme_lambda_sink(), transport, test_logger());
    ThrowsNonStandard handler;

    REQUIRE_THROWS_AS(invoker.invoke(handler, nlohmann::json::object(), demo_context("corr-odd")), int);

    REQUIRE(transport->call_count() == 1);
    auto root = test::records_with_message(transport->batch(), "odd_handler");
    REQUIRE(root.size() == 1);
    REQUIRE(root[0]["status"] == "error");
    REQUIRE(test::records_with_message(transport->batch(), "about to fail oddly").size() == 1);
}

TEST_CASE("Non-standard exception from the error handler falls back to a generic 500", "[runtime][invoker]") {
    auto transport = std::make_shared<RecordingTransport>();
    runtime::Invoker invoker(acme_lambda_sink(), transport, test_logger());
    ErrorHandlerThrowsNonStandard handler;

    runtime::InvocationResponse response;
    REQUIRE_NOTHROW(response = invoker.invoke(handler, nlohmann::json::object(), demo_context("corr-fragile")));

    REQUIRE(response.status_code == 500);
    REQUIRE(response.header("X-Request-ID") == "corr-fragile");
    REQUIRE(transport->call_count() == 1);
    auto root = test::records_with_message(transport->batch(), "fragile_handler");
    REQUIRE(root.size() == 1);
    REQUIRE(root[0]["status"] == "error");
}
