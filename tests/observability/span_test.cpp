#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <thread>

#include "faastel/core/observability/span.hpp"

using namespace faastel::core::observability;

TEST_CASE("Span lifecycle", "[observability][span]") {
    Span span("lookup", "req-1", Span::generate_id(), "parent-1");

    SECTION("open span accepts attributes of every scalar type") {
        REQUIRE(span.is_open());
        REQUIRE(span.status().code == StatusCode::unset);
        REQUIRE_FALSE(span.end_time().has_value());

        REQUIRE(span.set_attribute("db.table", "demo-table"));
        REQUIRE(span.set_attribute("db.rows", int64_t{42}));
        REQUIRE(span.set_attribute("retries", 3));
        REQUIRE(span.set_attribute("ratio", 0.5));
        REQUIRE(span.set_attribute("cached", true));

        auto attributes = span.attributes();
        REQUIRE(std::get<std::string>(attributes.at("db.table")) == "demo-table");
        REQUIRE(std::get<int64_t>(attributes.at("db.rows")) == 42);
        REQUIRE(std::get<int64_t>(attributes.at("retries")) == 3);
        REQUIRE(std::get<double>(attributes.at("ratio")) == 0.5);
        REQUIRE(std::get<bool>(attributes.at("cached")) == true);
    }

    SECTION("end is idempotent") {
        REQUIRE(span.end(StatusCode::error, "boom"));
        auto first_end = span.end_time();
        REQUIRE(first_end.has_value());

        REQUIRE_FALSE(span.end(StatusCode::ok));
        REQUIRE(span.status().code == StatusCode::error);
        REQUIRE(span.status().message == "boom");
        REQUIRE(span.end_time() == first_end);
    }

    SECTION("end timestamp never precedes start") {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        span.end();
        REQUIRE(*span.end_time() >= span.start_time());
        REQUIRE(span.snapshot().duration() >= std::chrono::milliseconds(0));
    }

    SECTION("unset status finalizes as ok") {
        span.end(StatusCode::unset);
        REQUIRE(span.status().code == StatusCode::ok);
    }

    SECTION("ok status drops the error message") {
        span.end(StatusCode::ok, "ignored");
        REQUIRE(span.status().message.empty());
    }

    SECTION("ended span rejects mutations") {
        span.end();
        REQUIRE_FALSE(span.set_attribute("late", "value"));
        REQUIRE_FALSE(span.record_exception("std::runtime_error", "late"));
        REQUIRE(span.attributes().empty());
        REQUIRE(span.exceptions().empty());
    }
}

TEST_CASE("Span exception capture", "[observability][span]") {
    Span span("process", "req-2", Span::generate_id());

    SECTION("recording keeps the span open") {
        REQUIRE(span.record_exception(std::runtime_error("disk full")));
        REQUIRE(span.is_open());
        REQUIRE(span.status().code == StatusCode::unset);

        auto exceptions = span.exceptions();
        REQUIRE(exceptions.size() == 1);
        REQUIRE(exceptions[0].type == "std::runtime_error");
        REQUIRE(exceptions[0].message == "disk full");
    }

    SECTION("nested exceptions are flattened into the stack text") {
        try {
            try {
                throw std::out_of_range("index 7");
            } catch (const std::exception&) {
                std::throw_with_nested(std::runtime_error("lookup failed"));
            }
        } catch (const std::exception& e) {
            span.record_exception(e);
        }

        auto exceptions = span.exceptions();
        REQUIRE(exceptions.size() == 1);
        REQUIRE(exceptions[0].message == "lookup failed");
        REQUIRE(exceptions[0].stacktrace == "caused by std::out_of_range: index 7");
    }

    SECTION("exceptions keep call order") {
        span.record_exception("A", "first");
        span.record_exception("B", "second");
        auto exceptions = span.exceptions();
        REQUIRE(exceptions.size() == 2);
        REQUIRE(exceptions[0].type == "A");
        REQUIRE(exceptions[1].type == "B");
    }
}

TEST_CASE("Span snapshot and identity", "[observability][span]") {
    SECTION("root has no parent") {
        Span root("handler", "req-3", Span::generate_id());
        REQUIRE(root.is_root());
        Span child("child", "req-3", Span::generate_id(), root.span_id());
        REQUIRE_FALSE(child.is_root());
        REQUIRE(child.parent_span_id() == root.span_id());
    }

    SECTION("snapshot copies the finalized state") {
        Span span("handler", "req-3", "00000000000000aa");
        span.set_attribute("k", "v");
        span.end(StatusCode::error, "failed");

        SpanData data = span.snapshot();
        REQUIRE(data.name == "handler");
        REQUIRE(data.correlation_id == "req-3");
        REQUIRE(data.span_id == "00000000000000aa");
        REQUIRE(data.parent_span_id.empty());
        REQUIRE(data.status.code == StatusCode::error);
        REQUIRE(data.end_time == *span.end_time());
        REQUIRE(data.attributes.size() == 1);
    }

    SECTION("generated ids are 16 hex characters and distinct") {
        auto a = Span::generate_id();
        auto b = Span::generate_id();
        REQUIRE(a.size() == 16);
        REQUIRE(a.find_first_not_of("0123456789abcdef") == std::string::npos);
        REQUIRE(a != b);
    }
}
