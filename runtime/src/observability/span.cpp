#include "faastel/core/observability/span.hpp"

#include <cxxabi.h>
#include <cstdlib>
#include <iomanip>
#include <random>
#include <sstream>
#include <typeinfo>

namespace faastel::core::observability {

Span::Span(std::string name, std::string correlation_id, std::string span_id, std::string parent_span_id)
    : name_(std::move(name)),
      correlation_id_(std::move(correlation_id)),
      span_id_(std::move(span_id)),
      parent_span_id_(std::move(parent_span_id)),
      start_time_(std::chrono::system_clock::now()),
      start_steady_(std::chrono::steady_clock::now()) {
}

bool Span::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !ended_;
}

SpanStatus Span::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

std::optional<Timestamp> Span::end_time() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ended_) {
        return std::nullopt;
    }
    return end_time_;
}

Attributes Span::attributes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return attributes_;
}

std::vector<ExceptionRecord> Span::exceptions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return exceptions_;
}

bool Span::set_attribute(const std::string& key, std::string_view value) {
    return set(key, std::string{value});
}

bool Span::set_attribute(const std::string& key, const char* value) {
    return set(key, std::string{value ? value : ""});
}

bool Span::set_attribute(const std::string& key, int64_t value) {
    return set(key, value);
}

bool Span::set_attribute(const std::string& key, int value) {
    return set(key, static_cast<int64_t>(value));
}

bool Span::set_attribute(const std::string& key, double value) {
    return set(key, value);
}

bool Span::set_attribute(const std::string& key, bool value) {
    return set(key, value);
}

bool Span::set(const std::string& key, AttributeValue value) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ended_) {
        return false;
    }
    attributes_[key] = std::move(value);
    return true;
}

bool Span::record_exception(std::string type, std::string message, std::string stacktrace) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ended_) {
        return false;
    }
    exceptions_.push_back(ExceptionRecord{std::move(type), std::move(message), std::move(stacktrace),
                                          std::chrono::system_clock::now()});
    return true;
}

bool Span::record_exception(const std::exception& ex) {
    // Nested exceptions (std::throw_with_nested) are flattened into the stack text
    std::string chain;
    try {
        std::rethrow_if_nested(ex);
    } catch (const std::exception& nested) {
        chain = "caused by " + exception_type_name(nested) + ": " + nested.what();
    }
    return record_exception(exception_type_name(ex), ex.what(), std::move(chain));
}

bool Span::end(StatusCode code, std::string message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ended_) {
        return false;
    }
    ended_ = true;
    // Wall-clock end derived from the monotonic duration keeps end >= start
    end_time_ = start_time_ + std::chrono::duration_cast<std::chrono::system_clock::duration>(
                                  std::chrono::steady_clock::now() - start_steady_);
    status_.code = code == StatusCode::unset ? StatusCode::ok : code;
    if (status_.code == StatusCode::error) {
        status_.message = std::move(message);
    }
    return true;
}

SpanData Span::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    SpanData data;
    data.name = name_;
    data.correlation_id = correlation_id_;
    data.span_id = span_id_;
    data.parent_span_id = parent_span_id_;
    data.start_time = start_time_;
    data.end_time = ended_ ? end_time_ : start_time_;
    data.status = status_;
    data.attributes = attributes_;
    data.exceptions = exceptions_;
    return data;
}

std::string Span::generate_id() {
    static thread_local std::mt19937_64 rng(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dist;
    std::ostringstream oss;
    oss << std::hex << std::setw(16) << std::setfill('0') << dist(rng);
    return oss.str();
}

std::string exception_type_name(const std::exception& ex) {
    const char* mangled = typeid(ex).name();
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> demangled(
        abi::__cxa_demangle(mangled, nullptr, nullptr, &status), std::free);
    if (status == 0 && demangled) {
        return demangled.get();
    }
    return mangled;
}

}  // namespace faastel::core::observability
