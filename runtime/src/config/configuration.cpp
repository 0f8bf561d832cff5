#include "faastel/core/config/configuration.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <map>
#include <stdexcept>

namespace faastel::core::config {
namespace {

std::string normalize_key(std::string_view section, std::string_view key) {
    if (section.empty()) {
        return std::string{key};
    }
    std::string normalized;
    normalized.reserve(section.size() + 1 + key.size());
    normalized.append(section);
    normalized.push_back('.');
    normalized.append(key);
    return normalized;
}

bool is_list(std::string_view value) {
    return !value.empty() && value.front() == '[' && value.back() == ']';
}

std::vector<std::string> parse_list(std::string_view list_raw) {
    std::vector<std::string> items;
    if (!is_list(list_raw)) {
        return items;
    }

    std::string buffer;
    bool inside_string = false;
    for (size_t i = 1; i + 1 < list_raw.size(); ++i) {
        char ch = list_raw[i];
        if (ch == '"') {
            inside_string = !inside_string;
            continue;
        }
        if (!inside_string && ch == ',') {
            auto trimmed = Configuration::trim(buffer);
            if (!trimmed.empty()) {
                items.emplace_back(Configuration::strip_quotes(trimmed));
            }
            buffer.clear();
            continue;
        }
        buffer.push_back(ch);
    }

    auto trimmed = Configuration::trim(buffer);
    if (!trimmed.empty()) {
        items.emplace_back(Configuration::strip_quotes(trimmed));
    }

    return items;
}

// Drops a trailing "# comment" that is not inside a quoted string.
std::string_view strip_comment(std::string_view value) {
    bool inside_string = false;
    for (size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '"') {
            inside_string = !inside_string;
        } else if (value[i] == '#' && !inside_string) {
            return value.substr(0, i);
        }
    }
    return value;
}

}  // namespace

Configuration Configuration::load_from_file(const std::filesystem::path& path) {
    std::ifstream input{path};
    if (!input) {
        throw std::runtime_error("Cannot open configuration file: " + path.string());
    }

    Configuration config;
    config.source_path_ = path;

    std::string current_section;
    std::map<std::string, int> section_indices;
    std::string line;
    while (std::getline(input, line)) {
        auto trimmed = trim(line);
        if (trimmed.empty() || trimmed.front() == '#') {
            continue;
        }

        if (trimmed.front() == '[' && trimmed.back() == ']') {
            bool is_array = (trimmed.size() > 4 && trimmed[1] == '[' && trimmed[trimmed.size() - 2] == ']');
            if (is_array) {
                std::string section_name = trim(std::string_view{trimmed}.substr(2, trimmed.size() - 4));
                int index = section_indices[section_name]++;
                current_section = section_name + "[" + std::to_string(index) + "]";
            } else {
                current_section = trim(std::string_view{trimmed}.substr(1, trimmed.size() - 2));
            }
            continue;
        }

        auto delimiter = trimmed.find('=');
        if (delimiter == std::string::npos) {
            continue;
        }

        auto key = trim(std::string_view{trimmed}.substr(0, delimiter));
        auto value = trim(strip_comment(std::string_view{trimmed}.substr(delimiter + 1)));
        if (key.empty()) {
            continue;
        }

        config.values_[normalize_key(current_section, key)] = value;
    }

    return config;
}

bool Configuration::contains(std::string_view key) const {
    return values_.find(std::string{key}) != values_.end();
}

std::string Configuration::get_string(std::string_view key, std::string default_value) const {
    auto it = values_.find(std::string{key});
    if (it == values_.end()) {
        return default_value;
    }
    return strip_quotes(it->second);
}

bool Configuration::get_bool(std::string_view key, bool default_value) const {
    auto raw = get_string(key, default_value ? "true" : "false");
    std::string lowered = raw;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "true" || lowered == "1") {
        return true;
    }
    if (lowered == "false" || lowered == "0") {
        return false;
    }
    return default_value;
}

int Configuration::get_int(std::string_view key, int default_value) const {
    auto it = values_.find(std::string{key});
    if (it == values_.end()) {
        return default_value;
    }

    int value = default_value;
    auto text = strip_quotes(trim(it->second));
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec == std::errc{} && result.ptr == text.data() + text.size()) {
        return value;
    }
    return default_value;
}

std::vector<std::string> Configuration::get_list(std::string_view key) const {
    auto it = values_.find(std::string{key});
    if (it == values_.end()) {
        return {};
    }
    auto view = trim(it->second);
    return parse_list(view);
}

std::vector<std::string> Configuration::get_keys() const {
    std::vector<std::string> keys;
    keys.reserve(values_.size());
    for (const auto& [key, _] : values_) {
        keys.push_back(key);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

void Configuration::set(std::string key, std::string value) {
    values_[std::move(key)] = std::move(value);
}

std::size_t Configuration::overlay_environment(const std::vector<EnvironmentBinding>& bindings) {
    return overlay_environment(bindings, [](const char* name) { return std::getenv(name); });
}

std::size_t Configuration::overlay_environment(const std::vector<EnvironmentBinding>& bindings,
                                               const EnvironmentLookup& lookup) {
    std::size_t applied = 0;
    for (const auto& binding : bindings) {
        const char* value = lookup(binding.variable.c_str());
        if (value == nullptr || *value == '\0') {
            continue;
        }
        values_[binding.key] = value;
        ++applied;
    }
    return applied;
}

const std::vector<EnvironmentBinding>& Configuration::default_environment_bindings() {
    static const std::vector<EnvironmentBinding> bindings{
        {"export.base_endpoint", "OPENOBSERVE_BASE_ENDPOINT"},
        {"export.organization", "OPENOBSERVE_ORGANIZATION"},
        {"export.stream", "OPENOBSERVE_STREAM"},
        {"export.username", "OPENOBSERVE_USERNAME"},
        {"export.password", "OPENOBSERVE_PASSWORD"},
        {"export.service_name", "FAASTEL_SERVICE_NAME"},
        {"export.function_name", "AWS_LAMBDA_FUNCTION_NAME"},
        {"export.request_timeout_ms", "FAASTEL_EXPORT_TIMEOUT_MS"},
        {"runtime.region", "AWS_REGION"},
        {"logging.level", "FAASTEL_LOG_LEVEL"},
    };
    return bindings;
}

std::string Configuration::trim(std::string_view text) {
    auto begin = text.find_first_not_of(" \t\n\r");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\n\r");
    return std::string{text.substr(begin, end - begin + 1)};
}

std::string Configuration::strip_quotes(std::string_view text) {
    if (text.size() >= 2) {
        auto first = text.front();
        auto last = text.back();
        if ((first == '"' && last == '"') || (first == '\'' && last == '\'')) {
            return std::string{text.substr(1, text.size() - 2)};
        }
    }
    return std::string{text};
}

}  // namespace faastel::core::config
