#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace faastel::core::config {

// Maps a configuration key onto the environment variable that overrides it.
struct EnvironmentBinding {
    std::string key;
    std::string variable;
};

class Configuration {
public:
    using EnvironmentLookup = std::function<const char*(const char*)>;

    Configuration() = default;

    static Configuration load_from_file(const std::filesystem::path& path);

    [[nodiscard]] const std::filesystem::path& source_path() const noexcept { return source_path_; }
    [[nodiscard]] bool contains(std::string_view key) const;
    [[nodiscard]] std::string get_string(std::string_view key, std::string default_value = "") const;
    [[nodiscard]] bool get_bool(std::string_view key, bool default_value = false) const;
    [[nodiscard]] int get_int(std::string_view key, int default_value = 0) const;
    [[nodiscard]] std::vector<std::string> get_list(std::string_view key) const;
    [[nodiscard]] std::size_t size() const noexcept { return values_.size(); }
    [[nodiscard]] std::vector<std::string> get_keys() const;

    void set(std::string key, std::string value);

    /**
     * @brief Copies every bound environment variable that is set (and non-empty)
     * over the matching key. Environment always wins over the file.
     * @return number of keys overridden
     */
    std::size_t overlay_environment(const std::vector<EnvironmentBinding>& bindings);
    std::size_t overlay_environment(const std::vector<EnvironmentBinding>& bindings,
                                    const EnvironmentLookup& lookup);

    // Variables understood by the function runtime (see config/faastel.sample.toml).
    static const std::vector<EnvironmentBinding>& default_environment_bindings();

    static std::string trim(std::string_view text);
    static std::string strip_quotes(std::string_view text);

private:
    using Table = std::unordered_map<std::string, std::string>;

    Table values_{};
    std::filesystem::path source_path_{};
};

}  // namespace faastel::core::config
