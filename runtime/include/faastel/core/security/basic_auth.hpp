#pragma once

#include <string>
#include <string_view>

namespace faastel::core::security {

/**
 * @brief HTTP Basic credentials for the ingestion endpoint
 */
class BasicCredentials {
public:
    BasicCredentials() = default;
    BasicCredentials(std::string username, std::string password);

    [[nodiscard]] bool empty() const noexcept { return username_.empty() || password_.empty(); }
    [[nodiscard]] const std::string& username() const noexcept { return username_; }

    /**
     * @brief Value for the Authorization header: "Basic base64(username:password)"
     */
    [[nodiscard]] std::string authorization_header() const;

    static std::string to_base64(std::string_view data);

private:
    std::string username_;
    std::string password_;
};

} // namespace faastel::core::security
