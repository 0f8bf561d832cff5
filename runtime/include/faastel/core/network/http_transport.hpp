#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace faastel::core::network {

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

struct HttpRequest {
    std::string method{"POST"};
    std::string url;
    HttpHeaders headers;
    std::string body;
};

struct HttpResponse {
    int status{0};
    std::string reason;
    HttpHeaders headers;
    std::string body;

    [[nodiscard]] bool success() const noexcept { return status >= 200 && status < 300; }
    // Case-insensitive lookup; empty when absent
    [[nodiscard]] std::string header(std::string_view name) const;
};

/**
 * @brief Parsed absolute http(s) URL
 */
struct Url {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target{"/"};

    [[nodiscard]] bool secure() const noexcept { return scheme == "https"; }
    [[nodiscard]] std::string host_header() const;

    static std::optional<Url> parse(std::string_view text);
};

/**
 * @brief Builds the HTTP/1.1 wire form of a request (Host, Content-Length and
 * Connection: close are added when the caller did not set them)
 */
std::string serialize_request(const HttpRequest& request, const Url& url);

/**
 * @brief Parses a complete response read until connection close.
 * Handles Content-Length and chunked bodies.
 */
std::error_code parse_response(std::string_view raw, HttpResponse& response);

/**
 * @brief Transport interface for delivering one HTTP request
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /**
     * @brief Transport name (e.g. "asio")
     */
    virtual std::string_view type() const noexcept = 0;

    /**
     * @brief Performs one request/response exchange.
     * @param timeout upper bound for the whole exchange (resolve, connect, handshake, write, read)
     * @return empty on a complete response (any status); std::errc::timed_out when the
     *         timeout elapsed; otherwise the network error
     */
    virtual std::error_code send(const HttpRequest& request,
                                 std::chrono::milliseconds timeout,
                                 HttpResponse& response) = 0;
};

using HttpTransportPtr = std::shared_ptr<HttpTransport>;

}  // namespace faastel::core::network
