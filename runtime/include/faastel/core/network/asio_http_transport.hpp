#pragma once

#include "faastel/core/network/http_transport.hpp"
#include "faastel/core/logging/logger.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <asio.hpp>
#include <asio/ssl.hpp>

namespace faastel::core::network {

/**
 * @brief HTTP/1.1 client on Asio (plain TCP or TLS through asio::ssl).
 *
 * send() drives the transport's own io_context until the response is read or
 * the timeout expires. On expiry the connection is closed, the pending
 * resolve is cancelled and send() returns std::errc::timed_out right away;
 * abandoned handlers finish on a later send() or when the transport is
 * destroyed. One connection per request (Connection: close), one send() at a
 * time.
 *
 * A DNS lookup that was abandoned on timeout may still be running inside
 * getaddrinfo; destroying the transport waits for it.
 */
class AsioHttpTransport : public HttpTransport {
public:
    using Endpoints = asio::ip::tcp::resolver::results_type;
    using ResolveHandler = std::function<void(std::error_code, Endpoints)>;
    using ResolveStep = std::function<void(const Url&, ResolveHandler)>;

    explicit AsioHttpTransport(std::shared_ptr<logging::Logger> logger, bool verify_peer = true);

    std::string_view type() const noexcept override { return "asio"; }

    std::error_code send(const HttpRequest& request,
                         std::chrono::milliseconds timeout,
                         HttpResponse& response) override;

    // Extra CA bundle (PEM); the system default paths are always loaded
    void set_ca_file(std::string path) { ca_file_ = std::move(path); }

    // Upper bound for buffered response bytes
    void set_max_response_size(std::size_t bytes) { max_response_size_ = bytes; }

    // Replaces the name lookup; an empty step restores asio's resolver
    void set_resolve_step(ResolveStep step);

private:
    std::error_code configure_tls(asio::ssl::context& ssl_ctx) const;

    std::shared_ptr<logging::Logger> logger_;
    bool verify_peer_;
    std::string ca_file_;
    std::size_t max_response_size_{1024 * 1024};

    asio::io_context io_context_;
    asio::ip::tcp::resolver resolver_;
    ResolveStep resolve_step_;
    std::mutex send_mutex_;
};

} // namespace faastel::core::network
