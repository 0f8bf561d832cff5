#include "faastel/core/network/asio_http_transport.hpp"

#include <functional>
#include <optional>
#include <type_traits>

#include <openssl/err.h>
#include <openssl/ssl.h>

namespace faastel::core::network {
namespace {

using Clock = std::chrono::steady_clock;
using Completion = std::function<void(std::error_code)>;

template <typename Stream>
struct is_ssl_stream : std::false_type {};

template <typename Next>
struct is_ssl_stream<asio::ssl::stream<Next>> : std::true_type {};

// State touched by the handlers of one request. Handlers hold it by
// shared_ptr, so a request abandoned on timeout stays valid until they run.
template <typename Stream>
struct Exchange {
    template <typename... Args>
    explicit Exchange(std::shared_ptr<asio::ssl::context> tls, Args&&... args)
        : tls_context(std::move(tls)), stream(std::forward<Args>(args)...) {}

    std::shared_ptr<asio::ssl::context> tls_context;
    Stream stream;
    std::string wire;
    std::string raw;
    AsioHttpTransport::Endpoints endpoints;
};

/**
 * Runs one asynchronous step at a time on the transport's io_context, giving
 * each step whatever is left of the overall deadline. On expiry the cancel
 * action closes the connection and run() returns at once; it never waits for
 * the cancelled handlers (a blocked getaddrinfo cannot be interrupted).
 */
class DeadlineRunner {
public:
    DeadlineRunner(asio::io_context& io_context, Clock::time_point deadline, std::function<void()> cancel)
        : io_context_(io_context), deadline_(deadline), cancel_(std::move(cancel)) {}

    std::error_code run(const std::function<void(Completion)>& initiate) {
        auto outcome = std::make_shared<std::optional<std::error_code>>();
        initiate([outcome](std::error_code ec) { *outcome = ec; });

        // Steps whose work lives outside the io_context must not make it run dry
        auto work = asio::make_work_guard(io_context_);
        if (io_context_.stopped()) {
            io_context_.restart();
        }
        // Handlers left over from an abandoned request may run here too
        while (!outcome->has_value()) {
            if (io_context_.run_one_until(deadline_) == 0) {
                break;
            }
        }
        work.reset();

        if (!outcome->has_value()) {
            cancel_();
            return std::make_error_code(std::errc::timed_out);
        }
        return **outcome;
    }

private:
    asio::io_context& io_context_;
    Clock::time_point deadline_;
    std::function<void()> cancel_;
};

template <typename Stream>
std::error_code exchange(DeadlineRunner& runner,
                         const AsioHttpTransport::ResolveStep& resolve,
                         const std::shared_ptr<Exchange<Stream>>& state,
                         const Url& url,
                         std::size_t max_response_size) {
    auto ec = runner.run([&](Completion done) {
        resolve(url, [state, done](std::error_code error, AsioHttpTransport::Endpoints results) {
            state->endpoints = std::move(results);
            done(error);
        });
    });
    if (ec) return ec;

    ec = runner.run([&](Completion done) {
        asio::async_connect(state->stream.lowest_layer(), state->endpoints,
            [state, done](std::error_code error, const asio::ip::tcp::endpoint& /*endpoint*/) { done(error); });
    });
    if (ec) return ec;

    if constexpr (is_ssl_stream<Stream>::value) {
        ec = runner.run([&](Completion done) {
            state->stream.async_handshake(asio::ssl::stream_base::client,
                [state, done](std::error_code error) { done(error); });
        });
        if (ec) return ec;
    }

    ec = runner.run([&](Completion done) {
        asio::async_write(state->stream, asio::buffer(state->wire),
            [state, done](std::error_code error, std::size_t /*length*/) { done(error); });
    });
    if (ec) return ec;

    // Connection: close, so the response ends at EOF
    ec = runner.run([&](Completion done) {
        asio::async_read(state->stream, asio::dynamic_buffer(state->raw, max_response_size),
            [state, done](std::error_code error, std::size_t /*length*/) { done(error); });
    });
    if (ec == asio::error::eof) {
        return {};
    }
    if constexpr (is_ssl_stream<Stream>::value) {
        // Peers that drop TCP without close_notify
        if (ec == asio::ssl::error::stream_truncated) {
            return {};
        }
    }
    return ec;
}

}  // namespace

AsioHttpTransport::AsioHttpTransport(std::shared_ptr<logging::Logger> logger, bool verify_peer)
    : logger_(std::move(logger)), verify_peer_(verify_peer), resolver_(io_context_) {
}

void AsioHttpTransport::set_resolve_step(ResolveStep step) {
    std::lock_guard<std::mutex> lock(send_mutex_);
    resolve_step_ = std::move(step);
}

std::error_code AsioHttpTransport::configure_tls(asio::ssl::context& ssl_ctx) const {
    std::error_code ec;
    ssl_ctx.set_options(asio::ssl::context::default_workarounds |
                        asio::ssl::context::no_sslv2 |
                        asio::ssl::context::no_sslv3, ec);
    if (ec) return ec;

    if (!verify_peer_) {
        ssl_ctx.set_verify_mode(asio::ssl::verify_none, ec);
        return ec;
    }

    ssl_ctx.set_default_verify_paths(ec);
    if (ec) return ec;
    if (!ca_file_.empty()) {
        ssl_ctx.load_verify_file(ca_file_, ec);
        if (ec) return ec;
    }
    ssl_ctx.set_verify_mode(asio::ssl::verify_peer, ec);
    return ec;
}

std::error_code AsioHttpTransport::send(const HttpRequest& request,
                                        std::chrono::milliseconds timeout,
                                        HttpResponse& response) {
    auto url = Url::parse(request.url);
    if (!url) {
        if (logger_) logger_->error("[http] invalid url: " + request.url);
        return std::make_error_code(std::errc::invalid_argument);
    }
    if (timeout.count() <= 0) {
        return std::make_error_code(std::errc::timed_out);
    }

    std::lock_guard<std::mutex> lock(send_mutex_);
    const auto started = Clock::now();
    const auto deadline = started + timeout;

    ResolveStep resolve = resolve_step_;
    if (!resolve) {
        resolve = [this](const Url& target, ResolveHandler handler) {
            resolver_.async_resolve(target.host, target.port, std::move(handler));
        };
    }

    std::string raw;
    std::error_code ec;

    if (url->secure()) {
        auto ssl_ctx = std::make_shared<asio::ssl::context>(asio::ssl::context::tls_client);
        ec = configure_tls(*ssl_ctx);
        if (ec) {
            if (logger_) logger_->error("[http] TLS setup failed: " + ec.message());
            return ec;
        }

        using TlsStream = asio::ssl::stream<asio::ip::tcp::socket>;
        auto state = std::make_shared<Exchange<TlsStream>>(ssl_ctx, io_context_, *ssl_ctx);
        state->wire = serialize_request(request, *url);
        if (!SSL_set_tlsext_host_name(state->stream.native_handle(), url->host.c_str())) {
            return std::error_code(static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category());
        }
        if (verify_peer_) {
            state->stream.set_verify_callback(asio::ssl::host_name_verification(url->host));
        }

        DeadlineRunner runner(io_context_, deadline, [this, state]() {
            resolver_.cancel();
            std::error_code ignored;
            state->stream.lowest_layer().close(ignored);
        });
        ec = exchange(runner, resolve, state, *url, max_response_size_);
        if (!ec) raw = std::move(state->raw);
    } else {
        auto state = std::make_shared<Exchange<asio::ip::tcp::socket>>(nullptr, io_context_);
        state->wire = serialize_request(request, *url);

        DeadlineRunner runner(io_context_, deadline, [this, state]() {
            resolver_.cancel();
            std::error_code ignored;
            state->stream.close(ignored);
        });
        ec = exchange(runner, resolve, state, *url, max_response_size_);
        if (!ec) raw = std::move(state->raw);
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);
    if (ec) {
        if (logger_) {
            logger_->debug("[http] " + request.method + " " + url->host_header() + url->target +
                           " failed after " + std::to_string(elapsed.count()) + "ms: " + ec.message());
        }
        return ec;
    }

    ec = parse_response(raw, response);
    if (ec) {
        if (logger_) logger_->debug("[http] malformed response from " + url->host_header() + ": " + ec.message());
        return ec;
    }

    if (logger_) {
        logger_->debug("[http] " + request.method + " " + url->host_header() + url->target + " -> " +
                       std::to_string(response.status) + " in " + std::to_string(elapsed.count()) + "ms");
    }
    return {};
}

} // namespace faastel::core::network
