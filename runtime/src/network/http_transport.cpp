#include "faastel/core/network/http_transport.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace faastel::core::network {
namespace {

bool iequals(std::string_view lhs, std::string_view rhs) {
    return lhs.size() == rhs.size() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
               return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
           });
}

bool has_header(const HttpHeaders& headers, std::string_view name) {
    return std::any_of(headers.begin(), headers.end(),
                       [name](const auto& header) { return iequals(header.first, name); });
}

std::string_view trim_view(std::string_view text) {
    auto begin = text.find_first_not_of(" \t");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t");
    return text.substr(begin, end - begin + 1);
}

std::error_code decode_chunked(std::string_view body, std::string& out) {
    std::size_t pos = 0;
    while (pos < body.size()) {
        auto line_end = body.find("\r\n", pos);
        if (line_end == std::string_view::npos) {
            return std::make_error_code(std::errc::bad_message);
        }
        auto size_text = body.substr(pos, line_end - pos);
        auto ext = size_text.find(';');
        if (ext != std::string_view::npos) {
            size_text = size_text.substr(0, ext);
        }
        size_text = trim_view(size_text);

        std::size_t chunk_size = 0;
        auto result = std::from_chars(size_text.data(), size_text.data() + size_text.size(), chunk_size, 16);
        if (result.ec != std::errc{}) {
            return std::make_error_code(std::errc::bad_message);
        }
        pos = line_end + 2;
        if (chunk_size == 0) {
            return {};
        }
        if (pos + chunk_size > body.size()) {
            return std::make_error_code(std::errc::bad_message);
        }
        out.append(body.substr(pos, chunk_size));
        pos += chunk_size + 2;
    }
    return std::make_error_code(std::errc::bad_message);
}

}  // namespace

std::string HttpResponse::header(std::string_view name) const {
    for (const auto& [key, value] : headers) {
        if (iequals(key, name)) {
            return value;
        }
    }
    return {};
}

std::string Url::host_header() const {
    bool default_port = (secure() && port == "443") || (!secure() && port == "80");
    return default_port ? host : host + ":" + port;
}

std::optional<Url> Url::parse(std::string_view text) {
    auto scheme_end = text.find("://");
    if (scheme_end == std::string_view::npos) {
        return std::nullopt;
    }

    Url url;
    url.scheme = std::string{text.substr(0, scheme_end)};
    std::transform(url.scheme.begin(), url.scheme.end(), url.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (url.scheme != "http" && url.scheme != "https") {
        return std::nullopt;
    }

    auto rest = text.substr(scheme_end + 3);
    auto path_start = rest.find('/');
    auto authority = rest.substr(0, path_start);
    if (path_start != std::string_view::npos) {
        url.target = std::string{rest.substr(path_start)};
    }

    if (!authority.empty() && authority.front() == '[') {
        // IPv6 literal: [::1]:8080
        auto close = authority.find(']');
        if (close == std::string_view::npos) {
            return std::nullopt;
        }
        url.host = std::string{authority.substr(1, close - 1)};
        auto after = authority.substr(close + 1);
        if (!after.empty() && after.front() == ':') {
            url.port = std::string{after.substr(1)};
        }
    } else {
        auto colon = authority.rfind(':');
        if (colon != std::string_view::npos) {
            url.host = std::string{authority.substr(0, colon)};
            url.port = std::string{authority.substr(colon + 1)};
        } else {
            url.host = std::string{authority};
        }
    }

    if (url.host.empty()) {
        return std::nullopt;
    }
    if (url.port.empty()) {
        url.port = url.secure() ? "443" : "80";
    }
    if (!std::all_of(url.port.begin(), url.port.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    return url;
}

std::string serialize_request(const HttpRequest& request, const Url& url) {
    std::string wire;
    wire.reserve(256 + request.body.size());
    wire.append(request.method).append(" ").append(url.target).append(" HTTP/1.1\r\n");

    if (!has_header(request.headers, "Host")) {
        wire.append("Host: ").append(url.host_header()).append("\r\n");
    }
    for (const auto& [name, value] : request.headers) {
        wire.append(name).append(": ").append(value).append("\r\n");
    }
    if (!has_header(request.headers, "Content-Length")) {
        wire.append("Content-Length: ").append(std::to_string(request.body.size())).append("\r\n");
    }
    if (!has_header(request.headers, "Connection")) {
        wire.append("Connection: close\r\n");
    }
    wire.append("\r\n");
    wire.append(request.body);
    return wire;
}

std::error_code parse_response(std::string_view raw, HttpResponse& response) {
    auto header_end = raw.find("\r\n\r\n");
    if (header_end == std::string_view::npos) {
        return std::make_error_code(std::errc::bad_message);
    }

    auto head = raw.substr(0, header_end);
    auto status_end = head.find("\r\n");
    auto status_line = head.substr(0, status_end);

    // HTTP/1.1 200 OK
    if (status_line.substr(0, 5) != "HTTP/") {
        return std::make_error_code(std::errc::bad_message);
    }
    auto first_space = status_line.find(' ');
    if (first_space == std::string_view::npos || first_space + 4 > status_line.size()) {
        return std::make_error_code(std::errc::bad_message);
    }
    auto code_text = status_line.substr(first_space + 1, 3);
    int status = 0;
    auto result = std::from_chars(code_text.data(), code_text.data() + code_text.size(), status);
    if (result.ec != std::errc{} || status < 100 || status > 599) {
        return std::make_error_code(std::errc::bad_message);
    }
    response.status = status;
    response.reason = status_line.size() > first_space + 5
        ? std::string{trim_view(status_line.substr(first_space + 5))}
        : std::string{};

    response.headers.clear();
    std::size_t pos = status_end == std::string_view::npos ? head.size() : status_end + 2;
    while (pos < head.size()) {
        auto line_end = head.find("\r\n", pos);
        auto line = head.substr(pos, line_end == std::string_view::npos ? std::string_view::npos : line_end - pos);
        auto colon = line.find(':');
        if (colon != std::string_view::npos) {
            response.headers.emplace_back(std::string{trim_view(line.substr(0, colon))},
                                          std::string{trim_view(line.substr(colon + 1))});
        }
        if (line_end == std::string_view::npos) {
            break;
        }
        pos = line_end + 2;
    }

    auto body = raw.substr(header_end + 4);
    response.body.clear();
    if (iequals(response.header("Transfer-Encoding"), "chunked")) {
        return decode_chunked(body, response.body);
    }

    auto length_text = response.header("Content-Length");
    if (!length_text.empty()) {
        std::size_t length = 0;
        auto length_result = std::from_chars(length_text.data(), length_text.data() + length_text.size(), length);
        if (length_result.ec != std::errc{}) {
            return std::make_error_code(std::errc::bad_message);
        }
        if (length > body.size()) {
            return std::make_error_code(std::errc::bad_message);
        }
        body = body.substr(0, length);
    }
    response.body = std::string{body};
    return {};
}

}  // namespace faastel::core::network
