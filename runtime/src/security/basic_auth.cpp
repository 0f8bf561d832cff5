#include "faastel/core/security/basic_auth.hpp"

#include <array>
#include <utility>

namespace faastel::core::security {

namespace {
constexpr std::string_view kBase64Chars =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
}

BasicCredentials::BasicCredentials(std::string username, std::string password)
    : username_(std::move(username)), password_(std::move(password)) {
}

std::string BasicCredentials::authorization_header() const {
    return "Basic " + to_base64(username_ + ":" + password_);
}

std::string BasicCredentials::to_base64(std::string_view data) {
    std::string base64;
    base64.reserve(((data.size() + 2) / 3) * 4);

    std::array<unsigned char, 3> group{};
    std::size_t filled = 0;

    auto emit = [&base64](const std::array<unsigned char, 3>& in, std::size_t count) {
        std::array<unsigned char, 4> out{};
        out[0] = static_cast<unsigned char>((in[0] & 0xfc) >> 2);
        out[1] = static_cast<unsigned char>(((in[0] & 0x03) << 4) + ((in[1] & 0xf0) >> 4));
        out[2] = static_cast<unsigned char>(((in[1] & 0x0f) << 2) + ((in[2] & 0xc0) >> 6));
        out[3] = static_cast<unsigned char>(in[2] & 0x3f);
        for (std::size_t i = 0; i < count + 1; ++i) {
            base64 += kBase64Chars[out[i]];
        }
        for (std::size_t i = count; i < 3; ++i) {
            base64 += '=';
        }
    };

    for (char c : data) {
        group[filled++] = static_cast<unsigned char>(c);
        if (filled == 3) {
            emit(group, 3);
            filled = 0;
        }
    }

    if (filled) {
        for (std::size_t i = filled; i < 3; ++i) group[i] = '\0';
        emit(group, filled);
    }

    return base64;
}

} // namespace faastel::core::security
