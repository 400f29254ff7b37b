#pragma once

#include <string>
#include <vector>
#include <optional>
#include <boost/beast/core/detail/base64.hpp>

namespace strongbox {

// Strict base64 (RFC 4648 standard alphabet) on top of Beast's codec.
// Beast stops silently at the first foreign character, so input is
// validated before it is handed over.
class Base64Codec {
public:
    // Encodes bytes as one padded base64 line with no folding.
    static std::string encode(const std::vector<unsigned char>& data) {
        std::string out;
        out.resize(boost::beast::detail::base64::encoded_size(data.size()));
        auto written = boost::beast::detail::base64::encode(out.data(), data.data(), data.size());
        out.resize(written);
        return out;
    }

    /**
     * Validates the base64 alphabet and padding layout.
     * Padding is optional, but when present the input length must be a
     * multiple of four and at most two '=' may close it.
     */
    static bool is_valid(const std::string& input) {
        size_t padding = 0;
        size_t body = input.size();
        while (body > 0 && input[body - 1] == '=') {
            --body;
            ++padding;
        }
        if (padding > 2) return false;
        if (padding > 0 && input.size() % 4 != 0) return false;
        if (body % 4 == 1) return false;

        auto const inverse = boost::beast::detail::base64::get_inverse();
        for (size_t i = 0; i < body; ++i) {
            if (inverse[static_cast<unsigned char>(input[i])] == -1) return false;
        }
        return true;
    }

    // Returns std::nullopt for malformed input.
    static std::optional<std::vector<unsigned char>> decode(const std::string& input) {
        if (!is_valid(input)) return std::nullopt;

        // Beast's decoded_size() assumes padded input; round up for unpadded tails.
        std::vector<unsigned char> out((input.size() + 3) / 4 * 3);
        auto result = boost::beast::detail::base64::decode(out.data(), input.data(), input.size());

        size_t body = input.find('=');
        if (body == std::string::npos) body = input.size();
        if (result.second != body) return std::nullopt;

        out.resize(result.first);
        return out;
    }

    // Removes ASCII whitespace, used for folded PEM bodies.
    static std::string strip_whitespace(const std::string& input) {
        std::string out;
        out.reserve(input.size());
        for (char c : input) {
            if (c != ' ' && c != '\t' && c != '\r' && c != '\n') out += c;
        }
        return out;
    }
};

}
