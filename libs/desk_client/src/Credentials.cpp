#include "desk_client/Credentials.hpp"

#include <openssl/evp.h>
#include <openssl/sha.h>

#include <algorithm>
#include <vector>

namespace pandadesk::client {

namespace {

constexpr size_t MIME_LINE_LENGTH = 76;

} // anonymous namespace

std::string password_digest_text(const std::string& username, const std::string& password) {
    const std::string salted = password + "#" + username + "@franka";

    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(salted.data()), salted.size(), digest);

    std::string text;
    for (size_t i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
        if (i > 0) text += ',';
        text += std::to_string(static_cast<unsigned>(digest[i]));
    }
    return text;
}

std::string base64_mime(const std::string& data) {
    if (data.empty()) {
        return {};
    }

    // EVP_EncodeBlock writes 4 bytes per 3-byte group plus a terminating NUL
    std::vector<unsigned char> encoded(4 * ((data.size() + 2) / 3) + 1);
    int length = EVP_EncodeBlock(encoded.data(),
                                 reinterpret_cast<const unsigned char*>(data.data()),
                                 static_cast<int>(data.size()));

    std::string result;
    result.reserve(static_cast<size_t>(length) + static_cast<size_t>(length) / MIME_LINE_LENGTH + 1);
    for (int offset = 0; offset < length; offset += static_cast<int>(MIME_LINE_LENGTH)) {
        int line = std::min(static_cast<int>(MIME_LINE_LENGTH), length - offset);
        result.append(encoded.begin() + offset, encoded.begin() + offset + line);
        result += '\n';
    }
    return result;
}

std::string encode_password(const std::string& username, const std::string& password) {
    return base64_mime(password_digest_text(username, password));
}

} // namespace pandadesk::client
