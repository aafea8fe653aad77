#pragma once

/**
 * @file Credentials.hpp
 * @brief Password encoding expected by the Desk login endpoint
 *
 * The Desk never receives the clear-text password. The client sends
 *
 *   base64( join(",", SHA256("{password}#{username}@franka")) )
 *
 * where the digest bytes are written as decimal numbers separated by commas
 * and the base64 text is wrapped in MIME lines of 76 characters, each
 * terminated by a newline.
 */

#include <string>

namespace pandadesk::client {

/**
 * @brief Comma separated decimal digest bytes, e.g. "49,115,66,..."
 */
std::string password_digest_text(const std::string& username, const std::string& password);

/**
 * @brief Base64 with MIME line wrapping (76 chars per line, '\n' after each line)
 *
 * Returns an empty string for empty input.
 */
std::string base64_mime(const std::string& data);

/**
 * @brief Encoded password as posted to /admin/api/login
 *
 * Deterministic: the same inputs always produce the same text.
 */
std::string encode_password(const std::string& username, const std::string& password);

} // namespace pandadesk::client
