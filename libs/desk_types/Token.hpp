#pragma once

#include <string>

namespace desk_types {

// Claim of exclusive control over a Desk
// An empty id is the "no token held" sentinel
struct Token {
    std::string id;        // Device-issued token id (decimal string)
    std::string owned_by;  // Identity that requested the token
    std::string token;     // Secret presented on privileged calls

    Token() = default;
    Token(std::string id, std::string owned_by, std::string token);

    // True when this token represents an actual claim
    bool is_held() const { return !id.empty(); }

    // Same claim on the device (ids match and are non-empty)
    bool same_claim(const Token& other) const;

    bool operator==(const Token& other) const;
    bool operator!=(const Token& other) const { return !(*this == other); }
};

} // namespace desk_types
