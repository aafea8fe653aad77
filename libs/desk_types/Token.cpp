#include "Token.hpp"

#include <utility>

namespace desk_types {

Token::Token(std::string id_, std::string owned_by_, std::string token_)
    : id(std::move(id_)), owned_by(std::move(owned_by_)), token(std::move(token_)) {}

bool Token::same_claim(const Token& other) const {
    return is_held() && id == other.id;
}

bool Token::operator==(const Token& other) const {
    return id == other.id && owned_by == other.owned_by && token == other.token;
}

} // namespace desk_types
