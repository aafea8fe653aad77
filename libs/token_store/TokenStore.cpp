#include "TokenStore.hpp"

#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <cstdlib>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace token_store {

namespace fs = std::filesystem;
namespace pt = boost::property_tree;

namespace {

// INI section names end at the first ']', so bracketed IPv6 hosts are
// percent-encoded on disk: '%' -> %25, '[' -> %5B, ']' -> %5D
std::string encode_section(const std::string& host) {
    std::string encoded;
    for (char c : host) {
        switch (c) {
            case '%': encoded += "%25"; break;
            case '[': encoded += "%5B"; break;
            case ']': encoded += "%5D"; break;
            default: encoded += c; break;
        }
    }
    return encoded;
}

// Host names contain dots, so section names must never be split into paths
pt::ptree::path_type section_key(const std::string& host) {
    return pt::ptree::path_type(encode_section(host), '\0');
}

desk_types::Token token_from_section(const pt::ptree& section) {
    desk_types::Token token;
    token.id = section.get<std::string>("id", "");
    token.owned_by = section.get<std::string>("owned_by", "");
    token.token = section.get<std::string>("token", "");
    return token;
}

pt::ptree read_tree(const fs::path& path) {
    pt::ptree tree;
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return tree;
    }
    try {
        pt::ini_parser::read_ini(path.string(), tree);
    } catch (const pt::ini_parser_error& e) {
        throw TokenStoreError("Cannot read token file " + path.string() + ": " + e.what());
    }
    return tree;
}

} // anonymous namespace

TokenStore::TokenStore(fs::path path)
    : path_(std::move(path)) {}

desk_types::Token TokenStore::load(const std::string& host) const {
    pt::ptree tree = read_tree(path_);
    auto section = tree.get_child_optional(section_key(host));
    if (!section) {
        return desk_types::Token{};
    }
    return token_from_section(*section);
}

void TokenStore::save(const std::string& host, const desk_types::Token& token) {
    if (host.empty()) {
        throw std::invalid_argument("TokenStore::save: host name is empty");
    }
    if (token.is_held() && token.token.empty()) {
        throw std::invalid_argument("TokenStore::save: token " + token.id + " has no secret");
    }

    pt::ptree tree = read_tree(path_);

    pt::ptree section;
    section.put("id", token.id);
    section.put("owned_by", token.owned_by);
    section.put("token", token.token);
    tree.put_child(section_key(host), section);

    try {
        if (path_.has_parent_path()) {
            fs::create_directories(path_.parent_path());
        }
        fs::path tmp = path_;
        tmp += ".tmp";
        pt::ini_parser::write_ini(tmp.string(), tree);
        fs::rename(tmp, path_);
    } catch (const pt::ini_parser_error& e) {
        throw TokenStoreError("Cannot write token file " + path_.string() + ": " + e.what());
    } catch (const fs::filesystem_error& e) {
        throw TokenStoreError("Cannot write token file " + path_.string() + ": " + e.what());
    }
}

fs::path TokenStore::expand_user(const std::string& path) {
    if (path.empty() || path.front() != '~') {
        return fs::path(path);
    }
    const char* home = std::getenv("HOME");
    if (home == nullptr || *home == '\0') {
        return fs::path(path);
    }
    return fs::path(std::string(home) + path.substr(1));
}

} // namespace token_store
