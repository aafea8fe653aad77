#pragma once

#include "Errors.hpp"
#include "Token.hpp"

#include <filesystem>
#include <string>

namespace token_store {

// Default location of the token file, before "~" expansion
constexpr const char* DEFAULT_TOKEN_PATH = "~/.panda_py/token.conf";

// Token file could not be read or written
class TokenStoreError : public desk_types::DeskError {
public:
    explicit TokenStoreError(const std::string& what) : desk_types::DeskError(what) {}
};

// Durable per-host record of control tokens
//
// INI format, one section per host name:
//   [172.16.0.2]
//   id=645396955
//   owned_by=admin
//   token=...
//
// '%', '[' and ']' in host names are percent-encoded in section headers
// ("[fe80::1]" is stored as "[%5Bfe80::1%5D]").
//
// Every save re-reads the whole file, replaces one section and rewrites the
// file through a temporary + rename. Concurrent writers from several
// processes are not coordinated.
class TokenStore {
public:
    explicit TokenStore(std::filesystem::path path);

    // Token stored for host, or the empty sentinel when there is none
    desk_types::Token load(const std::string& host) const;

    // Upserts host's record, keeping every other host's record
    // Creates the parent directory when missing
    // Throws std::invalid_argument for a token with an id but no secret
    void save(const std::string& host, const desk_types::Token& token);

    const std::filesystem::path& path() const { return path_; }

    // Replaces a leading "~" with $HOME
    static std::filesystem::path expand_user(const std::string& path);

private:
    std::filesystem::path path_;
};

} // namespace token_store
