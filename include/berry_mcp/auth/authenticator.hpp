#pragma once

#include <berry_mcp/core/result.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace berry_mcp {

// Request headers as received from the HTTP layer. Use FindHeader for
// case-insensitive lookup.
using HttpHeaders = std::multimap<std::string, std::string>;

// Header value by case-insensitive name; nullopt when absent.
std::optional<std::string> FindHeader(const HttpHeaders& headers, const std::string& name);

// The token from "Authorization: Bearer <token>", if well formed.
std::optional<std::string> ExtractBearerToken(const HttpHeaders& headers);

// What an authenticator learned about the caller.
struct TokenInfo {
    std::string token_type = "Bearer";
    std::string subject;
    std::vector<std::string> scopes;
};

// ---------------------------------------------------------------------------
// IAuthenticator: validates inbound HTTP requests before dispatch. An Err
// result (ErrorCategory::Authentication) is answered with 401.
// ---------------------------------------------------------------------------
class IAuthenticator {
public:
    virtual ~IAuthenticator() = default;
    virtual Result<TokenInfo, Error> Authenticate(const HttpHeaders& headers) const = 0;
};

// ---------------------------------------------------------------------------
// BearerTokenAuthenticator: accepts a fixed set of static bearer tokens.
// Comparison takes the same time wherever the first difference is.
// ---------------------------------------------------------------------------
class BearerTokenAuthenticator : public IAuthenticator {
public:
    explicit BearerTokenAuthenticator(std::vector<std::string> tokens);

    Result<TokenInfo, Error> Authenticate(const HttpHeaders& headers) const override;

    [[nodiscard]] std::size_t TokenCount() const noexcept { return tokens_.size(); }

private:
    std::vector<std::string> tokens_;
};

// Constant-time string equality (length still leaks).
[[nodiscard]] bool ConstantTimeEquals(const std::string& a, const std::string& b);

} // namespace berry_mcp
