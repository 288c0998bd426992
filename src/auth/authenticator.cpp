#include <berry_mcp/auth/authenticator.hpp>

#include <berry_mcp/core/log.hpp>

#include <algorithm>
#include <cctype>

namespace berry_mcp {

namespace {

bool EqualsIgnoreCase(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

Error MakeAuthError(const std::string& message) {
    return Error{"Authenticate", message, ErrorCategory::Authentication, std::nullopt};
}

} // anonymous namespace

std::optional<std::string> FindHeader(const HttpHeaders& headers, const std::string& name) {
    for (const auto& [key, value] : headers) {
        if (EqualsIgnoreCase(key, name)) return value;
    }
    return std::nullopt;
}

std::optional<std::string> ExtractBearerToken(const HttpHeaders& headers) {
    auto header = FindHeader(headers, "Authorization");
    if (!header) return std::nullopt;

    const std::string scheme = "bearer";
    if (header->size() <= scheme.size() + 1) return std::nullopt;
    if (!EqualsIgnoreCase(header->substr(0, scheme.size()), scheme)) return std::nullopt;
    if ((*header)[scheme.size()] != ' ') return std::nullopt;

    auto token = header->substr(scheme.size() + 1);
    auto begin = token.find_first_not_of(' ');
    if (begin == std::string::npos) return std::nullopt;
    auto end = token.find_last_not_of(" \t\r\n");
    return token.substr(begin, end - begin + 1);
}

bool ConstantTimeEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    unsigned char diff = 0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        diff |= static_cast<unsigned char>(a[i] ^ b[i]);
    }
    return diff == 0;
}

BearerTokenAuthenticator::BearerTokenAuthenticator(std::vector<std::string> tokens)
    : tokens_(std::move(tokens)) {
    tokens_.erase(std::remove(tokens_.begin(), tokens_.end(), std::string()), tokens_.end());
}

Result<TokenInfo, Error> BearerTokenAuthenticator::Authenticate(
    const HttpHeaders& headers) const {
    auto token = ExtractBearerToken(headers);
    if (!token) {
        return Result<TokenInfo, Error>::Err(MakeAuthError("Authentication required"));
    }

    bool matched = false;
    for (const auto& candidate : tokens_) {
        matched |= ConstantTimeEquals(*token, candidate);
    }
    if (!matched) {
        LogWarn("auth", "Rejected bearer token");
        return Result<TokenInfo, Error>::Err(MakeAuthError("Authentication failed"));
    }

    TokenInfo info;
    info.subject = "static-token";
    return Result<TokenInfo, Error>::Ok(std::move(info));
}

} // namespace berry_mcp
