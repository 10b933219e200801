#include "authorization_request.h"
#include <uuid/uuid.h>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace kubeoidc {
namespace oauth {

namespace {

std::string generate_session_id() {
    uuid_t uuid;
    uuid_generate_random(uuid);
    char uuid_str[37];
    uuid_unparse_lower(uuid, uuid_str);
    return std::string(uuid_str);
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

AuthorizationRequestBuilder::AuthorizationRequestBuilder(const OAuthConfig& config)
    : config_(config) {
}

AuthSession AuthorizationRequestBuilder::build(const PKCEPair& pkce) const {
    return build(pkce, config_.authorization_endpoint());
}

AuthSession AuthorizationRequestBuilder::build(
    const PKCEPair& pkce,
    const std::string& authorization_endpoint
) const {
    AuthSession session;
    session.session_id = generate_session_id();
    session.code_verifier = pkce.code_verifier;
    session.code_challenge = pkce.code_challenge;
    session.redirect_uri = config_.redirect_uri();
    session.issuer_url = config_.issuer_url;
    session.client_id = config_.client_id;
    session.scopes = config_.scopes;
    session.state = PKCEHelper::generate_state();

    std::map<std::string, std::string> params;
    params["client_id"] = session.client_id;
    params["response_type"] = "code";
    params["redirect_uri"] = session.redirect_uri;
    params["scope"] = config_.scope_string();
    params["code_challenge"] = session.code_challenge;
    params["code_challenge_method"] = "S256";
    params["state"] = session.state;

    char separator = authorization_endpoint.find('?') == std::string::npos ? '?' : '&';
    session.authorization_url = authorization_endpoint + separator + build_query_string(params);

    return session;
}

std::string url_encode(const std::string& value) {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex;

    for (char c : value) {
        if (std::isalnum(static_cast<unsigned char>(c)) ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else {
            escaped << std::uppercase;
            escaped << '%' << std::setw(2) << int(static_cast<unsigned char>(c));
            escaped << std::nouppercase;
        }
    }

    return escaped.str();
}

std::string url_decode(const std::string& value) {
    std::string decoded;
    decoded.reserve(value.size());

    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c == '+') {
            decoded += ' ';
        } else if (c == '%' && i + 2 < value.size() &&
                   hex_value(value[i + 1]) >= 0 && hex_value(value[i + 2]) >= 0) {
            decoded += static_cast<char>(hex_value(value[i + 1]) * 16 + hex_value(value[i + 2]));
            i += 2;
        } else {
            decoded += c;
        }
    }

    return decoded;
}

std::string build_query_string(const std::map<std::string, std::string>& params) {
    std::stringstream ss;
    bool first = true;

    for (const auto& [key, value] : params) {
        if (!first) {
            ss << "&";
        }
        ss << url_encode(key) << "=" << url_encode(value);
        first = false;
    }

    return ss.str();
}

std::map<std::string, std::string> parse_query_string(const std::string& query) {
    std::map<std::string, std::string> params;
    size_t start = 0;

    while (start <= query.size()) {
        size_t end = query.find('&', start);
        if (end == std::string::npos) end = query.size();

        std::string pair = query.substr(start, end - start);
        if (!pair.empty()) {
            size_t eq = pair.find('=');
            std::string key = url_decode(pair.substr(0, eq));
            std::string value = eq == std::string::npos ? "" : url_decode(pair.substr(eq + 1));
            params.emplace(key, value);
        }
        start = end + 1;
    }

    return params;
}

} // namespace oauth
} // namespace kubeoidc
