#include "token_exchanger.h"
#include "oauth_errors.h"

using json = nlohmann::json;

namespace kubeoidc {
namespace oauth {

namespace {

std::string required_string(
    const json& document,
    const char* field,
    const std::string& source_url
) {
    if (!document.contains(field) || !document[field].is_string() ||
        document[field].get<std::string>().empty()) {
        throw DiscoveryValidationError(std::string("missing required field '") + field + "'", source_url);
    }
    return document[field].get<std::string>();
}

std::string optional_string(const json& document, const char* field) {
    if (document.contains(field) && document[field].is_string()) {
        return document[field].get<std::string>();
    }
    return "";
}

// error / error_description from an OAuth error body, if it is one
std::string provider_error(const std::string& body) {
    json parsed = json::parse(body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object() || !parsed.contains("error") ||
        !parsed["error"].is_string()) {
        return "";
    }
    std::string error = parsed["error"].get<std::string>();
    std::string description = optional_string(parsed, "error_description");
    return description.empty() ? error : error + ": " + description;
}

} // namespace

TokenExchanger::TokenExchanger(const OAuthConfig& config, HttpClient& http, Clock clock)
    : config_(config), http_(http), clock_(std::move(clock)) {
}

DiscoveryDocument TokenExchanger::fetch_discovery() {
    const std::string url = config_.discovery_url();

    HttpResponse response = http_.get(url);
    if (response.code < 0) {
        throw DiscoveryValidationError("request failed: " + response.body, url);
    }
    if (response.code != 200) {
        throw DiscoveryValidationError("unexpected HTTP " + std::to_string(response.code), url);
    }

    json document = json::parse(response.body, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        throw DiscoveryValidationError("response is not a JSON object", url);
    }

    return validate_discovery(document, config_.issuer_url, url);
}

DiscoveryDocument TokenExchanger::validate_discovery(
    const json& document,
    const std::string& expected_issuer,
    const std::string& source_url
) {
    DiscoveryDocument discovery;
    discovery.issuer = required_string(document, "issuer", source_url);
    discovery.authorization_endpoint = required_string(document, "authorization_endpoint", source_url);
    discovery.token_endpoint = required_string(document, "token_endpoint", source_url);
    discovery.userinfo_endpoint = optional_string(document, "userinfo_endpoint");
    discovery.jwks_uri = optional_string(document, "jwks_uri");

    if (discovery.issuer != expected_issuer) {
        throw DiscoveryValidationError(
            "issuer '" + discovery.issuer + "' does not match configured '" + expected_issuer + "'",
            source_url
        );
    }

    return discovery;
}

TokenSet TokenExchanger::exchange_code(const AuthSession& session, const std::string& code) {
    return exchange_code(session, code, config_.token_endpoint());
}

TokenSet TokenExchanger::exchange_code(
    const AuthSession& session,
    const std::string& code,
    const std::string& token_endpoint
) {
    std::map<std::string, std::string> params;
    params["grant_type"] = "authorization_code";
    params["code"] = code;
    params["redirect_uri"] = session.redirect_uri;
    params["client_id"] = session.client_id;
    params["code_verifier"] = session.code_verifier;

    // Confidential clients only
    if (!config_.client_secret.empty()) {
        params["client_secret"] = config_.client_secret;
    }

    return request_tokens(token_endpoint, params, config_.require_id_token);
}

TokenSet TokenExchanger::refresh(const std::string& refresh_token) {
    return refresh(refresh_token, config_.token_endpoint());
}

TokenSet TokenExchanger::refresh(const std::string& refresh_token, const std::string& token_endpoint) {
    std::map<std::string, std::string> params;
    params["grant_type"] = "refresh_token";
    params["refresh_token"] = refresh_token;
    params["client_id"] = config_.client_id;

    if (!config_.client_secret.empty()) {
        params["client_secret"] = config_.client_secret;
    }

    TokenSet tokens = request_tokens(token_endpoint, params, false);
    if (!tokens.refresh_token) {
        tokens.refresh_token = refresh_token;
    }
    return tokens;
}

TokenSet TokenExchanger::client_credentials(
    const std::string& client_id,
    const std::string& client_secret
) {
    std::map<std::string, std::string> params;
    params["grant_type"] = "client_credentials";
    params["client_id"] = client_id;
    params["client_secret"] = client_secret;

    return request_tokens(config_.token_endpoint(), params, false);
}

TokenSet TokenExchanger::request_tokens(
    const std::string& endpoint,
    const std::map<std::string, std::string>& params,
    bool require_id_token
) {
    HttpResponse response = http_.post_form(endpoint, build_query_string(params));

    if (response.code < 0) {
        throw TokenExchangeError("Token request failed: " + response.body, endpoint);
    }
    if (response.code != 200) {
        throw TokenExchangeError("Token endpoint rejected the request", endpoint,
                                 response.code, provider_error(response.body));
    }

    json token_json = json::parse(response.body, nullptr, false);
    if (token_json.is_discarded() || !token_json.is_object()) {
        throw TokenExchangeError("Token response is not valid JSON", endpoint, response.code);
    }
    if (token_json.contains("error")) {
        throw TokenExchangeError("Token endpoint returned an error", endpoint,
                                 response.code, provider_error(response.body));
    }
    if (!token_json.contains("access_token") || !token_json["access_token"].is_string() ||
        token_json["access_token"].get<std::string>().empty()) {
        throw TokenExchangeError("Token response has no access_token", endpoint, response.code);
    }
    if (require_id_token && (!token_json.contains("id_token") || !token_json["id_token"].is_string())) {
        throw TokenExchangeError("Token response has no id_token", endpoint, response.code);
    }

    TokenSet tokens;
    try {
        tokens = TokenSet::from_token_response(token_json, clock_());
    } catch (const std::out_of_range& e) {
        throw TokenExchangeError(std::string("Token response is invalid: ") + e.what(), endpoint, response.code);
    }
    tokens.token_endpoint = endpoint;
    return tokens;
}

} // namespace oauth
} // namespace kubeoidc
