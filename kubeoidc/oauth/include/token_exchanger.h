#ifndef KUBEOIDC_TOKEN_EXCHANGER_H
#define KUBEOIDC_TOKEN_EXCHANGER_H

#include <map>
#include <string>
#include <nlohmann/json.hpp>
#include "authorization_request.h"
#include "http_client.h"
#include "oauth_config.h"
#include "time_util.h"
#include "token_set.h"

namespace kubeoidc {
namespace oauth {

/**
 * Validated subset of the provider's discovery document
 */
struct DiscoveryDocument {
    std::string issuer;
    std::string authorization_endpoint;
    std::string token_endpoint;
    std::string userinfo_endpoint;
    std::string jwks_uri;
};

/**
 * Token endpoint client
 * Trades authorization codes, refresh tokens and client credentials
 * for TokenSets. One synchronous request per call, never retried.
 */
class TokenExchanger {
public:
    /**
     * @param config Issuer, client and endpoint configuration
     * @param http Transport; must outlive the exchanger
     * @param clock Source for expires_at computation
     */
    TokenExchanger(const OAuthConfig& config, HttpClient& http, Clock clock = system_clock_source());

    /**
     * Fetch {issuer}/.well-known/openid-configuration and validate it
     * @return Validated document
     * @throws DiscoveryValidationError
     */
    DiscoveryDocument fetch_discovery();

    /**
     * Check required fields and exact issuer equality
     * @param document Parsed discovery JSON
     * @param expected_issuer Configured issuer URL
     * @param source_url Used in error messages
     * @throws DiscoveryValidationError
     */
    static DiscoveryDocument validate_discovery(
        const nlohmann::json& document,
        const std::string& expected_issuer,
        const std::string& source_url
    );

    /**
     * Exchange an authorization code (grant_type=authorization_code)
     * @param session Login attempt holding the PKCE verifier
     * @param code Code received on the callback
     * @param token_endpoint Discovered or configured endpoint
     * @return Fresh TokenSet
     * @throws TokenExchangeError
     */
    TokenSet exchange_code(
        const AuthSession& session,
        const std::string& code,
        const std::string& token_endpoint
    );

    TokenSet exchange_code(const AuthSession& session, const std::string& code);

    /**
     * Redeem a refresh token (grant_type=refresh_token)
     * A response without a new refresh token keeps the old one.
     * @param refresh_token Token from an earlier grant
     * @param token_endpoint Endpoint that issued it
     * @throws TokenExchangeError
     */
    TokenSet refresh(const std::string& refresh_token, const std::string& token_endpoint);

    TokenSet refresh(const std::string& refresh_token);

    /**
     * Service account token (grant_type=client_credentials)
     * @throws TokenExchangeError
     */
    TokenSet client_credentials(const std::string& client_id, const std::string& client_secret);

private:
    TokenSet request_tokens(
        const std::string& endpoint,
        const std::map<std::string, std::string>& params,
        bool require_id_token
    );

    const OAuthConfig& config_;
    HttpClient& http_;
    Clock clock_;
};

} // namespace oauth
} // namespace kubeoidc

#endif // KUBEOIDC_TOKEN_EXCHANGER_H
