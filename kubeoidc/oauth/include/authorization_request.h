#ifndef KUBEOIDC_AUTHORIZATION_REQUEST_H
#define KUBEOIDC_AUTHORIZATION_REQUEST_H

#include <map>
#include <string>
#include <vector>
#include "oauth_config.h"
#include "pkce_helper.h"

namespace kubeoidc {
namespace oauth {

/**
 * One in-flight login attempt
 * Lives only as long as the attempt; never persisted.
 */
struct AuthSession {
    std::string session_id;      // diagnostics only
    std::string code_verifier;
    std::string code_challenge;
    std::string redirect_uri;
    std::string issuer_url;
    std::string client_id;
    std::vector<std::string> scopes;
    std::string state;
    std::string authorization_url;
};

/**
 * Assembles the browser-facing authorization URL
 */
class AuthorizationRequestBuilder {
public:
    explicit AuthorizationRequestBuilder(const OAuthConfig& config);

    /**
     * Create a session for the given PKCE pair with a fresh state value
     * @param pkce Verifier/challenge pair
     * @param authorization_endpoint Endpoint to use (discovered or configured)
     * @return Fully populated AuthSession
     */
    AuthSession build(const PKCEPair& pkce, const std::string& authorization_endpoint) const;

    /**
     * Same, against the configured authorization endpoint
     */
    AuthSession build(const PKCEPair& pkce) const;

private:
    const OAuthConfig& config_;
};

/**
 * Percent-encode everything outside the RFC 3986 unreserved set
 */
std::string url_encode(const std::string& value);

/**
 * Decode %XX escapes and '+' as space
 */
std::string url_decode(const std::string& value);

/**
 * Build "k1=v1&k2=v2" with encoded keys and values
 */
std::string build_query_string(const std::map<std::string, std::string>& params);

/**
 * Parse a query string; the first occurrence of a key wins
 */
std::map<std::string, std::string> parse_query_string(const std::string& query);

} // namespace oauth
} // namespace kubeoidc

#endif // KUBEOIDC_AUTHORIZATION_REQUEST_H
