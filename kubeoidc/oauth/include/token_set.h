#ifndef KUBEOIDC_TOKEN_SET_H
#define KUBEOIDC_TOKEN_SET_H

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "time_util.h"

namespace kubeoidc {
namespace oauth {

/**
 * Tokens issued by one successful grant
 * Treated as immutable: a refresh produces a new TokenSet.
 */
struct TokenSet {
    std::string access_token;
    std::optional<std::string> refresh_token;
    std::optional<std::string> id_token;
    std::string token_type = "Bearer";
    std::string scope;
    TimePoint expires_at;
    TimePoint issued_at;
    std::string token_endpoint;  // issuing endpoint, refreshes go here; empty if unknown

    /**
     * Build from a token endpoint response
     * expires_in defaults to 3600 seconds when absent
     * @param response Parsed token response (access_token already checked)
     * @param now Issue instant
     * @throws std::out_of_range if expires_in is negative or beyond ten years
     */
    static TokenSet from_token_response(const nlohmann::json& response, TimePoint now);

    /**
     * Cache record representation with RFC3339 instants
     */
    nlohmann::json to_json() const;

    /**
     * @throws nlohmann::json::exception or std::invalid_argument on a malformed record
     */
    static TokenSet from_json(const nlohmann::json& j);

    bool is_expired(TimePoint now) const { return now >= expires_at; }

    /**
     * Token handed to Kubernetes: the ID token when present
     */
    const std::string& bearer_token() const;
};

} // namespace oauth
} // namespace kubeoidc

#endif // KUBEOIDC_TOKEN_SET_H
