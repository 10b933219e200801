#ifndef KUBEOIDC_ID_TOKEN_CLAIMS_H
#define KUBEOIDC_ID_TOKEN_CLAIMS_H

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "time_util.h"

namespace kubeoidc {
namespace oauth {

/**
 * Identity claims read from a JWT
 * The signature is NOT verified; use for display only.
 */
struct IdTokenClaims {
    std::string subject;             // sub
    std::string preferred_username;
    std::string email;
    std::string name;
    std::string issuer;              // iss
    std::optional<TimePoint> expiry; // exp

    nlohmann::json header;
    nlohmann::json payload;

    /**
     * Decode header and payload
     * @param token Compact JWT
     * @throws TokenFormatError if the token is not a decodable JWT
     */
    static IdTokenClaims decode(const std::string& token);
};

} // namespace oauth
} // namespace kubeoidc

#endif // KUBEOIDC_ID_TOKEN_CLAIMS_H
