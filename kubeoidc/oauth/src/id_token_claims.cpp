#include "id_token_claims.h"
#include "oauth_errors.h"
#include <jwt-cpp/traits/nlohmann-json/traits.h>
#include <cstdint>
#include <ctime>

using json = nlohmann::json;

namespace kubeoidc {
namespace oauth {

namespace {

std::string string_claim(const json& payload, const char* name) {
    if (payload.contains(name) && payload.at(name).is_string()) {
        return payload.at(name).get<std::string>();
    }
    return "";
}

} // namespace

IdTokenClaims IdTokenClaims::decode(const std::string& token) {
    IdTokenClaims claims;

    try {
        auto decoded = jwt::decode<jwt::traits::nlohmann_json>(token);
        claims.header = decoded.get_header_json();
        claims.payload = decoded.get_payload_json();
    } catch (const std::exception& e) {
        throw TokenFormatError(e.what());
    }

    if (!claims.payload.is_object()) {
        throw TokenFormatError("payload is not a JSON object");
    }

    claims.subject = string_claim(claims.payload, "sub");
    claims.preferred_username = string_claim(claims.payload, "preferred_username");
    claims.email = string_claim(claims.payload, "email");
    claims.name = string_claim(claims.payload, "name");
    claims.issuer = string_claim(claims.payload, "iss");

    if (claims.payload.contains("exp") && claims.payload.at("exp").is_number()) {
        claims.expiry = std::chrono::system_clock::from_time_t(
            static_cast<std::time_t>(claims.payload.at("exp").get<int64_t>())
        );
    }

    return claims;
}

} // namespace oauth
} // namespace kubeoidc
