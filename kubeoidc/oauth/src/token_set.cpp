#include "token_set.h"
#include <cstdint>
#include <stdexcept>

using json = nlohmann::json;

namespace kubeoidc {
namespace oauth {

namespace {

constexpr int64_t kDefaultExpiresIn = 3600;
constexpr int64_t kMaxExpiresIn = 10LL * 365 * 24 * 3600;

std::optional<std::string> optional_string(const json& j, const char* key) {
    if (j.contains(key) && j[key].is_string() && !j[key].get<std::string>().empty()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

TimePoint require_time(const json& j, const char* key) {
    auto parsed = parse_rfc3339(j.at(key).get<std::string>());
    if (!parsed) {
        throw std::invalid_argument(std::string("malformed timestamp in '") + key + "'");
    }
    return *parsed;
}

} // namespace

TokenSet TokenSet::from_token_response(const json& response, TimePoint now) {
    TokenSet tokens;
    tokens.access_token = response.at("access_token").get<std::string>();
    tokens.refresh_token = optional_string(response, "refresh_token");
    tokens.id_token = optional_string(response, "id_token");
    if (auto type = optional_string(response, "token_type")) {
        tokens.token_type = *type;
    }
    tokens.scope = optional_string(response, "scope").value_or("");

    // Some providers send expires_in as a string
    int64_t expires_in = kDefaultExpiresIn;
    if (response.contains("expires_in")) {
        const auto& value = response["expires_in"];
        if (value.is_number_integer()) {
            expires_in = value.get<int64_t>();
        } else if (value.is_string()) {
            try {
                expires_in = std::stoll(value.get<std::string>());
            } catch (const std::logic_error&) {
                expires_in = kDefaultExpiresIn;
            }
        }
    }

    if (expires_in < 0 || expires_in > kMaxExpiresIn) {
        throw std::out_of_range("expires_in out of range: " + std::to_string(expires_in));
    }

    tokens.issued_at = now;
    tokens.expires_at = now + std::chrono::seconds(expires_in);
    return tokens;
}

json TokenSet::to_json() const {
    json j;
    j["access_token"] = access_token;
    j["refresh_token"] = refresh_token ? json(*refresh_token) : json(nullptr);
    j["id_token"] = id_token ? json(*id_token) : json(nullptr);
    j["token_type"] = token_type;
    j["scope"] = scope;
    j["expires_at"] = format_rfc3339(expires_at);
    j["cached_at"] = format_rfc3339(issued_at);
    if (!token_endpoint.empty()) {
        j["token_endpoint"] = token_endpoint;
    }
    return j;
}

TokenSet TokenSet::from_json(const json& j) {
    TokenSet tokens;
    tokens.access_token = j.at("access_token").get<std::string>();
    if (tokens.access_token.empty()) {
        throw std::invalid_argument("empty access_token");
    }
    tokens.refresh_token = optional_string(j, "refresh_token");
    tokens.id_token = optional_string(j, "id_token");
    tokens.token_type = j.value("token_type", "Bearer");
    tokens.scope = optional_string(j, "scope").value_or("");
    tokens.expires_at = require_time(j, "expires_at");
    tokens.issued_at = j.contains("cached_at") ? require_time(j, "cached_at") : tokens.expires_at;
    tokens.token_endpoint = optional_string(j, "token_endpoint").value_or("");
    return tokens;
}

const std::string& TokenSet::bearer_token() const {
    return id_token ? *id_token : access_token;
}

} // namespace oauth
} // namespace kubeoidc
