#include "exec_credential.h"
#include "oauth_errors.h"
#include "token_exchanger.h"
#include <cstdlib>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace kubeoidc {
namespace oauth {

EnvLookup process_environment() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (!value) {
            return std::nullopt;
        }
        return std::string(value);
    };
}

ExecCredentialAdapter::ExecCredentialAdapter(
    const OAuthConfig& config,
    TokenCache& cache,
    LoginFlow& flow,
    HttpClient& http
) : config_(config), cache_(cache), flow_(flow), http_(http) {
}

int ExecCredentialAdapter::run(std::ostream& out, std::ostream& err, const EnvLookup& env) {
    try {
        if (!interactive_mode_available(env)) {
            throw ProtocolModeError(
                "This credential plugin requires interactive mode (" +
                config_.exec.mode_variable + "=" + config_.exec.mode_value + ")"
            );
        }

        TokenSet tokens = obtain_tokens(err);
        std::string document = format_document(tokens.bearer_token(), tokens.expires_at);

        out << document << "\n";
        out.flush();
        return 0;
    } catch (const std::exception& e) {
        err << "Authentication failed: " << e.what() << std::endl;
        return 1;
    }
}

bool ExecCredentialAdapter::interactive_mode_available(const EnvLookup& env) const {
    auto mode = env(config_.exec.mode_variable);
    if (mode && *mode == config_.exec.mode_value) {
        return true;
    }

    // client-go describes the invocation in KUBERNETES_EXEC_INFO
    auto exec_info = env("KUBERNETES_EXEC_INFO");
    if (exec_info) {
        json info = json::parse(*exec_info, nullptr, false);
        if (!info.is_discarded() && info.is_object() && info.contains("spec") &&
            info["spec"].is_object() && info["spec"].contains("interactive") &&
            info["spec"]["interactive"].is_boolean()) {
            return info["spec"]["interactive"].get<bool>();
        }
    }

    return false;
}

std::string ExecCredentialAdapter::format_document(const std::string& token, TimePoint expiry) {
    json credential;
    credential["apiVersion"] = kApiVersion;
    credential["kind"] = kKind;
    credential["status"] = {
        {"token", token},
        {"expirationTimestamp", format_rfc3339(expiry)}
    };
    return credential.dump();
}

TokenSet ExecCredentialAdapter::obtain_tokens(std::ostream& err) {
    const std::string& key = config_.exec.identity;

    auto cached = cache_.get(key);
    if (cached && !cache_.is_near_expiry(*cached)) {
        return *cached;
    }

    if (cached && cached->refresh_token) {
        if (auto refreshed = try_refresh(*cached, err)) {
            cache_.save(key, *refreshed);
            return *refreshed;
        }
    }

    TokenSet tokens = flow_.login();
    cache_.save(key, tokens);
    return tokens;
}

std::optional<TokenSet> ExecCredentialAdapter::try_refresh(const TokenSet& cached, std::ostream& err) {
    try {
        TokenExchanger exchanger(config_, http_);
        const std::string& endpoint = cached.token_endpoint.empty()
            ? config_.token_endpoint() : cached.token_endpoint;
        TokenSet refreshed = exchanger.refresh(*cached.refresh_token, endpoint);
        if (config_.require_id_token && !refreshed.id_token) {
            err << "Refreshed token has no id_token; starting a new login" << std::endl;
            return std::nullopt;
        }
        return refreshed;
    } catch (const TokenExchangeError& e) {
        err << "Token refresh failed, starting a new login: " << e.what() << std::endl;
        return std::nullopt;
    }
}

} // namespace oauth
} // namespace kubeoidc
