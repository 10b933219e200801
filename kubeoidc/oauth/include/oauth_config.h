#ifndef KUBEOIDC_OAUTH_CONFIG_H
#define KUBEOIDC_OAUTH_CONFIG_H

#include <chrono>
#include <string>
#include <vector>

namespace kubeoidc {
namespace oauth {

/**
 * Provider Endpoints
 * Empty endpoints fall back to the Keycloak layout below the issuer.
 */
struct OAuthEndpoints {
    std::string authorization;
    std::string token;
};

/**
 * Local redirect listener
 */
struct CallbackConfig {
    std::string host = "localhost";
    int port = 8000;
    std::string path = "/callback";
};

/**
 * Credential exec plugin settings
 */
struct ExecConfig {
    std::string identity = "kubernetes-oidc";  // cache key
    std::string mode_variable = "KUBECTL_EXEC_INTERACTIVE_MODE";
    std::string mode_value = "IfAvailable";
};

/**
 * Complete login configuration
 * One instance is passed to every component so that issuer, client and
 * port can never diverge between them.
 */
class OAuthConfig {
public:
    std::string issuer_url = "https://sts.itlusions.com/realms/itlusions";
    std::string client_id = "kubernetes-oidc";
    std::string client_secret;
    std::vector<std::string> scopes = {"openid", "email", "profile", "groups"};

    OAuthEndpoints endpoints;
    CallbackConfig callback;
    ExecConfig exec;

    std::chrono::seconds login_timeout{120};
    std::chrono::seconds http_timeout{10};
    std::chrono::seconds refresh_window{300};

    bool verify_discovery = true;
    bool require_id_token = true;

    std::string cache_dir;

    /**
     * Built-in defaults with environment overrides applied
     */
    static OAuthConfig defaults();

    /**
     * Load configuration from YAML file
     * Missing keys keep their defaults; ${VAR} references are expanded.
     * @param config_path Path to kubeoidc.yaml
     * @return OAuthConfig instance
     * @throws ConfigError if the file is missing or invalid
     */
    static OAuthConfig load_from_file(const std::string& config_path);

    /**
     * Apply KEYCLOAK_* and KUBEOIDC_* environment overrides
     */
    void apply_environment();

    /**
     * Validate configuration
     * @throws ConfigError on the first invalid field
     */
    void validate() const;

    std::string redirect_uri() const;
    std::string authorization_endpoint() const;
    std::string token_endpoint() const;
    std::string discovery_url() const;

    /**
     * Realm name taken from a ".../realms/<name>" issuer, else empty
     */
    std::string realm() const;

    /**
     * Replace the realm component of a Keycloak issuer
     */
    void set_realm(const std::string& realm);

    std::string scope_string() const;

private:
    static std::string replace_env_vars(const std::string& str);
    static std::string default_cache_dir();
};

} // namespace oauth
} // namespace kubeoidc

#endif // KUBEOIDC_OAUTH_CONFIG_H
