#include "oauth_config.h"
#include "oauth_errors.h"
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <cstdlib>
#include <pwd.h>
#include <unistd.h>

namespace kubeoidc {
namespace oauth {

namespace {

std::string strip_trailing_slash(std::string value) {
    while (!value.empty() && value.back() == '/') {
        value.pop_back();
    }
    return value;
}

const char* env_or_null(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

int parse_port(const std::string& text) {
    try {
        size_t consumed = 0;
        int port = std::stoi(text, &consumed);
        if (consumed != text.size()) {
            throw ConfigError("callback port is not a number: " + text);
        }
        return port;
    } catch (const std::logic_error&) {
        throw ConfigError("callback port is not a number: " + text);
    }
}

const std::string kRealmMarker = "/realms/";

} // namespace

OAuthConfig OAuthConfig::defaults() {
    OAuthConfig config;
    config.cache_dir = default_cache_dir();
    config.apply_environment();
    return config;
}

OAuthConfig OAuthConfig::load_from_file(const std::string& config_path) {
    std::ifstream file(config_path);
    if (!file.good()) {
        throw ConfigError("config file not found: " + config_path);
    }

    OAuthConfig config;
    config.cache_dir = default_cache_dir();

    try {
        YAML::Node yaml = YAML::LoadFile(config_path);
        YAML::Node oidc = yaml["oidc"];
        if (!oidc) {
            throw ConfigError("missing top-level 'oidc' section in " + config_path);
        }

        config.issuer_url = strip_trailing_slash(replace_env_vars(
            oidc["issuer_url"].as<std::string>(config.issuer_url)
        ));

        YAML::Node client = oidc["client"];
        config.client_id = replace_env_vars(
            client["client_id"].as<std::string>(config.client_id)
        );
        config.client_secret = replace_env_vars(
            client["client_secret"].as<std::string>("")
        );
        if (client["scopes"]) {
            if (client["scopes"].IsSequence()) {
                config.scopes = client["scopes"].as<std::vector<std::string>>();
            } else {
                config.scopes.clear();
                std::string joined = client["scopes"].as<std::string>();
                size_t start = 0;
                while (start < joined.size()) {
                    size_t end = joined.find(' ', start);
                    if (end == std::string::npos) end = joined.size();
                    if (end > start) {
                        config.scopes.push_back(joined.substr(start, end - start));
                    }
                    start = end + 1;
                }
            }
        }

        YAML::Node endpoints = oidc["endpoints"];
        config.endpoints.authorization = replace_env_vars(
            endpoints["authorization"].as<std::string>("")
        );
        config.endpoints.token = replace_env_vars(
            endpoints["token"].as<std::string>("")
        );

        YAML::Node callback = oidc["callback"];
        config.callback.host = callback["host"].as<std::string>(config.callback.host);
        config.callback.port = callback["port"].as<int>(config.callback.port);
        config.callback.path = callback["path"].as<std::string>(config.callback.path);

        YAML::Node timeouts = oidc["timeouts"];
        config.login_timeout = std::chrono::seconds(
            timeouts["login_seconds"].as<int>(static_cast<int>(config.login_timeout.count()))
        );
        config.http_timeout = std::chrono::seconds(
            timeouts["http_seconds"].as<int>(static_cast<int>(config.http_timeout.count()))
        );
        config.refresh_window = std::chrono::seconds(
            timeouts["refresh_window_seconds"].as<int>(static_cast<int>(config.refresh_window.count()))
        );

        YAML::Node security = oidc["security"];
        config.verify_discovery = security["verify_discovery"].as<bool>(config.verify_discovery);
        config.require_id_token = security["require_id_token"].as<bool>(config.require_id_token);

        YAML::Node cache = oidc["cache"];
        if (cache["dir"]) {
            config.cache_dir = replace_env_vars(cache["dir"].as<std::string>());
        }

        YAML::Node exec = oidc["exec"];
        config.exec.identity = exec["identity"].as<std::string>(config.exec.identity);
        config.exec.mode_variable = exec["mode_variable"].as<std::string>(config.exec.mode_variable);
        config.exec.mode_value = exec["mode_value"].as<std::string>(config.exec.mode_value);
    } catch (const YAML::Exception& e) {
        throw ConfigError(config_path + ": " + e.what());
    }

    config.validate();

    return config;
}

void OAuthConfig::apply_environment() {
    const char* keycloak_url = env_or_null("KEYCLOAK_URL");
    const char* keycloak_realm = env_or_null("KEYCLOAK_REALM");
    if (keycloak_url) {
        issuer_url = strip_trailing_slash(keycloak_url) + kRealmMarker +
                     (keycloak_realm ? keycloak_realm : (realm().empty() ? "itlusions" : realm()));
    } else if (keycloak_realm) {
        set_realm(keycloak_realm);
    }

    if (const char* issuer = env_or_null("KUBEOIDC_ISSUER_URL")) {
        issuer_url = strip_trailing_slash(issuer);
    }
    if (const char* id = env_or_null("KUBEOIDC_CLIENT_ID")) {
        client_id = id;
    }
    if (const char* port = env_or_null("KUBEOIDC_CALLBACK_PORT")) {
        callback.port = parse_port(port);
    }
    if (const char* dir = env_or_null("KUBEOIDC_CACHE_DIR")) {
        cache_dir = dir;
    }
}

void OAuthConfig::validate() const {
    if (issuer_url.empty()) {
        throw ConfigError("issuer_url is required");
    }
    if (issuer_url.find("https://") != 0 && issuer_url.find("http://") != 0) {
        throw ConfigError("issuer_url must be an http(s) URL: " + issuer_url);
    }
    if (client_id.empty()) {
        throw ConfigError("client_id is required");
    }
    if (callback.port < 1 || callback.port > 65535) {
        throw ConfigError("callback port out of range: " + std::to_string(callback.port));
    }
    if (callback.path.empty() || callback.path.front() != '/') {
        throw ConfigError("callback path must start with '/'");
    }
    if (callback.host != "localhost" && callback.host != "127.0.0.1") {
        throw ConfigError("callback host must be a loopback name: " + callback.host);
    }
    if (login_timeout.count() <= 0 || http_timeout.count() <= 0) {
        throw ConfigError("timeouts must be positive");
    }
    if (refresh_window.count() < 0) {
        throw ConfigError("refresh window must not be negative");
    }
    if (cache_dir.empty()) {
        throw ConfigError("cache directory could not be determined");
    }
}

std::string OAuthConfig::redirect_uri() const {
    return "http://" + callback.host + ":" + std::to_string(callback.port) + callback.path;
}

std::string OAuthConfig::authorization_endpoint() const {
    if (!endpoints.authorization.empty()) {
        return endpoints.authorization;
    }
    return issuer_url + "/protocol/openid-connect/auth";
}

std::string OAuthConfig::token_endpoint() const {
    if (!endpoints.token.empty()) {
        return endpoints.token;
    }
    return issuer_url + "/protocol/openid-connect/token";
}

std::string OAuthConfig::discovery_url() const {
    return issuer_url + "/.well-known/openid-configuration";
}

std::string OAuthConfig::realm() const {
    size_t pos = issuer_url.rfind(kRealmMarker);
    if (pos == std::string::npos) {
        return "";
    }
    std::string name = issuer_url.substr(pos + kRealmMarker.size());
    return name.find('/') == std::string::npos ? name : "";
}

void OAuthConfig::set_realm(const std::string& new_realm) {
    size_t pos = issuer_url.rfind(kRealmMarker);
    if (pos == std::string::npos) {
        issuer_url += kRealmMarker + new_realm;
    } else {
        issuer_url = issuer_url.substr(0, pos) + kRealmMarker + new_realm;
    }
}

std::string OAuthConfig::scope_string() const {
    std::string joined;
    for (const auto& scope : scopes) {
        if (!joined.empty()) joined += " ";
        joined += scope;
    }
    return joined;
}

std::string OAuthConfig::replace_env_vars(const std::string& str) {
    std::string result = str;
    size_t start_pos = 0;

    // ${VAR_NAME}
    while ((start_pos = result.find("${", start_pos)) != std::string::npos) {
        size_t end_pos = result.find("}", start_pos);
        if (end_pos == std::string::npos) {
            break;
        }

        std::string var_name = result.substr(start_pos + 2, end_pos - start_pos - 2);
        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";

        result.replace(start_pos, end_pos - start_pos + 1, replacement);
        start_pos += replacement.length();
    }

    return result;
}

std::string OAuthConfig::default_cache_dir() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) {
        struct passwd* pw = getpwuid(getuid());
        home = pw ? pw->pw_dir : nullptr;
    }
    if (!home) {
        return "";
    }
    return std::string(home) + "/.kube/cache/kubeoidc";
}

} // namespace oauth
} // namespace kubeoidc
