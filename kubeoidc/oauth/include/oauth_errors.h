#ifndef KUBEOIDC_OAUTH_ERRORS_H
#define KUBEOIDC_OAUTH_ERRORS_H

#include <optional>
#include <stdexcept>
#include <string>

namespace kubeoidc {
namespace oauth {

/**
 * Base class for every failure raised by the login components.
 * Messages name endpoints and status codes but never token material.
 */
class OAuthError : public std::runtime_error {
public:
    explicit OAuthError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * Invalid or incomplete configuration
 */
class ConfigError : public OAuthError {
public:
    explicit ConfigError(const std::string& message)
        : OAuthError("Configuration error: " + message) {}
};

/**
 * Discovery document unreachable, malformed, missing a required field,
 * or published for a different issuer. Never retried.
 */
class DiscoveryValidationError : public OAuthError {
public:
    DiscoveryValidationError(const std::string& message, const std::string& url)
        : OAuthError("Discovery validation failed for " + url + ": " + message),
          url_(url) {}

    const std::string& url() const { return url_; }

private:
    std::string url_;
};

/**
 * The provider redirected back with an error, or the callback state did
 * not match the login attempt.
 */
class AuthorizationError : public OAuthError {
public:
    AuthorizationError(
        const std::string& error_code,
        const std::string& description,
        bool state_mismatch = false
    ) : OAuthError(
            state_mismatch
                ? std::string("Authorization rejected: callback state does not match this login")
                : "Authorization failed: " + error_code +
                      (description.empty() ? "" : " (" + description + ")")),
        error_code_(error_code),
        state_mismatch_(state_mismatch) {}

    const std::string& error_code() const { return error_code_; }
    bool state_mismatch() const { return state_mismatch_; }

private:
    std::string error_code_;
    bool state_mismatch_;
};

/**
 * No callback arrived before the login deadline
 */
class TimeoutError : public OAuthError {
public:
    explicit TimeoutError(int seconds)
        : OAuthError("Login timed out after " + std::to_string(seconds) +
                     "s without a callback from the browser"),
          seconds_(seconds) {}

    int seconds() const { return seconds_; }

private:
    int seconds_;
};

/**
 * Token endpoint returned a non-success status, malformed JSON, or a
 * response lacking required fields.
 */
class TokenExchangeError : public OAuthError {
public:
    TokenExchangeError(
        const std::string& message,
        const std::string& endpoint,
        std::optional<int> status_code = std::nullopt,
        const std::string& provider_error = ""
    ) : OAuthError(format(message, endpoint, status_code, provider_error)),
        endpoint_(endpoint),
        status_code_(status_code),
        provider_error_(provider_error) {}

    const std::string& endpoint() const { return endpoint_; }
    std::optional<int> status_code() const { return status_code_; }
    const std::string& provider_error() const { return provider_error_; }

private:
    static std::string format(
        const std::string& message,
        const std::string& endpoint,
        std::optional<int> status_code,
        const std::string& provider_error
    ) {
        std::string text = message + " [" + endpoint;
        if (status_code) {
            text += ", HTTP " + std::to_string(*status_code);
        }
        text += "]";
        if (!provider_error.empty()) {
            text += ": " + provider_error;
        }
        return text;
    }

    std::string endpoint_;
    std::optional<int> status_code_;
    std::string provider_error_;
};

/**
 * Token cache I/O failure. Logged where it happens, never fatal.
 */
class CacheError : public OAuthError {
public:
    CacheError(const std::string& message, const std::string& path)
        : OAuthError("Token cache error at " + path + ": " + message),
          path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

/**
 * Credential plugin started without the interactive capability signal
 */
class ProtocolModeError : public OAuthError {
public:
    explicit ProtocolModeError(const std::string& message)
        : OAuthError(message) {}
};

/**
 * Local callback port could not be bound
 */
class CallbackBindError : public OAuthError {
public:
    CallbackBindError(int port, const std::string& reason)
        : OAuthError("Cannot listen for the login callback on port " +
                     std::to_string(port) + ": " + reason),
          port_(port) {}

    int port() const { return port_; }

private:
    int port_;
};

/**
 * A second login was started while one is still in flight
 */
class LoginInProgressError : public OAuthError {
public:
    LoginInProgressError()
        : OAuthError("Another login is already in progress in this process") {}
};

/**
 * Operation needs a stored login context that does not exist
 */
class ContextError : public OAuthError {
public:
    explicit ContextError(const std::string& message)
        : OAuthError(message) {}
};

/**
 * Token is not a decodable JWT
 */
class TokenFormatError : public OAuthError {
public:
    explicit TokenFormatError(const std::string& message)
        : OAuthError("Invalid JWT: " + message) {}
};

} // namespace oauth
} // namespace kubeoidc

#endif // KUBEOIDC_OAUTH_ERRORS_H
