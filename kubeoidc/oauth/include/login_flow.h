#ifndef KUBEOIDC_LOGIN_FLOW_H
#define KUBEOIDC_LOGIN_FLOW_H

#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include "browser_launcher.h"
#include "callback_listener.h"
#include "context_store.h"
#include "http_client.h"
#include "oauth_config.h"
#include "time_util.h"
#include "token_set.h"

namespace kubeoidc {
namespace oauth {

/**
 * Authorization Code + PKCE login
 * Runs one AuthSession end to end: discovery check, listener, browser,
 * bounded wait, code exchange. Only one login may run per process.
 */
class LoginFlow {
public:
    /**
     * @param config Shared configuration
     * @param http Transport for discovery and token requests
     * @param browser Opens the authorization URL
     * @param diagnostics Progress messages; never stdout in plugin mode
     * @param clock Time source for token expiry
     */
    LoginFlow(
        const OAuthConfig& config,
        HttpClient& http,
        BrowserLauncher& browser,
        std::ostream& diagnostics = std::cerr,
        Clock clock = system_clock_source()
    );

    /**
     * Perform the interactive login
     * @return Tokens issued for the authorization code
     * @throws LoginInProgressError, CallbackBindError, DiscoveryValidationError,
     *         AuthorizationError, TimeoutError, TokenExchangeError
     */
    TokenSet login();

    /**
     * Abort a login waiting for its callback (e.g. on SIGINT)
     * Safe to call from any thread.
     */
    void cancel();

private:
    const OAuthConfig& config_;
    HttpClient& http_;
    BrowserLauncher& browser_;
    std::ostream& diagnostics_;
    Clock clock_;

    std::mutex active_mutex_;
    CallbackListener* active_listener_ = nullptr;
    bool cancel_requested_ = false;
};

/**
 * Login commands operating on the stored Context
 */
class InteractiveLogin {
public:
    InteractiveLogin(
        const OAuthConfig& config,
        LoginFlow& flow,
        HttpClient& http,
        ContextStore& contexts,
        Clock clock = system_clock_source()
    );

    /**
     * Log in and replace the stored context
     * A context write failure is logged; the returned context is still valid.
     */
    Context login();

    /**
     * Supersede the context's tokens using its refresh token
     * @return Updated context, or std::nullopt without a refresh token
     * @throws ContextError when not logged in
     * @throws TokenExchangeError when the provider refuses the refresh
     */
    std::optional<Context> refresh();

    /**
     * Access token of the current context, refreshed when near expiry
     * @throws ContextError when not logged in or the login has expired
     */
    std::string current_access_token();

    /**
     * @return true if a context was removed
     */
    bool logout();

private:
    const OAuthConfig& config_;
    LoginFlow& flow_;
    HttpClient& http_;
    ContextStore& contexts_;
    Clock clock_;
};

} // namespace oauth
} // namespace kubeoidc

#endif // KUBEOIDC_LOGIN_FLOW_H
