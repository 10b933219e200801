#include "login_flow.h"
#include "authorization_request.h"
#include "oauth_errors.h"
#include "pkce_helper.h"
#include "token_exchanger.h"

namespace kubeoidc {
namespace oauth {

namespace {

std::mutex& session_guard() {
    static std::mutex guard;
    return guard;
}

// Records written before endpoints were stored fall back to the context's issuer
std::string refresh_endpoint(const OAuthConfig& config, const Context& context) {
    if (!context.tokens.token_endpoint.empty()) {
        return context.tokens.token_endpoint;
    }
    if (context.issuer_url.empty() || context.issuer_url == config.issuer_url) {
        return config.token_endpoint();
    }
    OAuthConfig issuer_config = config;
    issuer_config.issuer_url = context.issuer_url;
    issuer_config.endpoints = OAuthEndpoints();
    return issuer_config.token_endpoint();
}

} // namespace

LoginFlow::LoginFlow(
    const OAuthConfig& config,
    HttpClient& http,
    BrowserLauncher& browser,
    std::ostream& diagnostics,
    Clock clock
) : config_(config),
    http_(http),
    browser_(browser),
    diagnostics_(diagnostics),
    clock_(std::move(clock)) {
}

TokenSet LoginFlow::login() {
    std::unique_lock<std::mutex> session_lock(session_guard(), std::try_to_lock);
    if (!session_lock.owns_lock()) {
        throw LoginInProgressError();
    }
    {
        std::lock_guard<std::mutex> lock(active_mutex_);
        cancel_requested_ = false;
    }

    TokenExchanger exchanger(config_, http_, clock_);

    std::string authorization_endpoint = config_.authorization_endpoint();
    std::string token_endpoint = config_.token_endpoint();
    if (config_.verify_discovery) {
        DiscoveryDocument discovery = exchanger.fetch_discovery();
        authorization_endpoint = discovery.authorization_endpoint;
        token_endpoint = discovery.token_endpoint;
    }

    AuthSession session = AuthorizationRequestBuilder(config_).build(
        PKCEHelper::generate_pair(), authorization_endpoint
    );

    CallbackListener listener(config_, session.state);
    listener.start();

    {
        std::lock_guard<std::mutex> lock(active_mutex_);
        active_listener_ = &listener;
        if (cancel_requested_) {
            listener.cancel();
        }
    }
    struct ActiveReset {
        LoginFlow& flow;
        ~ActiveReset() {
            std::lock_guard<std::mutex> lock(flow.active_mutex_);
            flow.active_listener_ = nullptr;
            flow.cancel_requested_ = false;
        }
    } active_reset{*this};

    diagnostics_ << "Starting login to " << session.issuer_url
                 << " (session " << session.session_id << ")" << std::endl;
    diagnostics_ << "Listening on " << session.redirect_uri << std::endl;
    present_authorization_url(browser_, session.authorization_url, diagnostics_);

    std::string code = listener.wait_for_code(config_.login_timeout);

    diagnostics_ << "Exchanging authorization code for token..." << std::endl;
    return exchanger.exchange_code(session, code, token_endpoint);
}

void LoginFlow::cancel() {
    std::lock_guard<std::mutex> lock(active_mutex_);
    cancel_requested_ = true;
    if (active_listener_) {
        active_listener_->cancel();
    }
}

InteractiveLogin::InteractiveLogin(
    const OAuthConfig& config,
    LoginFlow& flow,
    HttpClient& http,
    ContextStore& contexts,
    Clock clock
) : config_(config),
    flow_(flow),
    http_(http),
    contexts_(contexts),
    clock_(std::move(clock)) {
}

Context InteractiveLogin::login() {
    Context context;
    context.realm = config_.realm();
    context.issuer_url = config_.issuer_url;
    context.tokens = flow_.login();

    try {
        contexts_.save(context);
    } catch (const CacheError& e) {
        std::cerr << "Warning: login succeeded but the context was not saved: "
                  << e.what() << std::endl;
    }

    return context;
}

std::optional<Context> InteractiveLogin::refresh() {
    auto context = contexts_.load();
    if (!context) {
        throw ContextError("Not logged in. Run 'kubeoidc login' first.");
    }
    if (!context->tokens.refresh_token) {
        return std::nullopt;
    }

    TokenExchanger exchanger(config_, http_, clock_);
    Context updated = *context;
    updated.tokens = exchanger.refresh(
        *context->tokens.refresh_token, refresh_endpoint(config_, *context)
    );
    if (!updated.tokens.id_token) {
        updated.tokens.id_token = context->tokens.id_token;
    }

    try {
        contexts_.save(updated);
    } catch (const CacheError& e) {
        std::cerr << "Warning: refreshed token was not saved: " << e.what() << std::endl;
    }

    return updated;
}

std::string InteractiveLogin::current_access_token() {
    auto context = contexts_.load();
    if (!context) {
        throw ContextError("Not logged in. Run 'kubeoidc login' first.");
    }

    const TimePoint now = clock_();
    const bool expired = context->tokens.is_expired(now);
    const bool near_expiry = now >= context->tokens.expires_at - config_.refresh_window;

    if (!near_expiry) {
        return context->tokens.access_token;
    }

    if (context->tokens.refresh_token) {
        try {
            auto updated = refresh();
            if (updated) {
                return updated->tokens.access_token;
            }
        } catch (const TokenExchangeError& e) {
            if (expired) {
                throw;
            }
            std::cerr << "Warning: token refresh failed, using current token: "
                      << e.what() << std::endl;
        }
    }

    if (expired) {
        throw ContextError("Login has expired. Run 'kubeoidc login' again.");
    }
    return context->tokens.access_token;
}

bool InteractiveLogin::logout() {
    return contexts_.clear();
}

} // namespace oauth
} // namespace kubeoidc
