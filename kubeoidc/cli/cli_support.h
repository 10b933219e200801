#ifndef KUBEOIDC_CLI_SUPPORT_H
#define KUBEOIDC_CLI_SUPPORT_H

#include <atomic>
#include <csignal>
#include <optional>
#include <string>
#include <thread>
#include "login_flow.h"
#include "oauth_config.h"

namespace kubeoidc {
namespace cli {

/**
 * Resolve configuration for a command line entry point
 * Reads $KUBEOIDC_CONFIG, else ~/.kube/kubeoidc.yaml when present, then
 * applies environment overrides and validates.
 * @throws ConfigError
 */
oauth::OAuthConfig load_config();

/**
 * Cancels a running login on SIGINT or SIGTERM
 *
 * Must be constructed before any other thread is started: the signals
 * are blocked process-wide and consumed by a dedicated sigwait thread.
 */
class SignalCanceller {
public:
    explicit SignalCanceller(oauth::LoginFlow& flow);
    ~SignalCanceller();

    SignalCanceller(const SignalCanceller&) = delete;
    SignalCanceller& operator=(const SignalCanceller&) = delete;

    /**
     * @return The signal that interrupted the command, if any
     */
    std::optional<int> received() const;

private:
    oauth::LoginFlow& flow_;
    sigset_t signals_;
    sigset_t previous_mask_;
    std::thread thread_;
    std::atomic<int> received_{0};
};

/**
 * Service account credentials
 */
struct ClientCredentials {
    std::string client_id;
    std::string client_secret;
    std::string source;
};

/**
 * Look up service account credentials
 * KEYCLOAK_CLIENT_ID/KEYCLOAK_CLIENT_SECRET, then ITL_CLIENT_ID/
 * ITL_CLIENT_SECRET, then the files client-id and client-secret
 * below secrets_dir.
 */
std::optional<ClientCredentials> credentials_from_environment(
    const std::string& secrets_dir = "/etc/secrets/keycloak"
);

/**
 * First and last characters of a token, for display
 */
std::string abbreviate_token(const std::string& token);

} // namespace cli
} // namespace kubeoidc

#endif // KUBEOIDC_CLI_SUPPORT_H
