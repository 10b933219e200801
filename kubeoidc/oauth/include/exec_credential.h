#ifndef KUBEOIDC_EXEC_CREDENTIAL_H
#define KUBEOIDC_EXEC_CREDENTIAL_H

#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include "http_client.h"
#include "login_flow.h"
#include "oauth_config.h"
#include "time_util.h"
#include "token_cache.h"

namespace kubeoidc {
namespace oauth {

/**
 * Environment accessor; tests supply a map-backed lookup
 */
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

EnvLookup process_environment();

/**
 * Kubernetes client-go credential exec plugin
 *
 * Standard output carries exactly one ExecCredential document on
 * success and nothing at all on failure; every diagnostic goes to the
 * error stream.
 */
class ExecCredentialAdapter {
public:
    static constexpr const char* kApiVersion = "client.authentication.k8s.io/v1beta1";
    static constexpr const char* kKind = "ExecCredential";

    /**
     * @param config exec identity, capability variable, refresh window
     * @param cache Token cache for the plugin identity
     * @param flow Interactive login used on cache miss
     * @param http Transport for refresh-token grants
     */
    ExecCredentialAdapter(
        const OAuthConfig& config,
        TokenCache& cache,
        LoginFlow& flow,
        HttpClient& http
    );

    /**
     * Produce the credential
     * @param out Standard output
     * @param err Diagnostic stream
     * @param env Invocation environment
     * @return Process exit code
     */
    int run(std::ostream& out, std::ostream& err, const EnvLookup& env);

    /**
     * Whether kubectl allows user interaction for this invocation
     */
    bool interactive_mode_available(const EnvLookup& env) const;

    /**
     * Serialize the ExecCredential document (single line, no newline)
     */
    static std::string format_document(const std::string& token, TimePoint expiry);

private:
    TokenSet obtain_tokens(std::ostream& err);
    std::optional<TokenSet> try_refresh(const TokenSet& cached, std::ostream& err);

    const OAuthConfig& config_;
    TokenCache& cache_;
    LoginFlow& flow_;
    HttpClient& http_;
};

} // namespace oauth
} // namespace kubeoidc

#endif // KUBEOIDC_EXEC_CREDENTIAL_H
