#include "cli_support.h"
#include "browser_launcher.h"
#include "exec_credential.h"
#include "http_client.h"
#include "login_flow.h"
#include "token_cache.h"
#include "token_store.h"
#include <iostream>
#include <memory>

using namespace kubeoidc;

// kubectl credential plugin: stdout is reserved for the ExecCredential
int main() {
    try {
        oauth::OAuthConfig config = cli::load_config();

        oauth::RestHttpClient http(config.http_timeout);
        oauth::SystemBrowserLauncher browser;
        auto backend = std::make_shared<oauth::FileTokenBackend>(config.cache_dir);
        oauth::TokenCache cache(backend, oauth::system_clock_source(), config.refresh_window);
        oauth::LoginFlow flow(config, http, browser, std::cerr);
        cli::SignalCanceller canceller(flow);

        oauth::ExecCredentialAdapter adapter(config, cache, flow, http);
        return adapter.run(std::cout, std::cerr, oauth::process_environment());
    } catch (const std::exception& e) {
        std::cerr << "Authentication failed: " << e.what() << std::endl;
        return 1;
    }
}
