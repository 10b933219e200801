#include "cli_support.h"
#include "browser_launcher.h"
#include "context_store.h"
#include "http_client.h"
#include "id_token_claims.h"
#include "login_flow.h"
#include "oauth_errors.h"
#include "token_cache.h"
#include "token_exchanger.h"
#include "token_store.h"
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::json;
using namespace kubeoidc;

namespace {

void print_usage(std::ostream& out) {
    out << "Usage: kubeoidc <command> [options]\n"
           "\n"
           "Commands:\n"
           "  login [--realm NAME]        Log in through the browser\n"
           "  logout                      Forget the current login\n"
           "  whoami                      Show the logged-in user\n"
           "  context show                Show the current login context\n"
           "  realm set NAME              Change the realm of the current context\n"
           "  token                       Print the current access token\n"
           "  get-token [--client-id ID] [--client-secret SECRET]\n"
           "            [--output token|json] [--no-cache]\n"
           "                              Service account token (client credentials)\n"
           "  cache list                  List cached tokens\n"
           "  cache clear                 Delete all cached tokens\n"
           "  inspect TOKEN [--decode]    Inspect a JWT\n";
}

// Value following --name, or --name=value
bool take_option(const std::vector<std::string>& args, size_t& i, const std::string& name, std::string& value) {
    const std::string& arg = args[i];
    if (arg == name) {
        if (i + 1 >= args.size()) {
            throw std::invalid_argument(name + " requires a value");
        }
        value = args[++i];
        return true;
    }
    const std::string prefix = name + "=";
    if (arg.rfind(prefix, 0) == 0) {
        value = arg.substr(prefix.size());
        return true;
    }
    return false;
}

std::string describe_remaining(oauth::TimePoint expires_at, oauth::TimePoint now) {
    if (expires_at <= now) {
        return "expired";
    }
    auto minutes = std::chrono::duration_cast<std::chrono::minutes>(expires_at - now).count();
    if (minutes >= 60) {
        return std::to_string(minutes / 60) + "h " + std::to_string(minutes % 60) + "m";
    }
    return std::to_string(minutes) + "m";
}

class Application {
public:
    explicit Application(oauth::OAuthConfig config)
        : config_(std::move(config)),
          http_(config_.http_timeout),
          backend_(std::make_shared<oauth::FileTokenBackend>(config_.cache_dir)),
          cache_(backend_, oauth::system_clock_source(), config_.refresh_window),
          contexts_(backend_),
          flow_(config_, http_, browser_),
          interactive_(config_, flow_, http_, contexts_) {
    }

    oauth::LoginFlow& flow() { return flow_; }

    int run(const std::vector<std::string>& args) {
        const std::string& command = args[0];

        if (command == "login") {
            return login(args);
        }
        if (command == "logout") {
            return logout();
        }
        if (command == "whoami") {
            return whoami();
        }
        if (command == "context" && args.size() >= 2 && args[1] == "show") {
            return context_show();
        }
        if (command == "realm" && args.size() >= 3 && args[1] == "set") {
            return realm_set(args[2]);
        }
        if (command == "token") {
            std::cout << interactive_.current_access_token() << std::endl;
            return 0;
        }
        if (command == "get-token") {
            return get_token(args);
        }
        if (command == "cache" && args.size() >= 2 && args[1] == "list") {
            return cache_list();
        }
        if (command == "cache" && args.size() >= 2 && args[1] == "clear") {
            size_t removed = cache_.clear_all();
            std::cout << "Removed " << removed << " cached token(s)" << std::endl;
            return 0;
        }
        if (command == "inspect" && args.size() >= 2) {
            return inspect(args);
        }

        print_usage(std::cerr);
        return 2;
    }

private:
    int login(const std::vector<std::string>& args) {
        std::string realm;
        for (size_t i = 1; i < args.size(); ++i) {
            if (!take_option(args, i, "--realm", realm)) {
                throw std::invalid_argument("unknown option for login: " + args[i]);
            }
        }
        if (!realm.empty()) {
            config_.set_realm(realm);
        }

        oauth::Context context = interactive_.login();

        std::string user;
        if (context.tokens.id_token) {
            try {
                user = oauth::IdTokenClaims::decode(*context.tokens.id_token).preferred_username;
            } catch (const oauth::TokenFormatError& e) {
                std::cerr << "Warning: " << e.what() << std::endl;
            }
        }

        std::cout << "Logged in to realm '" << context.realm << "'";
        if (!user.empty()) {
            std::cout << " as " << user;
        }
        std::cout << std::endl;
        return 0;
    }

    int logout() {
        if (interactive_.logout()) {
            std::cout << "Logged out successfully" << std::endl;
        } else {
            std::cout << "Not logged in" << std::endl;
        }
        return 0;
    }

    int whoami() {
        auto context = require_context();
        if (!context->tokens.id_token) {
            std::cout << "No user information available" << std::endl;
            return 0;
        }

        oauth::IdTokenClaims claims = oauth::IdTokenClaims::decode(*context->tokens.id_token);
        auto or_na = [](const std::string& value) { return value.empty() ? std::string("N/A") : value; };

        std::cout << "Username: " << or_na(claims.preferred_username) << "\n"
                  << "Email:    " << or_na(claims.email) << "\n"
                  << "Name:     " << or_na(claims.name) << "\n"
                  << "Subject:  " << or_na(claims.subject) << "\n"
                  << "Realm:    " << or_na(context->realm) << "\n"
                  << "Issuer:   " << context->issuer_url << std::endl;
        return 0;
    }

    int context_show() {
        auto context = require_context();
        auto now = std::chrono::system_clock::now();

        std::cout << "Realm:         " << context->realm << "\n"
                  << "Issuer:        " << context->issuer_url << "\n"
                  << "Token type:    " << context->token_type() << "\n"
                  << "Scope:         " << context->scope() << "\n"
                  << "Expires:       " << oauth::format_rfc3339(context->tokens.expires_at)
                  << " (" << describe_remaining(context->tokens.expires_at, now) << ")\n"
                  << "Refreshable:   " << (context->tokens.refresh_token ? "yes" : "no") << std::endl;
        return 0;
    }

    int realm_set(const std::string& realm) {
        contexts_.set_realm(realm);
        std::cout << "Realm set to '" << realm << "'" << std::endl;
        return 0;
    }

    int get_token(const std::vector<std::string>& args) {
        std::string client_id;
        std::string client_secret;
        std::string output = "token";
        bool use_cache = true;

        for (size_t i = 1; i < args.size(); ++i) {
            if (take_option(args, i, "--client-id", client_id) ||
                take_option(args, i, "--client-secret", client_secret) ||
                take_option(args, i, "--output", output)) {
                continue;
            }
            if (args[i] == "--no-cache") {
                use_cache = false;
                continue;
            }
            throw std::invalid_argument("unknown option for get-token: " + args[i]);
        }
        if (output != "token" && output != "json") {
            throw std::invalid_argument("--output must be 'token' or 'json'");
        }

        if (client_id.empty() || client_secret.empty()) {
            auto creds = cli::credentials_from_environment();
            if (!creds) {
                std::cerr << "error: no service account credentials provided" << std::endl;
                std::cerr << "Set KEYCLOAK_CLIENT_ID and KEYCLOAK_CLIENT_SECRET, "
                             "or use --client-id and --client-secret" << std::endl;
                return 1;
            }
            client_id = creds->client_id;
            client_secret = creds->client_secret;
        }

        std::optional<oauth::TokenSet> tokens;
        if (use_cache) {
            tokens = cache_.get_fresh(client_id);
        }
        if (!tokens) {
            oauth::TokenExchanger exchanger(config_, http_);
            tokens = exchanger.client_credentials(client_id, client_secret);
            cache_.save(client_id, *tokens);
        }

        if (output == "json") {
            json document = tokens->to_json();
            document["client_id"] = client_id;
            std::cout << document.dump(2) << std::endl;
        } else {
            std::cout << tokens->access_token << std::endl;
        }
        return 0;
    }

    int cache_list() {
        auto entries = cache_.list();
        if (entries.empty()) {
            std::cout << "No cached tokens" << std::endl;
            return 0;
        }

        auto now = std::chrono::system_clock::now();
        for (const auto& entry : entries) {
            std::cout << entry.key
                      << "  expires " << oauth::format_rfc3339(entry.expires_at)
                      << " (" << describe_remaining(entry.expires_at, now) << ")"
                      << (entry.near_expiry ? "  [refresh due]" : "")
                      << (entry.has_refresh_token ? "  [refreshable]" : "")
                      << std::endl;
        }
        return 0;
    }

    int inspect(const std::vector<std::string>& args) {
        const std::string& token = args[1];
        bool decode = args.size() >= 3 && args[2] == "--decode";

        if (!decode) {
            std::cout << "Token length: " << token.size() << " characters\n"
                      << "Token: " << cli::abbreviate_token(token) << std::endl;
            return 0;
        }

        oauth::IdTokenClaims claims = oauth::IdTokenClaims::decode(token);
        std::cout << "JWT Header:\n" << claims.header.dump(2) << "\n\n"
                  << "JWT Payload:\n" << claims.payload.dump(2) << std::endl;

        if (claims.expiry) {
            auto now = std::chrono::system_clock::now();
            if (*claims.expiry > now) {
                std::cout << "\nToken expires in " << describe_remaining(*claims.expiry, now) << std::endl;
            } else {
                std::cout << "\nToken expired at " << oauth::format_rfc3339(*claims.expiry) << std::endl;
            }
        }
        return 0;
    }

    std::optional<oauth::Context> require_context() {
        auto context = contexts_.load();
        if (!context) {
            throw oauth::ContextError("Not logged in. Run 'kubeoidc login' first.");
        }
        return context;
    }

    oauth::OAuthConfig config_;
    oauth::RestHttpClient http_;
    oauth::SystemBrowserLauncher browser_;
    std::shared_ptr<oauth::FileTokenBackend> backend_;
    oauth::TokenCache cache_;
    oauth::ContextStore contexts_;
    oauth::LoginFlow flow_;
    oauth::InteractiveLogin interactive_;
};

} // namespace

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty() || args[0] == "--help" || args[0] == "-h") {
        print_usage(args.empty() ? std::cerr : std::cout);
        return args.empty() ? 2 : 0;
    }

    try {
        Application app(cli::load_config());
        cli::SignalCanceller canceller(app.flow());

        int rc = app.run(args);
        if (canceller.received()) {
            return 128 + *canceller.received();
        }
        return rc;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << std::endl;
        return 1;
    }
}
