#include <catch2/catch.hpp>
#include <map>
#include <sstream>
#include <thread>
#include <vector>

#include "authorization_request.h"
#include "exec_credential.h"
#include "test_helpers.h"
#include "token_store.h"

using namespace kubeoidc::oauth;
using namespace kubeoidc::test;
using json = nlohmann::json;

namespace {

const std::string kIssuer = "https://idp.example.com/realms/test";
const std::string kTokenEndpoint = kIssuer + "/protocol/openid-connect/token";
const std::string kDiscoveryUrl = kIssuer + "/.well-known/openid-configuration";

EnvLookup env_from(std::map<std::string, std::string> values) {
    return [values](const std::string& name) -> std::optional<std::string> {
        auto it = values.find(name);
        if (it == values.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

const EnvLookup kInteractive = env_from({{"KUBECTL_EXEC_INTERACTIVE_MODE", "IfAvailable"}});

/**
 * Redirects straight back with a code, as a provider with an existing
 * browser session would
 */
class AutoApproveBrowser : public BrowserLauncher {
public:
    ~AutoApproveBrowser() override {
        for (auto& thread : threads_) {
            thread.join();
        }
    }

    bool open(const std::string& url) override {
        ++opened;
        auto params = parse_query_string(url.substr(url.find('?') + 1));
        std::string redirect = params["redirect_uri"];
        redirect.replace(redirect.find("localhost"), 9, "127.0.0.1");
        std::string target = redirect + "?code=abc123&state=" + url_encode(params["state"]);

        threads_.emplace_back([target]() {
            RestHttpClient client(std::chrono::seconds(5));
            client.get(target);
        });
        return true;
    }

    int opened = 0;

private:
    std::vector<std::thread> threads_;
};

struct PluginFixture {
    TempDir dir;
    OAuthConfig config = test_config(dir.path());
    FakeHttpClient http;
    AutoApproveBrowser browser;
    std::ostringstream diagnostics;
    TokenCache cache{std::make_shared<FileTokenBackend>(dir.path()), system_clock_source(), config.refresh_window};
    LoginFlow flow{config, http, browser, diagnostics};
    ExecCredentialAdapter adapter{config, cache, flow, http};

    std::string id_token = make_jwt({{"sub", "u-1"}, {"preferred_username", "alice"}});

    void expect_login() {
        http.enqueue_json(kDiscoveryUrl, 200, discovery_document(kIssuer));
        http.enqueue_json(kTokenEndpoint, 200, {
            {"access_token", "access-1"},
            {"id_token", id_token},
            {"refresh_token", "refresh-1"},
            {"expires_in", 3600}
        });
    }
};

} // namespace

TEST_CASE("ExecCredential document format", "[exec_credential]") {
    TimePoint expiry = std::chrono::system_clock::from_time_t(1767229200);
    std::string document = ExecCredentialAdapter::format_document("tok", expiry);

    REQUIRE(document ==
            "{\"apiVersion\":\"client.authentication.k8s.io/v1beta1\",\"kind\":\"ExecCredential\","
            "\"status\":{\"expirationTimestamp\":\"2026-01-01T01:00:00Z\",\"token\":\"tok\"}}");
    REQUIRE(document.find('\n') == std::string::npos);
}

TEST_CASE("Interactive capability signal", "[exec_credential]") {
    PluginFixture fixture;
    const auto& adapter = fixture.adapter;

    REQUIRE(adapter.interactive_mode_available(kInteractive));
    REQUIRE_FALSE(adapter.interactive_mode_available(env_from({})));
    REQUIRE_FALSE(adapter.interactive_mode_available(env_from({{"KUBECTL_EXEC_INTERACTIVE_MODE", "Never"}})));
    REQUIRE(adapter.interactive_mode_available(env_from({
        {"KUBERNETES_EXEC_INFO", R"({"kind":"ExecCredential","spec":{"interactive":true}})"}
    })));
    REQUIRE_FALSE(adapter.interactive_mode_available(env_from({
        {"KUBERNETES_EXEC_INFO", R"({"kind":"ExecCredential","spec":{"interactive":false}})"}
    })));
    REQUIRE_FALSE(adapter.interactive_mode_available(env_from({{"KUBERNETES_EXEC_INFO", "{broken"}})));
}

TEST_CASE("Non-interactive invocation fails without side effects", "[exec_credential]") {
    PluginFixture fixture;
    std::ostringstream out;
    std::ostringstream err;

    int rc = fixture.adapter.run(out, err, env_from({}));

    REQUIRE(rc == 1);
    REQUIRE(out.str().empty());
    REQUIRE(err.str().find("interactive") != std::string::npos);
    REQUIRE(fixture.http.requests().empty());
    REQUIRE(fixture.browser.opened == 0);
}

TEST_CASE("Cached credential is emitted without network access", "[exec_credential]") {
    PluginFixture fixture;
    TokenSet tokens = TokenSet::from_token_response({
        {"access_token", "cached-access"},
        {"id_token", fixture.id_token},
        {"expires_in", 3600}
    }, std::chrono::system_clock::now());
    REQUIRE(fixture.cache.save(fixture.config.exec.identity, tokens));

    std::ostringstream out;
    std::ostringstream err;
    int rc = fixture.adapter.run(out, err, kInteractive);

    REQUIRE(rc == 0);
    REQUIRE(fixture.http.requests().empty());

    std::string output = out.str();
    REQUIRE(output.back() == '\n');
    REQUIRE(output.find('\n') == output.size() - 1);

    json document = json::parse(output);
    REQUIRE(document["apiVersion"].get<std::string>() == "client.authentication.k8s.io/v1beta1");
    REQUIRE(document["kind"].get<std::string>() == "ExecCredential");
    REQUIRE(document["status"]["token"].get<std::string>() == fixture.id_token);

    auto expiry = parse_rfc3339(document["status"]["expirationTimestamp"].get<std::string>());
    REQUIRE(expiry.has_value());
    REQUIRE(*expiry >= std::chrono::system_clock::now());
}

TEST_CASE("Cache miss runs the login and caches its tokens", "[exec_credential]") {
    PluginFixture fixture;
    fixture.expect_login();

    std::ostringstream out;
    std::ostringstream err;
    REQUIRE(fixture.adapter.run(out, err, kInteractive) == 0);

    REQUIRE(fixture.browser.opened == 1);
    REQUIRE(fixture.http.count("POST") == 1);
    REQUIRE(parse_query_string(fixture.http.requests().back().body)["code"] == "abc123");
    REQUIRE(json::parse(out.str())["status"]["token"].get<std::string>() == fixture.id_token);

    // Progress goes to the diagnostic stream only
    REQUIRE(fixture.diagnostics.str().find("http") != std::string::npos);

    std::ostringstream second_out;
    std::ostringstream second_err;
    REQUIRE(fixture.adapter.run(second_out, second_err, kInteractive) == 0);
    REQUIRE(fixture.browser.opened == 1);
    REQUIRE(fixture.http.count("POST") == 1);
    REQUIRE(second_out.str() == out.str());
}

TEST_CASE("Entry inside the refresh window is refreshed", "[exec_credential]") {
    PluginFixture fixture;
    TokenSet tokens = TokenSet::from_token_response({
        {"access_token", "old-access"},
        {"id_token", "old-id"},
        {"refresh_token", "refresh-1"},
        {"expires_in", 60}
    }, std::chrono::system_clock::now());
    fixture.cache.save(fixture.config.exec.identity, tokens);

    fixture.http.enqueue_json(kTokenEndpoint, 200, {
        {"access_token", "new-access"},
        {"id_token", "new-id"},
        {"expires_in", 3600}
    });

    std::ostringstream out;
    std::ostringstream err;
    REQUIRE(fixture.adapter.run(out, err, kInteractive) == 0);

    REQUIRE(json::parse(out.str())["status"]["token"].get<std::string>() == "new-id");
    REQUIRE(fixture.browser.opened == 0);
    REQUIRE(parse_query_string(fixture.http.requests().back().body)["grant_type"] == "refresh_token");

    auto cached = fixture.cache.get(fixture.config.exec.identity);
    REQUIRE(cached.has_value());
    REQUIRE(cached->bearer_token() == "new-id");
}

TEST_CASE("Refresh uses the endpoint the tokens came from", "[exec_credential]") {
    PluginFixture fixture;
    const std::string discovered_endpoint = "https://idp.example.com/oauth2/v1/token";
    TokenSet tokens = TokenSet::from_token_response({
        {"access_token", "old-access"},
        {"id_token", "old-id"},
        {"refresh_token", "refresh-1"},
        {"expires_in", 60}
    }, std::chrono::system_clock::now());
    tokens.token_endpoint = discovered_endpoint;
    fixture.cache.save(fixture.config.exec.identity, tokens);

    fixture.http.enqueue_json(discovered_endpoint, 200, {
        {"access_token", "new-access"},
        {"id_token", "new-id"},
        {"expires_in", 3600}
    });

    std::ostringstream out;
    std::ostringstream err;
    REQUIRE(fixture.adapter.run(out, err, kInteractive) == 0);

    REQUIRE(fixture.browser.opened == 0);
    REQUIRE(fixture.http.requests().size() == 1);
    REQUIRE(fixture.http.requests()[0].url == discovered_endpoint);
    REQUIRE(fixture.cache.get(fixture.config.exec.identity)->token_endpoint == discovered_endpoint);
}

TEST_CASE("Failed refresh falls back to a full login", "[exec_credential]") {
    PluginFixture fixture;
    TokenSet tokens = TokenSet::from_token_response({
        {"access_token", "old-access"},
        {"id_token", "old-id"},
        {"refresh_token", "revoked"},
        {"expires_in", 60}
    }, std::chrono::system_clock::now());
    fixture.cache.save(fixture.config.exec.identity, tokens);

    fixture.http.enqueue_json(kTokenEndpoint, 400, {{"error", "invalid_grant"}});
    fixture.expect_login();

    std::ostringstream out;
    std::ostringstream err;
    REQUIRE(fixture.adapter.run(out, err, kInteractive) == 0);

    REQUIRE(fixture.browser.opened == 1);
    REQUIRE(err.str().find("refresh") != std::string::npos);
    REQUIRE(json::parse(out.str())["status"]["token"].get<std::string>() == fixture.id_token);
}

TEST_CASE("Login failure leaves stdout empty", "[exec_credential]") {
    PluginFixture fixture;
    fixture.http.enqueue_json(kDiscoveryUrl, 200, discovery_document(kIssuer));
    fixture.http.enqueue_json(kTokenEndpoint, 400, {{"error", "invalid_grant"}});

    std::ostringstream out;
    std::ostringstream err;
    REQUIRE(fixture.adapter.run(out, err, kInteractive) == 1);

    REQUIRE(out.str().empty());
    REQUIRE(err.str().find("Authentication failed") != std::string::npos);
    REQUIRE_FALSE(fixture.cache.get(fixture.config.exec.identity).has_value());
}
