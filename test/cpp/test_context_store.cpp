#include <catch2/catch.hpp>
#include <fstream>

#include "context_store.h"
#include "oauth_errors.h"
#include "test_helpers.h"
#include "token_store.h"

using namespace kubeoidc::oauth;
using namespace kubeoidc::test;

namespace {

Context sample_context(const ManualClock& clock) {
    Context context;
    context.realm = "test";
    context.issuer_url = "https://idp.example.com/realms/test";
    context.tokens = TokenSet::from_token_response({
        {"access_token", "access"},
        {"refresh_token", "refresh"},
        {"id_token", "id"},
        {"scope", "openid groups"},
        {"expires_in", 3600}
    }, clock.now());
    return context;
}

} // namespace

TEST_CASE("Context survives a save and load", "[context_store]") {
    TempDir dir;
    ManualClock clock;
    ContextStore store(std::make_shared<FileTokenBackend>(dir.path()));

    REQUIRE_FALSE(store.load().has_value());

    store.save(sample_context(clock));
    auto loaded = store.load();

    REQUIRE(loaded.has_value());
    REQUIRE(loaded->realm == "test");
    REQUIRE(loaded->issuer_url == "https://idp.example.com/realms/test");
    REQUIRE(loaded->tokens.access_token == "access");
    REQUIRE(loaded->tokens.refresh_token == std::optional<std::string>("refresh"));
    REQUIRE(loaded->token_type() == "Bearer");
    REQUIRE(loaded->scope() == "openid groups");
    REQUIRE(loaded->tokens.expires_at == clock.now() + std::chrono::seconds(3600));
}

TEST_CASE("Login overwrites and logout deletes the context", "[context_store]") {
    TempDir dir;
    ManualClock clock;
    ContextStore store(std::make_shared<FileTokenBackend>(dir.path()));

    store.save(sample_context(clock));
    Context second = sample_context(clock);
    second.realm = "other";
    store.save(second);
    REQUIRE(store.load()->realm == "other");

    REQUIRE(store.clear());
    REQUIRE_FALSE(store.load().has_value());
    REQUIRE_FALSE(store.clear());
}

TEST_CASE("Realm can only be set while logged in", "[context_store]") {
    TempDir dir;
    ManualClock clock;
    ContextStore store(std::make_shared<FileTokenBackend>(dir.path()));

    REQUIRE_THROWS_AS(store.set_realm("ops"), ContextError);

    store.save(sample_context(clock));
    store.set_realm("ops");
    REQUIRE(store.load()->realm == "ops");
}

TEST_CASE("Corrupt context reads as logged out", "[context_store]") {
    TempDir dir;
    auto backend = std::make_shared<FileTokenBackend>(dir.path());
    ContextStore store(backend);

    backend->write(ContextStore::kContextKey, {{"realm", "test"}});
    REQUIRE_FALSE(store.load().has_value());

    {
        std::ofstream corrupt(backend->path_for(ContextStore::kContextKey), std::ios::trunc);
        corrupt << "not json";
    }
    REQUIRE_FALSE(store.load().has_value());
    REQUIRE(store.clear());
}
