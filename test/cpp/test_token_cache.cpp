#include <catch2/catch.hpp>
#include <fstream>
#include <sys/stat.h>

#include "context_store.h"
#include "oauth_errors.h"
#include "test_helpers.h"
#include "token_cache.h"
#include "token_store.h"

using namespace kubeoidc::oauth;
using namespace kubeoidc::test;
using json = nlohmann::json;

namespace {

TokenSet sample_tokens(const ManualClock& clock, int expires_in, bool refreshable = false) {
    json response = {{"access_token", "access"}, {"id_token", "id"}, {"expires_in", expires_in}};
    if (refreshable) {
        response["refresh_token"] = "refresh";
    }
    return TokenSet::from_token_response(response, clock.now());
}

mode_t mode_of(const std::string& path) {
    struct stat st {};
    REQUIRE(::stat(path.c_str(), &st) == 0);
    return st.st_mode & 0777;
}

} // namespace

// ============================================================================
// File backend
// ============================================================================

TEST_CASE("File backend stores owner-only records", "[token_store]") {
    TempDir dir;
    FileTokenBackend backend(dir.sub("cache"));

    backend.write("ci-bot", {{"access_token", "a"}});

    REQUIRE(mode_of(dir.sub("cache")) == 0700);
    REQUIRE(mode_of(backend.path_for("ci-bot")) == 0600);

    auto record = backend.read("ci-bot");
    REQUIRE(record.has_value());
    REQUIRE((*record)["access_token"].get<std::string>() == "a");
    REQUIRE((*record)["key"].get<std::string>() == "ci-bot");
}

TEST_CASE("File backend names files after the key digest", "[token_store]") {
    TempDir dir;
    FileTokenBackend backend(dir.path());

    std::string path = backend.path_for("ci-bot");
    std::string name = path.substr(path.rfind('/') + 1);

    REQUIRE(name.size() == 64 + 5);
    REQUIRE(name.substr(64) == ".json");
    REQUIRE(name.find("ci-bot") == std::string::npos);
    REQUIRE(backend.path_for("ci-bot") != backend.path_for("ci-bot2"));
}

TEST_CASE("File backend replaces records and leaves no temporary files", "[token_store]") {
    TempDir dir;
    FileTokenBackend backend(dir.path());

    backend.write("k", {{"v", 1}});
    backend.write("k", {{"v", 2}});

    REQUIRE((*backend.read("k"))["v"].get<int>() == 2);

    for (const auto& entry : std::filesystem::directory_iterator(dir.path())) {
        REQUIRE(entry.path().extension() != ".tmp");
    }
    REQUIRE(backend.keys() == std::vector<std::string>{"k"});
}

TEST_CASE("File backend handles absent and corrupt records", "[token_store]") {
    TempDir dir;
    FileTokenBackend backend(dir.sub("not-created-yet"));

    REQUIRE_FALSE(backend.read("missing").has_value());
    REQUIRE(backend.keys().empty());
    REQUIRE_NOTHROW(backend.remove("missing"));

    backend.write("k", {{"v", 1}});
    {
        std::ofstream corrupt(backend.path_for("k"), std::ios::trunc);
        corrupt << "{ truncated";
    }
    REQUIRE_THROWS_AS(backend.read("k"), CacheError);
    REQUIRE(backend.keys().empty());
}

// ============================================================================
// Token cache
// ============================================================================

TEST_CASE("Cached tokens are returned until they expire", "[token_cache]") {
    TempDir dir;
    ManualClock clock;
    auto backend = std::make_shared<FileTokenBackend>(dir.path());
    TokenCache cache(backend, clock.source());

    REQUIRE(cache.save("ci-bot", sample_tokens(clock, 600)));

    clock.advance(std::chrono::seconds(599));
    auto cached = cache.get("ci-bot");
    REQUIRE(cached.has_value());
    REQUIRE(cached->access_token == "access");

    clock.advance(std::chrono::seconds(1));
    REQUIRE_FALSE(cache.get("ci-bot").has_value());
    REQUIRE_FALSE(backend->read("ci-bot").has_value());
}

TEST_CASE("Refresh window marks entries as near expiry", "[token_cache]") {
    TempDir dir;
    ManualClock clock;
    TokenCache cache(std::make_shared<FileTokenBackend>(dir.path()), clock.source(), std::chrono::minutes(5));

    cache.save("k", sample_tokens(clock, 600));

    auto tokens = cache.get("k");
    REQUIRE(tokens.has_value());
    REQUIRE_FALSE(cache.is_near_expiry(*tokens));
    REQUIRE(cache.get_fresh("k").has_value());

    clock.advance(std::chrono::seconds(300));
    REQUIRE(cache.is_near_expiry(*tokens));
    REQUIRE_FALSE(cache.get_fresh("k").has_value());
    REQUIRE(cache.get("k").has_value());
}

TEST_CASE("Corrupt cache entries are treated as absent", "[token_cache]") {
    TempDir dir;
    ManualClock clock;
    auto backend = std::make_shared<FileTokenBackend>(dir.path());
    TokenCache cache(backend, clock.source());

    SECTION("Unparsable file") {
        cache.save("k", sample_tokens(clock, 600));
        {
            std::ofstream corrupt(backend->path_for("k"), std::ios::trunc);
            corrupt << "garbage";
        }
        REQUIRE_FALSE(cache.get("k").has_value());
        REQUIRE_FALSE(std::filesystem::exists(backend->path_for("k")));
    }

    SECTION("Valid JSON without token fields") {
        backend->write("k", {{"unexpected", true}});
        REQUIRE_FALSE(cache.get("k").has_value());
        REQUIRE_FALSE(backend->read("k").has_value());
    }
}

TEST_CASE("Unwritable cache does not fail the caller", "[token_cache]") {
    TempDir dir;
    ManualClock clock;
    {
        std::ofstream blocker(dir.sub("file"));
        blocker << "x";
    }
    // A regular file where the cache directory should be
    TokenCache cache(std::make_shared<FileTokenBackend>(dir.sub("file")), clock.source());

    REQUIRE_FALSE(cache.save("k", sample_tokens(clock, 600)));
}

TEST_CASE("Cache listing and clearing", "[token_cache]") {
    TempDir dir;
    ManualClock clock;
    auto backend = std::make_shared<FileTokenBackend>(dir.path());
    TokenCache cache(backend, clock.source());
    ContextStore contexts(backend);

    cache.save("ci-bot", sample_tokens(clock, 3600, true));
    cache.save("deployer", sample_tokens(clock, 120));

    Context context;
    context.realm = "test";
    context.issuer_url = "https://idp.example.com/realms/test";
    context.tokens = sample_tokens(clock, 3600);
    contexts.save(context);

    auto entries = cache.list();
    REQUIRE(entries.size() == 2);
    for (const auto& entry : entries) {
        if (entry.key == "ci-bot") {
            REQUIRE(entry.has_refresh_token);
            REQUIRE_FALSE(entry.near_expiry);
            REQUIRE(entry.cached_at == clock.now());
        } else {
            REQUIRE(entry.key == "deployer");
            REQUIRE(entry.near_expiry);
        }
    }

    REQUIRE(cache.clear_all() == 2);
    REQUIRE(cache.list().empty());
    REQUIRE(contexts.load().has_value());
}

TEST_CASE("Login context key is not a cache entry", "[token_cache]") {
    TempDir dir;
    ManualClock clock;
    TokenCache cache(std::make_shared<FileTokenBackend>(dir.path()), clock.source());

    REQUIRE_FALSE(cache.save(ContextStore::kContextKey, sample_tokens(clock, 600)));
    REQUIRE_FALSE(cache.get(ContextStore::kContextKey).has_value());
}
