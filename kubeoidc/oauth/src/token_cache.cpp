#include "token_cache.h"
#include "context_store.h"
#include "oauth_errors.h"
#include <iostream>

using json = nlohmann::json;

namespace kubeoidc {
namespace oauth {

TokenCache::TokenCache(
    std::shared_ptr<TokenStoreBackend> backend,
    Clock clock,
    std::chrono::seconds refresh_window
) : backend_(std::move(backend)),
    clock_(std::move(clock)),
    refresh_window_(refresh_window) {
}

namespace {

// The login context shares the store but is not a cache entry
bool is_reserved(const std::string& key) {
    return key == ContextStore::kContextKey;
}

} // namespace

bool TokenCache::save(const std::string& key, const TokenSet& tokens) {
    if (is_reserved(key)) {
        std::cerr << "Warning: '" << key << "' is reserved and cannot hold cached tokens" << std::endl;
        return false;
    }
    try {
        backend_->write(key, tokens.to_json());
        return true;
    } catch (const CacheError& e) {
        std::cerr << "Warning: failed to cache token: " << e.what() << std::endl;
        return false;
    }
}

std::optional<TokenSet> TokenCache::get(const std::string& key) {
    if (is_reserved(key)) {
        return std::nullopt;
    }

    std::optional<json> record;
    try {
        record = backend_->read(key);
    } catch (const CacheError& e) {
        std::cerr << "Warning: discarding unreadable cache entry: " << e.what() << std::endl;
        remove(key);
        return std::nullopt;
    }

    if (!record) {
        return std::nullopt;
    }

    TokenSet tokens;
    try {
        tokens = TokenSet::from_json(*record);
    } catch (const std::exception& e) {
        std::cerr << "Warning: discarding malformed cache entry for '" << key << "': "
                  << e.what() << std::endl;
        remove(key);
        return std::nullopt;
    }

    if (tokens.is_expired(clock_())) {
        remove(key);
        return std::nullopt;
    }

    return tokens;
}

std::optional<TokenSet> TokenCache::get_fresh(const std::string& key) {
    auto tokens = get(key);
    if (tokens && is_near_expiry(*tokens)) {
        return std::nullopt;
    }
    return tokens;
}

bool TokenCache::is_near_expiry(const TokenSet& tokens) const {
    return clock_() >= tokens.expires_at - refresh_window_;
}

void TokenCache::remove(const std::string& key) {
    try {
        backend_->remove(key);
    } catch (const CacheError& e) {
        std::cerr << "Warning: failed to delete cache entry: " << e.what() << std::endl;
    }
}

size_t TokenCache::clear_all() {
    size_t removed = 0;
    try {
        for (const auto& key : backend_->keys()) {
            if (is_reserved(key)) {
                continue;
            }
            backend_->remove(key);
            ++removed;
        }
    } catch (const CacheError& e) {
        std::cerr << "Warning: failed to clear cache: " << e.what() << std::endl;
    }
    return removed;
}

std::vector<CacheEntryInfo> TokenCache::list() {
    std::vector<CacheEntryInfo> entries;

    std::vector<std::string> keys;
    try {
        keys = backend_->keys();
    } catch (const CacheError& e) {
        std::cerr << "Warning: failed to list cache: " << e.what() << std::endl;
        return entries;
    }

    for (const auto& key : keys) {
        if (is_reserved(key)) {
            continue;
        }
        auto tokens = get(key);
        if (!tokens) {
            continue;
        }
        CacheEntryInfo info;
        info.key = key;
        info.expires_at = tokens->expires_at;
        info.cached_at = tokens->issued_at;
        info.near_expiry = is_near_expiry(*tokens);
        info.has_refresh_token = tokens->refresh_token.has_value();
        entries.push_back(info);
    }

    return entries;
}

} // namespace oauth
} // namespace kubeoidc
