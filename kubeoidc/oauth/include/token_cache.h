#ifndef KUBEOIDC_TOKEN_CACHE_H
#define KUBEOIDC_TOKEN_CACHE_H

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "time_util.h"
#include "token_set.h"
#include "token_store.h"

namespace kubeoidc {
namespace oauth {

/**
 * Metadata-only view of a cache entry (no token material)
 */
struct CacheEntryInfo {
    std::string key;
    TimePoint expires_at;
    TimePoint cached_at;
    bool near_expiry = false;
    bool has_refresh_token = false;
};

/**
 * Token Cache
 * Stores TokenSets per principal (service-account client ID, plugin
 * identity). Expired entries are evicted when read. The cache never
 * refreshes on its own; callers check is_near_expiry().
 * The login context key is reserved: never returned, listed or cleared.
 */
class TokenCache {
public:
    /**
     * @param backend Keyed store holding the records
     * @param clock Time source for expiry decisions
     * @param refresh_window Entries expiring within this window are near expiry
     */
    explicit TokenCache(
        std::shared_ptr<TokenStoreBackend> backend,
        Clock clock = system_clock_source(),
        std::chrono::seconds refresh_window = std::chrono::minutes(5)
    );

    /**
     * Store tokens under key
     * Failure is logged and reported through the return value only;
     * the tokens stay usable by the caller.
     * @return true if persisted
     */
    bool save(const std::string& key, const TokenSet& tokens);

    /**
     * Get tokens if not expired
     * An expired or unreadable entry is deleted and std::nullopt returned.
     */
    std::optional<TokenSet> get(const std::string& key);

    /**
     * Like get(), but also treats entries inside the refresh window as absent
     * without deleting them
     */
    std::optional<TokenSet> get_fresh(const std::string& key);

    bool is_near_expiry(const TokenSet& tokens) const;

    void remove(const std::string& key);

    /**
     * Delete every cached entry
     * @return Number of entries removed
     */
    size_t clear_all();

    std::vector<CacheEntryInfo> list();

private:
    std::shared_ptr<TokenStoreBackend> backend_;
    Clock clock_;
    std::chrono::seconds refresh_window_;
};

} // namespace oauth
} // namespace kubeoidc

#endif // KUBEOIDC_TOKEN_CACHE_H
