#ifndef KUBEOIDC_CONTEXT_STORE_H
#define KUBEOIDC_CONTEXT_STORE_H

#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "token_set.h"
#include "token_store.h"

namespace kubeoidc {
namespace oauth {

/**
 * The current interactive login
 */
struct Context {
    std::string realm;
    std::string issuer_url;
    TokenSet tokens;

    const std::string& token_type() const { return tokens.token_type; }
    const std::string& scope() const { return tokens.scope; }

    nlohmann::json to_json() const;
    static Context from_json(const nlohmann::json& j);
};

/**
 * Holds at most one Context per installation
 * Logging in overwrites it, logging out deletes it.
 */
class ContextStore {
public:
    static constexpr const char* kContextKey = "current-context";

    explicit ContextStore(std::shared_ptr<TokenStoreBackend> backend);

    /**
     * @return Stored context, or std::nullopt when not logged in or unreadable
     */
    std::optional<Context> load();

    /**
     * @throws CacheError if the context cannot be written
     */
    void save(const Context& context);

    /**
     * Delete the stored context
     * @return true if a context existed
     */
    bool clear();

    /**
     * Change the realm recorded in the current context
     * @throws ContextError when not logged in
     */
    void set_realm(const std::string& realm);

private:
    std::shared_ptr<TokenStoreBackend> backend_;
};

} // namespace oauth
} // namespace kubeoidc

#endif // KUBEOIDC_CONTEXT_STORE_H
