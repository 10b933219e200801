#include "context_store.h"
#include "oauth_errors.h"
#include <iostream>

using json = nlohmann::json;

namespace kubeoidc {
namespace oauth {

json Context::to_json() const {
    json j;
    j["realm"] = realm;
    j["issuer_url"] = issuer_url;
    j["token_type"] = tokens.token_type;
    j["scope"] = tokens.scope;
    j["tokens"] = tokens.to_json();
    return j;
}

Context Context::from_json(const json& j) {
    Context context;
    context.realm = j.value("realm", "");
    context.issuer_url = j.at("issuer_url").get<std::string>();
    context.tokens = TokenSet::from_json(j.at("tokens"));
    return context;
}

ContextStore::ContextStore(std::shared_ptr<TokenStoreBackend> backend)
    : backend_(std::move(backend)) {
}

std::optional<Context> ContextStore::load() {
    try {
        auto record = backend_->read(kContextKey);
        if (!record) {
            return std::nullopt;
        }
        return Context::from_json(*record);
    } catch (const CacheError& e) {
        std::cerr << "Warning: cannot read login context: " << e.what() << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Warning: malformed login context: " << e.what() << std::endl;
    }
    return std::nullopt;
}

void ContextStore::save(const Context& context) {
    backend_->write(kContextKey, context.to_json());
}

bool ContextStore::clear() {
    bool existed = false;
    try {
        existed = backend_->read(kContextKey).has_value();
    } catch (const CacheError&) {
        existed = true;
    }
    backend_->remove(kContextKey);
    return existed;
}

void ContextStore::set_realm(const std::string& realm) {
    auto context = load();
    if (!context) {
        throw ContextError("Not logged in. Run 'kubeoidc login' first.");
    }
    context->realm = realm;
    save(*context);
}

} // namespace oauth
} // namespace kubeoidc
