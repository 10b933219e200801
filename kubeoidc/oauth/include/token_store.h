#ifndef KUBEOIDC_TOKEN_STORE_H
#define KUBEOIDC_TOKEN_STORE_H

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace kubeoidc {
namespace oauth {

/**
 * Keyed persistence for token material
 * Backends own the storage; callers never touch it directly.
 * All failures are reported as CacheError.
 */
class TokenStoreBackend {
public:
    virtual ~TokenStoreBackend() = default;

    /**
     * @return Stored record, or std::nullopt if the key is absent
     * @throws CacheError if the record exists but cannot be read or parsed
     */
    virtual std::optional<nlohmann::json> read(const std::string& key) = 0;

    /**
     * Replace the record for key atomically
     * @throws CacheError
     */
    virtual void write(const std::string& key, const nlohmann::json& record) = 0;

    /**
     * Delete the record; absent keys are not an error
     * @throws CacheError
     */
    virtual void remove(const std::string& key) = 0;

    /**
     * Keys of all readable records
     */
    virtual std::vector<std::string> keys() = 0;
};

/**
 * One JSON file per key below a private directory
 *
 * Files are named after the SHA-256 of the key, created with mode 0600
 * in a 0700 directory, written to a temporary file and renamed into
 * place. Writers and readers in different processes serialize on an
 * advisory flock of "<dir>/.lock".
 */
class FileTokenBackend : public TokenStoreBackend {
public:
    explicit FileTokenBackend(const std::string& directory);

    std::optional<nlohmann::json> read(const std::string& key) override;
    void write(const std::string& key, const nlohmann::json& record) override;
    void remove(const std::string& key) override;
    std::vector<std::string> keys() override;

    /**
     * Path of the file backing key
     */
    std::string path_for(const std::string& key) const;

    const std::string& directory() const { return directory_; }

private:
    void ensure_directory() const;

    std::string directory_;
};

} // namespace oauth
} // namespace kubeoidc

#endif // KUBEOIDC_TOKEN_STORE_H
