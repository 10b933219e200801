#ifndef KUBEOIDC_PKCE_HELPER_H
#define KUBEOIDC_PKCE_HELPER_H

#include <cstddef>
#include <string>

namespace kubeoidc {
namespace oauth {

/**
 * Verifier and its S256 challenge
 */
struct PKCEPair {
    std::string code_verifier;
    std::string code_challenge;
};

/**
 * PKCE (Proof Key for Code Exchange) Helper
 * Implements RFC 7636 with the S256 method only
 */
class PKCEHelper {
public:
    /**
     * Generate a fresh verifier/challenge pair
     * @return Independent pair on every call
     */
    static PKCEPair generate_pair();

    /**
     * Generate a cryptographically random code verifier
     * 256 bits of entropy, base64url encoded: 43 characters
     * @return Random code verifier
     */
    static std::string generate_code_verifier();

    /**
     * BASE64URL(SHA256(code_verifier))
     * @param verifier Code verifier
     * @return Code challenge
     */
    static std::string generate_code_challenge(const std::string& verifier);

    /**
     * Generate a cryptographically random state parameter
     * Binds the browser callback to one login attempt (CSRF protection)
     * @return Random state string
     */
    static std::string generate_state();

    /**
     * Base64 URL-safe encode without padding
     * @param data Data to encode
     * @return Base64url encoded string
     */
    static std::string base64url_encode(const std::string& data);

    /**
     * SHA-256 digest
     * @param data Data to hash
     * @return 32 raw digest bytes
     */
    static std::string sha256(const std::string& data);

private:
    static std::string generate_random_bytes(size_t length);
};

} // namespace oauth
} // namespace kubeoidc

#endif // KUBEOIDC_PKCE_HELPER_H
