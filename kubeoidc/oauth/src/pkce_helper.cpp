#include "pkce_helper.h"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <stdexcept>
#include <vector>

namespace kubeoidc {
namespace oauth {

namespace {

constexpr size_t kVerifierEntropyBytes = 32;
constexpr size_t kStateEntropyBytes = 32;

} // namespace

PKCEPair PKCEHelper::generate_pair() {
    PKCEPair pair;
    pair.code_verifier = generate_code_verifier();
    pair.code_challenge = generate_code_challenge(pair.code_verifier);
    return pair;
}

std::string PKCEHelper::generate_code_verifier() {
    return base64url_encode(generate_random_bytes(kVerifierEntropyBytes));
}

std::string PKCEHelper::generate_code_challenge(const std::string& verifier) {
    return base64url_encode(sha256(verifier));
}

std::string PKCEHelper::generate_state() {
    return base64url_encode(generate_random_bytes(kStateEntropyBytes));
}

std::string PKCEHelper::generate_random_bytes(size_t length) {
    std::vector<unsigned char> buffer(length);

    if (RAND_bytes(buffer.data(), static_cast<int>(length)) != 1) {
        throw std::runtime_error("Failed to generate random bytes");
    }

    return std::string(buffer.begin(), buffer.end());
}

std::string PKCEHelper::base64url_encode(const std::string& data) {
    if (data.empty()) {
        return "";
    }

    // Standard Base64; EVP_EncodeBlock writes no newlines and a trailing NUL
    std::vector<unsigned char> buffer(4 * ((data.size() + 2) / 3) + 1);
    int length = EVP_EncodeBlock(
        buffer.data(),
        reinterpret_cast<const unsigned char*>(data.data()),
        static_cast<int>(data.size())
    );
    if (length < 0) {
        throw std::runtime_error("Base64 encoding failed");
    }

    std::string result(reinterpret_cast<char*>(buffer.data()), static_cast<size_t>(length));

    // Base64url: + to -, / to _, no padding
    for (char& c : result) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }

    size_t pad_pos = result.find('=');
    if (pad_pos != std::string::npos) {
        result.erase(pad_pos);
    }

    return result;
}

std::string PKCEHelper::sha256(const std::string& data) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_length = 0;

    if (EVP_Digest(data.data(), data.size(), hash, &hash_length,
                   EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }

    return std::string(reinterpret_cast<char*>(hash), hash_length);
}

} // namespace oauth
} // namespace kubeoidc
