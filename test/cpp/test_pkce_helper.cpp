#include <catch2/catch.hpp>
#include <set>

#include "pkce_helper.h"

using namespace kubeoidc::oauth;

namespace {

bool is_base64url(const std::string& text) {
    for (char c : text) {
        bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                  (c >= '0' && c <= '9') || c == '-' || c == '_';
        if (!ok) return false;
    }
    return true;
}

} // namespace

TEST_CASE("Code verifier has RFC 7636 shape", "[pkce]") {
    std::string verifier = PKCEHelper::generate_code_verifier();

    REQUIRE(verifier.size() >= 43);
    REQUIRE(verifier.size() <= 128);
    REQUIRE(is_base64url(verifier));
}

TEST_CASE("Code challenge matches the RFC 7636 appendix B vector", "[pkce]") {
    const std::string verifier = "dBjftJeZ4CVP-mJ92K9tY1j1oSzS1C4jtXhq5jO-TuA";
    REQUIRE(PKCEHelper::generate_code_challenge(verifier) == "E9Melhoa2OwvFrEMTJguCHaoeK1t8URWbuGJSstw-cM");
}

TEST_CASE("Generated pairs are consistent and independent", "[pkce]") {
    std::set<std::string> verifiers;
    for (int i = 0; i < 50; ++i) {
        PKCEPair pair = PKCEHelper::generate_pair();
        REQUIRE(pair.code_challenge == PKCEHelper::generate_code_challenge(pair.code_verifier));
        REQUIRE(pair.code_challenge.size() == 43);
        REQUIRE(pair.code_challenge.find('=') == std::string::npos);
        verifiers.insert(pair.code_verifier);
    }
    REQUIRE(verifiers.size() == 50);
}

TEST_CASE("State values are random and URL safe", "[pkce]") {
    std::string a = PKCEHelper::generate_state();
    std::string b = PKCEHelper::generate_state();

    REQUIRE_FALSE(a.empty());
    REQUIRE(a != b);
    REQUIRE(is_base64url(a));
}

TEST_CASE("base64url encoding omits padding", "[pkce]") {
    REQUIRE(PKCEHelper::base64url_encode("") == "");
    REQUIRE(PKCEHelper::base64url_encode("f") == "Zg");
    REQUIRE(PKCEHelper::base64url_encode("fo") == "Zm8");
    REQUIRE(PKCEHelper::base64url_encode("foo") == "Zm9v");
    REQUIRE(PKCEHelper::base64url_encode(std::string("\xfb\xff", 2)) == "-_8");
}

TEST_CASE("base64url encoding of long input stays on one line", "[pkce]") {
    std::string data(100, '\xfb');
    std::string encoded = PKCEHelper::base64url_encode(data);

    REQUIRE(encoded.size() == 134);
    REQUIRE(encoded.find('\n') == std::string::npos);
    REQUIRE(is_base64url(encoded));
    REQUIRE(encoded.substr(0, 4) == "-_v7");
}
