#ifndef KUBEOIDC_HTTP_CLIENT_H
#define KUBEOIDC_HTTP_CLIENT_H

#include <chrono>
#include <map>
#include <string>

namespace kubeoidc {
namespace oauth {

/**
 * HTTP response
 * code is negative when no response was received (connect failure,
 * timeout); body then holds the transport error text.
 */
struct HttpResponse {
    int code = 0;
    std::string body;
};

/**
 * Synchronous HTTP transport used for discovery and token requests
 */
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse get(
        const std::string& url,
        const std::map<std::string, std::string>& headers = {}
    ) = 0;

    /**
     * POST an application/x-www-form-urlencoded body
     */
    virtual HttpResponse post_form(
        const std::string& url,
        const std::string& body,
        const std::map<std::string, std::string>& headers = {}
    ) = 0;
};

/**
 * restclient-cpp transport with a fixed per-request timeout
 */
class RestHttpClient : public HttpClient {
public:
    explicit RestHttpClient(std::chrono::seconds timeout);

    HttpResponse get(
        const std::string& url,
        const std::map<std::string, std::string>& headers = {}
    ) override;

    HttpResponse post_form(
        const std::string& url,
        const std::string& body,
        const std::map<std::string, std::string>& headers = {}
    ) override;

private:
    std::chrono::seconds timeout_;
};

} // namespace oauth
} // namespace kubeoidc

#endif // KUBEOIDC_HTTP_CLIENT_H
