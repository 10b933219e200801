#include "http_client.h"
#include <restclient-cpp/connection.h>
#include <restclient-cpp/restclient.h>

namespace kubeoidc {
namespace oauth {

namespace {

HttpResponse to_response(const RestClient::Response& response) {
    HttpResponse result;
    // restclient-cpp reports curl failures as -1 or the curl code
    result.code = (response.code > 0 && response.code < 100) ? -response.code : response.code;
    result.body = response.body;
    return result;
}

} // namespace

RestHttpClient::RestHttpClient(std::chrono::seconds timeout) : timeout_(timeout) {
}

HttpResponse RestHttpClient::get(
    const std::string& url,
    const std::map<std::string, std::string>& headers
) {
    RestClient::init();
    RestClient::Connection conn(url);
    conn.SetTimeout(static_cast<int>(timeout_.count()));
    conn.FollowRedirects(true);
    conn.AppendHeader("Accept", "application/json");
    for (const auto& [key, value] : headers) {
        conn.AppendHeader(key, value);
    }

    RestClient::Response response = conn.get("");
    RestClient::disable();

    return to_response(response);
}

HttpResponse RestHttpClient::post_form(
    const std::string& url,
    const std::string& body,
    const std::map<std::string, std::string>& headers
) {
    RestClient::init();
    RestClient::Connection conn(url);
    conn.SetTimeout(static_cast<int>(timeout_.count()));
    conn.AppendHeader("Content-Type", "application/x-www-form-urlencoded");
    conn.AppendHeader("Accept", "application/json");
    for (const auto& [key, value] : headers) {
        conn.AppendHeader(key, value);
    }

    RestClient::Response response = conn.post("", body);
    RestClient::disable();

    return to_response(response);
}

} // namespace oauth
} // namespace kubeoidc
