#include "callback_listener.h"
#include "authorization_request.h"
#include "oauth_errors.h"
#include <openssl/crypto.h>
#include <iostream>
#include <map>

namespace kubeoidc {
namespace oauth {

namespace {

// Time the final page gets to reach the browser before the loop is forced down
constexpr std::chrono::seconds kShutdownGrace{2};

std::string html_escape(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': escaped += "&amp;"; break;
            case '<': escaped += "&lt;"; break;
            case '>': escaped += "&gt;"; break;
            case '"': escaped += "&quot;"; break;
            case '\'': escaped += "&#39;"; break;
            default: escaped += c;
        }
    }
    return escaped;
}

std::string render_page(const std::string& title, const std::string& color, const std::string& message) {
    return "<html>\n"
           "<head><title>" + title + "</title></head>\n"
           "<body style=\"font-family: Arial; text-align: center; padding: 50px;\">\n"
           "    <h1 style=\"color: " + color + ";\">" + title + "</h1>\n"
           "    <p>" + html_escape(message) + "</p>\n"
           "</body>\n"
           "</html>\n";
}

std::string success_page() {
    return render_page("Authentication Successful", "green",
                       "You can close this window and return to your terminal.");
}

std::string failure_page(const std::string& message) {
    return render_page("Authentication Failed", "red", message);
}

bool states_equal(const std::string& a, const std::string& b) {
    return a.size() == b.size() && CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace

const char* to_string(ListenerState state) {
    switch (state) {
        case ListenerState::Waiting: return "waiting";
        case ListenerState::CodeReceived: return "code_received";
        case ListenerState::ErrorReceived: return "error_received";
        case ListenerState::StateMismatch: return "state_mismatch";
        case ListenerState::TimedOut: return "timed_out";
        case ListenerState::Cancelled: return "cancelled";
    }
    return "unknown";
}

CallbackListener::CallbackListener(const OAuthConfig& config, const std::string& expected_state)
    : port_(config.callback.port),
      callback_path_(config.callback.path),
      expected_state_(expected_state),
      result_future_(result_promise_.get_future()),
      loop_done_future_(loop_done_.get_future()) {
    // Stdout may carry the exec credential document
    server_.get_alog().set_ostream(&std::cerr);
    server_.get_elog().set_ostream(&std::cerr);
    server_.clear_access_channels(websocketpp::log::alevel::all);
    server_.set_error_channels(websocketpp::log::elevel::rerror | websocketpp::log::elevel::fatal);
}

CallbackListener::~CallbackListener() {
    stop();
}

void CallbackListener::start() {
    websocketpp::lib::error_code ec;

    server_.init_asio(ec);
    if (ec) {
        throw CallbackBindError(port_, ec.message());
    }

    // Linux refuses the bind while another socket listens on the port even
    // with SO_REUSEADDR; it only lets us through lingering TIME_WAIT entries.
    server_.set_reuse_addr(true);
    server_.set_http_handler([this](connection_hdl hdl) { on_http(hdl); });

    auto address = websocketpp::lib::asio::ip::address::from_string("127.0.0.1");
    server_.listen(websocketpp::lib::asio::ip::tcp::endpoint(address, static_cast<unsigned short>(port_)), ec);
    if (ec) {
        throw CallbackBindError(port_, ec.message());
    }

    server_.start_accept(ec);
    if (ec) {
        websocketpp::lib::error_code ignored;
        server_.stop_listening(ignored);
        throw CallbackBindError(port_, ec.message());
    }

    loop_running_ = true;
    thread_ = std::thread([this]() {
        try {
            server_.run();
        } catch (const std::exception& e) {
            std::cerr << "Callback listener stopped: " << e.what() << std::endl;
        }
        loop_done_.set_value();
    });
}

void CallbackListener::on_http(connection_hdl hdl) {
    http_server::connection_ptr con = server_.get_con_from_hdl(hdl);
    con->append_header("Content-Type", "text/html; charset=utf-8");
    con->append_header("Cache-Control", "no-store");

    std::string resource = con->get_resource();
    size_t query_pos = resource.find('?');
    std::string path = resource.substr(0, query_pos);
    std::string query = query_pos == std::string::npos ? "" : resource.substr(query_pos + 1);

    if (path != callback_path_) {
        con->set_status(websocketpp::http::status_code::not_found);
        con->set_body(failure_page("Unknown path."));
        return;
    }

    std::map<std::string, std::string> params = parse_query_string(query);
    auto code_it = params.find("code");
    auto error_it = params.find("error");
    auto state_it = params.find("state");

    CallbackResult result;
    std::string failure_message;

    if (error_it != params.end()) {
        result.state = ListenerState::ErrorReceived;
        result.error = error_it->second;
        auto desc_it = params.find("error_description");
        if (desc_it != params.end()) {
            result.error_description = desc_it->second;
        }
        failure_message = "Error: " +
            (result.error_description.empty() ? result.error : result.error_description);
    } else if (code_it != params.end()) {
        if (state_it == params.end() || !states_equal(state_it->second, expected_state_)) {
            result.state = ListenerState::StateMismatch;
            failure_message = "The login request did not match this session. Please start the login again.";
        } else {
            result.state = ListenerState::CodeReceived;
            result.code = code_it->second;
        }
    } else {
        // Not a redirect from the provider; keep waiting
        con->set_status(websocketpp::http::status_code::bad_request);
        con->set_body(failure_page("Missing authorization code."));
        return;
    }

    if (!deliver(result)) {
        con->set_status(websocketpp::http::status_code::bad_request);
        con->set_body(failure_page("This login has already completed."));
        return;
    }

    if (result.state == ListenerState::CodeReceived) {
        con->set_status(websocketpp::http::status_code::ok);
        con->set_body(success_page());
    } else {
        con->set_status(websocketpp::http::status_code::bad_request);
        con->set_body(failure_page(failure_message));
    }
}

bool CallbackListener::deliver(const CallbackResult& result) {
    {
        std::lock_guard<std::mutex> lock(result_mutex_);
        if (delivered_) {
            return false;
        }
        delivered_ = true;
        state_ = result.state;
        result_promise_.set_value(result);
    }

    // Stop accepting; the in-flight response still completes
    post_stop_listening();
    return true;
}

void CallbackListener::post_stop_listening() {
    if (!loop_running_) {
        return;
    }
    server_.get_io_service().post([this]() {
        websocketpp::lib::error_code ec;
        server_.stop_listening(ec);
    });
}

CallbackResult CallbackListener::wait(std::chrono::milliseconds timeout) {
    if (result_future_.wait_for(timeout) != std::future_status::ready) {
        CallbackResult timed_out;
        timed_out.state = ListenerState::TimedOut;
        // Loses only if a callback landed at the same instant
        deliver(timed_out);
    }

    CallbackResult result = result_future_.get();
    stop();
    return result;
}

std::string CallbackListener::wait_for_code(std::chrono::milliseconds timeout) {
    CallbackResult result = wait(timeout);

    switch (result.state) {
        case ListenerState::CodeReceived:
            return result.code;
        case ListenerState::ErrorReceived:
            throw AuthorizationError(result.error, result.error_description);
        case ListenerState::StateMismatch:
            throw AuthorizationError("state_mismatch", "", true);
        case ListenerState::TimedOut:
            throw TimeoutError(static_cast<int>(
                std::chrono::duration_cast<std::chrono::seconds>(timeout).count()));
        default:
            throw OAuthError("Login cancelled");
    }
}

void CallbackListener::cancel() {
    CallbackResult cancelled;
    cancelled.state = ListenerState::Cancelled;
    deliver(cancelled);
}

void CallbackListener::stop() {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    if (!thread_.joinable()) {
        return;
    }

    cancel();
    post_stop_listening();

    if (loop_done_future_.wait_for(kShutdownGrace) != std::future_status::ready) {
        // A browser kept a connection open
        server_.stop();
    }
    thread_.join();
    loop_running_ = false;

    // Loop is gone; close the acceptor here if the posted handler never ran
    websocketpp::lib::error_code ignored;
    if (server_.is_listening()) {
        server_.stop_listening(ignored);
    }
}

} // namespace oauth
} // namespace kubeoidc
