#ifndef KUBEOIDC_CALLBACK_LISTENER_H
#define KUBEOIDC_CALLBACK_LISTENER_H

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>
#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <string>
#include <thread>
#include "oauth_config.h"

namespace kubeoidc {
namespace oauth {

typedef websocketpp::server<websocketpp::config::asio> http_server;
typedef websocketpp::connection_hdl connection_hdl;

/**
 * Listener lifecycle. Every state except Waiting is terminal.
 */
enum class ListenerState {
    Waiting,
    CodeReceived,
    ErrorReceived,
    StateMismatch,
    TimedOut,
    Cancelled
};

const char* to_string(ListenerState state);

/**
 * Outcome handed from the listener thread to the waiting caller
 */
struct CallbackResult {
    ListenerState state = ListenerState::Waiting;
    std::string code;
    std::string error;
    std::string error_description;
};

/**
 * Local HTTP endpoint receiving the authorization redirect
 *
 * Serves exactly one AuthSession. The socket loop runs on its own thread
 * and publishes the first terminating request through a one-shot
 * promise; the caller blocks on the matching future with a deadline.
 * The port is released by stop(), which the destructor also calls.
 */
class CallbackListener {
public:
    /**
     * @param config Supplies port and callback path
     * @param expected_state State value of the session being served
     */
    CallbackListener(const OAuthConfig& config, const std::string& expected_state);
    ~CallbackListener();

    CallbackListener(const CallbackListener&) = delete;
    CallbackListener& operator=(const CallbackListener&) = delete;

    /**
     * Bind 127.0.0.1:<port> and start serving on a background thread
     * @throws CallbackBindError if the port is taken or cannot be bound
     */
    void start();

    /**
     * Block until a terminating callback arrives or the timeout elapses
     * On timeout the state becomes TimedOut. The listener is stopped
     * before this returns.
     * @param timeout Deadline relative to now
     * @return Terminal result
     */
    CallbackResult wait(std::chrono::milliseconds timeout);

    /**
     * Wait and translate the outcome
     * @return Authorization code
     * @throws AuthorizationError on provider error or state mismatch
     * @throws TimeoutError when no callback arrived in time
     * @throws OAuthError when cancelled
     */
    std::string wait_for_code(std::chrono::milliseconds timeout);

    /**
     * Abort a pending wait from another thread
     */
    void cancel();

    /**
     * Close the socket and join the loop thread. Idempotent.
     */
    void stop();

    ListenerState state() const { return state_.load(); }
    int port() const { return port_; }

private:
    void on_http(connection_hdl hdl);
    bool deliver(const CallbackResult& result);
    void post_stop_listening();

    const int port_;
    const std::string callback_path_;
    const std::string expected_state_;

    http_server server_;
    std::thread thread_;
    std::atomic<bool> loop_running_{false};  // read by the loop thread; thread_ is caller-only
    std::mutex stop_mutex_;

    std::mutex result_mutex_;
    bool delivered_ = false;
    std::promise<CallbackResult> result_promise_;
    std::future<CallbackResult> result_future_;
    std::promise<void> loop_done_;
    std::future<void> loop_done_future_;

    std::atomic<ListenerState> state_{ListenerState::Waiting};
};

} // namespace oauth
} // namespace kubeoidc

#endif // KUBEOIDC_CALLBACK_LISTENER_H
