#include "cli_support.h"
#include <pthread.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>

namespace kubeoidc {
namespace cli {

namespace {

// Wakes the sigwait thread on shutdown
constexpr int kWakeSignal = SIGUSR1;

std::string trim(const std::string& value) {
    const char* whitespace = " \t\r\n";
    size_t first = value.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return "";
    }
    size_t last = value.find_last_not_of(whitespace);
    return value.substr(first, last - first + 1);
}

std::optional<std::string> read_secret_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::nullopt;
    }
    std::ifstream file(path);
    if (!file) {
        std::cerr << "Warning: cannot read " << path.string() << std::endl;
        return std::nullopt;
    }
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    content = trim(content);
    if (content.empty()) {
        return std::nullopt;
    }
    return content;
}

std::optional<ClientCredentials> credential_pair(const char* id_var, const char* secret_var) {
    const char* id = std::getenv(id_var);
    const char* secret = std::getenv(secret_var);
    if (id && *id && secret && *secret) {
        return ClientCredentials{id, secret, "environment"};
    }
    return std::nullopt;
}

} // namespace

oauth::OAuthConfig load_config() {
    std::string path;
    bool explicit_path = false;

    if (const char* env_path = std::getenv("KUBEOIDC_CONFIG")) {
        path = env_path;
        explicit_path = true;
    } else if (const char* home = std::getenv("HOME")) {
        path = std::string(home) + "/.kube/kubeoidc.yaml";
    }

    oauth::OAuthConfig config;
    std::error_code ec;
    if (!path.empty() && (explicit_path || std::filesystem::exists(path, ec))) {
        config = oauth::OAuthConfig::load_from_file(path);
        config.apply_environment();
    } else {
        config = oauth::OAuthConfig::defaults();
    }

    config.validate();
    return config;
}

SignalCanceller::SignalCanceller(oauth::LoginFlow& flow) : flow_(flow) {
    sigemptyset(&signals_);
    sigaddset(&signals_, SIGINT);
    sigaddset(&signals_, SIGTERM);
    sigaddset(&signals_, kWakeSignal);

    int rc = pthread_sigmask(SIG_BLOCK, &signals_, &previous_mask_);
    if (rc != 0) {
        throw std::system_error(rc, std::generic_category(), "pthread_sigmask");
    }

    thread_ = std::thread([this]() {
        for (;;) {
            int signal = 0;
            if (sigwait(&signals_, &signal) != 0) {
                continue;
            }
            if (signal == kWakeSignal) {
                return;
            }
            if (received_.exchange(signal) != 0) {
                // Second interrupt: the command is not in a cancellable wait
                std::_Exit(128 + signal);
            }
            std::cerr << "\nInterrupted, cancelling login..." << std::endl;
            flow_.cancel();
        }
    });
}

SignalCanceller::~SignalCanceller() {
    if (thread_.joinable()) {
        pthread_kill(thread_.native_handle(), kWakeSignal);
        thread_.join();
    }
    pthread_sigmask(SIG_SETMASK, &previous_mask_, nullptr);
}

std::optional<int> SignalCanceller::received() const {
    int signal = received_.load();
    if (signal == 0) {
        return std::nullopt;
    }
    return signal;
}

std::optional<ClientCredentials> credentials_from_environment(const std::string& secrets_dir) {
    if (auto creds = credential_pair("KEYCLOAK_CLIENT_ID", "KEYCLOAK_CLIENT_SECRET")) {
        return creds;
    }
    if (auto creds = credential_pair("ITL_CLIENT_ID", "ITL_CLIENT_SECRET")) {
        return creds;
    }

    std::filesystem::path dir(secrets_dir);
    auto id = read_secret_file(dir / "client-id");
    auto secret = read_secret_file(dir / "client-secret");
    if (id && secret) {
        return ClientCredentials{*id, *secret, "mounted secret"};
    }

    return std::nullopt;
}

std::string abbreviate_token(const std::string& token) {
    if (token.size() <= 50) {
        return token.substr(0, 10) + "...";
    }
    return token.substr(0, 30) + "..." + token.substr(token.size() - 20);
}

} // namespace cli
} // namespace kubeoidc
