#include <catch2/catch.hpp>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <pthread.h>
#include <sstream>

#include "browser_launcher.h"
#include "test_helpers.h"

using namespace kubeoidc::oauth;
using namespace kubeoidc::test;

namespace {

// Stand-in for xdg-open that records its argument and signal mask
void install_fake_opener(const TempDir& dir) {
    std::string path = dir.sub("xdg-open");
    {
        std::ofstream script(path, std::ios::trunc);
        script << "#!/bin/sh\n"
               << "here=$(dirname \"$0\")\n"
               << "printf '%s' \"$1\" > \"$here/url\"\n"
               << "grep '^SigBlk:' /proc/self/status > \"$here/mask\"\n";
    }
    std::filesystem::permissions(path, std::filesystem::perms::owner_all);
}

std::string read_file(const std::string& path) {
    std::ifstream file(path);
    std::stringstream content;
    content << file.rdbuf();
    return content.str();
}

} // namespace

TEST_CASE("Browser opener runs with signals unblocked", "[browser_launcher]") {
    TempDir dir;
    install_fake_opener(dir);
    ScopedEnv path("PATH", dir.path() + ":/usr/bin:/bin");

    // Same signals the command line tools hand to their sigwait thread
    sigset_t blocked;
    sigset_t previous;
    sigemptyset(&blocked);
    sigaddset(&blocked, SIGINT);
    sigaddset(&blocked, SIGTERM);
    sigaddset(&blocked, SIGUSR1);
    REQUIRE(pthread_sigmask(SIG_BLOCK, &blocked, &previous) == 0);

    bool opened = SystemBrowserLauncher().open("https://idp.example.com/auth?state=abc");

    REQUIRE(pthread_sigmask(SIG_SETMASK, &previous, nullptr) == 0);
    REQUIRE(opened);
    REQUIRE(read_file(dir.sub("url")) == "https://idp.example.com/auth?state=abc");

    std::string line = read_file(dir.sub("mask"));
    REQUIRE(line.rfind("SigBlk:", 0) == 0);
    unsigned long long mask = std::stoull(line.substr(7), nullptr, 16);
    REQUIRE((mask & (1ULL << (SIGINT - 1))) == 0);
    REQUIRE((mask & (1ULL << (SIGTERM - 1))) == 0);
    REQUIRE((mask & (1ULL << (SIGUSR1 - 1))) == 0);
}

TEST_CASE("Missing opener reports failure", "[browser_launcher]") {
    TempDir dir;
    ScopedEnv path("PATH", dir.path());

    REQUIRE_FALSE(SystemBrowserLauncher().open("https://idp.example.com/auth"));
}

TEST_CASE("Authorization URL is always shown on the diagnostic stream", "[browser_launcher]") {
    TempDir dir;
    ScopedEnv path("PATH", dir.path());
    SystemBrowserLauncher launcher;
    std::ostringstream diagnostics;

    present_authorization_url(launcher, "https://idp.example.com/auth?x=1", diagnostics);

    REQUIRE(diagnostics.str().find("Could not open a browser") != std::string::npos);
    REQUIRE(diagnostics.str().find("https://idp.example.com/auth?x=1") != std::string::npos);
}
