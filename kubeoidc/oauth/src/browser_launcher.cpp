#include "browser_launcher.h"
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

namespace kubeoidc {
namespace oauth {

bool SystemBrowserLauncher::open(const std::string& url) {
#ifdef __APPLE__
    std::vector<std::string> args = {"open", url};
#else
    std::vector<std::string> args = {"xdg-open", url};
#endif

    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid == 0) {
        // The signal mask survives exec; the browser must stay interruptible
        sigset_t none;
        sigemptyset(&none);
        sigprocmask(SIG_SETMASK, &none, nullptr);

        int devnull = ::open("/dev/null", O_WRONLY);
        if (devnull >= 0) {
            dup2(devnull, STDOUT_FILENO);
            dup2(devnull, STDERR_FILENO);
            close(devnull);
        }
        execvp(argv[0], argv.data());
        _exit(127);
    } else if (pid < 0) {
        return false;
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return false;
        }
    }
    return WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

void present_authorization_url(
    BrowserLauncher& launcher,
    const std::string& url,
    std::ostream& diagnostics
) {
    diagnostics << "Opening browser for authentication..." << std::endl;
    bool opened = launcher.open(url);
    if (!opened) {
        diagnostics << "Could not open a browser." << std::endl;
    }
    diagnostics << "If the browser doesn't open, visit:" << std::endl
                << "    " << url << std::endl;
}

} // namespace oauth
} // namespace kubeoidc
