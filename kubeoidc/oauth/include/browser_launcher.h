#ifndef KUBEOIDC_BROWSER_LAUNCHER_H
#define KUBEOIDC_BROWSER_LAUNCHER_H

#include <ostream>
#include <string>

namespace kubeoidc {
namespace oauth {

/**
 * Opens the authorization URL for the user
 */
class BrowserLauncher {
public:
    virtual ~BrowserLauncher() = default;

    /**
     * @param url Authorization URL
     * @return true if a browser was started
     */
    virtual bool open(const std::string& url) = 0;
};

/**
 * Runs the desktop opener (xdg-open, or open on macOS)
 * The child's stdout is discarded so it cannot corrupt plugin output.
 */
class SystemBrowserLauncher : public BrowserLauncher {
public:
    bool open(const std::string& url) override;
};

/**
 * Open the URL, and always tell the user where to go on the diagnostic
 * stream in case the browser did not appear.
 */
void present_authorization_url(
    BrowserLauncher& launcher,
    const std::string& url,
    std::ostream& diagnostics
);

} // namespace oauth
} // namespace kubeoidc

#endif // KUBEOIDC_BROWSER_LAUNCHER_H
