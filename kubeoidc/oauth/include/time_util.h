#ifndef KUBEOIDC_TIME_UTIL_H
#define KUBEOIDC_TIME_UTIL_H

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace kubeoidc {
namespace oauth {

using TimePoint = std::chrono::system_clock::time_point;

/**
 * Injectable time source; tests substitute a manual clock
 */
using Clock = std::function<TimePoint()>;

Clock system_clock_source();

/**
 * Format as RFC3339 in UTC with second precision, e.g. 2026-01-02T03:04:05Z
 */
std::string format_rfc3339(TimePoint time);

/**
 * Parse an RFC3339 timestamp ("Z" or numeric offset, optional fraction)
 * @return Parsed instant or std::nullopt if malformed
 */
std::optional<TimePoint> parse_rfc3339(const std::string& text);

} // namespace oauth
} // namespace kubeoidc

#endif // KUBEOIDC_TIME_UTIL_H
