#pragma once
/**
 * @file health_reporter.hpp
 * @brief Turns classified listeners into verdicts with messages and remediation hints.
 */
#include <cstdint>
#include <vector>

#include "health/health_verdict.hpp"
#include "health/ownership.hpp"
#include "health/preview_server.hpp"
#include "livepreview_health_export.h"

namespace livepreview::health
{

/**
 * @brief One verdict per classified listener, or a single NotRunning verdict when
 *        @p classified is empty.
 *
 * | listener                     | server      | verdict                  |
 * |------------------------------|-------------|--------------------------|
 * | none                         | any         | NotRunning (warn)        |
 * | self                         | running     | Healthy (ok)             |
 * | self                         | not running | PortStolen-class (warn)  |
 * | foreign, PID known           | any         | PortStolen (warn) + hint |
 * | PID unknown                  | any         | Unknown (warn)           |
 *
 * A self-owned listener carries the server's webroot whatever the server state.
 *
 * Anything @p server throws, std::exception or not, yields an Unknown verdict for the
 * listener being evaluated (or an Unknown server state in the NotRunning verdict).
 * Only a failure to allocate the verdicts themselves propagates.
 */
[[nodiscard]] LIVEPREVIEW_HEALTH_EXPORT std::vector<HealthVerdict>
report(const std::vector<ClassifiedListener> &classified, uint16_t port,
       const PreviewServer &server);

} // namespace livepreview::health
