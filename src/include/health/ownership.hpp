#pragma once
/**
 * @file ownership.hpp
 * @brief Splits listener records into "held by this process" and "held by someone else".
 */
#include <cstdint>
#include <vector>

#include "health/listener_record.hpp"
#include "livepreview_health_export.h"

namespace livepreview::health
{

/// Identity of the process running the diagnostic, captured once per run.
struct CurrentProcessIdentity
{
    uint64_t pid = kUnknownPid;

    /// Reads the PID from the OS.
    LIVEPREVIEW_HEALTH_EXPORT static CurrentProcessIdentity current();
};

struct ClassifiedListener
{
    ListenerRecord record;
    bool is_self = false;

    bool operator==(const ClassifiedListener &) const = default;
};

/**
 * @brief Marks each record whose PID equals @p self_pid.
 *
 * Order and count are preserved. A record with an unknown PID is never self and is
 * never dropped. Pure: calling it twice on the same input gives the same output.
 */
[[nodiscard]] LIVEPREVIEW_HEALTH_EXPORT std::vector<ClassifiedListener>
classify(const std::vector<ListenerRecord> &records, uint64_t self_pid);

} // namespace livepreview::health
