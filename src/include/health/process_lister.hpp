#pragma once
/**
 * @file process_lister.hpp
 * @brief Enumerates the processes listening on a TCP port.
 *
 * - Linux: reads /proc/net/tcp{,6} and maps each socket inode to every PID holding it
 *   via /proc/<pid>/fd.
 * - macOS / FreeBSD: runs `lsof -nP -iTCP:<port> -sTCP:LISTEN -Fpc` with a deadline.
 * - Windows: GetExtendedTcpTable(TCP_TABLE_OWNER_PID_LISTENER) for IPv4 and IPv6.
 */
#include <chrono>
#include <cstdint>
#include <string_view>
#include <vector>

#include "health/listener_record.hpp"
#include "livepreview_health_export.h"

namespace livepreview::health
{

/**
 * @class ProcessLister
 * @brief Source of listener snapshots for a port.
 */
class ProcessLister
{
  public:
    virtual ~ProcessLister() = default;

    /**
     * @brief Processes bound to @p port in LISTEN state, one record per PID.
     *
     * Ports outside 1..65535 yield an empty result.
     * @throws LookupError if the OS cannot be queried or its answer cannot be parsed.
     */
    [[nodiscard]] virtual std::vector<ListenerRecord> list_listeners_on_port(int port) const = 0;
};

/**
 * @class SystemProcessLister
 * @brief ProcessLister backed by the running OS.
 */
class LIVEPREVIEW_HEALTH_EXPORT SystemProcessLister : public ProcessLister
{
  public:
    static constexpr std::chrono::milliseconds kDefaultCommandTimeout{3000};

    /**
     * @param command_timeout Deadline for an external query command (lsof). Unused on
     *        platforms that answer from a native API.
     */
    explicit SystemProcessLister(std::chrono::milliseconds command_timeout = kDefaultCommandTimeout);

    [[nodiscard]] std::vector<ListenerRecord> list_listeners_on_port(int port) const override;

  private:
    [[maybe_unused]] std::chrono::milliseconds m_command_timeout;
};

namespace detail
{

/**
 * @brief Socket inodes in LISTEN state (st == 0A) on @p port from the text of
 *        /proc/net/tcp or /proc/net/tcp6.
 * @throws LookupError on a line that does not have the expected columns.
 */
LIVEPREVIEW_HEALTH_EXPORT std::vector<uint64_t> parse_proc_net_tcp(std::string_view content,
                                                                    uint16_t port);

/**
 * @brief Records from `lsof -F pc` field output ("p<pid>" then "c<command>" lines).
 * @throws LookupError on a malformed PID field.
 */
LIVEPREVIEW_HEALTH_EXPORT std::vector<ListenerRecord> parse_lsof_fields(std::string_view output,
                                                                         uint16_t port);

/**
 * @brief Collapses records sharing a known PID; keeps first-seen order and at most one
 *        unknown-owner record.
 */
LIVEPREVIEW_HEALTH_EXPORT std::vector<ListenerRecord>
dedupe_by_pid(std::vector<ListenerRecord> records);

} // namespace detail

} // namespace livepreview::health
