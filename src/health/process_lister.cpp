/**
 * @file process_lister.cpp
 * @brief OS-specific listener enumeration for SystemProcessLister.
 */
#include "lp_service.hpp"

#include "health/process_lister.hpp"

#include <charconv>
#include <fstream>
#include <optional>
#include <set>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

#if defined(LIVEPREVIEW_PLATFORM_WIN64)
#include <winsock2.h>
#include <ws2tcpip.h>
#include <iphlpapi.h>
#endif

namespace fs = std::filesystem;

namespace livepreview::health
{

// ============================================================================
// Parsing helpers (platform independent, exposed for tests)
// ============================================================================

namespace
{

template <typename T> std::optional<T> parse_number(std::string_view text, int base = 10)
{
    T value{};
    const char *first = text.data();
    const char *last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value, base);
    if (ec != std::errc{} || ptr != last)
    {
        return std::nullopt;
    }
    return value;
}

constexpr unsigned kTcpListenState = 0x0A;
constexpr size_t kProcNetTcpMinColumns = 10;
constexpr size_t kProcNetTcpInodeColumn = 9;

} // namespace

namespace detail
{

std::vector<uint64_t> parse_proc_net_tcp(std::string_view content, uint16_t port)
{
    std::vector<uint64_t> inodes;
    size_t start = 0;
    while (start < content.size())
    {
        size_t end = content.find('\n', start);
        if (end == std::string_view::npos)
        {
            end = content.size();
        }
        std::string_view line = format_tools::trim_whitespace(content.substr(start, end - start));
        start = end + 1;

        if (line.empty())
        {
            continue;
        }
        auto fields = format_tools::split_whitespace(line);
        if (fields.front() == "sl")
        {
            continue; // header
        }
        if (fields.size() < kProcNetTcpMinColumns)
        {
            throw LookupError(fmt::format("unparseable listener table line: '{}'", line));
        }

        // local_address is "<hex addr>:<hex port>"
        std::string_view local = fields[1];
        auto colon = local.rfind(':');
        if (colon == std::string_view::npos)
        {
            throw LookupError(fmt::format("unparseable local address '{}'", local));
        }
        auto local_port = parse_number<unsigned>(local.substr(colon + 1), 16);
        auto state = parse_number<unsigned>(fields[3], 16);
        auto inode = parse_number<uint64_t>(fields[kProcNetTcpInodeColumn]);
        if (!local_port || !state || !inode)
        {
            throw LookupError(fmt::format("unparseable listener table line: '{}'", line));
        }
        if (*state != kTcpListenState || *local_port != port)
        {
            continue;
        }
        inodes.push_back(*inode);
    }
    return inodes;
}

std::vector<ListenerRecord> parse_lsof_fields(std::string_view output, uint16_t port)
{
    std::vector<ListenerRecord> records;
    size_t start = 0;
    while (start < output.size())
    {
        size_t end = output.find('\n', start);
        if (end == std::string_view::npos)
        {
            end = output.size();
        }
        std::string_view line = output.substr(start, end - start);
        start = end + 1;

        if (line.empty())
        {
            continue;
        }
        const char tag = line.front();
        std::string_view value = line.substr(1);
        if (tag == 'p')
        {
            auto pid = parse_number<uint64_t>(value);
            if (!pid)
            {
                throw LookupError(fmt::format("unparseable lsof PID field '{}'", line));
            }
            records.push_back(ListenerRecord{*pid, std::string(kUnknownProcessName), port});
        }
        else if (tag == 'c' && !records.empty() && !value.empty())
        {
            records.back().process_name = std::string(value);
        }
        // Other field tags (f<fd>, ...) are not used.
    }
    return records;
}

std::vector<ListenerRecord> dedupe_by_pid(std::vector<ListenerRecord> records)
{
    std::vector<ListenerRecord> unique;
    unique.reserve(records.size());
    std::unordered_set<uint64_t> seen;
    for (auto &record : records)
    {
        if (!seen.insert(record.process_id).second)
        {
            continue;
        }
        unique.push_back(std::move(record));
    }
    return unique;
}

} // namespace detail

// ============================================================================
// Platform back ends
// ============================================================================

namespace
{

[[maybe_unused]] std::optional<std::string> read_text_file(const fs::path &path)
{
    std::ifstream in(path);
    if (!in.is_open())
    {
        return std::nullopt;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

#if defined(LIVEPREVIEW_PLATFORM_LINUX)

constexpr std::string_view kSocketLinkPrefix = "socket:[";

std::string read_process_name(uint64_t pid)
{
    if (auto comm = read_text_file(fmt::format("/proc/{}/comm", pid)))
    {
        auto name = format_tools::trim_whitespace(*comm);
        if (!name.empty())
        {
            return std::string(name);
        }
    }
    if (auto status = read_text_file(fmt::format("/proc/{}/status", pid)))
    {
        auto name = format_tools::extract_value_from_string("Name", *status, '\n', ':');
        if (name && !name->empty())
        {
            return *name;
        }
    }
    return std::string(kUnknownProcessName);
}

// Maps each wanted socket inode to every PID holding a descriptor on it, in /proc
// order. A socket inherited across fork() has several holders.
// Processes whose fd directory cannot be read (other users) are skipped.
std::unordered_map<uint64_t, std::vector<uint64_t>>
find_inode_owners(const std::set<uint64_t> &inodes)
{
    std::unordered_map<uint64_t, std::vector<uint64_t>> owners;
    std::error_code ec;
    fs::directory_iterator proc_it("/proc", ec);
    if (ec)
    {
        throw LookupError(fmt::format("cannot enumerate /proc: {}", ec.message()));
    }

    for (; proc_it != fs::directory_iterator(); proc_it.increment(ec))
    {
        if (ec)
        {
            break;
        }
        auto pid = parse_number<uint64_t>(proc_it->path().filename().string());
        if (!pid)
        {
            continue;
        }

        std::error_code fd_ec;
        fs::directory_iterator fd_it(proc_it->path() / "fd", fd_ec);
        if (fd_ec)
        {
            continue;
        }
        for (; fd_it != fs::directory_iterator(); fd_it.increment(fd_ec))
        {
            if (fd_ec)
            {
                break;
            }
            std::error_code link_ec;
            auto target = fs::read_symlink(fd_it->path(), link_ec);
            if (link_ec)
            {
                continue; // descriptor closed while iterating
            }
            const std::string link = target.string();
            if (!link.starts_with(kSocketLinkPrefix) || link.back() != ']')
            {
                continue;
            }
            auto inode = parse_number<uint64_t>(std::string_view(link).substr(
                kSocketLinkPrefix.size(), link.size() - kSocketLinkPrefix.size() - 1));
            if (!inode || !inodes.contains(*inode))
            {
                continue;
            }
            auto &holders = owners[*inode];
            if (holders.empty() || holders.back() != *pid)
            {
                holders.push_back(*pid); // dup()ed descriptors repeat the PID
            }
        }
    }
    return owners;
}

std::vector<ListenerRecord> list_from_procfs(uint16_t port)
{
    std::vector<uint64_t> inodes;
    bool table_found = false;
    for (const char *table : {"/proc/net/tcp", "/proc/net/tcp6"})
    {
        auto content = read_text_file(table);
        if (!content)
        {
            LOGGER_DEBUG("process_lister: {} is not readable", table);
            continue;
        }
        table_found = true;
        auto found = detail::parse_proc_net_tcp(*content, port);
        inodes.insert(inodes.end(), found.begin(), found.end());
    }
    if (!table_found)
    {
        throw LookupError("the kernel TCP table (/proc/net/tcp) is not available");
    }
    if (inodes.empty())
    {
        return {};
    }

    std::set<uint64_t> wanted(inodes.begin(), inodes.end());
    wanted.erase(0);
    auto owners = find_inode_owners(wanted);

    std::vector<ListenerRecord> records;
    for (uint64_t inode : inodes)
    {
        auto it = owners.find(inode);
        if (it == owners.end())
        {
            LOGGER_DEBUG("process_lister: owner of socket inode {} on port {} not found", inode,
                         port);
            records.push_back(ListenerRecord{kUnknownPid, std::string(kUnknownProcessName), port});
            continue;
        }
        for (uint64_t pid : it->second)
        {
            records.push_back(ListenerRecord{pid, read_process_name(pid), port});
        }
    }
    return records;
}

#elif defined(LIVEPREVIEW_PLATFORM_WIN64)

std::string process_image_name(DWORD pid)
{
    if (pid == 0)
    {
        return "System Idle Process";
    }
    if (pid == 4)
    {
        return "System";
    }
    HANDLE process = OpenProcess(PROCESS_QUERY_LIMITED_INFORMATION, FALSE, pid);
    if (process == nullptr)
    {
        return std::string(kUnknownProcessName);
    }
    auto close_process = basics::make_scope_guard([process]() noexcept { CloseHandle(process); });

    std::vector<wchar_t> buf(MAX_PATH);
    DWORD len = static_cast<DWORD>(buf.size());
    if (!QueryFullProcessImageNameW(process, 0, buf.data(), &len))
    {
        return std::string(kUnknownProcessName);
    }
    return fs::path(std::wstring(buf.data(), len)).filename().string();
}

// Fetches a TCP_TABLE_OWNER_PID_LISTENER table; the table can grow between calls.
std::vector<unsigned char> fetch_tcp_table(ULONG family)
{
    std::vector<unsigned char> buf;
    DWORD size = 0;
    for (int attempt = 0; attempt < 4; ++attempt)
    {
        DWORD rc = GetExtendedTcpTable(buf.empty() ? nullptr : buf.data(), &size, FALSE, family,
                                       TCP_TABLE_OWNER_PID_LISTENER, 0);
        if (rc == NO_ERROR)
        {
            return buf;
        }
        if (rc != ERROR_INSUFFICIENT_BUFFER)
        {
            throw LookupError(fmt::format("GetExtendedTcpTable failed (family {}): error {}",
                                          family, rc));
        }
        buf.resize(size);
    }
    throw LookupError("GetExtendedTcpTable: table kept growing while being read");
}

std::vector<ListenerRecord> list_from_tcp_table(uint16_t port)
{
    std::vector<ListenerRecord> records;

    auto v4 = fetch_tcp_table(AF_INET);
    if (!v4.empty())
    {
        const auto *table = reinterpret_cast<const MIB_TCPTABLE_OWNER_PID *>(v4.data());
        for (DWORD i = 0; i < table->dwNumEntries; ++i)
        {
            const auto &row = table->table[i];
            if (ntohs(static_cast<u_short>(row.dwLocalPort)) == port)
            {
                records.push_back(
                    ListenerRecord{row.dwOwningPid, process_image_name(row.dwOwningPid), port});
            }
        }
    }

    auto v6 = fetch_tcp_table(AF_INET6);
    if (!v6.empty())
    {
        const auto *table = reinterpret_cast<const MIB_TCP6TABLE_OWNER_PID *>(v6.data());
        for (DWORD i = 0; i < table->dwNumEntries; ++i)
        {
            const auto &row = table->table[i];
            if (ntohs(static_cast<u_short>(row.dwLocalPort)) == port)
            {
                records.push_back(
                    ListenerRecord{row.dwOwningPid, process_image_name(row.dwOwningPid), port});
            }
        }
    }
    return records;
}

#else

std::vector<ListenerRecord> list_from_lsof(uint16_t port, std::chrono::milliseconds timeout)
{
    std::vector<std::string> argv{"lsof", "-nP", fmt::format("-iTCP:{}", port), "-sTCP:LISTEN",
                                  "-Fpc"};
    auto result = utils::run_command(argv, timeout);
    if (result.is_error())
    {
        switch (result.error())
        {
        case utils::CommandError::SpawnFailed:
            throw LookupError(fmt::format("`lsof` is not available (error {})",
                                          result.error_code()));
        case utils::CommandError::Timeout:
            throw LookupError(
                fmt::format("`lsof` did not answer within {} ms", timeout.count()));
        case utils::CommandError::ReadFailed:
        default:
            throw LookupError(fmt::format("failed to read `lsof` output (error {})",
                                          result.error_code()));
        }
    }

    const auto &out = result.content();
    // lsof exits 1 with no output when nothing matches.
    if (format_tools::trim_whitespace(out.stdout_text).empty())
    {
        return {};
    }
    if (out.exit_code != 0)
    {
        LOGGER_DEBUG("process_lister: lsof exited with {} but produced output", out.exit_code);
    }
    return detail::parse_lsof_fields(out.stdout_text, port);
}

#endif

} // namespace

// ============================================================================
// SystemProcessLister
// ============================================================================

SystemProcessLister::SystemProcessLister(std::chrono::milliseconds command_timeout)
    : m_command_timeout(command_timeout)
{
}

std::vector<ListenerRecord> SystemProcessLister::list_listeners_on_port(int port) const
{
    if (port <= 0 || port > 65535)
    {
        LOGGER_DEBUG("process_lister: port {} is out of range, nothing to list", port);
        return {};
    }
    const auto tcp_port = static_cast<uint16_t>(port);

#if defined(LIVEPREVIEW_PLATFORM_LINUX)
    auto records = list_from_procfs(tcp_port);
#elif defined(LIVEPREVIEW_PLATFORM_WIN64)
    auto records = list_from_tcp_table(tcp_port);
#else
    auto records = list_from_lsof(tcp_port, m_command_timeout);
#endif

    auto unique = detail::dedupe_by_pid(std::move(records));
    LOGGER_DEBUG("process_lister: {} listener(s) on port {}", unique.size(), port);
    return unique;
}

} // namespace livepreview::health
