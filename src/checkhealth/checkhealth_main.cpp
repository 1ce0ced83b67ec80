/**
 * @file checkhealth_main.cpp
 * @brief livepreview-checkhealth: runs the live-preview health checks and prints the report.
 *
 * ## Usage
 *
 *     livepreview-checkhealth [--config <preview.json>] [--port <n>]
 *                             [--package <pkg.json>] [--host-version <x.y.z>]
 *                             [--pid <pid>] [--server-running] [--webroot <dir>]
 *                             [--plugin-root <dir>]...
 *                             [--json] [--log-file <path>] [--log-level <level>]
 *
 * The editor hosts the preview server in its own process, so `--pid` names the editor
 * process whose sockets count as "self" and `--server-running` / `--webroot` describe
 * the state the editor reports for its server. Optional pickers are looked up as Lua
 * modules below the `--plugin-root` directories, or the editor's default config, site
 * and plugin-manager directories when none is given.
 *
 * ## Exit codes
 *
 *     0  every check passed or only warned
 *     1  the report contains at least one error
 *     2  bad arguments, or a configuration / package file could not be read or parsed
 */

#include "lp_health.hpp"

#include <nlohmann/json.hpp>

#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace livepreview;
using namespace livepreview::health;

// ---------------------------------------------------------------------------
// Argument parsing
// ---------------------------------------------------------------------------

namespace
{

constexpr int kExitOk = 0;
constexpr int kExitReportErrors = 1;
constexpr int kExitUsage = 2;

constexpr const char *kDefaultSupportedRange = ">=0.10.0";
constexpr const char *kHostExecutable = "nvim";
constexpr std::chrono::milliseconds kHostVersionTimeout{3000};

struct CheckhealthArgs
{
    std::string config_path;
    std::string package_path;
    std::optional<int> port;
    std::optional<std::string> host_version;
    std::optional<uint64_t> host_pid;
    bool server_running{false};
    std::optional<std::string> webroot;
    std::vector<std::filesystem::path> plugin_roots;
    bool json_output{false};
    std::string log_file;
    utils::Logger::Level log_level{utils::Logger::Level::L_WARNING};
};

void print_usage(const char *prog)
{
    std::cout
        << "Usage:\n"
        << "  " << prog << " [options]\n\n"
        << "Options:\n"
        << "  --config <path>        Preview configuration JSON (defaults apply when omitted)\n"
        << "  --port <n>             Server port to check; overrides the configuration\n"
        << "  --package <path>       Plugin pkg.json; its engines.nvim is the supported range\n"
        << "  --host-version <ver>   Editor version (default: from `nvim --version`)\n"
        << "  --pid <pid>            PID of the editor process (default: this process)\n"
        << "  --server-running       The editor reports its preview server as running\n"
        << "  --webroot <dir>        Directory the preview server serves from\n"
        << "  --plugin-root <dir>    Where to look for picker plugins (repeatable)\n"
        << "  --json                 Print the report as JSON\n"
        << "  --log-file <path>      Append diagnostics logging to <path> instead of stderr\n"
        << "  --log-level <level>    trace, debug, info, warning, error, system (default: warning)\n"
        << "  --help                 Show this message\n";
}

[[noreturn]] void usage_error(const char *prog, const std::string &message)
{
    std::cerr << "Error: " << message << "\n\n";
    print_usage(prog);
    std::exit(kExitUsage);
}

template <typename T> std::optional<T> parse_number(std::string_view text)
{
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size())
        return std::nullopt;
    return value;
}

CheckhealthArgs parse_args(int argc, char *argv[])
{
    CheckhealthArgs args;
    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg(argv[i]);
        auto next_value = [&]() -> std::string_view
        {
            if (i + 1 >= argc)
                usage_error(argv[0], std::string(arg) + " requires a value");
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h")
        {
            print_usage(argv[0]);
            std::exit(kExitOk);
        }
        else if (arg == "--config")
        {
            args.config_path = next_value();
        }
        else if (arg == "--package")
        {
            args.package_path = next_value();
        }
        else if (arg == "--port")
        {
            auto value = next_value();
            auto port = parse_number<int>(value);
            if (!port || *port < 1 || *port > 65535)
                usage_error(argv[0], "--port must be an integer in 1..65535, got '" +
                                         std::string(value) + "'");
            args.port = *port;
        }
        else if (arg == "--host-version")
        {
            args.host_version = std::string(next_value());
        }
        else if (arg == "--pid")
        {
            auto value = next_value();
            auto pid = parse_number<uint64_t>(value);
            if (!pid || *pid == kUnknownPid)
                usage_error(argv[0], "--pid must be a positive integer, got '" +
                                         std::string(value) + "'");
            args.host_pid = *pid;
        }
        else if (arg == "--server-running")
        {
            args.server_running = true;
        }
        else if (arg == "--webroot")
        {
            args.webroot = std::string(next_value());
        }
        else if (arg == "--plugin-root")
        {
            args.plugin_roots.emplace_back(std::string(next_value()));
        }
        else if (arg == "--json")
        {
            args.json_output = true;
        }
        else if (arg == "--log-file")
        {
            args.log_file = next_value();
        }
        else if (arg == "--log-level")
        {
            auto value = next_value();
            auto level = utils::Logger::parse_level(value);
            if (!level)
                usage_error(argv[0], "unknown log level '" + std::string(value) + "'");
            args.log_level = *level;
        }
        else
        {
            usage_error(argv[0], "unknown argument: " + std::string(arg));
        }
    }
    return args;
}

// "NVIM v0.10.1" on the first line of `nvim --version`.
std::string detect_host_version()
{
    auto result = utils::run_command({kHostExecutable, "--version"}, kHostVersionTimeout);
    if (!result.is_ok())
    {
        LOGGER_WARN("checkhealth: could not run `{} --version`: {}", kHostExecutable,
                    utils::to_string(result.error()));
        return "unknown";
    }
    const std::string &out = result.content().stdout_text;
    auto first_line = std::string_view(out).substr(0, out.find('\n'));
    for (auto word : format_tools::split_whitespace(first_line))
    {
        if (SemVer::parse(word))
            return std::string(word.starts_with('v') ? word.substr(1) : word);
    }
    LOGGER_WARN("checkhealth: no version in `{} --version` output: '{}'", kHostExecutable,
                first_line);
    return "unknown";
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------

int main(int argc, char *argv[])
{
    const CheckhealthArgs args = parse_args(argc, argv);

    // ── Logging ───────────────────────────────────────────────────────────────
    auto &logger = utils::Logger::instance();
    logger.set_level(args.log_level);
    if (!args.log_file.empty() && !logger.set_logfile(args.log_file))
    {
        std::cerr << "Error: cannot open log file '" << args.log_file << "'\n";
        return kExitUsage;
    }

    LOGGER_INFO("checkhealth: {} {} (pid {})", platform::get_executable_name(),
                platform::get_version_string(), platform::get_pid());

    // ── Load configuration and package metadata ───────────────────────────────
    PreviewConfig config;
    std::string supported_range = kDefaultSupportedRange;
    try
    {
        config = args.config_path.empty() ? PreviewConfig::defaults()
                                          : PreviewConfig::from_json_file(args.config_path);
        if (!args.package_path.empty())
            supported_range = PackageSpec::from_json_file(args.package_path).engines_nvim;
    }
    catch (const ConfigError &e)
    {
        std::cerr << "Config error: " << e.what() << "\n";
        return kExitUsage;
    }
    if (args.port)
        config.port = *args.port;

    const std::string host_version = args.host_version ? *args.host_version : detect_host_version();
    const uint64_t self_pid = args.host_pid ? *args.host_pid : CurrentProcessIdentity::current().pid;
    if (args.host_pid && !platform::is_process_alive(*args.host_pid))
    {
        LOGGER_WARN("checkhealth: --pid {} does not name a running process", *args.host_pid);
    }

    // ── Collaborators ─────────────────────────────────────────────────────────
    StaticPreviewServer server(args.server_running, args.webroot);
    SystemProcessLister lister;
    PathExecutableFinder executables;
    LuaModuleProbe dependencies(args.plugin_roots.empty() ? default_plugin_roots()
                                                          : args.plugin_roots);
    LOGGER_DEBUG("checkhealth: {} plugin search root(s)", dependencies.search_roots().size());

    DiagnosticRunner runner(server, lister, dependencies, executables, host_version,
                            supported_range, self_pid);
    const DiagnosticReport report = runner.run(config);

    // ── Output ────────────────────────────────────────────────────────────────
    if (args.json_output)
        std::cout << to_json(report).dump(2) << "\n";
    else
        std::cout << render_text(report);

    logger.flush();
    return report.has_errors() ? kExitReportErrors : kExitOk;
}
