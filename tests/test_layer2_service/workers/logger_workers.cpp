// tests/test_layer2_service/workers/logger_workers.cpp
/**
 * @file logger_workers.cpp
 * @brief Worker functions for the Logger tests.
 *
 * The Logger is a process-wide singleton; every scenario runs in its own process so
 * that sink and level changes never leak into other tests.
 */
#include "lp_service.hpp"
#include "shared_test_helpers.h"
#include "test_entrypoint.h"
#include "gtest/gtest.h"

#include <atomic>
#include <thread>
#include <vector>

using namespace livepreview::tests::helper;
using namespace livepreview::utils;

namespace livepreview::tests::worker
{
namespace logger
{

// Worker to test basic logging to a file.
int basic_logging(const std::string &log_path)
{
    return run_gtest_worker(
        [&]()
        {
            ASSERT_TRUE(Logger::instance().set_logfile(log_path));
            LOGGER_INFO("Hello, port {}!", 5500);
            Logger::instance().flush();

            std::string contents;
            ASSERT_TRUE(read_file_contents(log_path, contents));
            EXPECT_NE(contents.find("Hello, port 5500!"), std::string::npos);
            EXPECT_NE(contents.find("[LP] [INFO  ]"), std::string::npos);
            EXPECT_NE(contents.find(fmt::format("PID:{:5}", platform::get_pid())),
                      std::string::npos);
        },
        "logger::basic_logging");
}

// Worker to test log level filtering.
int log_level_filtering(const std::string &log_path)
{
    return run_gtest_worker(
        [&]()
        {
            ASSERT_TRUE(Logger::instance().set_logfile(log_path));
            Logger::instance().set_level(Logger::Level::L_WARNING);
            EXPECT_EQ(Logger::instance().level(), Logger::Level::L_WARNING);

            LOGGER_DEBUG("This should be filtered (debug).");
            LOGGER_INFO("This should be filtered (info).");
            LOGGER_WARN("This should appear.");
            LOGGER_ERROR("This should appear too.");
            Logger::instance().flush();

            std::string contents;
            ASSERT_TRUE(read_file_contents(log_path, contents));
            EXPECT_EQ(contents.find("This should be filtered"), std::string::npos);
            EXPECT_NE(contents.find("This should appear."), std::string::npos);
            EXPECT_NE(contents.find("This should appear too."), std::string::npos);
        },
        "logger::log_level_filtering");
}

// Worker to test the fallback for bad runtime format strings.
int bad_format_string(const std::string &log_path)
{
    return run_gtest_worker(
        [&]()
        {
            ASSERT_TRUE(Logger::instance().set_logfile(log_path));
            LOGGER_INFO_RT("Bad format: {} {}", "one"); // Too few args
            Logger::instance().flush();

            std::string contents;
            ASSERT_TRUE(read_file_contents(log_path, contents));
            EXPECT_NE(contents.find("[FORMAT ERROR]"), std::string::npos);
        },
        "logger::bad_format_string");
}

// Switching sinks announces the switch in both the old and the new sink.
int sink_switch_messages(const std::string &first_path, const std::string &second_path)
{
    return run_gtest_worker(
        [&]()
        {
            ASSERT_TRUE(Logger::instance().set_logfile(first_path));
            LOGGER_INFO("in first");
            ASSERT_TRUE(Logger::instance().set_logfile(second_path));
            LOGGER_INFO("in second");
            Logger::instance().flush();

            std::string first, second;
            ASSERT_TRUE(read_file_contents(first_path, first));
            ASSERT_TRUE(read_file_contents(second_path, second));

            EXPECT_NE(first.find("in first"), std::string::npos);
            EXPECT_NE(first.find("Switching log sink to:"), std::string::npos);
            EXPECT_EQ(first.find("in second"), std::string::npos);

            EXPECT_NE(second.find("Log sink switched from:"), std::string::npos);
            EXPECT_NE(second.find("in second"), std::string::npos);
            EXPECT_EQ(second.find("in first"), std::string::npos);
        },
        "logger::sink_switch_messages");
}

// A sink that cannot be created leaves the old sink in place and reports the failure.
int write_error_callback(const std::string &bad_path)
{
    return run_gtest_worker(
        [&]()
        {
            std::vector<std::string> errors;
            Logger::instance().set_write_error_callback(
                [&errors](const std::string &msg) { errors.push_back(msg); });

            EXPECT_FALSE(Logger::instance().set_logfile(bad_path));
            ASSERT_EQ(errors.size(), 1u);
            EXPECT_NE(errors[0].find("FileSink"), std::string::npos) << errors[0];

            Logger::instance().set_write_error_callback(nullptr);
        },
        "logger::write_error_callback");
}

// Many threads logging concurrently produce whole, non-interleaved lines.
int multithread_lines(const std::string &log_path, int threads, int per_thread)
{
    return run_gtest_worker(
        [&]()
        {
            ASSERT_TRUE(Logger::instance().set_logfile(log_path));
            std::vector<std::thread> pool;
            for (int t = 0; t < threads; ++t)
            {
                pool.emplace_back(
                    [t, per_thread]()
                    {
                        for (int i = 0; i < per_thread; ++i)
                            LOGGER_INFO("mt-msg thread={} idx={}", t, i);
                    });
            }
            for (auto &th : pool)
                th.join();
            Logger::instance().flush();

            std::string contents;
            ASSERT_TRUE(read_file_contents(log_path, contents));
            EXPECT_EQ(count_lines(contents, "mt-msg"), static_cast<size_t>(threads * per_thread));
            EXPECT_EQ(count_lines(contents, "mt-msg", "[LP] [INFO  ]"), 0u)
                << "every message line carries its own header";
        },
        "logger::multithread_lines");
}

} // namespace logger
} // namespace livepreview::tests::worker

// Self-registering dispatcher.
namespace
{
struct LoggerWorkerRegistrar
{
    LoggerWorkerRegistrar()
    {
        register_worker_dispatcher(
            [](int argc, char **argv) -> int
            {
                if (argc < 2)
                    return -1;
                std::string_view mode = argv[1];
                auto dot = mode.find('.');
                if (dot == std::string_view::npos || mode.substr(0, dot) != "logger")
                    return -1;
                std::string scenario(mode.substr(dot + 1));
                using namespace livepreview::tests::worker::logger;
                if (scenario == "basic_logging" && argc > 2)
                    return basic_logging(argv[2]);
                if (scenario == "log_level_filtering" && argc > 2)
                    return log_level_filtering(argv[2]);
                if (scenario == "bad_format_string" && argc > 2)
                    return bad_format_string(argv[2]);
                if (scenario == "sink_switch_messages" && argc > 3)
                    return sink_switch_messages(argv[2], argv[3]);
                if (scenario == "write_error_callback" && argc > 2)
                    return write_error_callback(argv[2]);
                if (scenario == "multithread_lines" && argc > 4)
                    return multithread_lines(argv[2], std::stoi(argv[3]), std::stoi(argv[4]));
                fmt::print(stderr, "[WORKER FAILURE] Unknown logger scenario '{}'\n", scenario);
                return 1;
            });
    }
};
static LoggerWorkerRegistrar g_logger_registrar;
} // namespace
