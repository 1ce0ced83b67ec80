// tests/test_layer3_health/test_diagnostic_runner.cpp
/**
 * @file test_diagnostic_runner.cpp
 * @brief Tests for the full diagnostic run with mocked collaborators.
 */
#include "lp_health.hpp"
#include "test_patterns.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <nlohmann/json.hpp>

#include <stdexcept>

using namespace livepreview::health;
using ::testing::_;
using ::testing::AnyNumber;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;
using json = nlohmann::json;

namespace
{

constexpr uint64_t kSelfPid = 4242;

class MockProcessLister : public ProcessLister
{
  public:
    MOCK_METHOD(std::vector<ListenerRecord>, list_listeners_on_port, (int port),
                (const, override));
};

class MockDependencyProbe : public DependencyProbe
{
  public:
    MOCK_METHOD(bool, is_installed, (const std::string &name), (const, override));
};

class MockExecutableFinder : public ExecutableFinder
{
  public:
    MOCK_METHOD(std::optional<std::string>, find, (const std::string &name), (const, override));
};

std::vector<std::string> titles(const DiagnosticReport &report)
{
    std::vector<std::string> out;
    for (const auto &section : report.sections())
        out.push_back(section.title);
    return out;
}

} // namespace

class DiagnosticRunnerTest : public livepreview::tests::PureApiTest
{
  protected:
    void SetUp() override
    {
        ON_CALL(lister_, list_listeners_on_port(_))
            .WillByDefault(Return(std::vector<ListenerRecord>{}));
        ON_CALL(deps_, is_installed(_)).WillByDefault(Return(true));
        ON_CALL(finder_, find(_)).WillByDefault(Return(std::optional<std::string>("/bin/sh")));
    }

    DiagnosticRunner make_runner(std::string host_version = "0.10.1",
                                 std::string range = ">=0.10.0")
    {
        return DiagnosticRunner(server_, lister_, deps_, finder_, std::move(host_version),
                                std::move(range), kSelfPid);
    }

    StaticPreviewServer server_{true};
    NiceMock<MockProcessLister> lister_;
    NiceMock<MockDependencyProbe> deps_;
    NiceMock<MockExecutableFinder> finder_;
};

TEST_F(DiagnosticRunnerTest, SectionsRunInFixedOrder)
{
    auto report = make_runner().run(PreviewConfig::from_json(json{{"port", 3000}}));
    EXPECT_THAT(titles(report),
                ::testing::ElementsAre(kDependenciesSection, kServerSection, kConfigSection));

    auto all = report.entries();
    ASSERT_FALSE(all.empty());
    EXPECT_EQ(all.front().category, Category::Compatibility);
    EXPECT_EQ(all.back().category, Category::Config);
}

TEST_F(DiagnosticRunnerTest, ServerSectionSkippedWithoutPort)
{
    EXPECT_CALL(lister_, list_listeners_on_port(_)).Times(0);
    auto report = make_runner().run(PreviewConfig::from_json(json::object()));
    EXPECT_THAT(titles(report), ::testing::ElementsAre(kDependenciesSection, kConfigSection));
    EXPECT_TRUE(report.entries(Category::ServerPort).empty());
}

TEST_F(DiagnosticRunnerTest, NoListenerIsNotRunningWarning)
{
    EXPECT_CALL(lister_, list_listeners_on_port(3000));
    auto report = make_runner().run(PreviewConfig::from_json(json{{"port", 3000}}));

    auto port_entries = report.entries(Category::ServerPort);
    ASSERT_EQ(port_entries.size(), 2u);
    EXPECT_EQ(port_entries[0].severity, Severity::Info);
    EXPECT_EQ(port_entries[0].message, "This process's PID is 4242");
    ASSERT_TRUE(port_entries[1].verdict.has_value());
    EXPECT_EQ(port_entries[1].verdict->kind(), VerdictKind::NotRunning);
    EXPECT_EQ(port_entries[1].severity, Severity::Warn);
}

TEST_F(DiagnosticRunnerTest, OwnListenerIsHealthy)
{
    EXPECT_CALL(lister_, list_listeners_on_port(3000))
        .WillOnce(Return(std::vector<ListenerRecord>{{kSelfPid, "nvim", 3000}}));
    auto report = make_runner().run(PreviewConfig::from_json(json{{"port", 3000}}));

    auto port_entries = report.entries(Category::ServerPort);
    ASSERT_EQ(port_entries.size(), 2u);
    EXPECT_EQ(port_entries[1].verdict->kind(), VerdictKind::Healthy);
    EXPECT_EQ(port_entries[1].severity, Severity::Ok);
}

TEST_F(DiagnosticRunnerTest, ForeignListenerGetsKillHint)
{
    EXPECT_CALL(lister_, list_listeners_on_port(3000))
        .WillOnce(Return(std::vector<ListenerRecord>{{9999, "python", 3000}}));
    auto report = make_runner().run(PreviewConfig::from_json(json{{"port", 3000}}));

    auto port_entries = report.entries(Category::ServerPort);
    ASSERT_EQ(port_entries.size(), 2u);
    EXPECT_EQ(port_entries[1].verdict->kind(), VerdictKind::PortStolen);
    ASSERT_TRUE(port_entries[1].hint.has_value());
    EXPECT_THAT(*port_entries[1].hint, HasSubstr("9999"));
}

TEST_F(DiagnosticRunnerTest, OneEntryPerListener)
{
    EXPECT_CALL(lister_, list_listeners_on_port(5500))
        .WillOnce(Return(std::vector<ListenerRecord>{{kSelfPid, "nvim", 5500},
                                                     {9999, "python", 5500},
                                                     {kUnknownPid, "unknown", 5500}}));
    auto report = make_runner().run(PreviewConfig::from_json(json{{"port", 5500}}));
    EXPECT_EQ(report.entries(Category::ServerPort).size(), 4u);
}

TEST_F(DiagnosticRunnerTest, LookupFailureIsAnErrorAndLaterChecksStillRun)
{
    EXPECT_CALL(lister_, list_listeners_on_port(3000))
        .WillOnce(Throw(LookupError("`lsof` is not available")));
    auto report = make_runner().run(PreviewConfig::from_json(json{{"port", 3000}}));

    auto port_entries = report.entries(Category::ServerPort);
    ASSERT_EQ(port_entries.size(), 2u);
    EXPECT_EQ(port_entries[1].severity, Severity::Error);
    EXPECT_THAT(port_entries[1].message, HasSubstr("`lsof` is not available"));
    EXPECT_THAT(titles(report), ::testing::Contains(kConfigSection));
    EXPECT_FALSE(report.entries(Category::Config).empty());
}

TEST_F(DiagnosticRunnerTest, UnexpectedExceptionIsIsolated)
{
    EXPECT_CALL(lister_, list_listeners_on_port(3000))
        .WillOnce(Throw(std::runtime_error("boom")));
    auto report = make_runner().run(PreviewConfig::from_json(json{{"port", 3000}}));

    auto port_entries = report.entries(Category::ServerPort);
    ASSERT_FALSE(port_entries.empty());
    EXPECT_EQ(port_entries.back().severity, Severity::Error);
    EXPECT_THAT(port_entries.back().message, HasSubstr("boom"));
    EXPECT_FALSE(report.entries(Category::Config).empty());
}

TEST_F(DiagnosticRunnerTest, InvalidPortIsAnError)
{
    PreviewConfig config;
    config.port = 70000;
    EXPECT_CALL(lister_, list_listeners_on_port(_)).Times(0);
    auto report = make_runner().run(config);

    auto port_entries = report.entries(Category::ServerPort);
    ASSERT_EQ(port_entries.size(), 2u);
    EXPECT_EQ(port_entries[1].severity, Severity::Error);
    EXPECT_THAT(port_entries[1].message, HasSubstr("70000"));
}

TEST_F(DiagnosticRunnerTest, CompatibleHostVersionIsOk)
{
    auto report = make_runner("0.10.1", ">=0.10.0").run(PreviewConfig{});
    auto entries = report.entries(Category::Compatibility);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].severity, Severity::Ok);
    EXPECT_EQ(entries[0].message, "Nvim 0.10.1 is compatible with Live Preview");
}

TEST_F(DiagnosticRunnerTest, OldHostVersionIsAnErrorWithUpgradeHint)
{
    auto report = make_runner("0.9.5", ">=0.10.0").run(PreviewConfig{});
    auto entries = report.entries(Category::Compatibility);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].severity, Severity::Error);
    EXPECT_EQ(entries[0].message,
              "|live-preview.nvim| requires Nvim >=0.10.0, but you are using 0.9.5");
    EXPECT_EQ(entries[0].hint, "Please upgrade your Nvim");
    EXPECT_TRUE(report.has_errors());
}

TEST_F(DiagnosticRunnerTest, MissingShellIsAnError)
{
    EXPECT_CALL(finder_, find(std::string(default_shell())))
        .WillOnce(Return(std::nullopt));
    auto report = make_runner().run(PreviewConfig{});
    auto entries = report.entries(Category::Shell);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].severity, Severity::Error);
    EXPECT_THAT(entries[0].message, HasSubstr("is not available"));
    EXPECT_EQ(entries[0].hint, "Please make sure it is installed and available in your PATH");
}

TEST_F(DiagnosticRunnerTest, AvailableShellIsOk)
{
    auto report = make_runner().run(PreviewConfig{});
    auto entries = report.entries(Category::Shell);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].severity, Severity::Ok);
    EXPECT_EQ(entries[0].message, fmt::format("`{}` is available", default_shell()));
}

TEST_F(DiagnosticRunnerTest, OptionalDependenciesWarnWhenMissing)
{
    EXPECT_CALL(deps_, is_installed("telescope")).WillOnce(Return(true));
    EXPECT_CALL(deps_, is_installed("snacks")).WillOnce(Return(false));
    EXPECT_CALL(deps_, is_installed("")).Times(0);

    auto report = make_runner().run(
        PreviewConfig::from_json(json{{"pickers", {"telescope", "", "snacks"}}}));
    auto entries = report.entries(Category::Dependencies);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].severity, Severity::Ok);
    EXPECT_EQ(entries[0].message, "`telescope` is installed");
    EXPECT_EQ(entries[1].severity, Severity::Warn);
    EXPECT_EQ(entries[1].message, "`snacks` (optional) is not installed");
    EXPECT_FALSE(report.has_errors());
}

TEST_F(DiagnosticRunnerTest, UnknownConfigKeyIsWarned)
{
    auto report =
        make_runner().run(PreviewConfig::from_json(json{{"port", 3000}, {"bogusKey", true}}));
    auto entries = report.entries(Category::Config);
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].severity, Severity::Warn);
    EXPECT_EQ(entries[0].message, "bogusKey is not a config option");
    EXPECT_EQ(entries[1].severity, Severity::Info);
    EXPECT_THAT(entries[1].message, HasSubstr("|livepreview-config|"));
    EXPECT_THAT(entries[2].message, HasSubstr("Your configuration table:"));
    EXPECT_THAT(entries[2].message, HasSubstr("\"port\": 3000"));
}

TEST_F(DiagnosticRunnerTest, MistypedConfigValueIsReportedWithoutStoppingTheRun)
{
    EXPECT_CALL(lister_, list_listeners_on_port(3000));
    auto report = make_runner().run(PreviewConfig::from_json(
        json{{"port", 3000}, {"bogusKey", true}, {"browser", 1}}));

    EXPECT_THAT(titles(report),
                ::testing::ElementsAre(kDependenciesSection, kServerSection, kConfigSection));
    EXPECT_FALSE(report.entries(Category::Compatibility).empty());
    EXPECT_FALSE(report.entries(Category::ServerPort).empty());

    auto entries = report.entries(Category::Config);
    ASSERT_EQ(entries.size(), 4u);
    EXPECT_EQ(entries[0].severity, Severity::Warn);
    EXPECT_EQ(entries[0].message, "bogusKey is not a config option");
    EXPECT_EQ(entries[1].severity, Severity::Error);
    EXPECT_EQ(entries[1].message,
              "Invalid config value: 'browser' must be a string, got number");
    ASSERT_TRUE(entries[1].hint.has_value());
    EXPECT_THAT(*entries[1].hint, HasSubstr("default value is used"));
    EXPECT_THAT(entries[2].message, HasSubstr("|livepreview-config|"));
    EXPECT_THAT(entries[3].message, HasSubstr("\"browser\": \"default\""));
    EXPECT_TRUE(report.has_errors());
}

TEST_F(DiagnosticRunnerTest, CleanConfigOnlyShowsTable)
{
    auto report = make_runner().run(PreviewConfig::from_json(json{{"port", 3000}}));
    auto entries = report.entries(Category::Config);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].severity, Severity::Info);
}

TEST_F(DiagnosticRunnerTest, RunIsRepeatable)
{
    auto runner = make_runner();
    auto config = PreviewConfig::from_json(json{{"port", 3000}});
    auto first = runner.run(config);
    auto second = runner.run(config);
    EXPECT_EQ(render_text(first), render_text(second));
}
