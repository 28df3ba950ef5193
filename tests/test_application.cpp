#include <gtest/gtest.h>
#include <filesystem>
#include <sstream>

#include "core/application.hpp"
#include "core/network_profile.hpp"
#include "core/settings.hpp"
#include "fake_system.hpp"
#include "test_support.hpp"

using namespace aprelay::core;
using aprelay::testing::FakeSystem;
using aprelay::testing::TempDir;

namespace fs = std::filesystem;

class ApplicationTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        aprelay::testing::quiet_logging();
        host.add_interface("eth0");
        host.add_interface("wlan0");
    }

    ExitCode run(const std::string &action, bool privileged = true, const std::string &input = "")
    {
        std::istringstream in(input);
        out.str("");
        err.str("");
        Application app(settings, host, aprelay::testing::no_sleep, in, out, err, "aprelay");
        return app.run(action, privileged);
    }

    void save_profile()
    {
        NetworkProfile profile;
        profile.internet_interface = "eth0";
        profile.wireless_interface = "wlan0";
        profile.apply_defaults();
        ProfileStore(settings.paths.profile_file).save(profile);
    }

    TempDir dir;
    ToolSettings settings = aprelay::testing::settings_in(dir);
    FakeSystem host;
    std::ostringstream out;
    std::ostringstream err;
};

TEST_F(ApplicationTest, ParseAction)
{
    EXPECT_EQ(Application::parse_action(""), Action::INTERACTIVE);
    EXPECT_EQ(Application::parse_action("interactive"), Action::INTERACTIVE);
    EXPECT_EQ(Application::parse_action("start"), Action::START);
    EXPECT_EQ(Application::parse_action("stop"), Action::STOP);
    EXPECT_EQ(Application::parse_action("status"), Action::STATUS);
    EXPECT_FALSE(Application::parse_action("restart").has_value());
    EXPECT_FALSE(Application::parse_action("START").has_value());
}

TEST_F(ApplicationTest, UnprivilegedDoesNothing)
{
    save_profile();

    for (const char *action : {"start", "stop", "status", "interactive"})
    {
        EXPECT_EQ(run(action, false), ExitCode::INVALID_INVOCATION);
        EXPECT_NE(err.str().find("sudo"), std::string::npos);
    }
    EXPECT_TRUE(host.history.empty());
    EXPECT_EQ(aprelay::testing::files_in(dir.path()).size(), 1u);
}

TEST_F(ApplicationTest, UnknownActionPrintsUsage)
{
    EXPECT_EQ(run("restart"), ExitCode::INVALID_INVOCATION);
    EXPECT_EQ(err.str(), "Usage: aprelay [OPTIONS] {start|stop|status|interactive}\n");
    EXPECT_TRUE(host.history.empty());
}

TEST_F(ApplicationTest, InteractiveThenStart)
{
    ASSERT_EQ(run("interactive", true, "eth0\nwlan0\nCabin\n\n\n\n\n"), ExitCode::SUCCESS);
    EXPECT_NE(out.str().find("Configuration saved. To start the relay run: sudo aprelay start"), std::string::npos);
    EXPECT_TRUE(host.history.empty());

    ASSERT_EQ(run("start"), ExitCode::SUCCESS);
    EXPECT_EQ(host.interfaces["wlan0"].addresses, (std::vector<std::string>{"192.168.50.1/24"}));
    EXPECT_EQ(host.rule_count("nat", "POSTROUTING"), 1u);
    EXPECT_NE(aprelay::testing::read_file(settings.paths.hostapd_conf).find("ssid=Cabin\n"), std::string::npos);

    ASSERT_EQ(run("stop"), ExitCode::SUCCESS);
    EXPECT_TRUE(host.interfaces["wlan0"].addresses.empty());
    EXPECT_EQ(host.rule_count("nat", "POSTROUTING"), 0u);
    EXPECT_EQ(host.rule_count("filter", "FORWARD"), 0u);
}

TEST_F(ApplicationTest, EmptyActionIsInteractive)
{
    EXPECT_EQ(run("", true, "eth0\nwlan0\n\n\n\n\n\n"), ExitCode::SUCCESS);
    EXPECT_TRUE(ProfileStore(settings.paths.profile_file).load().has_value());
}

TEST_F(ApplicationTest, StartWithoutConfigurationAsksFirst)
{
    EXPECT_EQ(run("start", true, "eth0\nwlan0\n\n\n\n\n\n"), ExitCode::SUCCESS);
    EXPECT_NE(out.str().find("Internet interface"), std::string::npos);
    EXPECT_EQ(host.rule_count("filter", "FORWARD"), 2u);

    auto stored = ProfileStore(settings.paths.profile_file).load();
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->wireless_interface, "wlan0");
}

TEST_F(ApplicationTest, StartWithoutConfigurationAndNoInput)
{
    EXPECT_EQ(run("start", true, ""), ExitCode::INVALID_INVOCATION);
    EXPECT_TRUE(host.history.empty());
    EXPECT_TRUE(aprelay::testing::files_in(dir.path()).empty());
}

TEST_F(ApplicationTest, StopAndStatusNeedConfiguration)
{
    EXPECT_EQ(run("stop"), ExitCode::MISSING_RESOURCE);
    EXPECT_EQ(run("status"), ExitCode::MISSING_RESOURCE);
    EXPECT_TRUE(host.history.empty());
    EXPECT_TRUE(aprelay::testing::files_in(dir.path()).empty());
}

TEST_F(ApplicationTest, StatusPrintsToOutput)
{
    save_profile();
    EXPECT_EQ(run("status"), ExitCode::SUCCESS);
    EXPECT_NE(out.str().find("=== Relay status ==="), std::string::npos);
}

TEST_F(ApplicationTest, CorruptProfile)
{
    fs::create_directories(fs::path(settings.paths.profile_file).parent_path());
    aprelay::testing::write_file(settings.paths.profile_file, "INTERNET_IF=eth0\n");

    EXPECT_EQ(run("start"), ExitCode::MISSING_RESOURCE);
    EXPECT_EQ(run("stop"), ExitCode::MISSING_RESOURCE);
    EXPECT_EQ(run("status"), ExitCode::MISSING_RESOURCE);
    EXPECT_TRUE(host.history.empty());

    // interactive starts over and replaces it
    EXPECT_EQ(run("interactive", true, "eth0\nwlan0\n\n\n\n\n\n"), ExitCode::SUCCESS);
    EXPECT_TRUE(ProfileStore(settings.paths.profile_file).load().has_value());
}

TEST_F(ApplicationTest, UnprivilegedRunDoesNotOpenLogFile)
{
    settings.logging.log_file = dir.file("settings.log");
    std::string requested = dir.file("requested.log");

    Application::configure_logging(settings, 0, requested, false);
    EXPECT_EQ(run("start", false), ExitCode::INVALID_INVOCATION);

    Application::configure_logging(settings, 0, "", false);
    EXPECT_EQ(run("stop", false), ExitCode::INVALID_INVOCATION);

    aprelay::testing::quiet_logging();
    EXPECT_FALSE(fs::exists(requested));
    EXPECT_FALSE(fs::exists(settings.logging.log_file));
}

TEST_F(ApplicationTest, PrivilegedRunLogsToFile)
{
    std::string log_file = dir.file("aprelay.log");

    Application::configure_logging(settings, 0, log_file, true);
    EXPECT_EQ(run("restart"), ExitCode::INVALID_INVOCATION);

    aprelay::testing::quiet_logging();
    EXPECT_NE(aprelay::testing::read_file(log_file).find("[ERROR] main: Unknown action"), std::string::npos);
}
