#include <gtest/gtest.h>
#include <sstream>

#include "core/prompt.hpp"

using aprelay::core::InputClosed;
using aprelay::core::Prompter;

TEST(Prompter, EmptyAnswerSelectsDefault)
{
    std::istringstream in("\n");
    std::ostringstream out;
    Prompter prompter(in, out);

    EXPECT_EQ(prompter.ask("Network name (SSID)", "MonWifi"), "MonWifi");
    EXPECT_EQ(out.str(), "Network name (SSID) [MonWifi]: ");
}

TEST(Prompter, AnswerIsTrimmed)
{
    std::istringstream in("  Cabin \r\n");
    std::ostringstream out;
    Prompter prompter(in, out);

    EXPECT_EQ(prompter.ask("Network name (SSID)", "MonWifi"), "Cabin");
}

TEST(Prompter, RequiredRepeatsUntilAnswered)
{
    std::istringstream in("\n   \neth0\n");
    std::ostringstream out;
    Prompter prompter(in, out);

    EXPECT_EQ(prompter.ask_required("Internet interface"), "eth0");

    std::string transcript = out.str();
    size_t reminders = 0;
    for (size_t pos = transcript.find("A value is required."); pos != std::string::npos;
         pos = transcript.find("A value is required.", pos + 1))
    {
        ++reminders;
    }
    EXPECT_EQ(reminders, 2u);
}

TEST(Prompter, EndOfInputThrows)
{
    std::istringstream in("");
    std::ostringstream out;
    Prompter prompter(in, out);

    EXPECT_THROW(prompter.ask("SSID", "MonWifi"), InputClosed);
    EXPECT_THROW(prompter.ask_required("Internet interface"), InputClosed);
}
