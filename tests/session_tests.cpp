#include <csignal>
#include <filesystem>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

#include "core/context.hpp"
#include "core/environment.hpp"
#include "session/selector.hpp"
#include "session/session_manager.hpp"

namespace fs = std::filesystem;
using sessionizer::session::FzfSelector;
using sessionizer::session::LaunchError;
using sessionizer::session::sessionNameFor;
using sessionizer::session::TmuxSessionManager;

namespace
{

    sessionizer::Environment envWithMarker(bool insideClient)
    {
        sessionizer::Environment env;
        env.home = "/home/tester";
        env.cwd = "/home/tester";
        if (insideClient)
        {
            env.multiplexerMarker = "/tmp/tmux-1000/default,1234,0";
        }
        return env;
    }

    // Stand-in for fzf: reads every candidate, then behaves as scripted.
    FzfSelector scriptedSelector(const sessionizer::Context &ctx, const std::string &script)
    {
        return FzfSelector(ctx, "sh", {"-c", "cat > /dev/null; " + script});
    }

    class FzfSelectorTest : public ::testing::Test
    {
    protected:
        static void SetUpTestSuite()
        {
            std::signal(SIGPIPE, SIG_IGN);
        }

        sessionizer::Context ctx_{false};
    };

} // namespace

TEST(SessionName, UsesLastComponent)
{
    EXPECT_EQ(sessionNameFor("/home/tester/code/project"), "project");
}

TEST(SessionName, ReplacesDots)
{
    EXPECT_EQ(sessionNameFor("/home/tester/code/my.site.io"), "my_site_io");
    EXPECT_EQ(sessionNameFor("/home/tester/.dotfiles"), "_dotfiles");
}

TEST(SessionName, IgnoresTrailingSeparator)
{
    EXPECT_EQ(sessionNameFor("/srv/git/tool.rs/"), "tool_rs");
}

TEST(SessionName, RejectsPathsWithoutName)
{
    EXPECT_THROW(sessionNameFor("/"), std::invalid_argument);
    EXPECT_THROW(sessionNameFor(""), std::invalid_argument);
}

TEST_F(FzfSelectorTest, ReturnsChosenLine)
{
    FzfSelector selector(ctx_, "sed", {"-n", "2p"});
    const auto picked = selector.select({"/code/alpha", "/code/beta", "/code/gamma"});
    ASSERT_TRUE(picked.has_value());
    EXPECT_EQ(*picked, "/code/beta");
}

TEST_F(FzfSelectorTest, EmptyOutputMeansNoSelection)
{
    auto selector = scriptedSelector(ctx_, "exit 0");
    EXPECT_FALSE(selector.select({"/code/alpha"}).has_value());
}

TEST_F(FzfSelectorTest, AbortAndNoMatchMeanNoSelection)
{
    auto aborted = scriptedSelector(ctx_, "exit 130");
    EXPECT_FALSE(aborted.select({"/code/alpha"}).has_value());

    auto unmatched = scriptedSelector(ctx_, "exit 1");
    EXPECT_FALSE(unmatched.select({"/code/alpha"}).has_value());
}

TEST_F(FzfSelectorTest, MissingProgramIsLaunchError)
{
    FzfSelector selector(ctx_, "this_selector_does_not_exist_12345");
    EXPECT_THROW(selector.select({"/code/alpha"}), LaunchError);
}

TEST_F(FzfSelectorTest, UnexpectedFailureIsLaunchError)
{
    auto selector = scriptedSelector(ctx_, "exit 2");
    EXPECT_THROW(selector.select({"/code/alpha"}), LaunchError);
}

TEST(TmuxSessionManager, MarkerMeansServerRunning)
{
    const sessionizer::Context ctx(false);
    const auto env = envWithMarker(true);
    TmuxSessionManager sessions(ctx, env, true);
    EXPECT_TRUE(sessions.serverRunning());
}

TEST(TmuxSessionManager, DryRunNeverFindsSessions)
{
    const sessionizer::Context ctx(false);
    const auto env = envWithMarker(false);
    TmuxSessionManager sessions(ctx, env, true);
    EXPECT_FALSE(sessions.serverRunning());
    EXPECT_FALSE(sessions.hasSession("anything"));
}

TEST(TmuxSessionManager, DryRunInsideClientCreatesThenSwitches)
{
    const sessionizer::Context ctx(false);
    const auto env = envWithMarker(true);
    TmuxSessionManager sessions(ctx, env, true);

    testing::internal::CaptureStdout();
    sessions.ensureSession("my_app", "/code/my.app");
    sessions.switchTo("my_app");
    const std::string printed = testing::internal::GetCapturedStdout();

    EXPECT_NE(printed.find("'new-session' '-d' '-s' 'my_app' '-c' '/code/my.app'"), std::string::npos) << printed;
    EXPECT_NE(printed.find("'switch-client' '-t' '=my_app'"), std::string::npos) << printed;
    EXPECT_EQ(printed.find("attach-session"), std::string::npos) << printed;
}

TEST(TmuxSessionManager, DryRunOutsideClientAttaches)
{
    const sessionizer::Context ctx(false);
    const auto env = envWithMarker(false);
    TmuxSessionManager sessions(ctx, env, true);

    testing::internal::CaptureStdout();
    sessions.switchTo("notes");
    const std::string printed = testing::internal::GetCapturedStdout();

    EXPECT_NE(printed.find("'attach-session' '-t' '=notes'"), std::string::npos) << printed;
}
