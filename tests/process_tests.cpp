#include <csignal>
#include <filesystem>
#include <string>

#include <gtest/gtest.h>

#include "core/context.hpp"
#include "io/process.hpp"

namespace
{

    sessionizer::Context makeContext()
    {
        return sessionizer::Context(false);
    }

    std::filesystem::path invalidDirPath()
    {
        return std::filesystem::path("/sessionizer/this/path/should/not/exist/12345");
    }

    class ProcessCapture : public ::testing::Test
    {
    protected:
        static void SetUpTestSuite()
        {
            std::signal(SIGPIPE, SIG_IGN);
        }
    };

} // namespace

TEST(ProcessRunCommand, BasicCommandExecution)
{
    auto ctx = makeContext();
    auto result = sessionizer::io::runCommand("true", {}, {}, ctx, false);
    EXPECT_EQ(result.code, 0) << "Command: " << result.commandLine;
}

TEST(ProcessRunCommand, ReportsExitCode)
{
    auto ctx = makeContext();
    auto result = sessionizer::io::runCommand("sh", {"-c", "exit 3"}, {}, ctx, false);
    EXPECT_EQ(result.code, 3);
}

TEST(ProcessRunCommand, MissingCommandReturnsError)
{
    auto ctx = makeContext();
    auto result = sessionizer::io::runCommand("this_command_does_not_exist_12345", {}, {}, ctx, false);
    EXPECT_EQ(result.code, sessionizer::io::kExecFailedCode);
}

TEST(ProcessRunCommand, InvalidWorkingDirectoryFailsFast)
{
    auto ctx = makeContext();
    auto result = sessionizer::io::runCommand("true", {}, invalidDirPath(), ctx, false);
    EXPECT_NE(result.code, 0);
}

TEST(ProcessRunCommand, DryRunReturnsSuccessWithoutExecution)
{
    auto ctx = makeContext();
    auto result = sessionizer::io::runCommand("this_command_does_not_exist_12345", {"x"}, {}, ctx, true);
    EXPECT_EQ(result.code, 0);
    EXPECT_EQ(result.processId, -1);
}

TEST(ProcessRunCommand, ShellQuoteKeepsSpacesQuoted)
{
    EXPECT_EQ(sessionizer::io::shellQuote("Hello World"), "'Hello World'");
    EXPECT_EQ(sessionizer::io::shellQuote("it's"), "'it'\\''s'");
}

TEST_F(ProcessCapture, EchoesInputThroughCat)
{
    auto ctx = makeContext();
    sessionizer::io::CaptureOptions options;
    options.input = "/a/one\n/b/two\n";

    auto result = sessionizer::io::runCommandCapture("cat", {}, options, ctx);

    EXPECT_EQ(result.code, 0);
    EXPECT_EQ(result.output, options.input);
}

TEST_F(ProcessCapture, LargeInputDoesNotDeadlock)
{
    auto ctx = makeContext();
    sessionizer::io::CaptureOptions options;
    for (int i = 0; i < 20000; ++i)
    {
        options.input += "/home/tester/code/project_" + std::to_string(i) + "\n";
    }

    auto result = sessionizer::io::runCommandCapture("cat", {}, options, ctx);

    EXPECT_EQ(result.code, 0);
    EXPECT_EQ(result.output.size(), options.input.size());
}

TEST_F(ProcessCapture, DiscardsStderrOnRequest)
{
    auto ctx = makeContext();
    sessionizer::io::CaptureOptions options;
    options.discardStderr = true;

    auto result = sessionizer::io::runCommandCapture("sh", {"-c", "echo noise >&2; echo kept"}, options, ctx);

    EXPECT_EQ(result.code, 0);
    EXPECT_EQ(result.output, "kept\n");
}

TEST_F(ProcessCapture, ChildIgnoringInputStillCompletes)
{
    auto ctx = makeContext();
    sessionizer::io::CaptureOptions options;
    options.input = std::string(256 * 1024, 'x');

    auto result = sessionizer::io::runCommandCapture("true", {}, options, ctx);

    EXPECT_EQ(result.code, 0);
    EXPECT_TRUE(result.output.empty());
}

TEST_F(ProcessCapture, MissingCommandReportsExecFailure)
{
    auto ctx = makeContext();
    auto result = sessionizer::io::runCommandCapture("this_command_does_not_exist_12345", {}, {}, ctx);
    EXPECT_EQ(result.code, sessionizer::io::kExecFailedCode);
}
