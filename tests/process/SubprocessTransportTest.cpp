#include "process/SubprocessTransport.h"
#include <gtest/gtest.h>
#include <sys/wait.h>

namespace VCH {
namespace Tests {

using namespace std::chrono_literals;

class SubprocessTransportTest : public ::testing::Test {
protected:
    std::unique_ptr<ITransport> launchScript(const std::string &script) {
        auto result = launcher.launch(LaunchSpec::forCommand("sh", {"/bin/sh", "-c", script}));
        EXPECT_TRUE(result.isSuccess) << result.errorMessage;
        return std::move(result.transport);
    }

    SubprocessLauncher launcher;
};

TEST_F(SubprocessTransportTest, ExchangesLines) {
    auto transport = launchScript("while read line; do echo \"echo:$line\"; done");
    ASSERT_TRUE(transport);

    ASSERT_TRUE(transport->writeLine("hello").isSuccess);
    auto read = transport->readLine(5s);
    ASSERT_TRUE(read.isSuccess) << read.errorMessage;
    EXPECT_EQ(read.line, "echo:hello");

    ASSERT_TRUE(transport->writeLine("{\"cmd\":\"stop\"}").isSuccess);
    EXPECT_EQ(transport->readLine(5s).line, "echo:{\"cmd\":\"stop\"}");

    EXPECT_TRUE(transport->isAlive());
    transport->terminate(2s);
    EXPECT_FALSE(transport->isAlive());
}

TEST_F(SubprocessTransportTest, JoinsPartialWrites) {
    auto transport = launchScript("printf 'par'; sleep 0.2; printf 'tial\\nnext\\n'; cat >/dev/null");
    ASSERT_TRUE(transport);

    EXPECT_EQ(transport->readLine(5s).line, "partial");
    EXPECT_EQ(transport->readLine(5s).line, "next");
    transport->terminate(2s);
}

TEST_F(SubprocessTransportTest, MissingProgramIsLaunchFailure) {
    auto result = launcher.launch(LaunchSpec::forCommand("missing", {"/nonexistent/vch-implementation"}));
    ASSERT_FALSE(result.isSuccess);
    EXPECT_FALSE(result.transport);
    EXPECT_NE(result.errorMessage.find("could not execute"), std::string::npos);
}

TEST_F(SubprocessTransportTest, ExitIsReportedAsClosedAndStderrIsKept) {
    auto transport = launchScript("echo BOOM! >&2; exit 3");
    ASSERT_TRUE(transport);

    auto read = transport->readLine(5s);
    EXPECT_FALSE(read.isSuccess);
    EXPECT_EQ(read.errorType, TransportResult::ErrorType::CLOSED);

    transport->terminate(2s);
    EXPECT_NE(transport->takeStderr().find("BOOM!"), std::string::npos);
    EXPECT_TRUE(transport->takeStderr().empty());
}

TEST_F(SubprocessTransportTest, SilentPeerTimesOut) {
    auto transport = launchScript("exec sleep 30");
    ASSERT_TRUE(transport);

    auto started = std::chrono::steady_clock::now();
    auto read = transport->readLine(100ms);
    EXPECT_EQ(read.errorType, TransportResult::ErrorType::TIMEOUT);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);

    // sleep ignores EOF on stdin, so this needs SIGTERM
    transport->terminate(100ms);
    EXPECT_FALSE(transport->isAlive());
}

TEST_F(SubprocessTransportTest, ClosingStdinLetsWellBehavedPeerExit) {
    auto result = launcher.launch(LaunchSpec::forCommand("cat", {"/bin/sh", "-c", "cat >/dev/null; exit 0"}));
    ASSERT_TRUE(result.isSuccess);
    auto *transport = static_cast<SubprocessTransport *>(result.transport.get());

    transport->terminate(5s);
    ASSERT_TRUE(transport->exitStatus().has_value());
    EXPECT_TRUE(WIFEXITED(*transport->exitStatus()));
    EXPECT_EQ(WEXITSTATUS(*transport->exitStatus()), 0);
}

TEST_F(SubprocessTransportTest, WriteAfterExitIsBrokenPipe) {
    auto transport = launchScript("exit 0");
    ASSERT_TRUE(transport);

    // Wait for the exit to be observable
    EXPECT_FALSE(transport->readLine(5s).isSuccess);

    TransportResult written = TransportResult::success();
    for (int i = 0; i < 50 && written.isSuccess; ++i) {
        written = transport->writeLine(std::string(4096, 'x'));
    }
    EXPECT_FALSE(written.isSuccess);
    EXPECT_EQ(written.errorType, TransportResult::ErrorType::BROKEN_PIPE);
}

TEST_F(SubprocessTransportTest, EnvironmentOverridesReachTheChild) {
    LaunchSpec spec = LaunchSpec::forCommand("env", {"/bin/sh", "-c", "echo \"$VCH_TEST_VALUE\"; cat >/dev/null"});
    spec.env.push_back({"VCH_TEST_VALUE", "from-harness"});
    auto result = launcher.launch(spec);
    ASSERT_TRUE(result.isSuccess);

    EXPECT_EQ(result.transport->readLine(5s).line, "from-harness");
    result.transport->terminate(2s);
}

}  // namespace Tests
}  // namespace VCH
