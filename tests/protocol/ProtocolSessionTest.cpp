#include "mocks/FakeImplementation.h"
#include "protocol/Protocol.h"
#include "protocol/ProtocolSession.h"
#include <format>
#include <gtest/gtest.h>

namespace VCH {
namespace Tests {

class ProtocolSessionTest : public ::testing::Test {
protected:
    std::unique_ptr<ProtocolSession> makeSession(FakeBehavior behavior) {
        state = std::make_shared<FakeTransportState>();
        auto transport = std::make_unique<FakeTransport>(makeHandler(std::move(behavior)), state);
        return std::make_unique<ProtocolSession>("fake", std::move(transport));
    }

    std::unique_ptr<ProtocolSession> readySession(FakeBehavior behavior = {}) {
        auto session = makeSession(std::move(behavior));
        EXPECT_TRUE(session->start().isSuccess);
        EXPECT_TRUE(session->setDialect(DialectRegistry::known().newest()).isSuccess);
        return session;
    }

    std::shared_ptr<FakeTransportState> state;
    TestCase twoTests = makeCase("two tests", 2);
};

TEST_F(ProtocolSessionTest, StartSendsVersionAndStoresMetadata) {
    auto session = makeSession({});
    EXPECT_EQ(session->state(), SessionState::UNSTARTED);

    auto result = session->start();
    ASSERT_TRUE(result.isSuccess) << result.errorMessage;
    EXPECT_EQ(session->state(), SessionState::READY);
    ASSERT_TRUE(session->info().has_value());
    EXPECT_EQ(session->info()->name, "fake");

    ASSERT_EQ(state->requests.size(), 1u);
    EXPECT_EQ(state->requests[0], Protocol::startRequest());
    EXPECT_EQ(state->requests[0]["version"], 1);
}

TEST_F(ProtocolSessionTest, WrongVersionIsFatal) {
    FakeBehavior behavior;
    behavior.version = 2;
    auto session = makeSession(behavior);

    auto result = session->start();
    EXPECT_FALSE(result.isSuccess);
    EXPECT_EQ(result.errorType, ErrorType::PROTOCOL_VERSION_MISMATCH);
    EXPECT_NE(result.errorMessage.find("expected to speak version 1 but speaks version 2"), std::string::npos);
    EXPECT_EQ(session->state(), SessionState::CRASHED);
    EXPECT_TRUE(state->terminated);

    // Never retried
    EXPECT_FALSE(session->start().isSuccess);
    EXPECT_EQ(state->requests.size(), 1u);
}

TEST_F(ProtocolSessionTest, OversizedVersionIsNotTruncated) {
    FakeBehavior behavior;
    behavior.version = 4294967297ULL;
    auto session = makeSession(behavior);

    auto result = session->start();
    EXPECT_EQ(result.errorType, ErrorType::PROTOCOL_VERSION_MISMATCH);
    EXPECT_NE(result.errorMessage.find("speaks version 4294967297"), std::string::npos);
}

TEST_F(ProtocolSessionTest, BadMetadataIsFatal) {
    FakeBehavior behavior;
    behavior.metadata.erase("homepage");
    auto session = makeSession(behavior);

    auto result = session->start();
    EXPECT_EQ(result.errorType, ErrorType::INVALID_METADATA);
    EXPECT_NE(result.errorMessage.find("'homepage' is a required property"), std::string::npos);
    EXPECT_EQ(session->state(), SessionState::CRASHED);
}

TEST_F(ProtocolSessionTest, ExitDuringStartIsStartupFailureWithStderr) {
    FakeBehavior behavior;
    behavior.dieOnStart = true;
    behavior.stderrOnStart = "something went wrong\n";
    auto session = makeSession(behavior);

    auto result = session->start();
    EXPECT_EQ(result.errorType, ErrorType::STARTUP_FAILURE);
    EXPECT_EQ(result.stderrOutput, "something went wrong\n");
    EXPECT_EQ(session->state(), SessionState::CRASHED);
}

TEST_F(ProtocolSessionTest, UndeclaredDialectIsRefusedWithoutAsking) {
    FakeBehavior behavior;
    behavior.metadata = fakeMetadata("old", {DRAFT7});
    auto session = makeSession(behavior);
    ASSERT_TRUE(session->start().isSuccess);

    auto result = session->setDialect(DialectRegistry::known().newest());
    EXPECT_EQ(result.errorType, ErrorType::DIALECT_UNSUPPORTED);
    EXPECT_NE(result.errorMessage.find("does not support"), std::string::npos);
    EXPECT_EQ(state->requests.size(), 1u);
    EXPECT_EQ(session->state(), SessionState::READY);
}

TEST_F(ProtocolSessionTest, DialectNotOkIsUnsupported) {
    FakeBehavior behavior;
    behavior.dialectOk = false;
    auto session = makeSession(behavior);
    ASSERT_TRUE(session->start().isSuccess);

    auto result = session->setDialect(DialectRegistry::known().newest());
    EXPECT_EQ(result.errorType, ErrorType::DIALECT_UNSUPPORTED);
    EXPECT_EQ(state->requests.back()["cmd"], "dialect");
    EXPECT_EQ(state->requests.back()["dialect"], DRAFT2020_12);
}

TEST_F(ProtocolSessionTest, DialectCanOnlyBeSetOnce) {
    auto session = readySession();
    EXPECT_EQ(session->state(), SessionState::DIALECT_SET);
    EXPECT_FALSE(session->setDialect(DialectRegistry::known().newest()).isSuccess);
}

TEST_F(ProtocolSessionTest, RunEmbedsCaseAndSequenceNumber) {
    auto session = readySession();

    int seq = session->nextSequenceNumber();
    auto result = session->run(seq, twoTests);
    ASSERT_TRUE(result.isSuccess) << result.errorMessage;
    EXPECT_EQ(session->state(), SessionState::RUNNING);
    EXPECT_EQ(result.response["results"].size(), 2u);

    const json &request = state->requests.back();
    EXPECT_EQ(request["cmd"], "run");
    EXPECT_EQ(request["seq"], seq);
    EXPECT_EQ(request["case"], twoTests.toJson());

    EXPECT_GT(session->nextSequenceNumber(), seq);
}

TEST_F(ProtocolSessionTest, SequenceNumbersMustIncrease) {
    auto session = readySession();
    ASSERT_TRUE(session->run(5, twoTests).isSuccess);

    auto result = session->run(5, twoTests);
    EXPECT_EQ(result.errorType, ErrorType::SEQUENCE_MISMATCH);
    EXPECT_EQ(session->state(), SessionState::RUNNING);
}

TEST_F(ProtocolSessionTest, WrongSeqIsRecoverable) {
    FakeBehavior behavior;
    behavior.onRun = [](int seq, const json &testCase) { return allResults(seq + 10, testCase, {{"valid", true}}); };
    auto session = readySession(behavior);

    int seq = session->nextSequenceNumber();
    auto result = session->run(seq, twoTests);
    EXPECT_EQ(result.errorType, ErrorType::SEQUENCE_MISMATCH);
    EXPECT_NE(result.errorMessage.find(std::format("mismatched seq (expected {}, got {})", seq, seq + 10)),
              std::string::npos);
    EXPECT_EQ(session->state(), SessionState::RUNNING);
    EXPECT_FALSE(state->terminated);
}

TEST_F(ProtocolSessionTest, OversizedSeqIsNotTruncated) {
    FakeBehavior behavior;
    behavior.onRunLine = [](int, const json &) {
        return std::string(R"({"seq":4294967297,"results":[{"valid":true}]})");
    };
    auto session = readySession(behavior);

    int seq = session->nextSequenceNumber();
    ASSERT_EQ(seq, 1);
    auto result = session->run(seq, makeCase("one"));
    EXPECT_EQ(result.errorType, ErrorType::SEQUENCE_MISMATCH);
    EXPECT_NE(result.errorMessage.find("got 4294967297"), std::string::npos);
}

TEST_F(ProtocolSessionTest, MalformedJsonIsInvalidResponse) {
    FakeBehavior behavior;
    behavior.onRunLine = [](int, const json &) { return std::string("{not json"); };
    auto session = readySession(behavior);

    auto result = session->run(session->nextSequenceNumber(), makeCase("one"));
    EXPECT_EQ(result.errorType, ErrorType::INVALID_RESPONSE);
    EXPECT_NE(result.errorMessage.find("response={not json"), std::string::npos);
    EXPECT_EQ(session->state(), SessionState::RUNNING);
}

TEST_F(ProtocolSessionTest, ResultCountMustMatchTests) {
    FakeBehavior behavior;
    behavior.onRun = [](int seq, const json &) {
        return json{{"seq", seq}, {"results", json::array({{{"valid", true}}})}};
    };
    auto session = readySession(behavior);

    auto result = session->run(session->nextSequenceNumber(), twoTests);
    EXPECT_EQ(result.errorType, ErrorType::INVALID_RESPONSE);
    EXPECT_NE(result.errorMessage.find("expected 2 results but got 1"), std::string::npos);
}

TEST_F(ProtocolSessionTest, CaseLevelMarkersAreAccepted) {
    FakeBehavior behavior;
    behavior.onRun = [](int seq, const json &) {
        return json{{"seq", seq}, {"errored", true}, {"context", {{"message", "unsupported keyword"}}}};
    };
    auto session = readySession(behavior);

    auto result = session->run(session->nextSequenceNumber(), twoTests);
    ASSERT_TRUE(result.isSuccess);
    EXPECT_TRUE(result.response["errored"].get<bool>());
}

TEST_F(ProtocolSessionTest, DeathDuringRunCrashesSession) {
    FakeBehavior behavior;
    behavior.crashOnRuns = {1};
    auto session = readySession(behavior);

    auto result = session->run(session->nextSequenceNumber(), twoTests);
    EXPECT_EQ(result.errorType, ErrorType::TRANSPORT_FAILURE);
    EXPECT_EQ(session->state(), SessionState::CRASHED);
    EXPECT_NE(result.stderrOutput.find("BOOM!"), std::string::npos);

    // Absorbing
    EXPECT_FALSE(session->run(session->nextSequenceNumber(), twoTests).isSuccess);
    EXPECT_EQ(session->state(), SessionState::CRASHED);
}

TEST_F(ProtocolSessionTest, SilenceIsTreatedAsCrash) {
    FakeBehavior behavior;
    behavior.onRunLine = [](int, const json &) { return std::string(); };
    auto session = readySession(behavior);

    auto result = session->run(session->nextSequenceNumber(), twoTests);
    EXPECT_EQ(result.errorType, ErrorType::TRANSPORT_FAILURE);
    EXPECT_EQ(session->state(), SessionState::CRASHED);
}

TEST_F(ProtocolSessionTest, StopIsIdempotent) {
    auto session = readySession();
    session->stop();
    EXPECT_EQ(session->state(), SessionState::STOPPED);
    EXPECT_EQ(state->requests.back(), Protocol::stopRequest());
    EXPECT_EQ(state->terminateCalls, 1);

    session->stop();
    EXPECT_EQ(state->terminateCalls, 1);
}

TEST_F(ProtocolSessionTest, StopAfterCrashKeepsCrashedState) {
    FakeBehavior behavior;
    behavior.version = 0;
    auto session = makeSession(behavior);
    EXPECT_FALSE(session->start().isSuccess);

    session->stop();
    EXPECT_EQ(session->state(), SessionState::CRASHED);
    EXPECT_EQ(state->terminateCalls, 1);
}

}  // namespace Tests
}  // namespace VCH
