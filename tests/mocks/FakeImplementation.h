#pragma once

#include "FakeTransport.h"
#include "harness/Diagnostics.h"
#include "harness/ImplementationResolver.h"
#include "harness/TestCaseSource.h"
#include "process/IProcessLauncher.h"
#include <functional>
#include <gmock/gmock.h>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace VCH {
namespace Tests {

inline const std::string DRAFT2020_12 = "https://json-schema.org/draft/2020-12/schema";
inline const std::string DRAFT2019_09 = "https://json-schema.org/draft/2019-09/schema";
inline const std::string DRAFT7 = "http://json-schema.org/draft-07/schema#";

/**
 * @brief Metadata of a well-formed implementation
 */
json fakeMetadata(const std::string &name = "fake", std::vector<std::string> dialects = {DRAFT2020_12});

/**
 * @brief How a fake implementation answers the protocol
 */
struct FakeBehavior {
    json version = 1;
    json metadata = fakeMetadata();
    json dialectOk = true;
    bool dieOnStart{false};
    std::string stderrOnStart;

    // Full response for a run request; by default every test is valid
    std::function<json(int seq, const json &testCase)> onRun;

    // Raw response line, takes precedence over onRun; an empty line means no answer at all
    std::function<std::string(int seq, const json &testCase)> onRunLine;

    // Die without answering on these run numbers (1-based, counted per implementation)
    std::vector<int> crashOnRuns;
};

/**
 * @brief Response marking every test of a case with the same result
 */
json allResults(int seq, const json &testCase, const json &result);

FakeTransport::Handler makeHandler(FakeBehavior behavior);

/**
 * @brief IProcessLauncher serving FakeTransports, keyed by implementation id
 */
class FakeLauncher : public IProcessLauncher {
public:
    void add(const std::string &id, FakeBehavior behavior);

    LaunchResult launch(const LaunchSpec &spec) override;

    /**
     * @brief State of the transport created for `id` (null if never launched)
     */
    std::shared_ptr<FakeTransportState> state(const std::string &id) const;

    /**
     * @brief Number of run requests `id` received
     */
    size_t runCount(const std::string &id) const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, FakeBehavior> behaviors_;
    std::map<std::string, std::shared_ptr<FakeTransportState>> states_;
};

/**
 * @brief Resolves every id to a command named after it
 */
class PassThroughResolver : public IImplementationResolver {
public:
    std::optional<LaunchSpec> resolve(const std::string &id, std::string *) override {
        return LaunchSpec::forCommand(id, {id});
    }
};

class RecordingDiagnosticSink : public IDiagnosticSink {
public:
    void report(const Diagnostic &diagnostic) override {
        std::lock_guard<std::mutex> lock(mutex_);
        diagnostics.push_back(diagnostic);
    }

    size_t count(DiagnosticKind kind) const;

    /**
     * @brief Whether any diagnostic of `kind` mentions `text`
     */
    bool contains(DiagnosticKind kind, const std::string &text) const;

    std::vector<Diagnostic> diagnostics;

private:
    std::mutex mutex_;
};

class MockDiagnosticSink : public IDiagnosticSink {
public:
    MOCK_METHOD(void, report, (const Diagnostic &diagnostic), (override));
};

class VectorTestCaseSource : public ITestCaseSource {
public:
    explicit VectorTestCaseSource(std::vector<TestCase> cases) : cases_(std::move(cases)) {}

    std::optional<TestCase> next() override {
        if (position_ >= cases_.size()) {
            return std::nullopt;
        }
        ++consumed;
        return cases_[position_++];
    }

    size_t consumed{0};

private:
    std::vector<TestCase> cases_;
    size_t position_{0};
};

/**
 * @brief Case with `testCount` tests against a trivial schema
 */
TestCase makeCase(const std::string &description, size_t testCount = 1, json schema = json::object());

}  // namespace Tests
}  // namespace VCH
