#include "FakeTransport.h"

namespace VCH {
namespace Tests {

FakeTransport::FakeTransport(Handler handler, std::shared_ptr<FakeTransportState> state)
    : handler_(std::move(handler)), state_(std::move(state)) {}

TransportResult FakeTransport::writeLine(const std::string &line) {
    if (!state_->alive || state_->terminated) {
        return TransportResult::error("broken pipe", TransportResult::ErrorType::BROKEN_PIPE);
    }
    auto request = JsonUtils::parseJson(line);
    state_->requests.push_back(request ? *request : json(line));
    if (handler_ && request) {
        handler_(*request, *state_);
    }
    return TransportResult::success();
}

TransportResult FakeTransport::readLine(std::chrono::milliseconds) {
    if (!state_->pending.empty()) {
        std::string line = state_->pending.front();
        state_->pending.pop_front();
        return TransportResult::success(line);
    }
    if (!state_->alive) {
        return TransportResult::error("output closed", TransportResult::ErrorType::CLOSED);
    }
    return TransportResult::error("no response", TransportResult::ErrorType::TIMEOUT);
}

std::string FakeTransport::takeStderr() {
    std::string taken;
    taken.swap(state_->stderrText);
    return taken;
}

bool FakeTransport::isAlive() {
    return state_->alive && !state_->terminated;
}

void FakeTransport::terminate(std::chrono::milliseconds) {
    ++state_->terminateCalls;
    state_->terminated = true;
    state_->alive = false;
}

}  // namespace Tests
}  // namespace VCH
