#include "trellis/http/HttpTypes.hpp"
#include "trellis/logger/Logger.hpp"

namespace trellis {

const char* toString(HeaderPolicy policy) {
    switch (policy) {
        case HeaderPolicy::Parse: return "parse";
        case HeaderPolicy::Skip: return "skip";
        case HeaderPolicy::Leave: return "leave";
    }
    return "unknown";
}

std::optional<HeaderPolicy> headerPolicyFromString(std::string_view name) {
    if (name == "parse") return HeaderPolicy::Parse;
    if (name == "skip") return HeaderPolicy::Skip;
    if (name == "leave") return HeaderPolicy::Leave;
    return std::nullopt;
}

const char* toString(DispatchOutcome outcome) {
    switch (outcome) {
        case DispatchOutcome::ClosedEmpty: return "closed-empty";
        case DispatchOutcome::Dispatched: return "dispatched";
        case DispatchOutcome::NotFound: return "not-found";
        case DispatchOutcome::HandlerError: return "handler-error";
    }
    return "unknown";
}

ErrorDone::ErrorDone(std::function<void()> on_done)
    : state_(std::make_shared<State>()) {
    state_->on_done = std::move(on_done);
}

void ErrorDone::operator()() const {
    if (state_) {
        state_->fire();
    }
}

void ErrorDone::State::fire() {
    if (fired) {
        return;
    }
    fired = true;
    auto callback = std::move(on_done);
    if (callback) {
        callback();
    }
}

ErrorDone::State::~State() {
    try {
        fire();
    } catch (...) {
        Logger::getInstance().logCurrentError("ErrorDone: completion threw during release");
    }
}

} // namespace trellis
