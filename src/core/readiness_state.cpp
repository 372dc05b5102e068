#include "core/readiness_state.h"
#include "core/logger.h"

ReadinessStateMachine& ReadinessStateMachine::instance() {
    static ReadinessStateMachine inst;
    return inst;
}

void ReadinessStateMachine::setState(ReadinessState state, const std::string& reason) {
    ReadinessState oldState = state_.exchange(state);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        reason_ = reason;
    }

    if (oldState != state) {
        Logger::instance().log(LogLevel::Info,
            std::string("Readiness: ") + toString(oldState) + " -> " + toString(state) +
            (reason.empty() ? "" : " (" + reason + ")"));
    }
}

std::string ReadinessStateMachine::getReason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reason_;
}

const char* ReadinessStateMachine::toString(ReadinessState state) {
    switch (state) {
        case ReadinessState::STARTING: return "STARTING";
        case ReadinessState::READY:    return "READY";
        case ReadinessState::STOPPING: return "STOPPING";
        default:                       return "UNKNOWN";
    }
}
