#pragma once

#include <atomic>
#include <string>
#include <mutex>

/**
 * Lifecycle of the responder as seen by the /ready probe.
 * STARTING until the UDP listener is bound, STOPPING once shutdown begins.
 */
enum class ReadinessState {
    STARTING,
    READY,
    STOPPING
};

class ReadinessStateMachine {
public:
    static ReadinessStateMachine& instance();

    void setState(ReadinessState state, const std::string& reason = "");

    ReadinessState getState() const { return state_.load(); }
    std::string getReason() const;
    bool isReady() const { return state_.load() == ReadinessState::READY; }

    static const char* toString(ReadinessState state);

private:
    ReadinessStateMachine() = default;
    std::atomic<ReadinessState> state_{ReadinessState::STARTING};
    mutable std::mutex mutex_;
    std::string reason_;
};
