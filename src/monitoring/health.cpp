#include "monitoring/health.h"
#include "core/readiness_state.h"

HealthStatus Health::check() {
    auto& readiness = ReadinessStateMachine::instance();
    HealthStatus s;
    s.ok = readiness.isReady();
    s.message = ReadinessStateMachine::toString(readiness.getState());

    std::string reason = readiness.getReason();
    if (!s.ok && !reason.empty())
        s.message += ": " + reason;
    return s;
}
