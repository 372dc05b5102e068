#pragma once
#include <string>

// Liveness verdict for /health; ok only once the listener is READY
struct HealthStatus {
    bool ok = false;
    std::string message;
};

class Health {
public:
    static HealthStatus check();
};
