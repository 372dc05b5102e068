#include "monitoring/metrics.h"
#include <map>
#include <sstream>

Metrics& Metrics::instance() {
    static Metrics m;
    return m;
}

void Metrics::inc(const std::string& name, int64_t value) {
    std::lock_guard<std::mutex> lk(mutex_);
    counters_[name] += value;
}

int64_t Metrics::value(const std::string& name) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = counters_.find(name);
    return it == counters_.end() ? 0 : it->second;
}

std::string Metrics::errorCounter(const std::string& kindLabel) {
    return "sinkhole_errors_total{kind=\"" + kindLabel + "\"}";
}

std::string Metrics::renderPrometheus() const {
    std::lock_guard<std::mutex> lk(mutex_);
    // Stable output order
    std::map<std::string, int64_t> sorted(counters_.begin(), counters_.end());
    std::ostringstream out;
    for (const auto& p : sorted) {
        out << p.first << " " << p.second << "\n";
    }
    return out.str();
}

void Metrics::reset() {
    std::lock_guard<std::mutex> lk(mutex_);
    counters_.clear();
}
