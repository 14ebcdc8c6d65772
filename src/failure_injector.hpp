#pragma once

#include "config.hpp"
#include <mutex>
#include <optional>
#include <random>
#include <string>

namespace sfs {

struct SimulatedFailure {
    int status;            // 500, 503 or 504
    std::string reason;    // reason phrase carrying the "Simulated" marker
    std::string body;
};

// Randomly turns requests into synthetic server errors so the load client
// can exercise its error paths. Safe to call from any worker thread.
class FailureInjector {
public:
    explicit FailureInjector(const FailureInjectionConfig& config);

    std::optional<SimulatedFailure> draw();

    bool enabled() const { return enabled_; }
    double rate() const { return rate_; }

private:
    const bool enabled_;
    const double rate_;
    std::mutex mutex_;
    std::mt19937 gen_;
};

} // namespace sfs
