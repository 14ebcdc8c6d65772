#include "failure_injector.hpp"
#include <algorithm>

namespace sfs {

static uint32_t seed_from(const FailureInjectionConfig& config) {
    if (config.seed != 0) return config.seed;
    std::random_device rd;
    return rd();
}

FailureInjector::FailureInjector(const FailureInjectionConfig& config)
    : enabled_(config.enabled)
    , rate_(std::clamp(config.rate, 0.0, 1.0))
    , gen_(seed_from(config))
{
}

std::optional<SimulatedFailure> FailureInjector::draw() {
    if (!enabled_ || rate_ <= 0.0) {
        return std::nullopt;
    }

    double roll;
    int pick;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        roll = std::uniform_real_distribution<double>(0.0, 1.0)(gen_);
        pick = std::uniform_int_distribution<int>(0, 2)(gen_);
    }
    if (roll >= rate_) {
        return std::nullopt;
    }

    switch (pick) {
        case 0:
            return SimulatedFailure{500, "Simulated Internal Server Error",
                                    "Simulated failure: internal server error\n"};
        case 1:
            return SimulatedFailure{503, "Simulated Service Unavailable",
                                    "Simulated failure: service unavailable\n"};
        default:
            return SimulatedFailure{504, "Simulated Gateway Timeout",
                                    "Simulated failure: gateway timeout\n"};
    }
}

} // namespace sfs
