#include "results_store.hpp"
#include <utility>

namespace sfs {

void TestResultsStore::store(std::string payload) {
    // Build outside the lock; only the pointer swap is guarded
    auto next = std::make_shared<const std::string>(std::move(payload));
    std::lock_guard<std::mutex> lock(mutex_);
    current_ = std::move(next);
}

std::string TestResultsStore::snapshot() const {
    std::shared_ptr<const std::string> current;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        current = current_;
    }
    if (!current) {
        return "{}";
    }
    return *current;
}

} // namespace sfs
