#pragma once

#include <memory>
#include <mutex>
#include <string>

namespace sfs {

// Holds the last test-results payload POSTed by the load client, byte for byte.
// Readers get either the previous or the new payload, never a mix.
class TestResultsStore {
public:
    TestResultsStore() = default;

    // Non-copyable
    TestResultsStore(const TestResultsStore&) = delete;
    TestResultsStore& operator=(const TestResultsStore&) = delete;

    // Caller has already checked that payload is a JSON object
    void store(std::string payload);

    // Last stored payload, or "{}" if nothing was stored yet
    std::string snapshot() const;

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const std::string> current_;
};

} // namespace sfs
