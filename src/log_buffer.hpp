#pragma once

#include <spdlog/sinks/ringbuffer_sink.h>
#include <memory>
#include <string>
#include <vector>
#include <cstddef>

namespace sfs {

// Line format shared by the file sink and the in-memory buffer
constexpr const char* kLogPattern = "%Y-%m-%d %H:%M:%S - [%t] - %l - %v";

// Bounded in-memory tail of recent log lines, shared by all worker threads.
// Records arrive through sink(); once full, each record evicts the oldest.
class LogBuffer {
public:
    static constexpr size_t kDefaultCapacity = 500;

    explicit LogBuffer(size_t capacity = kDefaultCapacity);

    // Non-copyable
    LogBuffer(const LogBuffer&) = delete;
    LogBuffer& operator=(const LogBuffer&) = delete;

    // Attach to any logger whose records should be kept
    spdlog::sink_ptr sink() const { return sink_; }

    // Formatted lines without line terminators, oldest first
    std::vector<std::string> snapshot() const;

    size_t size() const;
    size_t capacity() const { return capacity_; }

private:
    const size_t capacity_;
    std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> sink_;
};

} // namespace sfs
