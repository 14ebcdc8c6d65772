#include "log_buffer.hpp"
#include <stdexcept>

namespace sfs {

LogBuffer::LogBuffer(size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::invalid_argument("LogBuffer capacity must be positive");
    }
    sink_ = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(capacity_);
    sink_->set_pattern(kLogPattern);
}

std::vector<std::string> LogBuffer::snapshot() const {
    std::vector<std::string> lines = sink_->last_formatted();
    for (auto& line : lines) {
        while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
            line.pop_back();
        }
    }
    return lines;
}

size_t LogBuffer::size() const {
    return sink_->last_raw().size();
}

} // namespace sfs
