#pragma once

#include "tracing/span_sink.hpp"

#include <mutex>
#include <vector>

namespace kvtrace {

/**
 * @brief Keeps finished spans in memory for inspection
 */
class MemorySpanSink : public ISpanSink {
public:
    [[nodiscard]] bool export_span(const SpanData& span) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) return false;
        spans_.push_back(span);
        return true;
    }

    void flush() override {}

    void shutdown() override {
        std::lock_guard<std::mutex> lock(mutex_);
        shut_down_ = true;
    }

    [[nodiscard]] std::string name() const override { return "memory"; }

    /// Snapshot of all exported spans, in finish order
    [[nodiscard]] std::vector<SpanData> spans() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return spans_;
    }

    [[nodiscard]] size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return spans_.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        spans_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::vector<SpanData> spans_;
    bool shut_down_ = false;
};

} // namespace kvtrace
