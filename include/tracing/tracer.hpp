#pragma once

#include "tracing/span.hpp"
#include "tracing/span_sink.hpp"

#include <memory>
#include <mutex>

namespace kvtrace {

/**
 * @brief Span that records into SpanData and exports on finish
 *
 * RAII: a span destroyed without finish() is finished by the destructor, so
 * an early return or exception still exports it.
 */
class RecordingSpan : public ISpan {
public:
    RecordingSpan(SpanData data, std::shared_ptr<ISpanSink> sink);
    ~RecordingSpan() override;

    RecordingSpan(const RecordingSpan&) = delete;
    RecordingSpan& operator=(const RecordingSpan&) = delete;

    void set_attribute(const std::string& key, AttributeValue value) override;
    void record_exception(const std::string& type, const std::string& message) override;
    void set_error_status(const std::string& message) override;
    void finish() override;

    [[nodiscard]] const TraceContext& context() const override { return data_.context; }

    [[nodiscard]] bool is_finished() const;

private:
    mutable std::mutex mutex_;
    SpanData data_;
    std::shared_ptr<ISpanSink> sink_;
    bool finished_ = false;
};

/**
 * @brief Tracer that exports every finished span to one sink
 *
 * Thread-safe: spans are independent objects, ids come from thread-local
 * generators, and the sink serializes its own writes.
 */
class Tracer : public ITracer {
public:
    explicit Tracer(std::shared_ptr<ISpanSink> sink);

    [[nodiscard]] std::unique_ptr<ISpan> start_span(
        const std::string& name,
        AttributeMap attributes,
        SpanKind kind,
        const TraceContext& parent) override;

private:
    std::shared_ptr<ISpanSink> sink_;
};

} // namespace kvtrace
