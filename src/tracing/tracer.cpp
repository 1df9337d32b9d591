#include "tracing/tracer.hpp"
#include "tracing/semantic_conventions.hpp"
#include "core/utils.hpp"

#include <exception>
#include <format>

namespace kvtrace {

// ============================================================================
// RecordingSpan
// ============================================================================

RecordingSpan::RecordingSpan(SpanData data, std::shared_ptr<ISpanSink> sink)
    : data_(std::move(data)), sink_(std::move(sink)) {}

RecordingSpan::~RecordingSpan() {
    try {
        finish();
    } catch (const std::exception& e) {
        utils::log::error(std::format("Span '{}' failed to export: {}", data_.name, e.what()));
    }
}

void RecordingSpan::set_attribute(const std::string& key, AttributeValue value) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (finished_) return;
    data_.attributes.insert_or_assign(key, std::move(value));
}

void RecordingSpan::record_exception(const std::string& type, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (finished_) return;

    SpanEvent event;
    event.name = std::string(semconv::kExceptionEventName);
    event.attributes.emplace(semconv::kExceptionType, type);
    event.attributes.emplace(semconv::kExceptionMessage, message);
    event.timestamp = std::chrono::system_clock::now();
    data_.events.push_back(std::move(event));
}

void RecordingSpan::set_error_status(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (finished_) return;
    data_.status = StatusCode::ERROR;
    data_.status_message = message;
}

void RecordingSpan::finish() {
    SpanData finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (finished_) return;
        finished_ = true;
        data_.end_time = std::chrono::system_clock::now();
        finished = data_;
    }

    if (!sink_) return;
    if (!sink_->export_span(finished)) {
        utils::log::warn(std::format("Span '{}' dropped by sink {}", finished.name, sink_->name()));
    }
}

bool RecordingSpan::is_finished() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return finished_;
}

// ============================================================================
// Tracer
// ============================================================================

Tracer::Tracer(std::shared_ptr<ISpanSink> sink)
    : sink_(std::move(sink)) {}

std::unique_ptr<ISpan> Tracer::start_span(
    const std::string& name,
    AttributeMap attributes,
    SpanKind kind,
    const TraceContext& parent) {

    SpanData data;
    data.context = TraceContext::child_of(parent);
    data.name = name;
    data.kind = kind;
    data.attributes = std::move(attributes);
    data.start_time = std::chrono::system_clock::now();

    return std::make_unique<RecordingSpan>(std::move(data), sink_);
}

} // namespace kvtrace
