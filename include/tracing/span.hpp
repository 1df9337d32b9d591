#pragma once

#include "core/types.hpp"
#include "tracing/trace_context.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace kvtrace {

enum class SpanKind {
    INTERNAL,
    CLIENT,
    SERVER
};

enum class StatusCode {
    UNSET,
    OK,
    ERROR
};

struct SpanEvent {
    std::string name;             // e.g. "exception"
    AttributeMap attributes;      // exception.type, exception.message
    std::chrono::system_clock::time_point timestamp;
};

/**
 * @brief Finished span as handed to span sinks
 */
struct SpanData {
    TraceContext context;
    std::string name;             // e.g. "GET", "PIPELINED"
    SpanKind kind = SpanKind::INTERNAL;
    AttributeMap attributes;
    std::vector<SpanEvent> events;
    StatusCode status = StatusCode::UNSET;
    std::string status_message;
    std::chrono::system_clock::time_point start_time;
    std::chrono::system_clock::time_point end_time;

    /// Duration in microseconds
    [[nodiscard]] uint64_t duration_us() const {
        return static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::microseconds>(
                end_time - start_time).count());
    }
};

/**
 * @brief A live span owned by the caller
 *
 * finish() is idempotent; calls after finish() are ignored.
 */
class ISpan {
public:
    virtual ~ISpan() = default;

    virtual void set_attribute(const std::string& key, AttributeValue value) = 0;

    /// Add an "exception" event
    virtual void record_exception(const std::string& type, const std::string& message) = 0;

    virtual void set_error_status(const std::string& message) = 0;

    virtual void finish() = 0;

    [[nodiscard]] virtual const TraceContext& context() const = 0;
};

/**
 * @brief Creates spans
 *
 * A valid @p parent makes the new span its child; otherwise the span starts a
 * new trace.
 */
class ITracer {
public:
    virtual ~ITracer() = default;

    [[nodiscard]] virtual std::unique_ptr<ISpan> start_span(
        const std::string& name,
        AttributeMap attributes,
        SpanKind kind,
        const TraceContext& parent) = 0;
};

inline const char* span_kind_to_string(SpanKind kind) {
    switch (kind) {
        case SpanKind::INTERNAL: return "internal";
        case SpanKind::CLIENT: return "client";
        case SpanKind::SERVER: return "server";
        default: return "unknown";
    }
}

inline const char* status_code_to_string(StatusCode code) {
    switch (code) {
        case StatusCode::UNSET: return "unset";
        case StatusCode::OK: return "ok";
        case StatusCode::ERROR: return "error";
        default: return "unknown";
    }
}

} // namespace kvtrace
