#pragma once

#include "tracing/span.hpp"

#include <string>

namespace kvtrace {

/**
 * @brief Abstract interface for finished-span destinations
 *
 * export_span() may be called from any thread that finishes a span;
 * implementations serialize their own writes.
 */
class ISpanSink {
public:
    virtual ~ISpanSink() = default;

    /// Accept one finished span. Returns true on success.
    [[nodiscard]] virtual bool export_span(const SpanData& span) = 0;

    /// Flush any buffered data to the underlying storage.
    virtual void flush() = 0;

    /// Graceful shutdown (drain buffers, close handles).
    virtual void shutdown() = 0;

    /// Human-readable sink name for logging (e.g. "file:/var/log/spans.jsonl")
    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace kvtrace
