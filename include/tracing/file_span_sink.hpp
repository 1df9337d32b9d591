#pragma once

#include "tracing/span_sink.hpp"

#include <fstream>
#include <mutex>
#include <string>

namespace kvtrace {

/**
 * @brief Appends finished spans to a file, one JSON object per line
 *
 * Line format:
 *   {"trace_id":"...","span_id":"...","parent_span_id":"...","name":"GET",
 *    "kind":"client","start_time":"...","duration_us":42,"status":"unset",
 *    "attributes":{...},"events":[...]}
 */
class FileSpanSink : public ISpanSink {
public:
    /// @throws std::runtime_error if the file cannot be opened
    explicit FileSpanSink(std::string output_file);
    ~FileSpanSink() override;

    [[nodiscard]] bool export_span(const SpanData& span) override;
    void flush() override;
    void shutdown() override;
    [[nodiscard]] std::string name() const override;

    /// Serialize one span as a single JSON line (no trailing newline)
    [[nodiscard]] static std::string to_json(const SpanData& span);

    /// Serialize an attribute map as a JSON object with sorted keys
    [[nodiscard]] static std::string attributes_to_json(const AttributeMap& attributes);

    /// Number of spans written
    [[nodiscard]] size_t written_count() const;

private:
    std::string output_file_;
    mutable std::mutex mutex_;
    std::ofstream file_stream_;
    size_t written_count_ = 0;
};

} // namespace kvtrace
