#include "tracing/file_span_sink.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>
#include <vector>

namespace kvtrace {

namespace {

void append_attributes(std::string& out, const AttributeMap& attributes) {
    // Sorted keys keep output stable across runs
    std::vector<const AttributeMap::value_type*> entries;
    entries.reserve(attributes.size());
    for (const auto& entry : attributes) {
        entries.push_back(&entry);
    }
    std::sort(entries.begin(), entries.end(),
        [](const auto* a, const auto* b) { return a->first < b->first; });

    out += '{';
    for (size_t i = 0; i < entries.size(); ++i) {
        if (i > 0) out += ',';
        const auto& [key, value] = *entries[i];
        if (const auto* s = std::get_if<std::string>(&value)) {
            out += std::format("\"{}\":\"{}\"", utils::escape_json(key), utils::escape_json(*s));
        } else {
            out += std::format("\"{}\":{}", utils::escape_json(key), std::get<int64_t>(value));
        }
    }
    out += '}';
}

} // anonymous namespace

FileSpanSink::FileSpanSink(std::string output_file)
    : output_file_(std::move(output_file)) {
    file_stream_.open(output_file_, std::ios::app);
    if (!file_stream_.is_open()) {
        throw std::runtime_error("Failed to open span file: " + output_file_);
    }
}

FileSpanSink::~FileSpanSink() {
    shutdown();
}

bool FileSpanSink::export_span(const SpanData& span) {
    std::string line = to_json(span);
    line += '\n';

    std::lock_guard<std::mutex> lock(mutex_);
    if (!file_stream_.is_open()) return false;
    file_stream_.write(line.data(), static_cast<std::streamsize>(line.size()));
    if (!file_stream_.good()) return false;
    ++written_count_;
    return true;
}

void FileSpanSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    file_stream_.flush();
}

void FileSpanSink::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_stream_.is_open()) {
        file_stream_.flush();
        file_stream_.close();
    }
}

std::string FileSpanSink::name() const {
    return "file:" + output_file_;
}

std::string FileSpanSink::attributes_to_json(const AttributeMap& attributes) {
    std::string out;
    append_attributes(out, attributes);
    return out;
}

size_t FileSpanSink::written_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return written_count_;
}

std::string FileSpanSink::to_json(const SpanData& span) {
    std::string out;
    out.reserve(512);

    out += '{';
    out += std::format("\"trace_id\":\"{}\",\"span_id\":\"{}\",",
                       span.context.trace_id, span.context.span_id);
    if (!span.context.parent_span_id.empty()) {
        out += std::format("\"parent_span_id\":\"{}\",", span.context.parent_span_id);
    }
    out += std::format("\"name\":\"{}\",\"kind\":\"{}\",",
                       utils::escape_json(span.name), span_kind_to_string(span.kind));
    out += std::format("\"start_time\":\"{}\",\"duration_us\":{},",
                       utils::format_timestamp(span.start_time), span.duration_us());

    out += std::format("\"status\":\"{}\",", status_code_to_string(span.status));
    if (!span.status_message.empty()) {
        out += std::format("\"status_message\":\"{}\",", utils::escape_json(span.status_message));
    }

    out += "\"attributes\":";
    append_attributes(out, span.attributes);

    out += ",\"events\":[";
    for (size_t i = 0; i < span.events.size(); ++i) {
        if (i > 0) out += ',';
        const auto& event = span.events[i];
        out += std::format("{{\"name\":\"{}\",\"timestamp\":\"{}\",\"attributes\":",
                           utils::escape_json(event.name),
                           utils::format_timestamp(event.timestamp));
        append_attributes(out, event.attributes);
        out += '}';
    }
    out += "]}";

    return out;
}

} // namespace kvtrace
