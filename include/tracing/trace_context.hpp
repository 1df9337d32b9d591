#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace kvtrace {

/**
 * @brief W3C Trace Context identifiers for one span
 *
 * A default-constructed context is invalid and stands for "no active parent".
 * Command spans become children of a valid parent, or roots of a fresh trace
 * when root spans are enabled.
 *
 * Format: "00-{trace_id}-{span_id}-{flags}"
 *   trace_id: 32 hex chars (128-bit)
 *   span_id:  16 hex chars (64-bit)
 *   flags:    2 hex chars (8-bit, 01 = sampled)
 */
struct TraceContext {
    std::string trace_id;       // 32 hex chars
    std::string span_id;        // 16 hex chars
    std::string parent_span_id; // 16 hex chars, empty for a root span
    uint8_t trace_flags = 1;    // 01 = sampled by default
    std::string tracestate;     // Opaque vendor-specific state (propagated as-is)

    [[nodiscard]] bool is_valid() const;
    [[nodiscard]] bool is_sampled() const { return (trace_flags & 0x01) != 0; }
    [[nodiscard]] bool is_root() const { return parent_span_id.empty(); }

    /// Fresh root context (new trace_id + span_id)
    [[nodiscard]] static TraceContext generate_root();

    /// Child of @p parent: same trace, new span_id, parent link set
    [[nodiscard]] static TraceContext child_of(const TraceContext& parent);

    /**
     * @brief Parse a traceparent header into the context of the remote span
     *
     * The returned context describes the remote caller's span (span_id taken
     * from the header) and can be passed as a parent.
     */
    [[nodiscard]] static std::optional<TraceContext> parse_traceparent(std::string_view header);

    /// Serialize to traceparent header value
    [[nodiscard]] std::string to_traceparent() const;

    [[nodiscard]] static std::string generate_span_id();
    [[nodiscard]] static std::string generate_trace_id();
};

} // namespace kvtrace
