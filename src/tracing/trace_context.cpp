#include "tracing/trace_context.hpp"
#include <charconv>
#include <format>
#include <random>

namespace kvtrace {

namespace {

constexpr size_t kTraceIdHexLen = 32;
constexpr size_t kSpanIdHexLen = 16;
constexpr size_t kTraceparentLen = 55;  // 2 + 1 + 32 + 1 + 16 + 1 + 2

bool is_hex_id(std::string_view s, size_t expected_len) {
    if (s.size() != expected_len) return false;
    bool non_zero = false;
    for (const char c : s) {
        const bool hex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
        if (!hex) return false;
        if (c != '0') non_zero = true;
    }
    return non_zero;  // all-zero ids are invalid
}

std::string random_hex(size_t bytes) {
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    static thread_local std::uniform_int_distribution<uint64_t> dis;

    std::string result;
    result.reserve(bytes * 2);

    while (result.size() < bytes * 2) {
        const uint64_t val = dis(gen);
        result += std::format("{:016x}", val);
    }
    result.resize(bytes * 2);

    // An all-zero id is invalid; vanishingly rare, but regenerate
    if (result.find_first_not_of('0') == std::string::npos) {
        return random_hex(bytes);
    }
    return result;
}

} // anonymous namespace

bool TraceContext::is_valid() const {
    return is_hex_id(trace_id, kTraceIdHexLen) && is_hex_id(span_id, kSpanIdHexLen);
}

TraceContext TraceContext::generate_root() {
    TraceContext ctx;
    ctx.trace_id = generate_trace_id();
    ctx.span_id = generate_span_id();
    ctx.trace_flags = 0x01;
    return ctx;
}

TraceContext TraceContext::child_of(const TraceContext& parent) {
    if (!parent.is_valid()) {
        return generate_root();
    }

    TraceContext ctx;
    ctx.trace_id = parent.trace_id;
    ctx.span_id = generate_span_id();
    ctx.parent_span_id = parent.span_id;
    ctx.trace_flags = parent.trace_flags;
    ctx.tracestate = parent.tracestate;
    return ctx;
}

std::optional<TraceContext> TraceContext::parse_traceparent(std::string_view header) {
    // "VV-TTTTTTTTTTTTTTTTTTTTTTTTTTTTTTTT-PPPPPPPPPPPPPPPP-FF"
    if (header.size() < kTraceparentLen) return std::nullopt;

    if (header[2] != '-' || header[35] != '-' || header[52] != '-') {
        return std::nullopt;
    }

    if (header.substr(0, 2) != "00") return std::nullopt;

    const auto trace_id = header.substr(3, kTraceIdHexLen);
    const auto span_id = header.substr(36, kSpanIdHexLen);
    if (!is_hex_id(trace_id, kTraceIdHexLen) || !is_hex_id(span_id, kSpanIdHexLen)) {
        return std::nullopt;
    }

    const auto flag_text = header.substr(53, 2);
    unsigned flags = 0;
    const auto [ptr, ec] = std::from_chars(flag_text.data(), flag_text.data() + flag_text.size(),
                                           flags, 16);
    if (ec != std::errc{} || ptr != flag_text.data() + flag_text.size()) return std::nullopt;

    TraceContext ctx;
    ctx.trace_id = std::string(trace_id);
    ctx.span_id = std::string(span_id);
    ctx.trace_flags = static_cast<uint8_t>(flags);
    return ctx;
}

std::string TraceContext::to_traceparent() const {
    return std::format("00-{}-{}-{:02x}", trace_id, span_id, trace_flags);
}

std::string TraceContext::generate_span_id() {
    return random_hex(kSpanIdHexLen / 2);
}

std::string TraceContext::generate_trace_id() {
    return random_hex(kTraceIdHexLen / 2);
}

} // namespace kvtrace
