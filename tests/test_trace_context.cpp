#include <catch2/catch_test_macros.hpp>
#include "tracing/trace_context.hpp"

using namespace kvtrace;

// ============================================================================
// W3C Trace Context Tests
// ============================================================================

TEST_CASE("TraceContext: parse valid traceparent", "[tracing]") {
    auto ctx = TraceContext::parse_traceparent(
        "00-4bf92f3577b34da6a3ce929d0e0e4736-00f067aa0ba902b7-01");

    REQUIRE(ctx.has_value());
    REQUIRE(ctx->trace_id == "4bf92f3577b34da6a3ce929d0e0e4736");
    REQUIRE(ctx->span_id == "00f067aa0ba902b7");
    REQUIRE(ctx->parent_span_id.empty());
    REQUIRE(ctx->trace_flags == 0x01);
    REQUIRE(ctx->is_sampled());
    REQUIRE(ctx->is_valid());
}

TEST_CASE("TraceContext: parse unsampled traceparent", "[tracing]") {
    auto ctx = TraceContext::parse_traceparent(
        "00-4bf92f3577b34da6a3ce929d0e0e4736-00f067aa0ba902b7-00");

    REQUIRE(ctx.has_value());
    REQUIRE(ctx->trace_flags == 0x00);
    REQUIRE_FALSE(ctx->is_sampled());
}

TEST_CASE("TraceContext: flags are hexadecimal", "[tracing]") {
    auto ctx = TraceContext::parse_traceparent(
        "00-4bf92f3577b34da6a3ce929d0e0e4736-00f067aa0ba902b7-11");

    REQUIRE(ctx.has_value());
    REQUIRE(ctx->trace_flags == 0x11);
}

TEST_CASE("TraceContext: reject malformed headers", "[tracing]") {
    SECTION("unsupported version") {
        REQUIRE_FALSE(TraceContext::parse_traceparent(
            "01-4bf92f3577b34da6a3ce929d0e0e4736-00f067aa0ba902b7-01").has_value());
    }
    SECTION("too short") {
        REQUIRE_FALSE(TraceContext::parse_traceparent("00-abcd-1234-01").has_value());
    }
    SECTION("all-zero trace_id") {
        REQUIRE_FALSE(TraceContext::parse_traceparent(
            "00-00000000000000000000000000000000-00f067aa0ba902b7-01").has_value());
    }
    SECTION("all-zero span_id") {
        REQUIRE_FALSE(TraceContext::parse_traceparent(
            "00-4bf92f3577b34da6a3ce929d0e0e4736-0000000000000000-01").has_value());
    }
    SECTION("non-hex characters") {
        REQUIRE_FALSE(TraceContext::parse_traceparent(
            "00-zzzzzzzzzzzzzzzzzzzzzzzzzzzzzzzz-00f067aa0ba902b7-01").has_value());
    }
    SECTION("bad separators") {
        REQUIRE_FALSE(TraceContext::parse_traceparent(
            "00_4bf92f3577b34da6a3ce929d0e0e4736_00f067aa0ba902b7_01").has_value());
    }
    SECTION("non-hex flags") {
        REQUIRE_FALSE(TraceContext::parse_traceparent(
            "00-4bf92f3577b34da6a3ce929d0e0e4736-00f067aa0ba902b7-zz").has_value());
    }
}

TEST_CASE("TraceContext: generate_root creates a valid root", "[tracing]") {
    auto ctx = TraceContext::generate_root();

    REQUIRE(ctx.trace_id.size() == 32);
    REQUIRE(ctx.span_id.size() == 16);
    REQUIRE(ctx.is_valid());
    REQUIRE(ctx.is_sampled());
    REQUIRE(ctx.is_root());
}

TEST_CASE("TraceContext: generate unique IDs", "[tracing]") {
    auto ctx1 = TraceContext::generate_root();
    auto ctx2 = TraceContext::generate_root();

    REQUIRE(ctx1.trace_id != ctx2.trace_id);
    REQUIRE(ctx1.span_id != ctx2.span_id);
}

TEST_CASE("TraceContext: child_of keeps the trace and links the parent", "[tracing]") {
    auto parent = TraceContext::parse_traceparent(
        "00-4bf92f3577b34da6a3ce929d0e0e4736-00f067aa0ba902b7-01");
    REQUIRE(parent.has_value());
    parent->tracestate = "vendor=abc";

    auto child = TraceContext::child_of(*parent);

    REQUIRE(child.trace_id == parent->trace_id);
    REQUIRE(child.parent_span_id == parent->span_id);
    REQUIRE(child.span_id != parent->span_id);
    REQUIRE(child.tracestate == "vendor=abc");
    REQUIRE_FALSE(child.is_root());
}

TEST_CASE("TraceContext: child_of an invalid parent starts a new trace", "[tracing]") {
    auto child = TraceContext::child_of(TraceContext{});

    REQUIRE(child.is_valid());
    REQUIRE(child.is_root());
}

TEST_CASE("TraceContext: to_traceparent round-trip", "[tracing]") {
    auto original = TraceContext::generate_root();
    auto header = original.to_traceparent();

    // Format: "00-{32hex}-{16hex}-{2hex}"
    REQUIRE(header.size() == 55);
    REQUIRE(header.substr(0, 3) == "00-");
    REQUIRE(header.substr(53) == "01");

    auto parsed = TraceContext::parse_traceparent(header);
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->trace_id == original.trace_id);
    REQUIRE(parsed->span_id == original.span_id);
}

TEST_CASE("TraceContext: generated id lengths", "[tracing]") {
    REQUIRE(TraceContext::generate_span_id().size() == 16);
    REQUIRE(TraceContext::generate_trace_id().size() == 32);
}

TEST_CASE("TraceContext: is_valid rejects empty IDs", "[tracing]") {
    TraceContext ctx;
    REQUIRE_FALSE(ctx.is_valid());
}

TEST_CASE("TraceContext: is_valid rejects wrong-length IDs", "[tracing]") {
    TraceContext ctx;
    ctx.trace_id = "abcd";
    ctx.span_id = "1234567890abcdef";
    REQUIRE_FALSE(ctx.is_valid());
}
