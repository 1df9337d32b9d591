#include <catch2/catch_test_macros.hpp>
#include "tracing/file_span_sink.hpp"
#include "tracing/memory_span_sink.hpp"
#include "tracing/tracer.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace kvtrace;

namespace {

std::string temp_path(const std::string& name) {
    return (std::filesystem::temp_directory_path() / name).string();
}

std::vector<std::string> read_lines(const std::string& path) {
    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

// Sink whose export always throws
class ThrowingSpanSink : public ISpanSink {
public:
    bool export_span(const SpanData&) override {
        ++attempts;
        throw std::runtime_error("collector unreachable");
    }
    void flush() override {}
    void shutdown() override {}
    std::string name() const override { return "throwing"; }

    int attempts = 0;
};

SpanData sample_span() {
    SpanData span;
    span.context.trace_id = "4bf92f3577b34da6a3ce929d0e0e4736";
    span.context.span_id = "00f067aa0ba902b7";
    span.name = "GET";
    span.kind = SpanKind::CLIENT;
    span.attributes.emplace("db.system", std::string("redis"));
    span.attributes.emplace("net.peer.port", int64_t{6379});
    span.attributes.emplace("db.statement", std::string("GET \"k\"\n"));
    span.start_time = std::chrono::system_clock::now();
    span.end_time = span.start_time + std::chrono::microseconds(42);
    return span;
}

} // anonymous namespace

// ============================================================================
// Tracer + MemorySpanSink
// ============================================================================

TEST_CASE("Tracer: finished span reaches the sink", "[sink]") {
    auto sink = std::make_shared<MemorySpanSink>();
    Tracer tracer(sink);

    auto span = tracer.start_span("GET", {}, SpanKind::CLIENT, {});
    span->set_attribute("db.system", std::string("redis"));
    REQUIRE(sink->size() == 0);

    span->finish();
    REQUIRE(sink->size() == 1);

    const auto exported = sink->spans().front();
    CHECK(exported.name == "GET");
    CHECK(exported.kind == SpanKind::CLIENT);
    CHECK(exported.status == StatusCode::UNSET);
    CHECK(std::get<std::string>(exported.attributes.at("db.system")) == "redis");
    CHECK(exported.end_time >= exported.start_time);
}

TEST_CASE("Tracer: finish is idempotent and ends recording", "[sink]") {
    auto sink = std::make_shared<MemorySpanSink>();
    Tracer tracer(sink);

    auto span = tracer.start_span("SET", {}, SpanKind::CLIENT, {});
    span->finish();
    span->set_attribute("late", std::string("ignored"));
    span->finish();

    REQUIRE(sink->size() == 1);
    CHECK_FALSE(sink->spans().front().attributes.contains("late"));
}

TEST_CASE("Tracer: destroying an unfinished span exports it", "[sink]") {
    auto sink = std::make_shared<MemorySpanSink>();
    Tracer tracer(sink);

    {
        auto span = tracer.start_span("GET", {}, SpanKind::CLIENT, {});
    }
    REQUIRE(sink->size() == 1);
}

TEST_CASE("Tracer: span destructor contains a throwing export", "[sink]") {
    auto sink = std::make_shared<ThrowingSpanSink>();
    Tracer tracer(sink);

    SECTION("implicit finish on destruction does not throw") {
        REQUIRE_NOTHROW([&] {
            auto span = tracer.start_span("GET", {}, SpanKind::CLIENT, {});
        }());
        CHECK(sink->attempts == 1);
    }
    SECTION("explicit finish propagates and is not retried") {
        REQUIRE_NOTHROW([&] {
            auto span = tracer.start_span("GET", {}, SpanKind::CLIENT, {});
            REQUIRE_THROWS_AS(span->finish(), std::runtime_error);
        }());
        CHECK(sink->attempts == 1);
    }
}

TEST_CASE("Tracer: exception events and error status", "[sink]") {
    auto sink = std::make_shared<MemorySpanSink>();
    Tracer tracer(sink);

    auto span = tracer.start_span("INCR", {}, SpanKind::CLIENT, {});
    span->record_exception("CommandError", "ERR value is not an integer");
    span->set_error_status("ERR value is not an integer");
    span->finish();

    const auto exported = sink->spans().front();
    CHECK(exported.status == StatusCode::ERROR);
    CHECK(exported.status_message == "ERR value is not an integer");
    REQUIRE(exported.events.size() == 1);
    CHECK(exported.events[0].name == "exception");
    CHECK(std::get<std::string>(exported.events[0].attributes.at("exception.type")) == "CommandError");
}

TEST_CASE("Tracer: root and child spans", "[sink]") {
    auto sink = std::make_shared<MemorySpanSink>();
    Tracer tracer(sink);

    auto root = tracer.start_span("PIPELINED", {}, SpanKind::CLIENT, {});
    CHECK(root->context().is_root());

    auto child = tracer.start_span("GET", {}, SpanKind::CLIENT, root->context());
    CHECK(child->context().trace_id == root->context().trace_id);
    CHECK(child->context().parent_span_id == root->context().span_id);
}

TEST_CASE("MemorySpanSink: rejects spans after shutdown", "[sink]") {
    MemorySpanSink sink;
    REQUIRE(sink.export_span(sample_span()));
    sink.shutdown();
    CHECK_FALSE(sink.export_span(sample_span()));
    CHECK(sink.size() == 1);

    sink.clear();
    CHECK(sink.size() == 0);
}

// ============================================================================
// FileSpanSink
// ============================================================================

TEST_CASE("FileSpanSink: JSON line format", "[sink]") {
    const auto json = FileSpanSink::to_json(sample_span());

    CHECK(json.starts_with("{\"trace_id\":\"4bf92f3577b34da6a3ce929d0e0e4736\""));
    CHECK(json.find("\"span_id\":\"00f067aa0ba902b7\"") != std::string::npos);
    CHECK(json.find("parent_span_id") == std::string::npos);
    CHECK(json.find("\"name\":\"GET\",\"kind\":\"client\"") != std::string::npos);
    CHECK(json.find("\"duration_us\":42") != std::string::npos);
    CHECK(json.find("\"status\":\"unset\"") != std::string::npos);
    CHECK(json.find("status_message") == std::string::npos);
    CHECK(json.ends_with("\"events\":[]}"));
    CHECK(json.find('\n') == std::string::npos);
}

TEST_CASE("FileSpanSink: attributes are sorted and escaped", "[sink]") {
    const auto json = FileSpanSink::attributes_to_json(sample_span().attributes);
    CHECK(json == "{\"db.statement\":\"GET \\\"k\\\"\\n\","
                  "\"db.system\":\"redis\","
                  "\"net.peer.port\":6379}");
}

TEST_CASE("FileSpanSink: events are serialized", "[sink]") {
    auto span = sample_span();
    span.status = StatusCode::ERROR;
    span.status_message = "boom";
    SpanEvent event;
    event.name = "exception";
    event.attributes.emplace("exception.type", std::string("TransportError"));
    event.timestamp = span.end_time;
    span.events.push_back(event);

    const auto json = FileSpanSink::to_json(span);
    CHECK(json.find("\"status\":\"error\",\"status_message\":\"boom\"") != std::string::npos);
    CHECK(json.find("\"events\":[{\"name\":\"exception\"") != std::string::npos);
    CHECK(json.find("\"exception.type\":\"TransportError\"") != std::string::npos);
}

TEST_CASE("FileSpanSink: writes one line per span", "[sink]") {
    const auto path = temp_path("kvtrace_test_spans.jsonl");
    std::filesystem::remove(path);

    {
        FileSpanSink sink(path);
        REQUIRE(sink.export_span(sample_span()));
        REQUIRE(sink.export_span(sample_span()));
        sink.flush();
        CHECK(sink.written_count() == 2);
        CHECK(sink.name() == "file:" + path);
    }

    const auto lines = read_lines(path);
    REQUIRE(lines.size() == 2);
    for (const auto& line : lines) {
        CHECK(line.starts_with("{\"trace_id\":\"4bf92f3577b34da6a3ce929d0e0e4736\""));
        CHECK(line.find("\"net.peer.port\":6379") != std::string::npos);
    }

    std::filesystem::remove(path);
}

TEST_CASE("FileSpanSink: rejects spans after shutdown", "[sink]") {
    const auto path = temp_path("kvtrace_test_spans_shutdown.jsonl");
    std::filesystem::remove(path);

    FileSpanSink sink(path);
    sink.shutdown();
    CHECK_FALSE(sink.export_span(sample_span()));
    CHECK(sink.written_count() == 0);

    std::filesystem::remove(path);
}

TEST_CASE("FileSpanSink: unopenable path throws", "[sink]") {
    REQUIRE_THROWS_AS(FileSpanSink("/nonexistent_dir_kvtrace/spans.jsonl"), std::runtime_error);
}
