#include "cli/command_reader.hpp"
#include "config/config_loader.hpp"
#include "core/attribute_builder.hpp"
#include "core/command_normalizer.hpp"
#include "core/utils.hpp"
#include "tracing/file_span_sink.hpp"
#include "tracing/semantic_conventions.hpp"
#include "tracing/tracer.hpp"

#include <cstdlib>
#include <format>
#include <iostream>
#include <memory>
#include <string>

using namespace kvtrace;

namespace {

struct CliOptions {
    std::string config_path;
    bool queued = false;
};

void print_usage(const char* prog) {
    std::cerr << std::format(
        "Usage: {} [--config path] [--queued]\n"
        "\n"
        "Reads commands from stdin, one per line (tokens separated by spaces).\n"
        "A blank line or end of input closes a batch; each batch prints one JSON\n"
        "object with its span attributes.\n"
        "\n"
        "  --config path   TOML configuration (default: built-in defaults)\n"
        "  --queued        Submit commands as queued (MULTI-style) entries\n",
        prog);
}

void emit_batch(const CommandBatch& batch, const KvTraceConfig& config, ITracer* tracer) {
    auto attributes = AttributeBuilder::build(batch, config.connection, config.instrumentation);
    std::cout << FileSpanSink::attributes_to_json(attributes) << '\n';

    if (tracer) {
        const std::string span_name = batch.size() == 1
            ? CommandNormalizer::normalize(batch.entries.front()).operation_upper()
            : std::string(semconv::kPipelinedSpanName);
        tracer->start_span(span_name, std::move(attributes), SpanKind::CLIENT, {})->finish();
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CliOptions options;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            options.config_path = argv[++i];
        } else if (arg == "--queued") {
            options.queued = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return EXIT_SUCCESS;
        } else {
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }
    }

    KvTraceConfig config;
    if (!options.config_path.empty()) {
        auto result = ConfigLoader::load_from_file(options.config_path);
        if (!result.success) {
            utils::log::error(result.error_message);
            return EXIT_FAILURE;
        }
        config = std::move(result.config);
    }

    if (auto level = utils::log::parse_level(config.logging.level)) {
        utils::log::set_level(*level);
    }
    utils::log::debug(std::format("db_statement={} record_value_size={}",
        statement_policy_to_string(config.instrumentation.db_statement),
        utils::booltostr(config.instrumentation.record_value_size)));

    std::shared_ptr<FileSpanSink> sink;
    std::unique_ptr<Tracer> tracer;
    if (!config.exporter.output_file.empty()) {
        try {
            sink = std::make_shared<FileSpanSink>(config.exporter.output_file);
        } catch (const std::exception& e) {
            utils::log::error(e.what());
            return EXIT_FAILURE;
        }
        tracer = std::make_unique<Tracer>(sink);
        utils::log::info(std::format("Exporting spans to {}", config.exporter.output_file));
    }

    CommandReader reader(std::cin, options.queued);
    size_t batches = 0;
    while (auto batch = reader.next()) {
        emit_batch(*batch, config, tracer.get());
        ++batches;
    }
    utils::log::debug(std::format("{} batch(es) read from {} line(s)", batches, reader.line_number()));

    if (sink) {
        sink->shutdown();
        utils::log::debug(std::format("{} span(s) written", sink->written_count()));
    }
    return EXIT_SUCCESS;
}
