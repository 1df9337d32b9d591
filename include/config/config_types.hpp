#pragma once

#include "core/types.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace kvtrace {

// ============================================================================
// Configuration Types
// ============================================================================

/**
 * @brief Static instrumentation toggles
 *
 * Read-only once loaded; shared by reference across concurrent batches.
 */
struct InstrumentationConfig {
    StatementPolicy db_statement = StatementPolicy::OBFUSCATE;
    bool record_value_size = false;
    std::optional<std::string> peer_service;
    bool trace_root_spans = true;  // Trace even without a valid parent context

    // Commands whose last argument is the value being set
    OperationSet set_value_size_commands{"SET"};
    // Commands whose reply is the value being retrieved
    OperationSet retrieved_value_size_commands{"GET", "MGET"};

    // Merged into every span's attributes (override built-in keys)
    AttributeMap attributes;
};

struct LoggingConfig {
    std::string level = "info";
};

struct ExporterConfig {
    std::string output_file;  // JSONL span file (empty = no file export)
};

// ============================================================================
// KvTraceConfig - Complete parsed configuration
// ============================================================================

struct KvTraceConfig {
    ConnectionOptions connection;
    InstrumentationConfig instrumentation;
    LoggingConfig logging;
    ExporterConfig exporter;
};

} // namespace kvtrace
