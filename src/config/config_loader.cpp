#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace kvtrace {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 *
 * Unset variables expand to the empty string.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_node(toml::node& node);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto&& [key, val] : tbl) {
        expand_env_vars_in_node(val);
    }
}

void expand_env_vars_in_node(toml::node& node) {
    if (auto* s = node.as_string()) {
        auto expanded = expand_env_vars(s->get());
        if (expanded != s->get()) {
            *s = std::move(expanded);
        }
    } else if (auto* tbl = node.as_table()) {
        expand_env_vars_recursive(*tbl);
    } else if (auto* arr = node.as_array()) {
        for (auto& elem : *arr) {
            expand_env_vars_in_node(elem);
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    try {
        auto result = toml::parse(content);
        expand_env_vars_recursive(result);
        return result;
    } catch (const toml::parse_error& e) {
        throw std::runtime_error(std::format("{} (line {}, column {})",
            e.description(), e.source().begin.line, e.source().begin.column));
    }
}

toml::table parse_toml_file(const std::string& file_path) {
    try {
        auto result = toml::parse_file(file_path);
        expand_env_vars_recursive(result);
        return result;
    } catch (const toml::parse_error& e) {
        throw std::runtime_error(std::format("{}: {} (line {}, column {})",
            file_path, e.description(), e.source().begin.line, e.source().begin.column));
    }
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

std::optional<std::string> toml_optional_string(const toml::table& tbl, const std::string_view key) {
    if (const auto* v = tbl[key].as_string()) {
        return std::string(v->get());
    }
    return std::nullopt;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Helpers ---------------------------------------------------------------

std::optional<StatementPolicy> ConfigLoader::parse_statement_policy(const std::string& value) {
    const std::string lower = utils::to_lower(value);

    static const std::unordered_map<std::string, StatementPolicy> lookup = {
        {"omit",      StatementPolicy::OMIT},
        {"obfuscate", StatementPolicy::OBFUSCATE},
        {"include",   StatementPolicy::RAW},
        {"raw",       StatementPolicy::RAW},
    };

    const auto it = lookup.find(lower);
    return (it != lookup.end()) ? std::make_optional(it->second) : std::nullopt;
}

// ---- Section extractors ----------------------------------------------------

ConnectionOptions ConfigLoader::extract_connection(const toml::table& root) {
    ConnectionOptions cfg;
    const auto* connection = root["connection"].as_table();
    if (!connection) return cfg;
    const auto& c = *connection;

    cfg.host = c["host"].value_or("127.0.0.1"s);

    const auto port = c["port"].value_or(int64_t{6379});
    if (port < 1 || port > 65535) {
        throw std::runtime_error(std::format("connection.port must be 1-65535, got {}", port));
    }
    cfg.port = static_cast<uint16_t>(port);
    cfg.db = c["db"].value_or(int64_t{0});
    return cfg;
}

InstrumentationConfig ConfigLoader::extract_instrumentation(const toml::table& root) {
    InstrumentationConfig cfg;
    const auto* instrumentation = root["instrumentation"].as_table();
    if (!instrumentation) return cfg;
    const auto& s = *instrumentation;

    if (auto policy_str = toml_optional_string(s, "db_statement")) {
        if (auto policy = parse_statement_policy(*policy_str)) {
            cfg.db_statement = *policy;
        } else {
            utils::log::warn(std::format(
                "instrumentation.db_statement: unknown value '{}', using '{}'",
                *policy_str, statement_policy_to_string(cfg.db_statement)));
        }
    }

    cfg.record_value_size = s["record_value_size"].value_or(false);
    cfg.trace_root_spans = s["trace_root_spans"].value_or(true);
    cfg.peer_service = toml_optional_string(s, "peer_service");

    if (s["set_value_size_commands"].as_array()) {
        cfg.set_value_size_commands = OperationSet(toml_string_array(s, "set_value_size_commands"));
    }
    if (s["retrieved_value_size_commands"].as_array()) {
        cfg.retrieved_value_size_commands =
            OperationSet(toml_string_array(s, "retrieved_value_size_commands"));
    }

    if (const auto* attrs = s["attributes"].as_table()) {
        for (auto&& [key, val] : *attrs) {
            const std::string name(key.str());
            if (val.is_string()) {
                cfg.attributes.insert_or_assign(name, std::string(val.as_string()->get()));
            } else if (val.is_integer()) {
                cfg.attributes.insert_or_assign(name, *val.value<int64_t>());
            } else if (val.is_boolean()) {
                cfg.attributes.insert_or_assign(name, std::string(utils::booltostr(*val.value<bool>())));
            } else {
                utils::log::warn(std::format(
                    "instrumentation.attributes.{}: only string, integer and boolean values are supported",
                    name));
            }
        }
    }

    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

ExporterConfig ConfigLoader::extract_exporter(const toml::table& root) {
    ExporterConfig cfg;
    const auto* exporter = root["exporter"].as_table();
    if (!exporter) return cfg;

    cfg.output_file = (*exporter)["output_file"].value_or(""s);
    return cfg;
}

KvTraceConfig ConfigLoader::extract_all_sections(const toml::table& root) {
    KvTraceConfig config;
    config.connection = extract_connection(root);
    config.instrumentation = extract_instrumentation(root);
    config.logging = extract_logging(root);
    config.exporter = extract_exporter(root);
    return config;
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const KvTraceConfig& config) {
    std::vector<std::string> errors;

    if (config.connection.host.empty()) {
        errors.emplace_back("connection.host must not be empty");
    }
    if (config.connection.db < 0) {
        errors.push_back(std::format("connection.db must be >= 0, got {}", config.connection.db));
    }
    if (config.instrumentation.peer_service && config.instrumentation.peer_service->empty()) {
        errors.emplace_back("instrumentation.peer_service must not be empty when set");
    }
    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be debug, info, warn or error, got '{}'", config.logging.level));
    }

    return errors;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(KvTraceConfig config) {
    const auto errors = validate_config(config);
    if (errors.empty()) {
        return LoadResult::ok(std::move(config));
    }

    std::string message = "Config validation failed:";
    for (const auto& err : errors) {
        message += "\n  - " + err;
    }
    return LoadResult::error(std::move(message));
}

} // namespace kvtrace
