#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <optional>
#include <string>
#include <vector>

namespace kvtrace {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief Loads KvTraceConfig from TOML
 *
 * Sections: [connection], [instrumentation], [instrumentation.attributes],
 * [logging], [exporter]. Missing sections and keys keep their defaults.
 * String values may reference environment variables as ${VAR_NAME}.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        KvTraceConfig config;

        static LoadResult ok(KvTraceConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to kvtrace.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Parse a db_statement option value
     * @return std::nullopt for anything but omit / obfuscate / include
     */
    [[nodiscard]] static std::optional<StatementPolicy> parse_statement_policy(const std::string& value);

    /**
     * @brief Semantic checks on a parsed config
     * @return One message per problem (empty = valid)
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const KvTraceConfig& config);

private:
    static KvTraceConfig extract_all_sections(const toml::table& root);
    static LoadResult validate_and_return(KvTraceConfig config);

    static ConnectionOptions extract_connection(const toml::table& root);
    static InstrumentationConfig extract_instrumentation(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static ExporterConfig extract_exporter(const toml::table& root);
};

} // namespace kvtrace
