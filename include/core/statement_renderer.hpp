#pragma once

#include "core/types.hpp"
#include <string>
#include <string_view>

namespace kvtrace {

/**
 * @brief Renders a command batch into a `db.statement` string
 *
 * One line per command, joined with '\n':
 *   OBFUSCATE:  "SET ? ?"           (one '?' per argument)
 *   RAW:        "SET key value"
 *
 * Any AUTH command in the batch replaces the whole statement with "AUTH ?".
 * No truncation happens here; callers bound the length afterwards.
 *
 * Example:
 *   Input:  [[set, "v1", "0"], [incr, "v1"], [get, "v1"]], OBFUSCATE
 *   Output: "SET ? ?\nINCR ?\nGET ?"
 */
class StatementRenderer {
public:
    static constexpr std::string_view kRedactedAuth = "AUTH ?";

    [[nodiscard]] static std::string render(const CommandBatch& batch, StatementPolicy policy);

    /// True if any (normalized) command in the batch is AUTH
    [[nodiscard]] static bool contains_auth(const CommandBatch& batch);

private:
    static std::string render_command(const Command& command, StatementPolicy policy);
};

} // namespace kvtrace
