#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

namespace kvtrace {

/**
 * @brief Reduces every batch entry to a bare command
 *
 * Queued submission adds one level of nesting around each command:
 *   pipelined: [[set, "v1", "0"], [incr, "v1"], [get, "v1"]]
 *   queued:    [[[set, "v1", "0"]], [[incr, "v1"]], [[get, "v1"]]]
 *
 * An entry is queued-wrapped iff it is a list whose first element is itself a
 * list. normalize() strips that level and is idempotent.
 */
class CommandNormalizer {
public:
    /**
     * @brief Structural form: unwrap a queued entry, otherwise pass through
     * @return Reference into @p entry (no copy)
     */
    [[nodiscard]] static const Value& normalize(const Value& entry);

    /// Typed form: the command inside either batch entry variant
    [[nodiscard]] static const Command& normalize(const BatchEntry& entry);

    /// True if @p entry carries the extra queued nesting level
    [[nodiscard]] static bool is_queued(const Value& entry);

    /**
     * @brief Convert one raw entry into a canonical command
     *
     * The first token must be a Symbol or a string.
     */
    [[nodiscard]] static Result<Command> to_command(const Value& entry);

    /**
     * @brief Convert a raw nested batch into a typed CommandBatch
     * @param raw List of entries, each a command or a queued-wrapped command
     * @return PARSE_ERROR for shapes outside singleton/pipelined/queued
     */
    [[nodiscard]] static Result<CommandBatch> parse_batch(const Value& raw);
};

} // namespace kvtrace
