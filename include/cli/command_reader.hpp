#pragma once

#include "core/types.hpp"

#include <istream>
#include <optional>
#include <string>
#include <string_view>

namespace kvtrace {

/**
 * @brief Reads command batches from a line-oriented text stream
 *
 * One command per line, tokens separated by spaces or tabs. The first token
 * is the operation; the rest are arguments. A blank (or whitespace-only) line
 * closes the current batch, as does end of input. Consecutive blank lines
 * never produce an empty batch.
 *
 * In queued mode every command is wrapped as a QueuedCommand, so a batch of
 * two or more commands has QUEUED shape.
 */
class CommandReader {
public:
    CommandReader(std::istream& in, bool queued);

    /// Next non-empty batch, or nullopt once the stream is exhausted
    [[nodiscard]] std::optional<CommandBatch> next();

    [[nodiscard]] size_t line_number() const { return line_number_; }

    /**
     * @brief Type one argument token
     *
     * Integers become int64_t, tokens with a '.', 'e' or 'E' that parse as a
     * number become double, everything else stays a string.
     */
    [[nodiscard]] static Value parse_token(std::string_view token);

    /// Operation (lowercased, even if numeric) plus typed arguments
    [[nodiscard]] static Command parse_line(std::string_view line);

private:
    std::istream& in_;
    bool queued_;
    size_t line_number_ = 0;
};

} // namespace kvtrace
