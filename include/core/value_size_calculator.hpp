#pragma once

#include "core/types.hpp"
#include <cstdint>

namespace kvtrace {

/**
 * @brief Byte-size accounting for values sent and retrieved by a batch
 *
 * Sizes follow the wire/display representation, not storage:
 *   string        -> encoded byte length
 *   integer       -> length of its decimal text, sign included (-42 -> 3)
 *   double        -> length of its default text form
 *   list          -> sum of its elements
 *   nil, error    -> 0
 */
class ValueSizeCalculator {
public:
    [[nodiscard]] static uint64_t byte_size(const Value& value);

    /**
     * @brief Size of the values written by tracked commands
     *
     * The last argument of a tracked command is taken as the value being set.
     * Any AUTH command in the batch makes the whole result 0.
     *
     * @param batch Commands in any of the three shapes
     * @param tracked Operations whose last argument counts (e.g. SET)
     */
    [[nodiscard]] static uint64_t sent_size(const CommandBatch& batch, const OperationSet& tracked);

    /**
     * @brief Size of the reply values returned to tracked commands
     *
     * Singleton batches size the whole reply. Pipelined and queued batches are
     * reduced to one singleton subproblem per position: (reply[i], batch[i]).
     *
     * @param reply Single value, or a list aligned with the batch
     * @param batch Commands in any of the three shapes
     * @param tracked Operations whose reply counts (e.g. GET, MGET)
     */
    [[nodiscard]] static uint64_t retrieved_size(const Value& reply,
                                                 const CommandBatch& batch,
                                                 const OperationSet& tracked);

private:
    static uint64_t retrieved_size_single(const Value& reply,
                                          const Command& command,
                                          const OperationSet& tracked);
};

} // namespace kvtrace
