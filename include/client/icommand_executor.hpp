#pragma once

#include "core/types.hpp"

namespace kvtrace {

/**
 * @brief Abstract command execution interface
 *
 * The real client transport sits behind this; InstrumentedClient holds
 * shared_ptr<ICommandExecutor>.
 */
class ICommandExecutor {
public:
    virtual ~ICommandExecutor() = default;

    /**
     * @brief Execute a command batch
     * @param batch Commands in any of the three shapes
     * @return Single reply for a singleton batch, otherwise a list aligned
     *         with the batch. Failed commands appear as CommandError values.
     * @throws TransportError on connection-level failure
     */
    [[nodiscard]] virtual Value execute(const CommandBatch& batch) = 0;
};

} // namespace kvtrace
