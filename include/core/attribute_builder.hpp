#pragma once

#include "config/config_types.hpp"
#include "core/types.hpp"

namespace kvtrace {

/**
 * @brief Assembles the span attribute map for one command batch
 *
 * Always:        db.system, net.peer.name, net.peer.port
 * Conditional:   db.redis.database_index (db != 0)
 *                peer.service            (configured)
 *                static attributes       (configured, override the above)
 *                db.statement            (policy != OMIT; truncated to 500, UTF-8 safe)
 *                db.set_value_size_bytes (record_value_size)
 *
 * Pure function of its inputs; safe to call concurrently.
 */
class AttributeBuilder {
public:
    [[nodiscard]] static AttributeMap build(const CommandBatch& batch,
                                            const ConnectionOptions& connection,
                                            const InstrumentationConfig& config);

    /// Rendered, truncated and UTF-8-safe statement text
    [[nodiscard]] static std::string statement(const CommandBatch& batch,
                                               StatementPolicy policy);
};

} // namespace kvtrace
