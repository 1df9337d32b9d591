#pragma once

#include "client/icommand_executor.hpp"
#include "config/config_types.hpp"
#include "tracing/span.hpp"

#include <memory>

namespace kvtrace {

/**
 * @brief Traces command execution without changing it
 *
 * Two entry points, mirroring how a client submits work:
 * - process():        one command, span named after the operation ("GET")
 * - call_pipelined(): a pipelined or queued batch, span named "PIPELINED"
 *
 * Both return the executor's reply unchanged and rethrow its exceptions.
 * Nothing is traced when root spans are disabled and the caller has no valid
 * parent context.
 */
class InstrumentedClient {
public:
    InstrumentedClient(std::shared_ptr<ICommandExecutor> executor,
                       std::shared_ptr<ITracer> tracer,
                       InstrumentationConfig config,
                       ConnectionOptions connection);

    /**
     * @brief Execute a single command under its own span
     *
     * Batches of more than one entry are executed untraced; their span belongs
     * to call_pipelined().
     */
    Value process(const CommandBatch& batch, const TraceContext& parent = {});

    /// Execute a pipelined/queued batch under one "PIPELINED" span
    Value call_pipelined(const CommandBatch& batch, const TraceContext& parent = {});

    [[nodiscard]] const InstrumentationConfig& config() const { return config_; }
    [[nodiscard]] const ConnectionOptions& connection() const { return connection_; }

private:
    [[nodiscard]] bool should_trace(const TraceContext& parent) const;

    /// Execute under @p span, recording transport failures before rethrowing
    Value execute_traced(ISpan& span, const CommandBatch& batch);

    void record_retrieved_size(ISpan& span, const Value& reply, const CommandBatch& batch) const;

    std::shared_ptr<ICommandExecutor> executor_;
    std::shared_ptr<ITracer> tracer_;
    InstrumentationConfig config_;
    ConnectionOptions connection_;
};

} // namespace kvtrace
