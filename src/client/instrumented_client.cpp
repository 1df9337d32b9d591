#include "client/instrumented_client.hpp"
#include "core/attribute_builder.hpp"
#include "core/command_normalizer.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "core/value_size_calculator.hpp"
#include "tracing/semantic_conventions.hpp"

#include <format>
#include <stdexcept>

namespace kvtrace {

InstrumentedClient::InstrumentedClient(std::shared_ptr<ICommandExecutor> executor,
                                       std::shared_ptr<ITracer> tracer,
                                       InstrumentationConfig config,
                                       ConnectionOptions connection)
    : executor_(std::move(executor)),
      tracer_(std::move(tracer)),
      config_(std::move(config)),
      connection_(std::move(connection)) {
    if (!executor_) {
        throw std::invalid_argument("InstrumentedClient requires a command executor");
    }
    if (!tracer_) {
        throw std::invalid_argument("InstrumentedClient requires a tracer");
    }
}

bool InstrumentedClient::should_trace(const TraceContext& parent) const {
    return config_.trace_root_spans || parent.is_valid();
}

Value InstrumentedClient::process(const CommandBatch& batch, const TraceContext& parent) {
    if (!should_trace(parent) || batch.size() != 1) {
        utils::log::debug(std::format("Untraced {} batch of {} command(s)",
                                      batch_shape_to_string(batch.shape()), batch.size()));
        return executor_->execute(batch);
    }

    const Command& command = CommandNormalizer::normalize(batch.entries.front());
    auto span = tracer_->start_span(command.operation_upper(),
                                    AttributeBuilder::build(batch, connection_, config_),
                                    SpanKind::CLIENT, parent);

    Value reply = execute_traced(*span, batch);

    if (reply.is_error()) {
        const auto& message = reply.as_error().message;
        span->record_exception("CommandError", message);
        span->set_error_status(message);
    }
    record_retrieved_size(*span, reply, batch);

    span->finish();
    return reply;
}

Value InstrumentedClient::call_pipelined(const CommandBatch& batch, const TraceContext& parent) {
    if (!should_trace(parent)) {
        utils::log::debug(std::format("Untraced pipeline of {} command(s)", batch.size()));
        return executor_->execute(batch);
    }

    auto span = tracer_->start_span(std::string(semconv::kPipelinedSpanName),
                                    AttributeBuilder::build(batch, connection_, config_),
                                    SpanKind::CLIENT, parent);

    Value reply = execute_traced(*span, batch);
    record_retrieved_size(*span, reply, batch);

    span->finish();
    return reply;
}

Value InstrumentedClient::execute_traced(ISpan& span, const CommandBatch& batch) {
    try {
        return executor_->execute(batch);
    } catch (const TransportError& e) {
        utils::log::error(std::format("Transport failure on {} batch: {}",
                                      batch_shape_to_string(batch.shape()), e.what()));
        span.record_exception("TransportError", e.what());
        span.set_error_status(e.what());
        span.finish();
        throw;
    } catch (const std::exception& e) {
        span.record_exception("std::exception", e.what());
        span.set_error_status(e.what());
        span.finish();
        throw;
    }
}

void InstrumentedClient::record_retrieved_size(ISpan& span, const Value& reply,
                                               const CommandBatch& batch) const {
    if (!config_.record_value_size) return;

    const auto retrieved = ValueSizeCalculator::retrieved_size(
        reply, batch, config_.retrieved_value_size_commands);
    span.set_attribute(std::string(semconv::kDbRetrievedValueSize),
                       static_cast<int64_t>(retrieved));
}

} // namespace kvtrace
