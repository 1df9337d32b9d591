#include "core/attribute_builder.hpp"
#include "core/statement_renderer.hpp"
#include "core/text_transforms.hpp"
#include "core/value_size_calculator.hpp"
#include "tracing/semantic_conventions.hpp"

namespace kvtrace {

std::string AttributeBuilder::statement(const CommandBatch& batch, StatementPolicy policy) {
    std::string rendered = StatementRenderer::render(batch, policy);
    return text::utf8_encode(text::truncate(rendered, semconv::kMaxStatementLength));
}

AttributeMap AttributeBuilder::build(const CommandBatch& batch,
                                     const ConnectionOptions& connection,
                                     const InstrumentationConfig& config) {
    AttributeMap attrs;
    attrs.reserve(8 + config.attributes.size());

    attrs.emplace(semconv::kDbSystem, std::string(semconv::kDbSystemRedis));
    attrs.emplace(semconv::kNetPeerName, connection.host);
    attrs.emplace(semconv::kNetPeerPort, static_cast<int64_t>(connection.port));

    // Database 0 is the default and not worth recording
    if (connection.db != 0) {
        attrs.emplace(semconv::kDbRedisDatabaseIndex, connection.db);
    }
    if (config.peer_service) {
        attrs.emplace(semconv::kPeerService, *config.peer_service);
    }
    for (const auto& [key, value] : config.attributes) {
        attrs.insert_or_assign(key, value);
    }

    if (config.db_statement != StatementPolicy::OMIT) {
        attrs.insert_or_assign(std::string(semconv::kDbStatement),
                               statement(batch, config.db_statement));
    }

    if (config.record_value_size) {
        const auto sent = ValueSizeCalculator::sent_size(batch, config.set_value_size_commands);
        attrs.insert_or_assign(std::string(semconv::kDbSetValueSize),
                               static_cast<int64_t>(sent));
    }

    return attrs;
}

} // namespace kvtrace
