#include "core/value_size_calculator.hpp"
#include "core/command_normalizer.hpp"
#include "core/statement_renderer.hpp"
#include "core/utils.hpp"

namespace kvtrace {

uint64_t ValueSizeCalculator::byte_size(const Value& value) {
    return std::visit([](const auto& v) -> uint64_t {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate> || std::is_same_v<T, CommandError>) {
            return 0;
        } else if constexpr (std::is_same_v<T, Symbol>) {
            return v.name.size();
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v.size();
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return utils::format_int(v).size();
        } else if constexpr (std::is_same_v<T, double>) {
            return utils::format_double(v).size();
        } else {
            uint64_t total = 0;
            for (const auto& item : v) {
                total += byte_size(item);
            }
            return total;
        }
    }, value.data);
}

uint64_t ValueSizeCalculator::sent_size(const CommandBatch& batch, const OperationSet& tracked) {
    if (StatementRenderer::contains_auth(batch)) {
        return 0;
    }

    uint64_t total = 0;
    for (const auto& entry : batch.entries) {
        const Command& cmd = CommandNormalizer::normalize(entry);
        if (!tracked.contains(cmd.operation) || cmd.args.empty()) continue;

        // Last argument is the value being set (SET key value)
        total += byte_size(cmd.args.back());
    }
    return total;
}

uint64_t ValueSizeCalculator::retrieved_size(const Value& reply,
                                             const CommandBatch& batch,
                                             const OperationSet& tracked) {
    if (batch.size() == 1) {
        return retrieved_size_single(reply, CommandNormalizer::normalize(batch.entries.front()),
                                     tracked);
    }

    static const Value kNoReply;
    const ValueList* replies = reply.is_list() ? &reply.as_list() : nullptr;

    uint64_t total = 0;
    for (size_t i = 0; i < batch.entries.size(); ++i) {
        const Value& item = (replies && i < replies->size()) ? (*replies)[i] : kNoReply;
        total += retrieved_size_single(item, CommandNormalizer::normalize(batch.entries[i]),
                                       tracked);
    }
    return total;
}

uint64_t ValueSizeCalculator::retrieved_size_single(const Value& reply,
                                                    const Command& command,
                                                    const OperationSet& tracked) {
    return tracked.contains(command.operation) ? byte_size(reply) : 0;
}

} // namespace kvtrace
