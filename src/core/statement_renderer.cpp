#include "core/statement_renderer.hpp"
#include "core/command_normalizer.hpp"

#include <algorithm>

namespace kvtrace {

static constexpr std::string_view kAuthOperation = "AUTH";

bool StatementRenderer::contains_auth(const CommandBatch& batch) {
    return std::any_of(batch.entries.begin(), batch.entries.end(),
        [](const BatchEntry& entry) {
            return CommandNormalizer::normalize(entry).is(kAuthOperation);
        });
}

std::string StatementRenderer::render(const CommandBatch& batch, StatementPolicy policy) {
    if (policy == StatementPolicy::OMIT) {
        return {};
    }

    // Credentials never reach the statement, whatever else the batch holds
    if (contains_auth(batch)) {
        return std::string(kRedactedAuth);
    }

    std::string statement;
    for (size_t i = 0; i < batch.entries.size(); ++i) {
        if (i > 0) statement += '\n';
        statement += render_command(CommandNormalizer::normalize(batch.entries[i]), policy);
    }
    return statement;
}

std::string StatementRenderer::render_command(const Command& command, StatementPolicy policy) {
    std::string line = command.operation_upper();

    if (policy == StatementPolicy::OBFUSCATE) {
        line.reserve(line.size() + command.args.size() * 2);
        for (size_t i = 0; i < command.args.size(); ++i) {
            line += " ?";
        }
        return line;
    }

    for (const auto& arg : command.args) {
        line += ' ';
        line += value_to_string(arg);
    }
    return line;
}

} // namespace kvtrace
