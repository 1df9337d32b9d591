#include "core/command_normalizer.hpp"

#include <format>

namespace kvtrace {

bool CommandNormalizer::is_queued(const Value& entry) {
    if (!entry.is_list()) return false;
    const auto& items = entry.as_list();
    return !items.empty() && items.front().is_list();
}

const Value& CommandNormalizer::normalize(const Value& entry) {
    if (is_queued(entry)) {
        return entry.as_list().front();
    }
    return entry;
}

const Command& CommandNormalizer::normalize(const BatchEntry& entry) {
    if (const auto* queued = std::get_if<QueuedCommand>(&entry)) {
        return queued->command;
    }
    return std::get<Command>(entry);
}

Result<Command> CommandNormalizer::to_command(const Value& entry) {
    const Value& cmd = normalize(entry);
    if (!cmd.is_list()) {
        return Result<Command>::error(ErrorCategory::PARSE_ERROR,
            "Command must be a list of tokens");
    }

    const auto& tokens = cmd.as_list();
    if (tokens.empty()) {
        return Result<Command>::error(ErrorCategory::PARSE_ERROR, "Empty command");
    }

    Command result;
    const Value& op = tokens.front();
    if (op.is_symbol()) {
        result.operation = op.as_symbol().name;
    } else if (op.is_string()) {
        result.operation = op.as_string();
    } else {
        return Result<Command>::error(ErrorCategory::PARSE_ERROR,
            "Command operation must be a symbol or string");
    }

    if (result.operation.empty()) {
        return Result<Command>::error(ErrorCategory::PARSE_ERROR,
            "Command operation is empty");
    }

    result.args.assign(tokens.begin() + 1, tokens.end());
    return Result<Command>::ok(std::move(result));
}

Result<CommandBatch> CommandNormalizer::parse_batch(const Value& raw) {
    if (!raw.is_list()) {
        return Result<CommandBatch>::error(ErrorCategory::PARSE_ERROR,
            "Command batch must be a list of commands");
    }

    const auto& items = raw.as_list();
    CommandBatch batch;
    batch.entries.reserve(items.size());

    for (size_t i = 0; i < items.size(); ++i) {
        auto cmd = to_command(items[i]);
        if (cmd.is_error()) {
            return Result<CommandBatch>::error(cmd.error_category(),
                std::format("Entry {}: {}", i, cmd.error_message()));
        }
        if (is_queued(items[i])) {
            batch.entries.emplace_back(QueuedCommand{std::move(cmd.value())});
        } else {
            batch.entries.emplace_back(std::move(cmd.value()));
        }
    }

    return Result<CommandBatch>::ok(std::move(batch));
}

} // namespace kvtrace
