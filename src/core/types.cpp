#include "core/types.hpp"
#include "core/utils.hpp"

#include <algorithm>

namespace kvtrace {

// ============================================================================
// Command
// ============================================================================

bool Command::is(std::string_view op) const {
    return utils::iequals(operation, op);
}

std::string Command::operation_upper() const {
    return utils::to_upper(operation);
}

Value Command::to_value() const {
    ValueList tokens;
    tokens.reserve(args.size() + 1);
    tokens.emplace_back(Symbol{operation});
    tokens.insert(tokens.end(), args.begin(), args.end());
    return Value(std::move(tokens));
}

// ============================================================================
// CommandBatch
// ============================================================================

CommandBatch CommandBatch::single(Command command) {
    CommandBatch batch;
    batch.entries.emplace_back(std::move(command));
    return batch;
}

CommandBatch CommandBatch::pipelined(std::vector<Command> commands) {
    CommandBatch batch;
    batch.entries.reserve(commands.size());
    for (auto& cmd : commands) {
        batch.entries.emplace_back(std::move(cmd));
    }
    return batch;
}

CommandBatch CommandBatch::queued(std::vector<Command> commands) {
    CommandBatch batch;
    batch.entries.reserve(commands.size());
    for (auto& cmd : commands) {
        batch.entries.emplace_back(QueuedCommand{std::move(cmd)});
    }
    return batch;
}

BatchShape CommandBatch::shape() const {
    if (entries.size() == 1) return BatchShape::SINGLETON;
    if (entries.empty()) return BatchShape::PIPELINED;

    const bool all_queued = std::all_of(entries.begin(), entries.end(),
        [](const BatchEntry& e) { return std::holds_alternative<QueuedCommand>(e); });
    return all_queued ? BatchShape::QUEUED : BatchShape::PIPELINED;
}

Value CommandBatch::to_value() const {
    ValueList raw;
    raw.reserve(entries.size());
    for (const auto& entry : entries) {
        if (const auto* queued = std::get_if<QueuedCommand>(&entry)) {
            raw.emplace_back(ValueList{queued->command.to_value()});
        } else {
            raw.push_back(std::get<Command>(entry).to_value());
        }
    }
    return Value(std::move(raw));
}

// ============================================================================
// OperationSet
// ============================================================================

OperationSet::OperationSet(std::initializer_list<std::string_view> names) {
    for (const auto name : names) {
        insert(name);
    }
}

OperationSet::OperationSet(const std::vector<std::string>& names) {
    for (const auto& name : names) {
        insert(name);
    }
}

void OperationSet::insert(std::string_view name) {
    names_.insert(utils::to_upper(name));
}

bool OperationSet::contains(std::string_view name) const {
    return names_.contains(utils::to_upper(name));
}

// ============================================================================
// Display Helpers
// ============================================================================

namespace {

void append_value(std::string& out, const Value& value) {
    std::visit([&out](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            // nil renders as nothing
        } else if constexpr (std::is_same_v<T, CommandError>) {
            out += v.message;
        } else if constexpr (std::is_same_v<T, Symbol>) {
            out += v.name;
        } else if constexpr (std::is_same_v<T, std::string>) {
            out += v;
        } else if constexpr (std::is_same_v<T, int64_t>) {
            out += utils::format_int(v);
        } else if constexpr (std::is_same_v<T, double>) {
            out += utils::format_double(v);
        } else {
            // Nested lists flatten into the same space-separated run
            for (size_t i = 0; i < v.size(); ++i) {
                if (i > 0) out += ' ';
                append_value(out, v[i]);
            }
        }
    }, value.data);
}

} // anonymous namespace

std::string value_to_string(const Value& value) {
    std::string out;
    append_value(out, value);
    return out;
}

std::string attribute_to_string(const AttributeValue& value) {
    if (const auto* s = std::get_if<std::string>(&value)) {
        return *s;
    }
    return utils::format_int(std::get<int64_t>(value));
}

} // namespace kvtrace
