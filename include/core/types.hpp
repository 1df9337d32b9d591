#pragma once

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

namespace kvtrace {

// ============================================================================
// Value Model
// ============================================================================

/**
 * @brief Operation identifier token (e.g. `set`, `get`, `auth`)
 *
 * Distinct from a string argument so that the first token of a command can be
 * told apart from its data.
 */
struct Symbol {
    std::string name;

    bool operator==(const Symbol&) const = default;
};

/**
 * @brief Per-command error returned in place of a reply element
 *
 * Carried as data, never thrown. Counts as zero bytes in size accounting.
 */
struct CommandError {
    std::string message;

    bool operator==(const CommandError&) const = default;
};

struct Value;
using ValueList = std::vector<Value>;

/**
 * @brief A command token or reply element
 *
 * Closed set: nil, CommandError, Symbol, string, integer, double, nested list.
 *
 * Usage:
 *   Value cmd = Value::list({Symbol{"set"}, "key", "value"});
 *   Value reply = Value::list({"OK", 1, "1"});
 */
struct Value {
    using Storage = std::variant<
        std::monostate,
        CommandError,
        Symbol,
        std::string,
        int64_t,
        double,
        ValueList>;

    Storage data;

    Value() = default;
    Value(std::nullptr_t) {}
    Value(CommandError v) : data(std::move(v)) {}
    Value(Symbol v) : data(std::move(v)) {}
    Value(const char* v) : data(std::string(v)) {}
    Value(std::string v) : data(std::move(v)) {}
    Value(std::string_view v) : data(std::string(v)) {}
    Value(bool) = delete;

    // Any integral argument (int, long long, size_t, ...) is stored as int64_t
    template<typename T>
        requires std::is_integral_v<T>
    Value(T v) : data(static_cast<int64_t>(v)) {}

    Value(double v) : data(v) {}
    Value(ValueList v) : data(std::move(v)) {}

    [[nodiscard]] static Value list(std::initializer_list<Value> items) {
        return Value(ValueList(items));
    }

    [[nodiscard]] bool is_nil() const { return std::holds_alternative<std::monostate>(data); }
    [[nodiscard]] bool is_error() const { return std::holds_alternative<CommandError>(data); }
    [[nodiscard]] bool is_symbol() const { return std::holds_alternative<Symbol>(data); }
    [[nodiscard]] bool is_string() const { return std::holds_alternative<std::string>(data); }
    [[nodiscard]] bool is_integer() const { return std::holds_alternative<int64_t>(data); }
    [[nodiscard]] bool is_double() const { return std::holds_alternative<double>(data); }
    [[nodiscard]] bool is_list() const { return std::holds_alternative<ValueList>(data); }

    [[nodiscard]] const ValueList& as_list() const { return std::get<ValueList>(data); }
    [[nodiscard]] const std::string& as_string() const { return std::get<std::string>(data); }
    [[nodiscard]] const Symbol& as_symbol() const { return std::get<Symbol>(data); }
    [[nodiscard]] const CommandError& as_error() const { return std::get<CommandError>(data); }

    bool operator==(const Value& other) const { return data == other.data; }
};

// ============================================================================
// Commands and Batches
// ============================================================================

/**
 * @brief Canonical command: operation identifier plus ordered arguments
 */
struct Command {
    std::string operation;
    ValueList args;

    Command() = default;
    Command(std::string op, ValueList arguments)
        : operation(std::move(op)), args(std::move(arguments)) {}
    Command(std::string op, std::initializer_list<Value> arguments)
        : operation(std::move(op)), args(arguments) {}

    /// Case-insensitive operation match ("auth" == "AUTH")
    [[nodiscard]] bool is(std::string_view op) const;

    [[nodiscard]] std::string operation_upper() const;

    /// Raw form: [Symbol(operation), args...]
    [[nodiscard]] Value to_value() const;

    bool operator==(const Command&) const = default;
};

/**
 * @brief Command submitted through a transactional queue
 *
 * Queued submission wraps each command in its own single-entry batch,
 * adding one level of nesting: [[cmd], [cmd], ...].
 */
struct QueuedCommand {
    Command command;

    bool operator==(const QueuedCommand&) const = default;
};

using BatchEntry = std::variant<Command, QueuedCommand>;

enum class BatchShape {
    SINGLETON,
    PIPELINED,
    QUEUED
};

/**
 * @brief Ordered group of commands submitted together
 *
 * Shape is derived from the entries, never stored:
 *   one entry                 -> SINGLETON
 *   every entry queued (N>1)  -> QUEUED
 *   otherwise (incl. empty)   -> PIPELINED
 */
struct CommandBatch {
    std::vector<BatchEntry> entries;

    [[nodiscard]] static CommandBatch single(Command command);
    [[nodiscard]] static CommandBatch pipelined(std::vector<Command> commands);
    [[nodiscard]] static CommandBatch queued(std::vector<Command> commands);

    [[nodiscard]] size_t size() const { return entries.size(); }
    [[nodiscard]] bool empty() const { return entries.empty(); }
    [[nodiscard]] BatchShape shape() const;

    /// Raw nested form, preserving the queued nesting level
    [[nodiscard]] Value to_value() const;
};

// ============================================================================
// Tracked Operations
// ============================================================================

/**
 * @brief Set of operation names, matched case-insensitively
 *
 * Names are stored uppercased.
 */
class OperationSet {
public:
    OperationSet() = default;
    OperationSet(std::initializer_list<std::string_view> names);
    explicit OperationSet(const std::vector<std::string>& names);

    void insert(std::string_view name);
    [[nodiscard]] bool contains(std::string_view name) const;
    [[nodiscard]] bool empty() const { return names_.empty(); }
    [[nodiscard]] size_t size() const { return names_.size(); }

    bool operator==(const OperationSet&) const = default;

private:
    std::unordered_set<std::string> names_;
};

// ============================================================================
// Attributes and Policies
// ============================================================================

using AttributeValue = std::variant<std::string, int64_t>;
using AttributeMap = std::unordered_map<std::string, AttributeValue>;

/**
 * @brief How `db.statement` is produced
 */
enum class StatementPolicy {
    OMIT,       // No statement attribute
    OBFUSCATE,  // Arguments replaced by '?'
    RAW         // Arguments rendered verbatim
};

struct ConnectionOptions {
    std::string host = "127.0.0.1";
    uint16_t port = 6379;
    int64_t db = 0;
};

// ============================================================================
// Utility Functions
// ============================================================================

inline const char* batch_shape_to_string(BatchShape shape) {
    switch (shape) {
        case BatchShape::SINGLETON: return "SINGLETON";
        case BatchShape::PIPELINED: return "PIPELINED";
        case BatchShape::QUEUED: return "QUEUED";
        default: return "UNKNOWN";
    }
}

inline const char* statement_policy_to_string(StatementPolicy policy) {
    switch (policy) {
        case StatementPolicy::OMIT: return "omit";
        case StatementPolicy::OBFUSCATE: return "obfuscate";
        case StatementPolicy::RAW: return "include";
        default: return "unknown";
    }
}

/// Display text of a value as it appears in a raw statement
[[nodiscard]] std::string value_to_string(const Value& value);

[[nodiscard]] std::string attribute_to_string(const AttributeValue& value);

} // namespace kvtrace
