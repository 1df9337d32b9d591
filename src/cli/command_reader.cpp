#include "cli/command_reader.hpp"
#include "core/utils.hpp"

namespace kvtrace {

CommandReader::CommandReader(std::istream& in, bool queued)
    : in_(in), queued_(queued) {}

std::optional<CommandBatch> CommandReader::next() {
    CommandBatch batch;
    std::string line;
    while (std::getline(in_, line)) {
        ++line_number_;
        line = utils::trim(line);
        if (line.empty()) {
            if (batch.empty()) continue;
            return batch;
        }

        Command command = parse_line(line);
        if (queued_) {
            batch.entries.emplace_back(QueuedCommand{std::move(command)});
        } else {
            batch.entries.emplace_back(std::move(command));
        }
    }

    if (batch.empty()) return std::nullopt;
    return batch;
}

Value CommandReader::parse_token(std::string_view token) {
    if (auto i = utils::try_parse_int<int64_t>(token)) {
        return Value(*i);
    }
    if (token.find_first_of(".eE") != std::string_view::npos) {
        if (auto d = utils::try_parse_double(token)) {
            return Value(*d);
        }
    }
    return Value(token);
}

Command CommandReader::parse_line(std::string_view line) {
    const auto tokens = utils::split_whitespace(line);
    if (tokens.empty()) return Command{};

    ValueList args;
    args.reserve(tokens.size() - 1);
    for (size_t i = 1; i < tokens.size(); ++i) {
        args.push_back(parse_token(tokens[i]));
    }
    return Command(utils::to_lower(tokens.front()), std::move(args));
}

} // namespace kvtrace
