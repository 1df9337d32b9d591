#include <catch2/catch_test_macros.hpp>
#include "core/command_normalizer.hpp"

using namespace kvtrace;

namespace {

Value set_cmd() { return Value::list({Symbol{"set"}, "v1", "0"}); }
Value incr_cmd() { return Value::list({Symbol{"incr"}, "v1"}); }
Value get_cmd() { return Value::list({Symbol{"get"}, "v1"}); }

} // anonymous namespace

// ============================================================================
// Structural normalization
// ============================================================================

TEST_CASE("Normalizer: plain command passes through", "[normalizer]") {
    const Value cmd = set_cmd();
    REQUIRE_FALSE(CommandNormalizer::is_queued(cmd));
    REQUIRE(CommandNormalizer::normalize(cmd) == cmd);
}

TEST_CASE("Normalizer: queued entry is unwrapped", "[normalizer]") {
    const Value queued = Value::list({set_cmd()});
    REQUIRE(CommandNormalizer::is_queued(queued));
    REQUIRE(CommandNormalizer::normalize(queued) == set_cmd());
}

TEST_CASE("Normalizer: normalize is idempotent", "[normalizer]") {
    const Value queued = Value::list({get_cmd()});
    const Value& once = CommandNormalizer::normalize(queued);
    const Value& twice = CommandNormalizer::normalize(once);
    REQUIRE(once == twice);
    REQUIRE(twice == get_cmd());
}

TEST_CASE("Normalizer: non-list values are not queued", "[normalizer]") {
    REQUIRE_FALSE(CommandNormalizer::is_queued(Value("get")));
    REQUIRE_FALSE(CommandNormalizer::is_queued(Value()));
    REQUIRE_FALSE(CommandNormalizer::is_queued(Value(ValueList{})));
}

TEST_CASE("Normalizer: typed entries yield their command", "[normalizer]") {
    const Command cmd("get", {"v1"});
    const BatchEntry plain = cmd;
    const BatchEntry queued = QueuedCommand{cmd};

    REQUIRE(CommandNormalizer::normalize(plain) == cmd);
    REQUIRE(CommandNormalizer::normalize(queued) == cmd);
}

// ============================================================================
// to_command
// ============================================================================

TEST_CASE("Normalizer: to_command splits operation and args", "[normalizer]") {
    auto result = CommandNormalizer::to_command(set_cmd());
    REQUIRE(result.is_ok());
    CHECK(result.value().operation == "set");
    REQUIRE(result.value().args.size() == 2);
    CHECK(result.value().args[0] == Value("v1"));
    CHECK(result.value().args[1] == Value("0"));
}

TEST_CASE("Normalizer: to_command accepts string operation", "[normalizer]") {
    auto result = CommandNormalizer::to_command(Value::list({"GET", "key"}));
    REQUIRE(result.is_ok());
    CHECK(result.value().is("get"));
}

TEST_CASE("Normalizer: to_command rejects malformed entries", "[normalizer]") {
    SECTION("not a list") {
        auto result = CommandNormalizer::to_command(Value("get"));
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::PARSE_ERROR);
    }
    SECTION("empty list") {
        auto result = CommandNormalizer::to_command(Value(ValueList{}));
        REQUIRE(result.is_error());
        CHECK(result.error_message() == "Empty command");
    }
    SECTION("numeric operation") {
        auto result = CommandNormalizer::to_command(Value::list({42, "key"}));
        REQUIRE(result.is_error());
    }
    SECTION("empty operation") {
        auto result = CommandNormalizer::to_command(Value::list({Symbol{""}}));
        REQUIRE(result.is_error());
    }
}

// ============================================================================
// parse_batch
// ============================================================================

TEST_CASE("Normalizer: parse pipelined batch", "[normalizer]") {
    const Value raw = Value::list({set_cmd(), incr_cmd(), get_cmd()});
    auto result = CommandNormalizer::parse_batch(raw);

    REQUIRE(result.is_ok());
    const auto& batch = result.value();
    REQUIRE(batch.size() == 3);
    CHECK(batch.shape() == BatchShape::PIPELINED);
    CHECK(CommandNormalizer::normalize(batch.entries[1]).operation == "incr");
}

TEST_CASE("Normalizer: parse queued batch", "[normalizer]") {
    const Value raw = Value::list({
        Value::list({set_cmd()}),
        Value::list({incr_cmd()}),
        Value::list({get_cmd()}),
    });
    auto result = CommandNormalizer::parse_batch(raw);

    REQUIRE(result.is_ok());
    CHECK(result.value().shape() == BatchShape::QUEUED);
    // Round trip keeps the extra nesting level
    CHECK(result.value().to_value() == raw);
}

TEST_CASE("Normalizer: queued and pipelined batches hold the same commands", "[normalizer]") {
    auto pipelined = CommandNormalizer::parse_batch(Value::list({set_cmd(), get_cmd()}));
    auto queued = CommandNormalizer::parse_batch(
        Value::list({Value::list({set_cmd()}), Value::list({get_cmd()})}));

    REQUIRE(pipelined.is_ok());
    REQUIRE(queued.is_ok());
    for (size_t i = 0; i < 2; ++i) {
        CHECK(CommandNormalizer::normalize(pipelined.value().entries[i]) ==
              CommandNormalizer::normalize(queued.value().entries[i]));
    }
}

TEST_CASE("Normalizer: parse singleton batch", "[normalizer]") {
    auto result = CommandNormalizer::parse_batch(Value::list({get_cmd()}));
    REQUIRE(result.is_ok());
    CHECK(result.value().shape() == BatchShape::SINGLETON);
}

TEST_CASE("Normalizer: empty batch is pipelined", "[normalizer]") {
    auto result = CommandNormalizer::parse_batch(Value(ValueList{}));
    REQUIRE(result.is_ok());
    CHECK(result.value().empty());
    CHECK(result.value().shape() == BatchShape::PIPELINED);
}

TEST_CASE("Normalizer: parse_batch reports the failing entry", "[normalizer]") {
    auto result = CommandNormalizer::parse_batch(
        Value::list({set_cmd(), Value(ValueList{})}));
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::PARSE_ERROR);
    CHECK(result.error_message() == "Entry 1: Empty command");
}

TEST_CASE("Normalizer: parse_batch rejects a non-list batch", "[normalizer]") {
    auto result = CommandNormalizer::parse_batch(Value(7));
    REQUIRE(result.is_error());
}

TEST_CASE("Normalizer: mixed entries form a pipelined batch", "[normalizer]") {
    auto result = CommandNormalizer::parse_batch(
        Value::list({set_cmd(), Value::list({get_cmd()})}));
    REQUIRE(result.is_ok());
    CHECK(result.value().shape() == BatchShape::PIPELINED);
    CHECK(std::holds_alternative<QueuedCommand>(result.value().entries[1]));
}
