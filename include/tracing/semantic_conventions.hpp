#pragma once

#include <cstddef>
#include <string_view>

namespace kvtrace::semconv {

// ============================================================================
// Attribute Keys
// ============================================================================

inline constexpr std::string_view kDbSystem              = "db.system";
inline constexpr std::string_view kDbStatement           = "db.statement";
inline constexpr std::string_view kDbRedisDatabaseIndex  = "db.redis.database_index";
inline constexpr std::string_view kDbSetValueSize        = "db.set_value_size_bytes";
inline constexpr std::string_view kDbRetrievedValueSize  = "db.retrieved_value_size_bytes";
inline constexpr std::string_view kNetPeerName           = "net.peer.name";
inline constexpr std::string_view kNetPeerPort           = "net.peer.port";
inline constexpr std::string_view kPeerService           = "peer.service";

inline constexpr std::string_view kExceptionType         = "exception.type";
inline constexpr std::string_view kExceptionMessage      = "exception.message";

// ============================================================================
// Values
// ============================================================================

inline constexpr std::string_view kDbSystemRedis         = "redis";
inline constexpr std::string_view kPipelinedSpanName     = "PIPELINED";
inline constexpr std::string_view kExceptionEventName    = "exception";

inline constexpr size_t kMaxStatementLength              = 500;

} // namespace kvtrace::semconv
