#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ingestgate {

// ============================================================================
// Stream lifecycle
// ============================================================================

/**
 * @brief Registry-facing stream state
 *
 * Transitions:
 * - (none) → CONNECTING:   creation started under the per-key lock
 * - CONNECTING → OPEN:     provider returned a stream
 * - OPEN → DEGRADED:       liveness check saw anything but OPEN
 * - DEGRADED/OPEN → CLOSED: explicit close or superseded by recreation
 */
enum class StreamState {
    CONNECTING,
    OPEN,
    DEGRADED,
    CLOSED
};

/**
 * @brief State vocabulary reported by a provider stream
 */
enum class ProviderStreamState {
    UNINITIALIZED,
    OPENED,
    FLUSHING,
    RECOVERING,
    FAILED,
    CLOSED
};

/**
 * @brief What the provider does when the in-flight ceiling is reached
 */
enum class BackpressureMode {
    BLOCK,
    REJECT
};

/// Stream offsets are assigned by the provider, starting at 0 per stream.
using StreamOffset = int64_t;

// ============================================================================
// Record schema
// ============================================================================

enum class FieldType {
    STRING,
    INT32,
    INT64,
    FLOAT,
    DOUBLE,
    BOOL
};

// ============================================================================
// String conversions
// ============================================================================

inline const char* stream_state_to_string(StreamState state) {
    switch (state) {
        case StreamState::CONNECTING: return "CONNECTING";
        case StreamState::OPEN:       return "OPEN";
        case StreamState::DEGRADED:   return "DEGRADED";
        case StreamState::CLOSED:     return "CLOSED";
    }
    return "UNKNOWN";
}

inline const char* provider_state_to_string(ProviderStreamState state) {
    switch (state) {
        case ProviderStreamState::UNINITIALIZED: return "UNINITIALIZED";
        case ProviderStreamState::OPENED:        return "OPENED";
        case ProviderStreamState::FLUSHING:      return "FLUSHING";
        case ProviderStreamState::RECOVERING:    return "RECOVERING";
        case ProviderStreamState::FAILED:        return "FAILED";
        case ProviderStreamState::CLOSED:        return "CLOSED";
    }
    return "UNKNOWN";
}

inline const char* backpressure_mode_to_string(BackpressureMode mode) {
    return mode == BackpressureMode::BLOCK ? "block" : "reject";
}

inline std::optional<BackpressureMode> parse_backpressure_mode(std::string_view s) {
    if (s == "block") return BackpressureMode::BLOCK;
    if (s == "reject") return BackpressureMode::REJECT;
    return std::nullopt;
}

inline const char* field_type_to_string(FieldType type) {
    switch (type) {
        case FieldType::STRING: return "string";
        case FieldType::INT32:  return "int32";
        case FieldType::INT64:  return "int64";
        case FieldType::FLOAT:  return "float";
        case FieldType::DOUBLE: return "double";
        case FieldType::BOOL:   return "bool";
    }
    return "string";
}

/// Unknown type names fall back to STRING.
inline FieldType parse_field_type(std::string_view s) {
    if (s == "int32") return FieldType::INT32;
    if (s == "int64") return FieldType::INT64;
    if (s == "float") return FieldType::FLOAT;
    if (s == "double") return FieldType::DOUBLE;
    if (s == "bool") return FieldType::BOOL;
    return FieldType::STRING;
}

} // namespace ingestgate
