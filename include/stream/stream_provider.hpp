#pragma once

#include "config/credential_source.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "schema/table_schema.hpp"

#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <string>

namespace ingestgate {

/**
 * @brief Immutable metadata needed to create a stream for one destination
 *
 * Passed through to the provider unchanged. The schema is resolved once at
 * configuration load, never per request.
 */
struct StreamDescriptor {
    std::string table_name;     // Physical sink address (fully qualified table)
    TableSchemaPtr schema;      // Wire schema reference
    std::string message_name;   // Human-readable record type name
};

/// Invoked on the provider's delivery path with the highest durable offset.
/// Must not block, perform I/O, or take registry locks.
using AckCallback = std::function<void(StreamOffset)>;

/**
 * @brief Operational parameters fixed at stream creation
 */
struct StreamOptions {
    size_t max_inflight_records = 50000;   // Backpressure threshold, enforced by the provider
    bool recovery = true;                  // Transport-level automatic recovery
    BackpressureMode backpressure = BackpressureMode::BLOCK;
    AckCallback ack_callback;
};

/**
 * @brief One provider-created, ordered, append-only stream
 *
 * Implementations must accept concurrent ingest() calls and deliver records
 * in the order they were accepted.
 */
class IIngestStream {
public:
    virtual ~IIngestStream() = default;

    [[nodiscard]] virtual const std::string& stream_id() const = 0;

    [[nodiscard]] virtual ProviderStreamState state() const = 0;

    /**
     * @brief Submit one record
     * @return Future resolving to the record's offset once durable, or holding
     *         the provider's exception if the stream fails first
     */
    [[nodiscard]] virtual Result<std::shared_future<StreamOffset>> ingest(Record record) = 0;

    /// Block until every accepted record is durable.
    [[nodiscard]] virtual Status flush() = 0;

    /// Release transport resources. Safe to call more than once.
    [[nodiscard]] virtual Status close() = 0;
};

/**
 * @brief Factory for provider streams (the external transport)
 */
class IStreamProvider {
public:
    virtual ~IStreamProvider() = default;

    [[nodiscard]] virtual Result<std::unique_ptr<IIngestStream>> create_stream(
        const Credentials& credentials,
        const StreamDescriptor& descriptor,
        const StreamOptions& options) = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace ingestgate
