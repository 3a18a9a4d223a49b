#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <chrono>
#include <exception>
#include <future>

namespace ingestgate {

/**
 * @brief Caller-visible handle on one submitted record
 *
 * Resolves with the record's offset once the provider reports it durable,
 * or with an error if the stream fails first. Dropping it is fire-and-forget.
 * After close_all() an unresolved PendingIngestion may never resolve; callers
 * that need a bound use wait_for().
 */
class PendingIngestion {
public:
    PendingIngestion() = default;
    explicit PendingIngestion(std::shared_future<StreamOffset> future)
        : future_(std::move(future)) {}

    [[nodiscard]] bool valid() const { return future_.valid(); }

    [[nodiscard]] bool is_ready() const {
        return future_.valid() &&
               future_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }

    /// Block until durable (unbounded).
    [[nodiscard]] Result<StreamOffset> wait() const {
        if (!future_.valid()) {
            return Result<StreamOffset>::error(ErrorCategory::INTERNAL_ERROR,
                "pending ingestion has no associated record");
        }
        try {
            return Result<StreamOffset>::ok(future_.get());
        } catch (const std::exception& e) {
            return Result<StreamOffset>::error(ErrorCategory::SUBMIT_ERROR, e.what());
        }
    }

    /// Wait up to timeout; returns false if still pending.
    template<typename Rep, typename Period>
    [[nodiscard]] bool wait_for(std::chrono::duration<Rep, Period> timeout) const {
        return future_.valid() &&
               future_.wait_for(timeout) == std::future_status::ready;
    }

private:
    std::shared_future<StreamOffset> future_;
};

} // namespace ingestgate
