#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <type_traits>
#include <vector>

namespace ingestgate {

/**
 * @brief Bounded lock-free multi-producer single-consumer queue
 *
 * Carries acknowledgment events from provider delivery threads to the
 * dispatcher's reporter thread.
 *
 * Slot protocol (sequence numbers, Vyukov style):
 *   Slot i starts with seq = i. A producer owning position p may write when
 *   seq == p, then publishes with seq = p + 1. The consumer reading position
 *   p waits for seq == p + 1, moves the value out and frees the slot with
 *   seq = p + Capacity. A full queue is detected (seq < p) before a position
 *   is claimed, so a dropped push never leaves a hole for the consumer.
 *
 * Producers never block: when the queue is full the item is dropped and the
 * overflow counter is incremented.
 *
 * @tparam T         Element type (must be move-assignable)
 * @tparam Capacity  Number of slots, power of 2
 */
template <typename T, size_t Capacity = 8192>
class AckQueue {
    static_assert((Capacity & (Capacity - 1)) == 0,
                  "Capacity must be a power of 2");
    static_assert(Capacity >= 2, "Capacity must be at least 2");
    static_assert(std::is_move_assignable_v<T>,
                  "T must be move-assignable");

public:
    AckQueue() {
        for (size_t i = 0; i < Capacity; ++i) {
            slots_[i].seq.store(i, std::memory_order_relaxed);
        }
    }

    // Non-copyable, non-movable (contains atomics)
    AckQueue(const AckQueue&) = delete;
    AckQueue& operator=(const AckQueue&) = delete;
    AckQueue(AckQueue&&) = delete;
    AckQueue& operator=(AckQueue&&) = delete;

    /**
     * @brief Try to enqueue an item (any thread, never blocks)
     * @return true if enqueued, false if dropped (queue full)
     */
    [[nodiscard]] bool try_push(T item) {
        size_t pos = write_pos_.load(std::memory_order_relaxed);
        Slot* slot = nullptr;

        for (;;) {
            slot = &slots_[pos & kMask];
            const size_t seq = slot->seq.load(std::memory_order_acquire);
            const auto dif = static_cast<intptr_t>(seq) - static_cast<intptr_t>(pos);
            if (dif == 0) {
                if (write_pos_.compare_exchange_weak(pos, pos + 1, std::memory_order_relaxed)) {
                    break;
                }
            } else if (dif < 0) {
                overflow_count_.fetch_add(1, std::memory_order_relaxed);
                return false;
            } else {
                pos = write_pos_.load(std::memory_order_relaxed);
            }
        }

        slot->data = std::move(item);
        slot->seq.store(pos + 1, std::memory_order_release);
        return true;
    }

    /**
     * @brief Dequeue one item (consumer thread only)
     */
    [[nodiscard]] std::optional<T> try_pop() {
        Slot& slot = slots_[read_pos_ & kMask];
        if (slot.seq.load(std::memory_order_acquire) != read_pos_ + 1) {
            return std::nullopt;
        }

        std::optional<T> result(std::move(slot.data));
        slot.seq.store(read_pos_ + Capacity, std::memory_order_release);
        ++read_pos_;
        return result;
    }

    /**
     * @brief Drain up to max_count items into batch (consumer thread only)
     * @return Number of items drained
     */
    size_t drain(std::vector<T>& batch, size_t max_count) {
        size_t count = 0;
        while (count < max_count) {
            auto item = try_pop();
            if (!item) {
                break;
            }
            batch.emplace_back(std::move(*item));
            ++count;
        }
        return count;
    }

    [[nodiscard]] uint64_t overflow_count() const noexcept {
        return overflow_count_.load(std::memory_order_relaxed);
    }

    /// Number of successful pushes so far (claimed positions).
    [[nodiscard]] size_t pushed_count() const noexcept {
        return write_pos_.load(std::memory_order_acquire);
    }

    static constexpr size_t capacity() noexcept {
        return Capacity;
    }

private:
    static constexpr size_t kMask = Capacity - 1;

    struct alignas(64) Slot {
        std::atomic<size_t> seq{0};
        T data{};
    };

    alignas(64) std::atomic<size_t> write_pos_{0};
    alignas(64) size_t read_pos_{0};  // Consumer only
    alignas(64) std::atomic<uint64_t> overflow_count_{0};

    std::array<Slot, Capacity> slots_;
};

} // namespace ingestgate
