#pragma once

#include <cstdint>

#include "beacon/core/observability/span.hpp"

namespace beacon::core::observability {

/**
 * @brief Per-thread stacks of active spans, one stack per tracer instance.
 *
 * Spans are pushed when started and removed when ended, so ending a child
 * makes its parent active again. Entries are weak: a span that was dropped
 * without end() stops being active. No locking, the state is thread-local.
 */
class ActiveSpanStack {
public:
    // Key for a tracer instance; never reused within the process.
    static std::uint64_t next_owner_id() noexcept;

    static void push(std::uint64_t owner, const SpanPtr& span);
    static void remove(std::uint64_t owner, const Span* span);
    [[nodiscard]] static SpanPtr top(std::uint64_t owner);

    // Forgets every span of @p owner on the calling thread.
    static void clear(std::uint64_t owner);
};

}  // namespace beacon::core::observability
