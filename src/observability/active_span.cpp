#include "beacon/core/observability/active_span.hpp"

#include <algorithm>
#include <atomic>
#include <unordered_map>
#include <vector>

namespace beacon::core::observability {

namespace {

using Stack = std::vector<std::weak_ptr<Span>>;

std::unordered_map<std::uint64_t, Stack>& stacks() {
    thread_local std::unordered_map<std::uint64_t, Stack> t_stacks;
    return t_stacks;
}

void prune(Stack& stack) {
    stack.erase(std::remove_if(stack.begin(), stack.end(),
                               [](const std::weak_ptr<Span>& entry) {
                                   auto span = entry.lock();
                                   return !span || span->is_ended();
                               }),
                stack.end());
}

}  // namespace

std::uint64_t ActiveSpanStack::next_owner_id() noexcept {
    static std::atomic<std::uint64_t> next{1};
    return next.fetch_add(1, std::memory_order_relaxed);
}

void ActiveSpanStack::push(std::uint64_t owner, const SpanPtr& span) {
    if (!span) {
        return;
    }
    stacks()[owner].push_back(span);
}

void ActiveSpanStack::remove(std::uint64_t owner, const Span* span) {
    auto& all = stacks();
    auto it = all.find(owner);
    if (it == all.end()) {
        return;
    }
    auto& stack = it->second;
    for (auto entry = stack.rbegin(); entry != stack.rend(); ++entry) {
        auto live = entry->lock();
        if (live.get() == span) {
            stack.erase(std::next(entry).base());
            break;
        }
    }
    prune(stack);
    if (stack.empty()) {
        all.erase(it);
    }
}

SpanPtr ActiveSpanStack::top(std::uint64_t owner) {
    auto& all = stacks();
    auto it = all.find(owner);
    if (it == all.end()) {
        return nullptr;
    }
    auto& stack = it->second;
    while (!stack.empty()) {
        auto span = stack.back().lock();
        if (span && !span->is_ended()) {
            return span;
        }
        stack.pop_back();
    }
    all.erase(it);
    return nullptr;
}

void ActiveSpanStack::clear(std::uint64_t owner) {
    stacks().erase(owner);
}

}  // namespace beacon::core::observability
