#include "beacon/core/observability/trace_context.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <functional>
#include <random>
#include <thread>

namespace beacon::core::observability {

namespace {

constexpr std::size_t kTraceIdDigits = 32;
constexpr std::size_t kSpanIdDigits = 16;
constexpr std::size_t kTraceparentSize = 2 + 1 + kTraceIdDigits + 1 + kSpanIdDigits + 1 + 2;

// splitmix64 finaliser; a bijection on 64-bit values.
std::uint64_t mix64(std::uint64_t x) noexcept {
    x += 0x9e3779b97f4a7c15ULL;
    x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
    x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
    return x ^ (x >> 31);
}

void append_hex(std::string& out, std::uint64_t value) {
    static constexpr char kDigits[] = "0123456789abcdef";
    for (int shift = 60; shift >= 0; shift -= 4) {
        out.push_back(kDigits[(value >> shift) & 0x0f]);
    }
}

std::uint64_t process_seed() {
    static const std::uint64_t seed = [] {
        std::random_device rd;
        auto now = static_cast<std::uint64_t>(std::chrono::high_resolution_clock::now().time_since_epoch().count());
        return (static_cast<std::uint64_t>(rd()) << 32) ^ rd() ^ now;
    }();
    return seed;
}

std::mt19937_64& thread_rng() {
    thread_local std::mt19937_64 rng{[] {
        std::random_device rd;
        std::seed_seq seq{rd(), rd(), rd(), rd(),
                          static_cast<unsigned>(std::hash<std::thread::id>{}(std::this_thread::get_id()))};
        return std::mt19937_64{seq};
    }()};
    return rng;
}

bool is_hex(std::string_view text) {
    return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isxdigit(c) != 0; });
}

std::string lower(std::string_view text) {
    std::string out{text};
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

}  // namespace

std::string generate_trace_id() {
    auto& rng = thread_rng();
    std::uint64_t high = 0;
    std::uint64_t low = 0;
    do {
        high = rng();
        low = rng();
    } while (high == 0 && low == 0);

    std::string id;
    id.reserve(kTraceIdDigits);
    append_hex(id, high);
    append_hex(id, low);
    return id;
}

std::string generate_span_id() {
    static std::atomic<std::uint64_t> counter{0};
    std::uint64_t value = 0;
    do {
        value = mix64(process_seed() + counter.fetch_add(1, std::memory_order_relaxed));
    } while (value == 0);

    std::string id;
    id.reserve(kSpanIdDigits);
    append_hex(id, value);
    return id;
}

std::optional<SpanContext> parse_traceparent(std::string_view header) {
    while (!header.empty() && std::isspace(static_cast<unsigned char>(header.front()))) {
        header.remove_prefix(1);
    }
    while (!header.empty() && std::isspace(static_cast<unsigned char>(header.back()))) {
        header.remove_suffix(1);
    }
    if (header.size() < kTraceparentSize) {
        return std::nullopt;
    }

    auto version = header.substr(0, 2);
    if (!is_hex(version) || lower(version) == "ff") {
        return std::nullopt;
    }
    // Version 00 has exactly four fields; later versions may append more.
    if (version == "00" && header.size() != kTraceparentSize) {
        return std::nullopt;
    }
    if (header.size() > kTraceparentSize && header[kTraceparentSize] != '-') {
        return std::nullopt;
    }
    if (header[2] != '-' || header[3 + kTraceIdDigits] != '-' ||
        header[4 + kTraceIdDigits + kSpanIdDigits] != '-') {
        return std::nullopt;
    }

    auto trace_id = header.substr(3, kTraceIdDigits);
    auto span_id = header.substr(4 + kTraceIdDigits, kSpanIdDigits);
    auto flags = header.substr(5 + kTraceIdDigits + kSpanIdDigits, 2);
    if (!is_hex(trace_id) || !is_hex(span_id) || !is_hex(flags)) {
        return std::nullopt;
    }

    SpanContext context;
    context.trace_id = lower(trace_id);
    context.span_id = lower(span_id);
    context.sampled = (std::stoi(std::string{flags}, nullptr, 16) & 0x01) != 0;
    if (!context.valid()) {
        return std::nullopt;
    }
    return context;
}

std::string format_traceparent(const SpanContext& context) {
    std::string header;
    header.reserve(kTraceparentSize);
    header.append("00-");
    header.append(context.trace_id);
    header.push_back('-');
    header.append(context.span_id);
    header.append(context.sampled ? "-01" : "-00");
    return header;
}

}  // namespace beacon::core::observability
