#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "beacon/core/logging/logger.hpp"
#include "beacon/core/observability/span_store.hpp"
#include "beacon/core/observability/tracer.hpp"

namespace beacon::core::observability {

struct BufferedTracerOptions {
    // Number of ended spans that triggers an automatic flush. Values below 1 act as 1.
    std::size_t buffer_size{10};
    std::optional<std::string> agent_id;
    std::optional<std::string> project_id;
    std::string classification{"CUI"};
};

struct TracerStats {
    std::uint64_t spans_ended{0};
    std::uint64_t flushes{0};
    std::uint64_t spans_written{0};
    std::uint64_t spans_dropped{0};
};

/**
 * @brief Ended-but-unpersisted spans shared by a tracer and its spans.
 *
 * The mutex guards only the vector. flush() swaps the vector out and writes
 * the drained batch without holding the lock; a failed batch is logged and
 * dropped.
 */
class SpanBuffer {
public:
    SpanBuffer(SpanStorePtr store, BufferedTracerOptions options, logging::LoggerPtr logger);

    void append(SpanRecord record);
    void flush();

    void set_threshold(std::size_t threshold) noexcept;
    [[nodiscard]] std::size_t threshold() const noexcept { return threshold_.load(); }
    [[nodiscard]] std::size_t pending() const;
    [[nodiscard]] TracerStats stats() const noexcept;

    [[nodiscard]] const BufferedTracerOptions& options() const noexcept { return options_; }
    [[nodiscard]] const SpanStorePtr& store() const noexcept { return store_; }
    [[nodiscard]] const logging::LoggerPtr& logger() const noexcept { return logger_; }

private:
    SpanStorePtr store_;
    BufferedTracerOptions options_;
    logging::LoggerPtr logger_;

    mutable std::mutex mutex_;
    std::vector<SpanRecord> records_;
    std::atomic<std::size_t> threshold_;

    std::atomic<std::uint64_t> spans_ended_{0};
    std::atomic<std::uint64_t> flushes_{0};
    std::atomic<std::uint64_t> spans_written_{0};
    std::atomic<std::uint64_t> spans_dropped_{0};
};

class BufferedSpan : public Span {
public:
    using Clock = std::chrono::system_clock;

    BufferedSpan(std::string name, std::string trace_id, std::string span_id,
                 std::optional<std::string> parent_span_id, SpanKind kind,
                 std::shared_ptr<SpanBuffer> buffer, std::uint64_t owner);

    const std::string& span_id() const noexcept override { return span_id_; }
    const std::string& trace_id() const noexcept override { return trace_id_; }
    const std::optional<std::string>& parent_span_id() const noexcept override { return parent_span_id_; }
    const std::string& name() const noexcept override { return name_; }
    SpanKind kind() const noexcept override { return kind_; }

    void set_attribute(const std::string& key, AttributeValue value) override;
    void add_event(const std::string& name, Attributes attributes = Attributes::object()) override;
    void set_status(StatusCode code, const std::string& message = "") override;

    // First call fixes end_time and duration_ms and hands the record to the buffer.
    void end() override;

    bool is_ended() const noexcept override { return ended_.load(); }
    StatusCode status_code() const noexcept override;

    [[nodiscard]] Attributes attributes() const;
    [[nodiscard]] Attributes events() const;
    [[nodiscard]] std::optional<std::string> status_message() const;
    [[nodiscard]] Clock::time_point start_time() const noexcept { return start_time_; }
    [[nodiscard]] std::optional<Clock::time_point> end_time() const;
    [[nodiscard]] std::int64_t duration_ms() const;

    [[nodiscard]] SpanRecord to_record() const;

private:
    SpanRecord to_record_locked() const;

    const std::string name_;
    const std::string trace_id_;
    const std::string span_id_;
    const std::optional<std::string> parent_span_id_;
    const SpanKind kind_;
    const Clock::time_point start_time_;

    std::shared_ptr<SpanBuffer> buffer_;
    std::uint64_t owner_;

    mutable std::mutex mutex_;
    Attributes attributes_ = Attributes::object();
    Attributes events_ = Attributes::array();
    StatusCode status_{StatusCode::Unset};
    std::optional<std::string> status_message_;
    std::optional<Clock::time_point> end_time_;
    std::int64_t duration_ms_{0};
    std::atomic<bool> ended_{false};
};

/**
 * @brief Persistent backend: buffers ended spans and flushes them in batches
 * to a SpanStore.
 *
 * Spans keep the buffer alive, so a span ended after its tracer is gone is
 * still persisted on the next flush or buffer fill. The destructor flushes.
 */
class BufferedTracer : public Tracer {
public:
    explicit BufferedTracer(SpanStorePtr store, BufferedTracerOptions options = {},
                            logging::LoggerPtr logger = nullptr);
    ~BufferedTracer() override;

    BufferedTracer(const BufferedTracer&) = delete;
    BufferedTracer& operator=(const BufferedTracer&) = delete;

    SpanPtr start_span(const std::string& name, const SpanOptions& options = {}) override;
    SpanPtr get_active_span() const override;
    void flush() override;
    std::vector<SpanRecord> query_spans(const SpanQuery& query) const override;
    std::string_view backend_name() const noexcept override { return "buffered"; }

    void set_buffer_size(std::size_t size) noexcept { buffer_->set_threshold(size); }
    [[nodiscard]] std::size_t buffer_size() const noexcept { return buffer_->threshold(); }
    [[nodiscard]] std::size_t pending() const { return buffer_->pending(); }
    [[nodiscard]] TracerStats stats() const noexcept { return buffer_->stats(); }
    [[nodiscard]] const SpanStorePtr& store() const noexcept { return buffer_->store(); }

private:
    std::shared_ptr<SpanBuffer> buffer_;
    std::uint64_t owner_;
};

}  // namespace beacon::core::observability
