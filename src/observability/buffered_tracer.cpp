#include "beacon/core/observability/buffered_tracer.hpp"

#include <algorithm>
#include <cmath>

#include "beacon/core/observability/active_span.hpp"
#include "beacon/core/observability/trace_context.hpp"

namespace beacon::core::observability {

namespace {

constexpr const char* kAgentAttribute = "beacon.agent_id";
constexpr const char* kProjectAttribute = "beacon.project_id";

std::size_t clamp_threshold(std::size_t threshold) noexcept {
    return std::max<std::size_t>(threshold, 1);
}

}  // namespace

// SpanBuffer

SpanBuffer::SpanBuffer(SpanStorePtr store, BufferedTracerOptions options, logging::LoggerPtr logger)
    : store_(std::move(store)),
      options_(std::move(options)),
      logger_(std::move(logger)),
      threshold_(clamp_threshold(options_.buffer_size)) {
    if (!logger_) {
        logger_ = logging::create_logger("beacon.tracing");
    }
}

void SpanBuffer::append(SpanRecord record) {
    bool full = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.push_back(std::move(record));
        full = records_.size() >= threshold_.load();
    }
    spans_ended_.fetch_add(1);
    if (full) {
        flush();
    }
}

void SpanBuffer::flush() {
    std::vector<SpanRecord> batch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        batch.swap(records_);
    }
    if (batch.empty()) {
        return;
    }

    flushes_.fetch_add(1);
    if (!store_) {
        spans_dropped_.fetch_add(batch.size());
        return;
    }

    try {
        store_->write(batch);
        spans_written_.fetch_add(batch.size());
        logger_->debug("Flushed spans:", batch.size());
    } catch (const std::exception& e) {
        spans_dropped_.fetch_add(batch.size());
        logger_->warn("Dropping span batch of", batch.size(), "after write failure:", e.what());
    }
}

void SpanBuffer::set_threshold(std::size_t threshold) noexcept {
    threshold_.store(clamp_threshold(threshold));
}

std::size_t SpanBuffer::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

TracerStats SpanBuffer::stats() const noexcept {
    TracerStats stats;
    stats.spans_ended = spans_ended_.load();
    stats.flushes = flushes_.load();
    stats.spans_written = spans_written_.load();
    stats.spans_dropped = spans_dropped_.load();
    return stats;
}

// BufferedSpan

BufferedSpan::BufferedSpan(std::string name, std::string trace_id, std::string span_id,
                           std::optional<std::string> parent_span_id, SpanKind kind,
                           std::shared_ptr<SpanBuffer> buffer, std::uint64_t owner)
    : name_(std::move(name)),
      trace_id_(std::move(trace_id)),
      span_id_(std::move(span_id)),
      parent_span_id_(std::move(parent_span_id)),
      kind_(kind),
      start_time_(Clock::now()),
      buffer_(std::move(buffer)),
      owner_(owner) {
}

void BufferedSpan::set_attribute(const std::string& key, AttributeValue value) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ended_.load()) {
        return;
    }
    attributes_[key] = std::move(value);
}

void BufferedSpan::add_event(const std::string& name, Attributes attributes) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ended_.load()) {
        return;
    }
    if (!attributes.is_object()) {
        attributes = Attributes::object();
    }
    Attributes event = Attributes::object();
    event["name"] = name;
    event["timestamp"] = format_timestamp(Clock::now());
    event["attributes"] = std::move(attributes);
    events_.push_back(std::move(event));
}

void BufferedSpan::set_status(StatusCode code, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ended_.load()) {
        return;
    }
    status_ = code;
    if (message.empty()) {
        status_message_.reset();
    } else {
        status_message_ = message;
    }
}

void BufferedSpan::end() {
    SpanRecord record;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (ended_.load()) {
            return;
        }
        const auto now = Clock::now();
        end_time_ = now;
        const std::chrono::duration<double, std::milli> elapsed = now - start_time_;
        duration_ms_ = static_cast<std::int64_t>(std::llround(elapsed.count()));
        ended_.store(true);
        record = to_record_locked();
    }

    ActiveSpanStack::remove(owner_, this);
    buffer_->append(std::move(record));
}

StatusCode BufferedSpan::status_code() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

Attributes BufferedSpan::attributes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return attributes_;
}

Attributes BufferedSpan::events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
}

std::optional<std::string> BufferedSpan::status_message() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_message_;
}

std::optional<BufferedSpan::Clock::time_point> BufferedSpan::end_time() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return end_time_;
}

std::int64_t BufferedSpan::duration_ms() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return duration_ms_;
}

SpanRecord BufferedSpan::to_record() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return to_record_locked();
}

SpanRecord BufferedSpan::to_record_locked() const {
    const auto& options = buffer_->options();

    SpanRecord r;
    r.id = span_id_;
    r.trace_id = trace_id_;
    r.parent_span_id = parent_span_id_;
    r.name = name_;
    r.kind = to_string(kind_);
    r.start_time = format_timestamp(start_time_);
    if (end_time_) {
        r.end_time = format_timestamp(*end_time_);
    }
    r.duration_ms = duration_ms_;
    r.status_code = to_string(status_);
    r.status_message = status_message_;
    r.attributes = attributes_;
    r.events = events_;
    r.agent_id = options.agent_id;
    r.project_id = options.project_id;
    r.classification = options.classification;
    return r;
}

// BufferedTracer

BufferedTracer::BufferedTracer(SpanStorePtr store, BufferedTracerOptions options, logging::LoggerPtr logger)
    : buffer_(std::make_shared<SpanBuffer>(std::move(store), std::move(options), std::move(logger))),
      owner_(ActiveSpanStack::next_owner_id()) {
}

BufferedTracer::~BufferedTracer() {
    buffer_->flush();
    ActiveSpanStack::clear(owner_);
}

SpanPtr BufferedTracer::start_span(const std::string& name, const SpanOptions& options) {
    std::string trace_id;
    std::optional<std::string> parent_span_id;

    if (options.parent) {
        trace_id = options.parent->trace_id();
        parent_span_id = options.parent->span_id();
    } else if (options.remote_parent && options.remote_parent->valid()) {
        trace_id = options.remote_parent->trace_id;
        parent_span_id = options.remote_parent->span_id;
    } else if (auto active = ActiveSpanStack::top(owner_)) {
        trace_id = active->trace_id();
        parent_span_id = active->span_id();
    } else {
        trace_id = generate_trace_id();
    }

    auto span = std::make_shared<BufferedSpan>(name, std::move(trace_id), generate_span_id(),
                                               std::move(parent_span_id), options.kind, buffer_, owner_);

    const auto& defaults = buffer_->options();
    if (defaults.agent_id) {
        span->set_attribute(kAgentAttribute, *defaults.agent_id);
    }
    if (defaults.project_id) {
        span->set_attribute(kProjectAttribute, *defaults.project_id);
    }
    if (options.attributes.is_object()) {
        for (const auto& [key, value] : options.attributes.items()) {
            span->set_attribute(key, value);
        }
    }

    ActiveSpanStack::push(owner_, span);
    return span;
}

SpanPtr BufferedTracer::get_active_span() const {
    return ActiveSpanStack::top(owner_);
}

void BufferedTracer::flush() {
    buffer_->flush();
}

std::vector<SpanRecord> BufferedTracer::query_spans(const SpanQuery& query) const {
    const auto& store = buffer_->store();
    if (!store) {
        return {};
    }
    try {
        return store->query(query);
    } catch (const std::exception& e) {
        buffer_->logger()->warn("Span query failed:", e.what());
        return {};
    }
}

}  // namespace beacon::core::observability
