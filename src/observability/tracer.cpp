#include "beacon/core/observability/tracer.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace beacon::core::observability {

namespace {

nlohmann::ordered_json optional_json(const std::optional<std::string>& value) {
    if (value) {
        return *value;
    }
    return nullptr;
}

}  // namespace

nlohmann::ordered_json SpanRecord::to_json() const {
    nlohmann::ordered_json j;
    j["id"] = id;
    j["span_id"] = id;
    j["trace_id"] = trace_id;
    j["parent_span_id"] = optional_json(parent_span_id);
    j["name"] = name;
    j["kind"] = kind;
    j["start_time"] = start_time;
    j["end_time"] = optional_json(end_time);
    j["duration_ms"] = duration_ms;
    j["status_code"] = status_code;
    j["status_message"] = optional_json(status_message);
    j["attributes"] = attributes;
    j["events"] = events;
    j["agent_id"] = optional_json(agent_id);
    j["project_id"] = optional_json(project_id);
    j["classification"] = classification;
    if (created_at) {
        j["created_at"] = *created_at;
    }
    return j;
}

std::vector<SpanRecord> Tracer::query_spans(const SpanQuery& /*query*/) const {
    return {};
}

std::string format_timestamp(std::chrono::system_clock::time_point time) {
    using namespace std::chrono;
    const auto since_epoch = time.time_since_epoch();
    auto secs = duration_cast<seconds>(since_epoch);
    auto micros = duration_cast<microseconds>(since_epoch - secs).count();
    if (micros < 0) {
        secs -= seconds(1);
        micros += 1000000;
    }
    const std::time_t t = static_cast<std::time_t>(secs.count());
    std::tm tm_buf{};
#if defined(_WIN32)
    gmtime_s(&tm_buf, &t);
#else
    gmtime_r(&t, &tm_buf);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setw(6) << std::setfill('0') << micros << 'Z';
    return oss.str();
}

}  // namespace beacon::core::observability
