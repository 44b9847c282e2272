#pragma once

#include <filesystem>
#include <mutex>
#include <vector>

#include "beacon/core/logging/logger.hpp"
#include "beacon/core/observability/tracer.hpp"

namespace beacon::core::observability {

/**
 * @brief Destination for finished span records.
 *
 * write() throws on failure; callers decide whether a lost batch matters.
 */
class SpanStore {
public:
    virtual ~SpanStore() = default;

    virtual void write(const std::vector<SpanRecord>& batch) = 0;
    [[nodiscard]] virtual std::vector<SpanRecord> query(const SpanQuery& query) const = 0;
};

using SpanStorePtr = std::shared_ptr<SpanStore>;

/**
 * @brief Spans in the otel_spans table of a SQLite database file.
 *
 * A connection is opened per operation so several processes can share the
 * file. The table is created on the first write when missing.
 */
class SqliteSpanStore : public SpanStore {
public:
    explicit SqliteSpanStore(std::filesystem::path db_path);

    void write(const std::vector<SpanRecord>& batch) override;
    [[nodiscard]] std::vector<SpanRecord> query(const SpanQuery& query) const override;

    // Creates the table and its indexes. Idempotent.
    void ensure_schema();

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return db_path_; }

    static constexpr int kBusyTimeoutMs = 5000;

private:
    std::filesystem::path db_path_;
    std::mutex write_mutex_;
};

/**
 * @brief Writes each record as one JSON line to a logger. Not queryable.
 */
class LogSpanStore : public SpanStore {
public:
    explicit LogSpanStore(logging::LoggerPtr logger);

    void write(const std::vector<SpanRecord>& batch) override;
    [[nodiscard]] std::vector<SpanRecord> query(const SpanQuery& query) const override;

private:
    logging::LoggerPtr logger_;
};

// DDL of the otel_spans table and its indexes.
[[nodiscard]] const char* span_schema_sql() noexcept;

}  // namespace beacon::core::observability
