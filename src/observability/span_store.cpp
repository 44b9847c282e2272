#include "beacon/core/observability/span_store.hpp"

#include <sstream>

#include "beacon/core/storage/sqlite.hpp"

namespace beacon::core::observability {

namespace {

// Invalid UTF-8 in one attribute becomes U+FFFD instead of failing the whole batch.
std::string to_column_text(const nlohmann::ordered_json& value) {
    return value.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

constexpr const char* kSchema = R"sql(
CREATE TABLE IF NOT EXISTS otel_spans (
    id TEXT PRIMARY KEY,
    trace_id TEXT NOT NULL,
    parent_span_id TEXT,
    name TEXT NOT NULL,
    kind TEXT DEFAULT 'INTERNAL',
    start_time TEXT NOT NULL,
    end_time TEXT,
    duration_ms INTEGER DEFAULT 0,
    status_code TEXT DEFAULT 'UNSET',
    status_message TEXT,
    attributes TEXT,
    events TEXT,
    agent_id TEXT,
    project_id TEXT,
    classification TEXT DEFAULT 'CUI',
    created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP
);
CREATE INDEX IF NOT EXISTS idx_otel_spans_trace_id ON otel_spans(trace_id);
CREATE INDEX IF NOT EXISTS idx_otel_spans_parent ON otel_spans(parent_span_id);
CREATE INDEX IF NOT EXISTS idx_otel_spans_name ON otel_spans(name);
CREATE INDEX IF NOT EXISTS idx_otel_spans_agent ON otel_spans(agent_id);
CREATE INDEX IF NOT EXISTS idx_otel_spans_project ON otel_spans(project_id);
CREATE INDEX IF NOT EXISTS idx_otel_spans_start ON otel_spans(start_time);
CREATE INDEX IF NOT EXISTS idx_otel_spans_created ON otel_spans(created_at);
)sql";

constexpr const char* kInsert =
    "INSERT OR IGNORE INTO otel_spans (id, trace_id, parent_span_id, name, kind, start_time, "
    "end_time, duration_ms, status_code, status_message, attributes, events, agent_id, "
    "project_id, classification) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";

constexpr const char* kColumns =
    "SELECT id, trace_id, parent_span_id, name, kind, start_time, end_time, duration_ms, "
    "status_code, status_message, attributes, events, agent_id, project_id, classification, "
    "created_at FROM otel_spans";

Attributes parse_json_column(const std::optional<std::string>& text, Attributes fallback) {
    if (!text || text->empty()) {
        return fallback;
    }
    auto parsed = Attributes::parse(*text, nullptr, false);
    if (parsed.is_discarded()) {
        return fallback;
    }
    return parsed;
}

bool table_exists(storage::Database& db) {
    storage::Statement stmt(db, "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = 'otel_spans'");
    return stmt.step();
}

SpanRecord read_row(const storage::Statement& stmt) {
    SpanRecord r;
    r.id = stmt.column_text(0).value_or("");
    r.trace_id = stmt.column_text(1).value_or("");
    r.parent_span_id = stmt.column_text(2);
    r.name = stmt.column_text(3).value_or("");
    r.kind = stmt.column_text(4).value_or("INTERNAL");
    r.start_time = stmt.column_text(5).value_or("");
    r.end_time = stmt.column_text(6);
    r.duration_ms = stmt.column_int64(7);
    r.status_code = stmt.column_text(8).value_or("UNSET");
    r.status_message = stmt.column_text(9);
    r.attributes = parse_json_column(stmt.column_text(10), Attributes::object());
    r.events = parse_json_column(stmt.column_text(11), Attributes::array());
    r.agent_id = stmt.column_text(12);
    r.project_id = stmt.column_text(13);
    r.classification = stmt.column_text(14).value_or("CUI");
    r.created_at = stmt.column_text(15);
    return r;
}

}  // namespace

const char* span_schema_sql() noexcept {
    return kSchema;
}

SqliteSpanStore::SqliteSpanStore(std::filesystem::path db_path)
    : db_path_(std::move(db_path)) {
}

void SqliteSpanStore::ensure_schema() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    storage::Database db(db_path_, storage::OpenMode::ReadWriteCreate);
    db.set_busy_timeout(kBusyTimeoutMs);
    db.execute(kSchema);
}

void SqliteSpanStore::write(const std::vector<SpanRecord>& batch) {
    if (batch.empty()) {
        return;
    }

    std::lock_guard<std::mutex> lock(write_mutex_);
    storage::Database db(db_path_, storage::OpenMode::ReadWriteCreate);
    db.set_busy_timeout(kBusyTimeoutMs);
    db.execute(kSchema);

    storage::Transaction tx(db);
    storage::Statement stmt(db, kInsert);
    for (const auto& r : batch) {
        stmt.reset();
        stmt.bind(1, std::string_view{r.id})
            .bind(2, std::string_view{r.trace_id})
            .bind(3, r.parent_span_id)
            .bind(4, std::string_view{r.name})
            .bind(5, std::string_view{r.kind})
            .bind(6, std::string_view{r.start_time})
            .bind(7, r.end_time)
            .bind(8, r.duration_ms)
            .bind(9, std::string_view{r.status_code})
            .bind(10, r.status_message)
            .bind(11, std::string_view{to_column_text(r.attributes)})
            .bind(12, std::string_view{to_column_text(r.events)})
            .bind(13, r.agent_id)
            .bind(14, r.project_id)
            .bind(15, std::string_view{r.classification});
        stmt.execute();
    }
    tx.commit();
}

std::vector<SpanRecord> SqliteSpanStore::query(const SpanQuery& query) const {
    std::error_code ec;
    if (!std::filesystem::exists(db_path_, ec)) {
        return {};
    }

    storage::Database db(db_path_, storage::OpenMode::ReadOnly);
    db.set_busy_timeout(kBusyTimeoutMs);
    if (!table_exists(db)) {
        return {};
    }

    std::ostringstream sql;
    sql << kColumns << " WHERE 1 = 1";
    if (query.trace_id) {
        sql << " AND trace_id = ?";
    }
    if (query.project_id) {
        sql << " AND project_id = ?";
    }
    if (query.name) {
        sql << " AND name = ?";
    }
    sql << " ORDER BY start_time DESC LIMIT ?";

    storage::Statement stmt(db, sql.str());
    int index = 1;
    if (query.trace_id) {
        stmt.bind(index++, std::string_view{*query.trace_id});
    }
    if (query.project_id) {
        stmt.bind(index++, std::string_view{*query.project_id});
    }
    if (query.name) {
        stmt.bind(index++, std::string_view{*query.name});
    }
    stmt.bind(index, static_cast<std::int64_t>(query.limit));

    std::vector<SpanRecord> records;
    while (stmt.step()) {
        records.push_back(read_row(stmt));
    }
    return records;
}

LogSpanStore::LogSpanStore(logging::LoggerPtr logger)
    : logger_(std::move(logger)) {
    if (!logger_) {
        logger_ = logging::create_logger("beacon.spans");
    }
}

void LogSpanStore::write(const std::vector<SpanRecord>& batch) {
    for (const auto& r : batch) {
        logger_->info(to_column_text(r.to_json()));
    }
}

std::vector<SpanRecord> LogSpanStore::query(const SpanQuery& /*query*/) const {
    return {};
}

}  // namespace beacon::core::observability
