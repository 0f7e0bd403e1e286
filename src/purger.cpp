#include "idscrub/purger.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <chrono>
#include <system_error>
#include <thread>
#include <utility>

namespace idscrub {
namespace purger {

namespace fs = std::filesystem;

namespace {

struct StatementDeleter {
    void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
};
using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

struct ConnectionDeleter {
    void operator()(sqlite3* db) const { sqlite3_close(db); }
};
using Connection = std::unique_ptr<sqlite3, ConnectionDeleter>;

std::string describe(sqlite3* db, const std::string& what) {
    return what + ": " + (db ? sqlite3_errmsg(db) : "out of memory");
}

int exec(sqlite3* db, const char* sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
    if (err) {
        sqlite3_free(err);
    }
    return rc;
}

Result<Statement> prepare(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* raw = nullptr;
    int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &raw, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_finalize(raw);
        return Result<Statement>::error(error_from_sqlite(rc), describe(db, "Cannot prepare"));
    }
    return Result<Statement>::ok(Statement(raw));
}

Result<Connection> connect(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return Result<Connection>::error(ErrorCode::NotFound,
                                         "Store does not exist: " + path.string());
    }

    sqlite3* raw = nullptr;
    int rc = sqlite3_open_v2(path.string().c_str(), &raw, SQLITE_OPEN_READWRITE, nullptr);
    Connection db(raw);
    if (rc != SQLITE_OK) {
        return Result<Connection>::error(error_from_sqlite(rc),
                                         describe(db.get(), "Cannot open " + path.string()));
    }

    // Contention is handled by our own backoff, not SQLite's busy handler
    (void)sqlite3_busy_timeout(db.get(), 0);
    return Result<Connection>::ok(std::move(db));
}

bool is_identifier(const std::string& name) {
    if (name.empty() || (name[0] >= '0' && name[0] <= '9')) {
        return false;
    }
    for (char c : name) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                  c == '_';
        if (!ok) {
            return false;
        }
    }
    return true;
}

std::string quote(const std::string& identifier) {
    return "\"" + identifier + "\"";
}

Result<void> validate(const TelemetryRowCriteria& criteria) {
    if (!is_identifier(criteria.table)) {
        return Result<void>::error(ErrorCode::InvalidParameter,
                                   "Invalid table name: " + criteria.table);
    }
    if (!is_identifier(criteria.key_column)) {
        return Result<void>::error(ErrorCode::InvalidParameter,
                                   "Invalid key column: " + criteria.key_column);
    }
    for (const auto& pattern : criteria.patterns) {
        if (pattern.text.empty()) {
            return Result<void>::error(ErrorCode::InvalidParameter,
                                       std::string("Empty ") + match_kind_to_string(pattern.kind) +
                                           " pattern");
        }
    }
    return Result<void>::ok();
}

// Pattern i is bound to parameter ?i
std::string where_clause(const TelemetryRowCriteria& criteria) {
    if (criteria.patterns.empty()) {
        return "0";
    }

    std::string column = quote(criteria.key_column);
    std::string clause;
    for (std::size_t i = 0; i < criteria.patterns.size(); ++i) {
        std::string param = "?" + std::to_string(i + 1);
        if (!clause.empty()) {
            clause += " OR ";
        }
        switch (criteria.patterns[i].kind) {
            case MatchKind::Prefix:
                clause += "substr(" + column + ", 1, length(" + param + ")) = " + param;
                break;
            case MatchKind::Contains:
                clause += "instr(" + column + ", " + param + ") > 0";
                break;
            case MatchKind::Exact:
                clause += column + " = " + param;
                break;
        }
    }
    return clause;
}

Result<void> bind_patterns(sqlite3* db, sqlite3_stmt* stmt, const TelemetryRowCriteria& criteria) {
    for (std::size_t i = 0; i < criteria.patterns.size(); ++i) {
        const auto& text = criteria.patterns[i].text;
        int rc = sqlite3_bind_text(stmt, static_cast<int>(i + 1), text.c_str(),
                                   static_cast<int>(text.size()), SQLITE_TRANSIENT);
        if (rc != SQLITE_OK) {
            return Result<void>::error(error_from_sqlite(rc), describe(db, "Cannot bind pattern"));
        }
    }
    return Result<void>::ok();
}

Result<bool> table_exists(sqlite3* db, const std::string& table) {
    auto stmt = prepare(db, "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?1");
    if (stmt.is_error()) {
        return Result<bool>::error(stmt.error_code(), stmt.error_message());
    }
    int rc = sqlite3_bind_text(stmt.value().get(), 1, table.c_str(),
                               static_cast<int>(table.size()), SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) {
        return Result<bool>::error(error_from_sqlite(rc), describe(db, "Cannot bind table name"));
    }

    rc = sqlite3_step(stmt.value().get());
    if (rc == SQLITE_ROW) {
        return Result<bool>::ok(true);
    }
    if (rc == SQLITE_DONE) {
        return Result<bool>::ok(false);
    }
    return Result<bool>::error(error_from_sqlite(rc), describe(db, "Cannot read schema"));
}

Result<std::size_t> count(sqlite3* db, const TelemetryRowCriteria& criteria, bool filtered) {
    auto valid = validate(criteria);
    if (valid.is_error()) {
        return Result<std::size_t>::error(valid.error_code(), valid.error_message());
    }

    auto exists = table_exists(db, criteria.table);
    if (exists.is_error()) {
        return Result<std::size_t>::error(exists.error_code(), exists.error_message());
    }
    if (!exists.value()) {
        return Result<std::size_t>::ok(0);
    }

    std::string sql = "SELECT count(*) FROM " + quote(criteria.table);
    if (filtered) {
        sql += " WHERE " + where_clause(criteria);
    }

    auto stmt = prepare(db, sql);
    if (stmt.is_error()) {
        return Result<std::size_t>::error(stmt.error_code(), stmt.error_message());
    }
    if (filtered) {
        auto bound = bind_patterns(db, stmt.value().get(), criteria);
        if (bound.is_error()) {
            return Result<std::size_t>::error(bound.error_code(), bound.error_message());
        }
    }

    int rc = sqlite3_step(stmt.value().get());
    if (rc != SQLITE_ROW) {
        return Result<std::size_t>::error(error_from_sqlite(rc), describe(db, "Cannot count rows"));
    }
    return Result<std::size_t>::ok(
        static_cast<std::size_t>(sqlite3_column_int64(stmt.value().get(), 0)));
}

Result<void> check_integrity(sqlite3* db, const fs::path& path) {
    auto stmt = prepare(db, "PRAGMA quick_check");
    if (stmt.is_error()) {
        return Result<void>::error(stmt.error_code(), path.string() + ": " + stmt.error_message());
    }

    int rc = sqlite3_step(stmt.value().get());
    if (rc != SQLITE_ROW) {
        return Result<void>::error(error_from_sqlite(rc),
                                   describe(db, "Integrity check failed for " + path.string()));
    }

    const unsigned char* text = sqlite3_column_text(stmt.value().get(), 0);
    std::string verdict = text ? reinterpret_cast<const char*>(text) : "";
    if (verdict != "ok") {
        return Result<void>::error(ErrorCode::StoreCorrupt, path.string() + ": " + verdict);
    }
    return Result<void>::ok();
}

// One attempt: probe for a host lock, connect, verify
Result<Connection> try_open(const fs::path& path, HostLockProbe& probe) {
    ErrorCode probed = probe.try_open_exclusive(path);
    if (probed != ErrorCode::Success) {
        return Result<Connection>::error(probed, "Store unavailable: " + path.string());
    }

    auto db = connect(path);
    if (db.is_error()) {
        return db;
    }

    auto checked = check_integrity(db.value().get(), path);
    if (checked.is_error()) {
        return Result<Connection>::error(checked.error_code(), checked.error_message());
    }
    return db;
}

// Repeats step while it reports StoreLocked, sleeping with capped doubling delays
template <typename Step>
auto retry_while_locked(const OpenOptions& options, Step step) -> decltype(step()) {
    int delay_ms = std::min(std::max(options.retry_interval_ms, 0), MAX_RETRY_DELAY_MS);
    for (int attempt = 0;; ++attempt) {
        auto result = step();
        if (result.is_ok() || result.error_code() != ErrorCode::StoreLocked ||
            attempt >= options.max_retries) {
            return result;
        }

        if (options.on_retry) {
            options.on_retry(attempt + 1, delay_ms);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
        delay_ms = next_retry_delay(delay_ms);
    }
}

}  // namespace

// ==================== Error mapping ====================

ErrorCode error_from_sqlite(int rc) noexcept {
    switch (rc & 0xFF) {
        case SQLITE_OK:
        case SQLITE_ROW:
        case SQLITE_DONE:
            return ErrorCode::Success;
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return ErrorCode::StoreLocked;
        case SQLITE_NOTADB:
        case SQLITE_CORRUPT:
            return ErrorCode::StoreCorrupt;
        case SQLITE_CANTOPEN:
            return ErrorCode::NotFound;
        case SQLITE_READONLY:
        case SQLITE_PERM:
        case SQLITE_AUTH:
            return ErrorCode::PermissionDenied;
        case SQLITE_IOERR:
        case SQLITE_FULL:
        case SQLITE_CONSTRAINT:
        case SQLITE_ABORT:
            return ErrorCode::WriteFailure;
        default:
            return ErrorCode::Unknown;
    }
}

int next_retry_delay(int delay_ms) noexcept {
    if (delay_ms <= 0) {
        return 0;
    }
    return delay_ms > MAX_RETRY_DELAY_MS / 2 ? MAX_RETRY_DELAY_MS : delay_ms * 2;
}

// ==================== SqliteLockProbe ====================

ErrorCode SqliteLockProbe::try_open_exclusive(const fs::path& store) {
    auto db = connect(store);
    if (db.is_error()) {
        return db.error_code();
    }

    int rc = exec(db.value().get(), "BEGIN EXCLUSIVE");
    if (rc != SQLITE_OK) {
        return error_from_sqlite(rc);
    }

    rc = exec(db.value().get(), "ROLLBACK");
    return error_from_sqlite(rc);
}

// ==================== LocalStore ====================

LocalStore::LocalStore(sqlite3* db, fs::path path, OpenOptions options)
    : db_(db), path_(std::move(path)), options_(std::move(options)) {}

LocalStore::~LocalStore() {
    close();
}

LocalStore::LocalStore(LocalStore&& other) noexcept
    : db_(std::exchange(other.db_, nullptr)),
      path_(std::move(other.path_)),
      options_(std::move(other.options_)) {}

LocalStore& LocalStore::operator=(LocalStore&& other) noexcept {
    if (this != &other) {
        close();
        db_ = std::exchange(other.db_, nullptr);
        path_ = std::move(other.path_);
        options_ = std::move(other.options_);
    }
    return *this;
}

void LocalStore::close() noexcept {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

Result<LocalStore> LocalStore::open(const fs::path& path, const OpenOptions& options) {
    std::shared_ptr<HostLockProbe> probe = options.probe;
    if (!probe) {
        probe = std::make_shared<SqliteLockProbe>();
    }

    auto db = retry_while_locked(options, [&]() { return try_open(path, *probe); });
    if (db.is_error()) {
        std::string message = db.error_message();
        if (db.error_code() == ErrorCode::StoreLocked) {
            message = "Store is held by a running host: " + path.string();
        }
        return Result<LocalStore>::error(db.error_code(), message);
    }
    return Result<LocalStore>::ok(LocalStore(db.value().release(), path, options));
}

Result<std::size_t> LocalStore::count_rows(const TelemetryRowCriteria& criteria) const {
    return count(db_, criteria, false);
}

Result<std::size_t> LocalStore::count_matching(const TelemetryRowCriteria& criteria) const {
    return count(db_, criteria, true);
}

Result<std::size_t> LocalStore::purge_matching(const TelemetryRowCriteria& criteria,
                                               const PurgeHooks& hooks) {
    auto valid = validate(criteria);
    if (valid.is_error()) {
        return Result<std::size_t>::error(valid.error_code(), valid.error_message());
    }

    auto exists = table_exists(db_, criteria.table);
    if (exists.is_error()) {
        return Result<std::size_t>::error(exists.error_code(), exists.error_message());
    }
    if (!exists.value() || criteria.patterns.empty()) {
        return Result<std::size_t>::ok(0);
    }

    auto begun = retry_while_locked(options_, [this]() {
        int begin_rc = exec(db_, "BEGIN IMMEDIATE");
        if (begin_rc != SQLITE_OK) {
            return Result<void>::error(error_from_sqlite(begin_rc),
                                       describe(db_, "Cannot start transaction"));
        }
        return Result<void>::ok();
    });
    if (begun.is_error()) {
        return Result<std::size_t>::error(begun.error_code(),
                                          path_.string() + ": " + begun.error_message());
    }

    auto fail = [this](ErrorCode code, const std::string& message) {
        (void)exec(db_, "ROLLBACK");
        return Result<std::size_t>::error(code, path_.string() + ": " + message);
    };

    auto expected = count(db_, criteria, true);
    if (expected.is_error()) {
        return fail(expected.error_code(), expected.error_message());
    }

    auto stmt = prepare(db_, "DELETE FROM " + quote(criteria.table) + " WHERE " +
                                 where_clause(criteria));
    if (stmt.is_error()) {
        return fail(stmt.error_code(), stmt.error_message());
    }
    auto bound = bind_patterns(db_, stmt.value().get(), criteria);
    if (bound.is_error()) {
        return fail(bound.error_code(), bound.error_message());
    }

    int rc = sqlite3_step(stmt.value().get());
    if (rc != SQLITE_DONE) {
        return fail(error_from_sqlite(rc), describe(db_, "Delete failed"));
    }
    stmt.value().reset();

    auto removed = static_cast<std::size_t>(sqlite3_changes(db_));
    if (removed != expected.value()) {
        return fail(ErrorCode::WriteFailure, "Removed " + std::to_string(removed) + " rows, expected " +
                                                 std::to_string(expected.value()));
    }

    if (hooks.before_commit && !hooks.before_commit()) {
        return fail(ErrorCode::WriteFailure, "Purge interrupted before commit");
    }

    rc = exec(db_, "COMMIT");
    if (rc != SQLITE_OK) {
        return fail(error_from_sqlite(rc), describe(db_, "Commit failed"));
    }

    return Result<std::size_t>::ok(removed);
}

Result<void> LocalStore::compact() {
    int rc = exec(db_, "VACUUM");
    if (rc != SQLITE_OK) {
        return Result<void>::error(error_from_sqlite(rc), describe(db_, "Compaction failed"));
    }
    return Result<void>::ok();
}

bool should_compact(std::size_t removed, std::size_t total, double threshold) noexcept {
    if (removed == 0 || total == 0) {
        return false;
    }
    return static_cast<double>(removed) / static_cast<double>(total) > threshold;
}

}  // namespace purger
}  // namespace idscrub
