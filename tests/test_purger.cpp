#include <gtest/gtest.h>
#include <idscrub/purger.hpp>

#include <sqlite3.h>

#include "test_support.hpp"

#include <limits>
#include <memory>
#include <string>
#include <vector>

namespace idscrub {
namespace purger {
namespace {

using testing_support::read_text;
using testing_support::TempDirectory;
using testing_support::write_text;

namespace fs = std::filesystem;

struct ConnectionDeleter {
    void operator()(sqlite3* db) const { sqlite3_close(db); }
};
using Connection = std::unique_ptr<sqlite3, ConnectionDeleter>;

Connection open_raw(const fs::path& path) {
    sqlite3* raw = nullptr;
    int rc = sqlite3_open_v2(path.string().c_str(), &raw,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    Connection db(raw);
    EXPECT_EQ(rc, SQLITE_OK);
    return db;
}

void exec_raw(sqlite3* db, const std::string& sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
    EXPECT_EQ(rc, SQLITE_OK) << (err ? err : "") << " in: " << sql;
    sqlite3_free(err);
}

// Builds a store shaped like a host's state.vscdb
void create_store(const fs::path& path, const std::vector<std::string>& keys) {
    auto db = open_raw(path);
    exec_raw(db.get(), "CREATE TABLE ItemTable (key TEXT UNIQUE ON CONFLICT REPLACE, value BLOB)");
    for (const auto& key : keys) {
        exec_raw(db.get(), "INSERT INTO ItemTable (key, value) VALUES ('" + key + "', 'v')");
    }
}

std::vector<std::string> remaining_keys(const fs::path& path) {
    std::vector<std::string> keys;
    auto db = open_raw(path);
    sqlite3_stmt* stmt = nullptr;
    EXPECT_EQ(sqlite3_prepare_v2(db.get(), "SELECT key FROM ItemTable ORDER BY key", -1, &stmt,
                                 nullptr),
              SQLITE_OK);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        keys.emplace_back(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0)));
    }
    sqlite3_finalize(stmt);
    return keys;
}

TelemetryRowCriteria prefix_criteria(const std::string& prefix) {
    TelemetryRowCriteria criteria;
    criteria.patterns = {{MatchKind::Prefix, prefix}};
    return criteria;
}

class FakeLockProbe : public HostLockProbe {
  public:
    explicit FakeLockProbe(int locked_attempts) : locked_attempts_(locked_attempts) {}

    ErrorCode try_open_exclusive(const fs::path&) override {
        ++calls;
        return calls <= locked_attempts_ ? ErrorCode::StoreLocked : ErrorCode::Success;
    }

    int calls = 0;

  private:
    int locked_attempts_;
};

class PurgerTest : public ::testing::Test {
  protected:
    void SetUp() override {
        store_path = temp.path() / "state.vscdb";
        create_store(store_path, {"telemetry.foo", "telemetry.bar", "other.baz"});
    }

    TempDirectory temp;
    fs::path store_path;
};

// ==================== Purge ====================

TEST_F(PurgerTest, PrefixPurgeRemovesOnlyMatchingRows) {
    auto store = LocalStore::open(store_path);
    ASSERT_TRUE(store.is_ok()) << store.error_message();

    auto criteria = prefix_criteria("telemetry.");
    auto total = store.value().count_rows(criteria);
    auto matching = store.value().count_matching(criteria);
    ASSERT_TRUE(total.is_ok());
    ASSERT_TRUE(matching.is_ok());
    EXPECT_EQ(total.value(), 3u);
    EXPECT_EQ(matching.value(), 2u);

    auto removed = store.value().purge_matching(criteria);

    ASSERT_TRUE(removed.is_ok()) << removed.error_message();
    EXPECT_EQ(removed.value(), 2u);
    EXPECT_EQ(remaining_keys(store_path), std::vector<std::string>{"other.baz"});
}

TEST_F(PurgerTest, ContainsAndExactPatterns) {
    auto store = LocalStore::open(store_path);
    ASSERT_TRUE(store.is_ok());

    TelemetryRowCriteria criteria;
    criteria.patterns = {{MatchKind::Contains, ".ba"}, {MatchKind::Exact, "telemetry.fo"}};

    auto removed = store.value().purge_matching(criteria);

    ASSERT_TRUE(removed.is_ok());
    EXPECT_EQ(removed.value(), 2u);
    EXPECT_EQ(remaining_keys(store_path), std::vector<std::string>{"telemetry.foo"});
}

TEST_F(PurgerTest, WildcardCharactersAreLiteral) {
    create_store(temp.path() / "wild.vscdb", {"a%b", "axb", "a_c"});
    auto store = LocalStore::open(temp.path() / "wild.vscdb");
    ASSERT_TRUE(store.is_ok());

    TelemetryRowCriteria criteria;
    criteria.patterns = {{MatchKind::Prefix, "a%"}, {MatchKind::Contains, "_"}};

    auto removed = store.value().purge_matching(criteria);

    ASSERT_TRUE(removed.is_ok());
    EXPECT_EQ(removed.value(), 2u);
    EXPECT_EQ(remaining_keys(temp.path() / "wild.vscdb"), std::vector<std::string>{"axb"});
}

TEST_F(PurgerTest, SecondPurgeRemovesNothing) {
    auto store = LocalStore::open(store_path);
    ASSERT_TRUE(store.is_ok());
    auto criteria = prefix_criteria("telemetry.");

    ASSERT_TRUE(store.value().purge_matching(criteria).is_ok());
    auto again = store.value().purge_matching(criteria);

    ASSERT_TRUE(again.is_ok());
    EXPECT_EQ(again.value(), 0u);
}

TEST_F(PurgerTest, NoPatternsRemoveNothing) {
    auto store = LocalStore::open(store_path);
    ASSERT_TRUE(store.is_ok());

    auto removed = store.value().purge_matching(TelemetryRowCriteria{});

    ASSERT_TRUE(removed.is_ok());
    EXPECT_EQ(removed.value(), 0u);
    EXPECT_EQ(remaining_keys(store_path).size(), 3u);
}

TEST_F(PurgerTest, EmptyPatternIsInvalid) {
    auto store = LocalStore::open(store_path);
    ASSERT_TRUE(store.is_ok());

    auto removed = store.value().purge_matching(prefix_criteria(""));
    EXPECT_EQ(removed.error_code(), ErrorCode::InvalidParameter);
    EXPECT_EQ(remaining_keys(store_path).size(), 3u);
}

TEST_F(PurgerTest, InvalidTableNameIsRejected) {
    auto store = LocalStore::open(store_path);
    ASSERT_TRUE(store.is_ok());

    auto criteria = prefix_criteria("telemetry.");
    criteria.table = "ItemTable; DROP TABLE ItemTable";

    EXPECT_EQ(store.value().purge_matching(criteria).error_code(), ErrorCode::InvalidParameter);
}

TEST_F(PurgerTest, MissingTableCountsZero) {
    auto store = LocalStore::open(store_path);
    ASSERT_TRUE(store.is_ok());

    auto criteria = prefix_criteria("telemetry.");
    criteria.table = "cursorDiskKV";

    auto total = store.value().count_rows(criteria);
    auto removed = store.value().purge_matching(criteria);
    ASSERT_TRUE(total.is_ok());
    ASSERT_TRUE(removed.is_ok());
    EXPECT_EQ(total.value(), 0u);
    EXPECT_EQ(removed.value(), 0u);
}

// ==================== All-or-nothing ====================

TEST_F(PurgerTest, InterruptBeforeCommitLeavesStoreUnchanged) {
    std::string before = read_text(store_path);
    {
        auto store = LocalStore::open(store_path);
        ASSERT_TRUE(store.is_ok());

        PurgeHooks hooks;
        bool called = false;
        hooks.before_commit = [&] {
            called = true;
            return false;
        };

        auto removed = store.value().purge_matching(prefix_criteria("telemetry."), hooks);

        EXPECT_TRUE(called);
        EXPECT_EQ(removed.error_code(), ErrorCode::WriteFailure);
    }

    EXPECT_EQ(remaining_keys(store_path).size(), 3u);
    EXPECT_EQ(read_text(store_path), before);
}

TEST_F(PurgerTest, FailingDeleteRollsBack) {
    {
        auto db = open_raw(store_path);
        exec_raw(db.get(),
                 "CREATE TRIGGER guard_bar BEFORE DELETE ON ItemTable "
                 "WHEN old.key = 'telemetry.bar' BEGIN SELECT RAISE(ABORT, 'refused'); END");
    }
    std::string before = read_text(store_path);
    {
        auto store = LocalStore::open(store_path);
        ASSERT_TRUE(store.is_ok());

        auto removed = store.value().purge_matching(prefix_criteria("telemetry."));
        EXPECT_TRUE(removed.is_error());
        EXPECT_EQ(removed.error_code(), ErrorCode::WriteFailure);

        auto matching = store.value().count_matching(prefix_criteria("telemetry."));
        ASSERT_TRUE(matching.is_ok());
        EXPECT_EQ(matching.value(), 2u);
    }

    EXPECT_EQ(read_text(store_path), before);
}

// ==================== Open ====================

TEST_F(PurgerTest, LockedStoreIsRetriedThenReported) {
    auto holder = open_raw(store_path);
    exec_raw(holder.get(), "BEGIN EXCLUSIVE");

    OpenOptions options;
    options.max_retries = 1;
    options.retry_interval_ms = 1;
    std::vector<int> delays;
    options.on_retry = [&](int attempt, int delay_ms) {
        EXPECT_EQ(attempt, static_cast<int>(delays.size()) + 1);
        delays.push_back(delay_ms);
    };

    auto store = LocalStore::open(store_path, options);

    EXPECT_EQ(store.error_code(), ErrorCode::StoreLocked);
    EXPECT_EQ(delays, std::vector<int>{1});
    exec_raw(holder.get(), "ROLLBACK");
}

TEST_F(PurgerTest, BackoffDoublesUntilUnlocked) {
    auto probe = std::make_shared<FakeLockProbe>(2);
    OpenOptions options;
    options.probe = probe;
    options.max_retries = 3;
    options.retry_interval_ms = 1;
    std::vector<int> delays;
    options.on_retry = [&](int, int delay_ms) { delays.push_back(delay_ms); };

    auto store = LocalStore::open(store_path, options);

    ASSERT_TRUE(store.is_ok()) << store.error_message();
    EXPECT_EQ(probe->calls, 3);
    EXPECT_EQ(delays, (std::vector<int>{1, 2}));
}

TEST_F(PurgerTest, HostLockDuringPurgeIsRetried) {
    OpenOptions options;
    options.max_retries = 2;
    options.retry_interval_ms = 1;
    auto holder = open_raw(store_path);
    std::vector<int> delays;
    options.on_retry = [&](int, int delay_ms) {
        delays.push_back(delay_ms);
        exec_raw(holder.get(), "ROLLBACK");
    };

    auto store = LocalStore::open(store_path, options);
    ASSERT_TRUE(store.is_ok()) << store.error_message();
    exec_raw(holder.get(), "BEGIN IMMEDIATE");  // host starts writing after the probe

    auto removed = store.value().purge_matching(prefix_criteria("telemetry."));

    ASSERT_TRUE(removed.is_ok()) << removed.error_message();
    EXPECT_EQ(removed.value(), 2u);
    EXPECT_EQ(delays, std::vector<int>{1});
    EXPECT_EQ(remaining_keys(store_path), std::vector<std::string>{"other.baz"});
}

TEST_F(PurgerTest, HostLockDuringPurgeWithoutRetriesIsReported) {
    OpenOptions options;
    options.max_retries = 0;
    auto store = LocalStore::open(store_path, options);
    ASSERT_TRUE(store.is_ok()) << store.error_message();

    auto holder = open_raw(store_path);
    exec_raw(holder.get(), "BEGIN IMMEDIATE");
    auto removed = store.value().purge_matching(prefix_criteria("telemetry."));
    exec_raw(holder.get(), "ROLLBACK");

    EXPECT_EQ(removed.error_code(), ErrorCode::StoreLocked);
    EXPECT_EQ(remaining_keys(store_path).size(), 3u);
}

TEST(RetryDelayTest, DoublesUpToCap) {
    EXPECT_EQ(next_retry_delay(1), 2);
    EXPECT_EQ(next_retry_delay(200), 400);
    EXPECT_EQ(next_retry_delay(MAX_RETRY_DELAY_MS / 2), MAX_RETRY_DELAY_MS);
    EXPECT_EQ(next_retry_delay(3000), MAX_RETRY_DELAY_MS);
    EXPECT_EQ(next_retry_delay(MAX_RETRY_DELAY_MS), MAX_RETRY_DELAY_MS);
    EXPECT_EQ(next_retry_delay(std::numeric_limits<int>::max()), MAX_RETRY_DELAY_MS);
    EXPECT_EQ(next_retry_delay(0), 0);
}

TEST_F(PurgerTest, ZeroRetriesFailsImmediately) {
    auto probe = std::make_shared<FakeLockProbe>(1);
    OpenOptions options;
    options.probe = probe;
    options.max_retries = 0;

    auto store = LocalStore::open(store_path, options);

    EXPECT_EQ(store.error_code(), ErrorCode::StoreLocked);
    EXPECT_EQ(probe->calls, 1);
}

TEST_F(PurgerTest, SqliteProbeSeesHolder) {
    SqliteLockProbe probe;
    EXPECT_FALSE(probe.is_locked(store_path));

    auto holder = open_raw(store_path);
    exec_raw(holder.get(), "BEGIN EXCLUSIVE");
    EXPECT_TRUE(probe.is_locked(store_path));
    exec_raw(holder.get(), "ROLLBACK");

    EXPECT_EQ(probe.try_open_exclusive(store_path), ErrorCode::Success);
}

TEST_F(PurgerTest, GarbageFileIsCorrupt) {
    auto path = temp.path() / "garbage.vscdb";
    write_text(path, std::string(4096, 'x'));

    auto store = LocalStore::open(path);
    EXPECT_EQ(store.error_code(), ErrorCode::StoreCorrupt);
}

TEST_F(PurgerTest, MissingFileIsNotFound) {
    auto store = LocalStore::open(temp.path() / "absent.vscdb");
    EXPECT_EQ(store.error_code(), ErrorCode::NotFound);
    EXPECT_FALSE(fs::exists(temp.path() / "absent.vscdb"));
}

TEST_F(PurgerTest, MovedStoreStaysUsable) {
    auto opened = LocalStore::open(store_path);
    ASSERT_TRUE(opened.is_ok());
    LocalStore store = std::move(opened).value();
    EXPECT_EQ(store.path(), store_path);

    auto removed = store.purge_matching(prefix_criteria("telemetry."));
    ASSERT_TRUE(removed.is_ok());
    EXPECT_EQ(removed.value(), 2u);
}

// ==================== Compaction ====================

TEST_F(PurgerTest, CompactAfterPurge) {
    auto store = LocalStore::open(store_path);
    ASSERT_TRUE(store.is_ok());
    ASSERT_TRUE(store.value().purge_matching(prefix_criteria("telemetry.")).is_ok());

    auto compacted = store.value().compact();

    ASSERT_TRUE(compacted.is_ok()) << compacted.error_message();
    EXPECT_EQ(remaining_keys(store_path), std::vector<std::string>{"other.baz"});
}

TEST(ShouldCompactTest, Threshold) {
    EXPECT_FALSE(should_compact(0, 100, 0.25));
    EXPECT_FALSE(should_compact(5, 0, 0.25));
    EXPECT_FALSE(should_compact(25, 100, 0.25));
    EXPECT_TRUE(should_compact(26, 100, 0.25));
    EXPECT_TRUE(should_compact(1, 1, 0.0));
}

TEST(SqliteErrorTest, Mapping) {
    EXPECT_EQ(error_from_sqlite(SQLITE_OK), ErrorCode::Success);
    EXPECT_EQ(error_from_sqlite(SQLITE_BUSY), ErrorCode::StoreLocked);
    EXPECT_EQ(error_from_sqlite(SQLITE_BUSY_SNAPSHOT), ErrorCode::StoreLocked);
    EXPECT_EQ(error_from_sqlite(SQLITE_NOTADB), ErrorCode::StoreCorrupt);
    EXPECT_EQ(error_from_sqlite(SQLITE_CANTOPEN), ErrorCode::NotFound);
    EXPECT_EQ(error_from_sqlite(SQLITE_READONLY), ErrorCode::PermissionDenied);
    EXPECT_EQ(error_from_sqlite(SQLITE_CONSTRAINT), ErrorCode::WriteFailure);
    EXPECT_EQ(error_from_sqlite(SQLITE_MISUSE), ErrorCode::Unknown);
}

}  // namespace
}  // namespace purger
}  // namespace idscrub
