#include "SqliteStorageTier.hpp"

#include "Errors.hpp"

#include <algorithm>
#include <filesystem>
#include <stdexcept>

#include <spdlog/spdlog.h>
#include <sqlite3.h>

namespace hs {

namespace {

[[noreturn]] void fail(sqlite3* db, const std::string& what) {
    std::string detail = db ? sqlite3_errmsg(db) : "database is not open";
    throw StorageUnavailable(what + ": " + detail);
}

// ---------------------------------------------------------------------------
// RAII helper for SQLite transactions
// ---------------------------------------------------------------------------

class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) {
        if (sqlite3_exec(db_, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr) != SQLITE_OK) {
            fail(db_, "BEGIN failed");
        }
    }
    void commit() {
        if (!committed_) {
            if (sqlite3_exec(db_, "COMMIT", nullptr, nullptr, nullptr) != SQLITE_OK) {
                fail(db_, "COMMIT failed");
            }
            committed_ = true;
        }
    }
    ~Transaction() {
        if (!committed_) {
            sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
        }
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

private:
    sqlite3* db_;
    bool committed_ = false;
};

// ---------------------------------------------------------------------------
// RAII helper for SQLite prepared statements
// ---------------------------------------------------------------------------

class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : db_(db) {
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
            stmt_ = nullptr;
            fail(db_, "prepare failed");
        }
    }
    ~Statement() {
        if (stmt_) sqlite3_finalize(stmt_);
    }
    operator sqlite3_stmt*() const { return stmt_; }

    void bind(int index, const std::string& value) {
        sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT);
    }

    /// Step a statement that must not return rows.
    void run(const char* what) {
        if (sqlite3_step(stmt_) != SQLITE_DONE) fail(db_, what);
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

private:
    sqlite3*      db_;
    sqlite3_stmt* stmt_ = nullptr;
};

std::string column_string(sqlite3_stmt* stmt, int col) {
    const char* t = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return t ? t : "";
}

PersistenceRecord read_record(sqlite3_stmt* stmt) {
    PersistenceRecord r;
    r.id         = column_string(stmt, 0);
    r.session_id = column_string(stmt, 1);
    r.related_id = column_string(stmt, 2);
    r.saved_at   = sqlite3_column_int64(stmt, 3);
    r.payload    = column_string(stmt, 4);

    const void* blob = sqlite3_column_blob(stmt, 5);
    int blob_size    = sqlite3_column_bytes(stmt, 5);
    if (blob && blob_size > 0) {
        const auto* data = static_cast<const uint8_t*>(blob);
        r.blob.assign(data, data + blob_size);
    }
    return r;
}

const char* kRecordColumns = "id, session_id, related_id, saved_at, payload, blob";

void delete_where(sqlite3* db, StoreKind store, const char* column, const std::string& value) {
    Statement stmt(db, std::string("DELETE FROM ") + store_to_string(store) +
                           " WHERE " + column + " = ?");
    stmt.bind(1, value);
    stmt.run("delete failed");
}

void delete_volatile(sqlite3* db, const std::string& scope, const std::string& key) {
    Statement stmt(db, "DELETE FROM scoped_values WHERE scope = ? AND key = ?");
    stmt.bind(1, scope);
    stmt.bind(2, key);
    stmt.run("volatile delete failed");
}

} // namespace

// ---------------------------------------------------------------------------
// BatchTransaction
// ---------------------------------------------------------------------------

class SqliteStorageTier::BatchTransaction : public StorageTransaction {
public:
    BatchTransaction(SqliteStorageTier& owner, std::vector<StoreKind> stores)
        : owner_(owner), stores_(std::move(stores)) {}

    void remove(StoreKind store, const std::string& key) override {
        check_scope(store);
        ops_.push_back({Op::Kind::by_key, store, key});
    }

    void remove_by_session(StoreKind store, const std::string& session_id) override {
        check_scope(store);
        ops_.push_back({Op::Kind::by_session, store, session_id});
    }

    void remove_volatile(const std::string& key) override {
        ops_.push_back({Op::Kind::scoped_value, StoreKind::sessions, key});
    }

    void commit() override {
        if (committed_) return;

        std::lock_guard<std::mutex> lock(owner_.mu_);
        owner_.require_open();

        Transaction txn(owner_.db_);
        for (const auto& op : ops_) {
            switch (op.kind) {
                case Op::Kind::by_key:
                    delete_where(owner_.db_, op.store, "id", op.value);
                    break;
                case Op::Kind::by_session:
                    delete_where(owner_.db_, op.store, "session_id", op.value);
                    break;
                case Op::Kind::scoped_value:
                    delete_volatile(owner_.db_, owner_.scope_, op.value);
                    break;
            }
        }
        txn.commit();
        committed_ = true;
    }

private:
    struct Op {
        enum class Kind { by_key, by_session, scoped_value };
        Kind        kind;
        StoreKind   store;
        std::string value;
    };

    void check_scope(StoreKind store) const {
        if (std::find(stores_.begin(), stores_.end(), store) == stores_.end()) {
            throw std::logic_error(std::string("store '") + store_to_string(store) +
                                   "' is not part of this transaction");
        }
    }

    SqliteStorageTier&     owner_;
    std::vector<StoreKind> stores_;
    std::vector<Op>        ops_;
    bool                   committed_ = false;
};

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

SqliteStorageTier::SqliteStorageTier(const std::string& db_path, const std::string& scope)
    : db_path_(db_path), scope_(scope) {}

SqliteStorageTier::~SqliteStorageTier() {
    close();
}

// ---------------------------------------------------------------------------
// open / close / is_open
// ---------------------------------------------------------------------------

bool SqliteStorageTier::open() {
    std::lock_guard<std::mutex> lock(mu_);

    if (db_) return true;   // already open

    if (db_path_.empty()) return false;

    // Ensure parent directory exists.
    std::error_code ec;
    auto parent = std::filesystem::path(db_path_).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            spdlog::warn("[SqliteStorageTier] cannot create {}: {}", parent.string(), ec.message());
            return false;
        }
    }

    int rc = sqlite3_open(db_path_.c_str(), &db_);
    if (rc != SQLITE_OK) {
        spdlog::warn("[SqliteStorageTier] cannot open {}: {}", db_path_,
                     db_ ? sqlite3_errmsg(db_) : "out of memory");
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        return false;
    }

    // Enable WAL mode for crash safety.
    sqlite3_exec(db_, "PRAGMA journal_mode=WAL", nullptr, nullptr, nullptr);
    sqlite3_busy_timeout(db_, 2000);

    if (!create_tables()) {
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }
    return true;
}

void SqliteStorageTier::close() {
    std::lock_guard<std::mutex> lock(mu_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool SqliteStorageTier::is_open() const {
    std::lock_guard<std::mutex> lock(mu_);
    return db_ != nullptr;
}

// ---------------------------------------------------------------------------
// create_tables
// ---------------------------------------------------------------------------

bool SqliteStorageTier::create_tables() {
    std::string sql;
    for (StoreKind store : {StoreKind::media, StoreKind::transcripts,
                            StoreKind::highlights, StoreKind::sessions}) {
        const std::string table = store_to_string(store);
        sql += "CREATE TABLE IF NOT EXISTS " + table + " ("
               "id TEXT PRIMARY KEY, "
               "session_id TEXT NOT NULL, "
               "related_id TEXT NOT NULL DEFAULT '', "
               "saved_at INTEGER NOT NULL, "
               "payload TEXT NOT NULL, "
               "blob BLOB);"
               "CREATE INDEX IF NOT EXISTS idx_" + table + "_session ON " + table + "(session_id);"
               "CREATE INDEX IF NOT EXISTS idx_" + table + "_related ON " + table + "(related_id);";
    }
    sql += R"SQL(
        CREATE TABLE IF NOT EXISTS scoped_values (
            scope TEXT NOT NULL,
            key TEXT NOT NULL,
            value TEXT NOT NULL,
            PRIMARY KEY (scope, key)
        );
    )SQL";

    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        spdlog::warn("[SqliteStorageTier] schema creation failed: {}", err ? err : "unknown");
        if (err) sqlite3_free(err);
        return false;
    }
    return true;
}

void SqliteStorageTier::require_open() const {
    if (!db_) {
        throw StorageUnavailable("database '" + db_path_ + "' is not open");
    }
}

// ---------------------------------------------------------------------------
// Durable tier
// ---------------------------------------------------------------------------

void SqliteStorageTier::put_durable(StoreKind store, const PersistenceRecord& record) {
    std::lock_guard<std::mutex> lock(mu_);
    require_open();

    Transaction txn(db_);

    Statement stmt(db_, std::string("INSERT OR REPLACE INTO ") + store_to_string(store) +
                            " (" + kRecordColumns + ") VALUES (?, ?, ?, ?, ?, ?)");
    stmt.bind(1, record.id);
    stmt.bind(2, record.session_id);
    stmt.bind(3, record.related_id);
    sqlite3_bind_int64(stmt, 4, record.saved_at);
    stmt.bind(5, record.payload);
    if (record.blob.empty()) {
        sqlite3_bind_null(stmt, 6);
    } else {
        sqlite3_bind_blob(stmt, 6, record.blob.data(),
                          static_cast<int>(record.blob.size()), SQLITE_TRANSIENT);
    }
    stmt.run("insert failed");

    txn.commit();
}

std::optional<PersistenceRecord> SqliteStorageTier::get_durable(StoreKind store,
                                                                const std::string& key) {
    auto rows = select_records(store, "id", key);
    if (rows.empty()) return std::nullopt;
    return std::move(rows.front());
}

std::vector<PersistenceRecord> SqliteStorageTier::get_all_durable(StoreKind store) {
    return select_records(store, nullptr, "");
}

std::vector<PersistenceRecord> SqliteStorageTier::get_by_session(StoreKind store,
                                                                 const std::string& session_id) {
    return select_records(store, "session_id", session_id);
}

std::vector<PersistenceRecord> SqliteStorageTier::get_by_related(StoreKind store,
                                                                 const std::string& related_id) {
    return select_records(store, "related_id", related_id);
}

std::vector<PersistenceRecord> SqliteStorageTier::select_records(StoreKind store,
                                                                 const char* where_column,
                                                                 const std::string& value) {
    std::lock_guard<std::mutex> lock(mu_);
    require_open();

    std::string sql = std::string("SELECT ") + kRecordColumns + " FROM " + store_to_string(store);
    if (where_column) {
        sql += std::string(" WHERE ") + where_column + " = ?";
    }
    sql += " ORDER BY saved_at DESC, id ASC";

    Statement stmt(db_, sql);
    if (where_column) stmt.bind(1, value);

    std::vector<PersistenceRecord> results;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        results.push_back(read_record(stmt));
    }
    if (rc != SQLITE_DONE) fail(db_, "select failed");

    return results;
}

void SqliteStorageTier::delete_durable(StoreKind store, const std::string& key) {
    std::lock_guard<std::mutex> lock(mu_);
    require_open();

    Transaction txn(db_);
    delete_where(db_, store, "id", key);
    txn.commit();
}

std::unique_ptr<StorageTransaction> SqliteStorageTier::begin_transaction(
    const std::vector<StoreKind>& stores) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        require_open();
    }
    return std::make_unique<BatchTransaction>(*this, stores);
}

// ---------------------------------------------------------------------------
// Volatile tier
// ---------------------------------------------------------------------------

void SqliteStorageTier::put_volatile(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mu_);
    require_open();

    Statement stmt(db_, "INSERT OR REPLACE INTO scoped_values (scope, key, value) VALUES (?, ?, ?)");
    stmt.bind(1, scope_);
    stmt.bind(2, key);
    stmt.bind(3, value);
    stmt.run("volatile insert failed");
}

std::optional<std::string> SqliteStorageTier::get_volatile(const std::string& key) {
    std::lock_guard<std::mutex> lock(mu_);
    require_open();

    Statement stmt(db_, "SELECT value FROM scoped_values WHERE scope = ? AND key = ?");
    stmt.bind(1, scope_);
    stmt.bind(2, key);

    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) return column_string(stmt, 0);
    if (rc != SQLITE_DONE) fail(db_, "volatile select failed");
    return std::nullopt;
}

void SqliteStorageTier::remove_volatile(const std::string& key) {
    std::lock_guard<std::mutex> lock(mu_);
    require_open();
    delete_volatile(db_, scope_, key);
}

std::vector<std::string> SqliteStorageTier::volatile_keys(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mu_);
    require_open();

    Statement stmt(db_,
                   "SELECT key FROM scoped_values "
                   "WHERE scope = ?1 AND substr(key, 1, length(?2)) = ?2 ORDER BY key");
    stmt.bind(1, scope_);
    stmt.bind(2, prefix);

    std::vector<std::string> keys;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        keys.push_back(column_string(stmt, 0));
    }
    if (rc != SQLITE_DONE) fail(db_, "volatile key scan failed");
    return keys;
}

} // namespace hs
