#include "database/database.h"
#include <sqlite3.h>
#include <mutex>
#include <utility>

namespace zackathon {
namespace database {

namespace {

// Owns one prepared statement for the duration of a call.
class Statement {
public:
    Statement(sqlite3* db, const char* sql) {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) stmt_ = nullptr;
    }
    ~Statement() { sqlite3_finalize(stmt_); }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    bool ok() const { return stmt_ != nullptr; }
    sqlite3_stmt* get() const { return stmt_; }

    void bindText(int index, const std::string& text) {
        sqlite3_bind_text(stmt_, index, text.c_str(), static_cast<int>(text.size()), SQLITE_TRANSIENT);
    }

    void bindBlob(int index, const std::vector<uint8_t>& blob) {
        sqlite3_bind_blob(stmt_, index, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
    }

    std::vector<uint8_t> columnBlob(int index) const {
        const auto* data = static_cast<const uint8_t*>(sqlite3_column_blob(stmt_, index));
        int size = sqlite3_column_bytes(stmt_, index);
        if (!data || size <= 0) return {};
        return std::vector<uint8_t>(data, data + size);
    }

private:
    sqlite3_stmt* stmt_ = nullptr;
};

}

struct WriteBatch::Impl {
    std::vector<std::pair<std::string, std::vector<uint8_t>>> puts;
};

WriteBatch::WriteBatch() : impl_(std::make_unique<Impl>()) {}
WriteBatch::~WriteBatch() = default;

void WriteBatch::put(const std::string& key, const std::vector<uint8_t>& value) {
    impl_->puts.emplace_back(key, value);
}

struct Database::Impl {
    sqlite3* db = nullptr;
    std::string lastError;
    mutable std::mutex mtx;

    bool exec(const char* sql) {
        char* errMsg = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
        if (rc != SQLITE_OK) {
            lastError = errMsg ? errMsg : sqlite3_errstr(rc);
            sqlite3_free(errMsg);
            return false;
        }
        return true;
    }

    bool putLocked(const std::string& key, const std::vector<uint8_t>& value) {
        Statement stmt(db, "INSERT OR REPLACE INTO kv (key, value) VALUES (?1, ?2);");
        if (!stmt.ok()) {
            lastError = sqlite3_errmsg(db);
            return false;
        }
        stmt.bindText(1, key);
        stmt.bindBlob(2, value);
        if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
            lastError = sqlite3_errmsg(db);
            return false;
        }
        return true;
    }
};

Database::Database() : impl_(std::make_unique<Impl>()) {}

Database::~Database() { close(); }

bool Database::open(const std::string& path) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (impl_->db) return false;

    int rc = sqlite3_open(path.c_str(), &impl_->db);
    if (rc != SQLITE_OK) {
        impl_->lastError = impl_->db ? sqlite3_errmsg(impl_->db) : sqlite3_errstr(rc);
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
        return false;
    }

    // The contract store and the local encryption service share one file.
    sqlite3_busy_timeout(impl_->db, 1000);
    if (!impl_->exec("CREATE TABLE IF NOT EXISTS kv (key TEXT PRIMARY KEY, value BLOB);") ||
        !impl_->exec("PRAGMA journal_mode=WAL;") ||
        !impl_->exec("PRAGMA synchronous=NORMAL;")) {
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
        return false;
    }
    return true;
}

void Database::close() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (impl_->db) {
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
    }
}

bool Database::isOpen() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->db != nullptr;
}

bool Database::put(const std::string& key, const std::vector<uint8_t>& value) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return false;
    return impl_->putLocked(key, value);
}

std::vector<uint8_t> Database::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return {};

    Statement stmt(impl_->db, "SELECT value FROM kv WHERE key = ?1;");
    if (!stmt.ok()) return {};
    stmt.bindText(1, key);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) return {};
    return stmt.columnBlob(0);
}

bool Database::write(const WriteBatch& batch) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return false;
    if (!impl_->exec("BEGIN IMMEDIATE;")) return false;

    for (const auto& [key, value] : batch.impl_->puts) {
        if (!impl_->putLocked(key, value)) {
            std::string cause = impl_->lastError;
            impl_->exec("ROLLBACK;");
            impl_->lastError = cause;
            return false;
        }
    }
    if (!impl_->exec("COMMIT;")) {
        std::string cause = impl_->lastError;
        impl_->exec("ROLLBACK;");
        impl_->lastError = cause;
        return false;
    }
    return true;
}

void Database::forEach(const std::string& prefix, Visitor fn) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return;

    Statement stmt(impl_->db,
                   "SELECT key, value FROM kv WHERE substr(key, 1, length(?1)) = ?1 ORDER BY key;");
    if (!stmt.ok()) return;
    stmt.bindText(1, prefix);

    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        const auto* text = sqlite3_column_text(stmt.get(), 0);
        std::string key = text ? reinterpret_cast<const char*>(text) : "";
        if (!fn(key, stmt.columnBlob(1))) break;
    }
}

std::string Database::lastError() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->lastError;
}

bool Database::beginTransaction() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return false;
    return impl_->exec("BEGIN TRANSACTION;");
}

bool Database::rollbackTransaction() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return false;
    return impl_->exec("ROLLBACK;");
}

}
}
