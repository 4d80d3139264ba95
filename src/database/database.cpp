#include "database/database.h"
#include <sqlite3.h>
#include <mutex>

namespace curator {
namespace database {

struct WriteBatch::Impl {
    struct Op {
        std::string key;
        std::vector<uint8_t> value;
    };
    std::vector<Op> ops;
};

WriteBatch::WriteBatch() : impl_(std::make_unique<Impl>()) {}
WriteBatch::~WriteBatch() = default;

void WriteBatch::put(const std::string& key, const std::vector<uint8_t>& value) {
    impl_->ops.push_back({key, value});
}

void WriteBatch::clear() {
    impl_->ops.clear();
}

struct Database::Impl {
    sqlite3* db = nullptr;
    std::string lastError;
    mutable std::mutex mtx;

    void recordError() {
        lastError = db ? sqlite3_errmsg(db) : "database not open";
    }

    bool exec(const char* sql) {
        char* errMsg = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
        if (rc != SQLITE_OK) {
            lastError = errMsg ? errMsg : "sqlite error";
            sqlite3_free(errMsg);
            return false;
        }
        return true;
    }

    bool putLocked(const std::string& key, const std::vector<uint8_t>& value) {
        sqlite3_stmt* stmt = nullptr;
        const char* sql = "INSERT OR REPLACE INTO kv (key, value) VALUES (?, ?);";
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            recordError();
            return false;
        }
        sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_blob(stmt, 2, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
        int rc = sqlite3_step(stmt);
        if (rc != SQLITE_DONE) recordError();
        sqlite3_finalize(stmt);
        return rc == SQLITE_DONE;
    }

};

// Keys sharing a prefix form the half-open range [prefix, prefix + 0xFF).
static std::string prefixUpperBound(const std::string& prefix) {
    return prefix + std::string(1, static_cast<char>(0xFF));
}

Database::Database() : impl_(std::make_unique<Impl>()) {}

Database::~Database() { close(); }

bool Database::open(const std::string& path) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (impl_->db) return false;

    if (sqlite3_open(path.c_str(), &impl_->db) != SQLITE_OK) {
        impl_->recordError();
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
        return false;
    }

    if (!impl_->exec("CREATE TABLE IF NOT EXISTS kv (key TEXT PRIMARY KEY, value BLOB);")) {
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
        return false;
    }

    impl_->exec("PRAGMA journal_mode=WAL;");
    impl_->exec("PRAGMA synchronous=NORMAL;");
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

std::vector<uint8_t> Database::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return {};

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(impl_->db, "SELECT value FROM kv WHERE key = ?;", -1, &stmt, nullptr) != SQLITE_OK) {
        return {};
    }
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

    std::vector<uint8_t> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        const uint8_t* blob = static_cast<const uint8_t*>(sqlite3_column_blob(stmt, 0));
        int blobSize = sqlite3_column_bytes(stmt, 0);
        if (blob && blobSize > 0) result.assign(blob, blob + blobSize);
    }
    sqlite3_finalize(stmt);
    return result;
}

bool Database::write(WriteBatch& batch) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return false;

    if (!impl_->exec("BEGIN IMMEDIATE TRANSACTION;")) return false;

    for (const auto& op : batch.impl_->ops) {
        if (!impl_->putLocked(op.key, op.value)) {
            std::string err = impl_->lastError;
            impl_->exec("ROLLBACK;");
            impl_->lastError = err;
            return false;
        }
    }

    if (!impl_->exec("COMMIT;")) {
        impl_->exec("ROLLBACK;");
        return false;
    }
    batch.clear();
    return true;
}

void Database::forEach(const std::string& prefix,
                       std::function<bool(const std::string&, const std::vector<uint8_t>&)> fn) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return;

    sqlite3_stmt* stmt = nullptr;
    const char* sql = prefix.empty()
        ? "SELECT key, value FROM kv ORDER BY key;"
        : "SELECT key, value FROM kv WHERE key >= ? AND key < ? ORDER BY key;";
    if (sqlite3_prepare_v2(impl_->db, sql, -1, &stmt, nullptr) != SQLITE_OK) return;

    std::string upper = prefixUpperBound(prefix);
    if (!prefix.empty()) {
        sqlite3_bind_text(stmt, 1, prefix.c_str(), static_cast<int>(prefix.size()), SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, upper.c_str(), static_cast<int>(upper.size()), SQLITE_TRANSIENT);
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        std::string key = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        const uint8_t* blob = static_cast<const uint8_t*>(sqlite3_column_blob(stmt, 1));
        int blobSize = sqlite3_column_bytes(stmt, 1);
        std::vector<uint8_t> value;
        if (blob && blobSize > 0) value.assign(blob, blob + blobSize);
        if (!fn(key, value)) break;
    }
    sqlite3_finalize(stmt);
}

std::string Database::lastError() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->lastError;
}

}
}
