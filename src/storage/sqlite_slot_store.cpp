#include <chrono>
#include <keyreg/storage/sqlite_slot_store.hpp>
#include <sqlite3.h>

namespace keyreg::storage {

    namespace {

        int bindBlob(sqlite3_stmt *stmt, int index, const uint8_t *data, size_t size) {
            if (size == 0) {
                return sqlite3_bind_zeroblob(stmt, index, 0);
            }
            return sqlite3_bind_blob(stmt, index, data, static_cast<int>(size), SQLITE_TRANSIENT);
        }

        int bindAddress(sqlite3_stmt *stmt, int index, const Pubkey &address) {
            return bindBlob(stmt, index, address.bytes().data(), address.bytes().size());
        }

        std::vector<uint8_t> columnBlob(sqlite3_stmt *stmt, int column) {
            const void *blob = sqlite3_column_blob(stmt, column);
            int size = sqlite3_column_bytes(stmt, column);
            if (blob == nullptr || size <= 0) {
                return {};
            }
            return std::vector<uint8_t>(static_cast<const uint8_t *>(blob), static_cast<const uint8_t *>(blob) + size);
        }

    } // namespace

    // ===========================================
    // Utility functions implementation
    // ===========================================

    int64_t currentTimestamp() {
        return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
            .count();
    }

    // ===========================================
    // SqliteSlotStore implementation
    // ===========================================

    SqliteSlotStore::SqliteSlotStore() : db_(nullptr), is_open_(false) {}

    SqliteSlotStore::~SqliteSlotStore() { close(); }

    dp::Result<void, dp::Error> SqliteSlotStore::open(const std::string &path, const OpenOptions &opts) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (db_) {
            return dp::Result<void, dp::Error>::err(dp::Error::invalid_argument("Store already open"));
        }

        int rc = sqlite3_open(path.c_str(), &db_);
        if (rc != SQLITE_OK) {
            auto error = lastError("Failed to open " + path);
            if (db_) {
                sqlite3_close(db_);
                db_ = nullptr;
            }
            is_open_ = false;
            return dp::Result<void, dp::Error>::err(error);
        }

        db_path_ = path;
        is_open_ = true;

        auto pragmas = applyPragmas(opts);
        if (!pragmas.is_ok()) {
            sqlite3_close(db_);
            db_ = nullptr;
            is_open_ = false;
            return pragmas;
        }
        return dp::Result<void, dp::Error>::ok();
    }

    void SqliteSlotStore::close() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
            is_open_ = false;
        }
    }

    bool SqliteSlotStore::isOpen() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return is_open_;
    }

    dp::Error SqliteSlotStore::lastError(const std::string &context) const {
        std::string message = context;
        if (db_) {
            message += ": ";
            message += sqlite3_errmsg(db_);
        }
        return storage_failed(dp::String(message.c_str()));
    }

    dp::Result<void, dp::Error> SqliteSlotStore::executeSql(const char *sql) {
        char *err_msg = nullptr;
        int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err_msg);
        if (rc != SQLITE_OK) {
            std::string message = "SQL error: ";
            message += err_msg ? err_msg : "unknown";
            sqlite3_free(err_msg);
            return dp::Result<void, dp::Error>::err(storage_failed(dp::String(message.c_str())));
        }
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> SqliteSlotStore::applyPragmas(const OpenOptions &opts) {
        // In-memory databases do not support WAL
        if (opts.enable_wal && db_path_ != ":memory:") {
            auto wal = executeSql("PRAGMA journal_mode=WAL;");
            if (!wal.is_ok())
                return wal;
        }

        std::string busy_timeout = "PRAGMA busy_timeout=" + std::to_string(opts.busy_timeout_ms) + ";";
        auto busy = executeSql(busy_timeout.c_str());
        if (!busy.is_ok())
            return busy;

        std::string cache_size = "PRAGMA cache_size=-" + std::to_string(opts.cache_size_kb) + ";";
        auto cache = executeSql(cache_size.c_str());
        if (!cache.is_ok())
            return cache;

        const char *sync_mode = "PRAGMA synchronous=NORMAL;";
        switch (opts.sync_mode) {
        case OpenOptions::Synchronous::OFF:
            sync_mode = "PRAGMA synchronous=OFF;";
            break;
        case OpenOptions::Synchronous::NORMAL:
            sync_mode = "PRAGMA synchronous=NORMAL;";
            break;
        case OpenOptions::Synchronous::FULL:
            sync_mode = "PRAGMA synchronous=FULL;";
            break;
        }
        return executeSql(sync_mode);
    }

    dp::Result<void, dp::Error> SqliteSlotStore::initializeSchema() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!db_ || !is_open_)
            return dp::Result<void, dp::Error>::err(dp::Error::invalid_argument("Store not open"));

        TxGuard tx(db_);
        if (!tx.isActive()) {
            return dp::Result<void, dp::Error>::err(lastError("Failed to begin transaction"));
        }

        auto migrations = executeSql(SCHEMA_MIGRATIONS_TABLE);
        if (!migrations.is_ok())
            return migrations;

        int32_t version = schemaVersionUnlocked();

        // Version 1: slots
        if (version < 1) {
            auto slots = executeSql(SLOTS_TABLE);
            if (!slots.is_ok())
                return slots;
            if (!setSchemaVersion(1))
                return dp::Result<void, dp::Error>::err(lastError("Failed to record schema version"));
        }

        // Version 2: request journal
        if (version < 2) {
            auto requests = executeSql(PROCESSED_REQUESTS_TABLE);
            if (!requests.is_ok())
                return requests;
            if (!setSchemaVersion(2))
                return dp::Result<void, dp::Error>::err(lastError("Failed to record schema version"));
        }

        if (!tx.commit()) {
            return dp::Result<void, dp::Error>::err(lastError("Failed to commit schema"));
        }
        return dp::Result<void, dp::Error>::ok();
    }

    bool SqliteSlotStore::tableExists(const std::string &table_name) const {
        if (!db_)
            return false;

        sqlite3_stmt *stmt;
        const char *sql = "SELECT name FROM sqlite_master WHERE type='table' AND name=?";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return false;
        }

        sqlite3_bind_text(stmt, 1, table_name.c_str(), -1, SQLITE_TRANSIENT);

        bool exists = (sqlite3_step(stmt) == SQLITE_ROW);
        sqlite3_finalize(stmt);

        return exists;
    }

    int32_t SqliteSlotStore::schemaVersion() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return schemaVersionUnlocked();
    }

    int32_t SqliteSlotStore::schemaVersionUnlocked() const {
        if (!tableExists("schema_migrations"))
            return 0;

        sqlite3_stmt *stmt;
        const char *sql = "SELECT MAX(version) FROM schema_migrations";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return 0;
        }

        int32_t version = 0;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            version = sqlite3_column_int(stmt, 0);
        }

        sqlite3_finalize(stmt);
        return version;
    }

    bool SqliteSlotStore::setSchemaVersion(int32_t version) {
        sqlite3_stmt *stmt;
        const char *sql = "INSERT OR REPLACE INTO schema_migrations (version, applied_at) VALUES (?, ?)";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return false;
        }

        sqlite3_bind_int(stmt, 1, version);
        sqlite3_bind_int64(stmt, 2, currentTimestamp());

        bool success = (sqlite3_step(stmt) == SQLITE_DONE);
        sqlite3_finalize(stmt);

        return success;
    }

    bool SqliteSlotStore::quickCheck() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!db_ || !is_open_)
            return false;

        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, "PRAGMA quick_check", -1, &stmt, nullptr) != SQLITE_OK) {
            return false;
        }

        bool healthy = false;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            const unsigned char *text = sqlite3_column_text(stmt, 0);
            healthy = text != nullptr && std::string(reinterpret_cast<const char *>(text)) == "ok";
        }

        sqlite3_finalize(stmt);
        return healthy;
    }

    // ===========================================
    // Transaction Guard
    // ===========================================

    SqliteSlotStore::TxGuard::TxGuard(sqlite3 *db) : db_(db), active_(false), committed_(false) {
        if (db_) {
            active_ = (sqlite3_exec(db_, "BEGIN IMMEDIATE TRANSACTION", nullptr, nullptr, nullptr) == SQLITE_OK);
        }
    }

    SqliteSlotStore::TxGuard::~TxGuard() { rollback(); }

    bool SqliteSlotStore::TxGuard::commit() {
        if (active_ && !committed_) {
            if (sqlite3_exec(db_, "COMMIT", nullptr, nullptr, nullptr) != SQLITE_OK) {
                return false;
            }
            committed_ = true;
            active_ = false;
            return true;
        }
        return false;
    }

    void SqliteSlotStore::TxGuard::rollback() {
        if (active_ && !committed_) {
            sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
            committed_ = true;
            active_ = false;
        }
    }

    // ===========================================
    // Slot operations
    // ===========================================

    dp::Result<std::optional<std::vector<uint8_t>>, dp::Error> SqliteSlotStore::load(const Pubkey &address) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return loadUnlocked(address);
    }

    dp::Result<std::optional<std::vector<uint8_t>>, dp::Error>
    SqliteSlotStore::loadUnlocked(const Pubkey &address) const {
        using LoadResult = dp::Result<std::optional<std::vector<uint8_t>>, dp::Error>;

        if (!db_ || !is_open_)
            return LoadResult::err(dp::Error::invalid_argument("Store not open"));

        sqlite3_stmt *stmt;
        const char *sql = "SELECT data FROM slots WHERE address = ?";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return LoadResult::err(lastError("Failed to prepare slot read"));
        }

        bindAddress(stmt, 1, address);

        int rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW) {
            auto data = columnBlob(stmt, 0);
            sqlite3_finalize(stmt);
            return LoadResult::ok(std::optional<std::vector<uint8_t>>(std::move(data)));
        }

        if (rc != SQLITE_DONE) {
            auto error = lastError("Failed to read slot");
            sqlite3_finalize(stmt);
            return LoadResult::err(error);
        }

        sqlite3_finalize(stmt);
        return LoadResult::ok(std::nullopt);
    }

    dp::Result<void, dp::Error> SqliteSlotStore::allocate(const Pubkey &address, const std::vector<uint8_t> &data) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!db_ || !is_open_)
            return dp::Result<void, dp::Error>::err(dp::Error::invalid_argument("Store not open"));

        TxGuard tx(db_);
        if (!tx.isActive()) {
            return dp::Result<void, dp::Error>::err(lastError("Failed to begin transaction"));
        }

        sqlite3_stmt *stmt;
        const char *sql = "INSERT INTO slots (address, data, created_at, updated_at) VALUES (?, ?, ?, ?)";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return dp::Result<void, dp::Error>::err(lastError("Failed to prepare slot insert"));
        }

        int64_t now = currentTimestamp();
        bindAddress(stmt, 1, address);
        bindBlob(stmt, 2, data.data(), data.size());
        sqlite3_bind_int64(stmt, 3, now);
        sqlite3_bind_int64(stmt, 4, now);

        int rc = sqlite3_step(stmt);
        if (rc == SQLITE_CONSTRAINT) {
            sqlite3_finalize(stmt);
            return dp::Result<void, dp::Error>::err(slot_occupied());
        }
        if (rc != SQLITE_DONE) {
            auto error = lastError("Failed to allocate slot");
            sqlite3_finalize(stmt);
            return dp::Result<void, dp::Error>::err(error);
        }
        sqlite3_finalize(stmt);

        if (!tx.commit()) {
            return dp::Result<void, dp::Error>::err(lastError("Failed to commit slot allocation"));
        }
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> SqliteSlotStore::compareAndSwap(const Pubkey &address,
                                                                const std::vector<uint8_t> &expected,
                                                                const std::vector<uint8_t> &desired) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!db_ || !is_open_)
            return dp::Result<void, dp::Error>::err(dp::Error::invalid_argument("Store not open"));

        TxGuard tx(db_);
        if (!tx.isActive()) {
            return dp::Result<void, dp::Error>::err(lastError("Failed to begin transaction"));
        }

        auto current = loadUnlocked(address);
        if (!current.is_ok()) {
            return dp::Result<void, dp::Error>::err(current.error());
        }
        if (!current.value().has_value()) {
            return dp::Result<void, dp::Error>::err(slot_missing());
        }
        if (*current.value() != expected) {
            return dp::Result<void, dp::Error>::err(write_conflict());
        }

        sqlite3_stmt *stmt;
        const char *sql = "UPDATE slots SET data = ?, updated_at = ? WHERE address = ?";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return dp::Result<void, dp::Error>::err(lastError("Failed to prepare slot update"));
        }

        bindBlob(stmt, 1, desired.data(), desired.size());
        sqlite3_bind_int64(stmt, 2, currentTimestamp());
        bindAddress(stmt, 3, address);

        int rc = sqlite3_step(stmt);
        if (rc != SQLITE_DONE) {
            auto error = lastError("Failed to update slot");
            sqlite3_finalize(stmt);
            return dp::Result<void, dp::Error>::err(error);
        }
        sqlite3_finalize(stmt);

        if (!tx.commit()) {
            return dp::Result<void, dp::Error>::err(lastError("Failed to commit slot update"));
        }
        return dp::Result<void, dp::Error>::ok();
    }

    bool SqliteSlotStore::exists(const Pubkey &address) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto slot = loadUnlocked(address);
        return slot.is_ok() && slot.value().has_value();
    }

    dp::usize SqliteSlotStore::size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!db_ || !is_open_)
            return 0;

        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM slots", -1, &stmt, nullptr) != SQLITE_OK) {
            return 0;
        }

        dp::usize count = 0;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            count = static_cast<dp::usize>(sqlite3_column_int64(stmt, 0));
        }

        sqlite3_finalize(stmt);
        return count;
    }

    // ===========================================
    // Request journal
    // ===========================================

    dp::Result<bool, dp::Error> SqliteSlotStore::recordRequest(const std::vector<uint8_t> &request_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!db_ || !is_open_)
            return dp::Result<bool, dp::Error>::err(dp::Error::invalid_argument("Store not open"));

        sqlite3_stmt *stmt;
        const char *sql = "INSERT OR IGNORE INTO processed_requests (request_id, processed_at) VALUES (?, ?)";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return dp::Result<bool, dp::Error>::err(lastError("Failed to prepare request insert"));
        }

        bindBlob(stmt, 1, request_id.data(), request_id.size());
        sqlite3_bind_int64(stmt, 2, currentTimestamp());

        int rc = sqlite3_step(stmt);
        if (rc != SQLITE_DONE) {
            auto error = lastError("Failed to record request");
            sqlite3_finalize(stmt);
            return dp::Result<bool, dp::Error>::err(error);
        }
        sqlite3_finalize(stmt);

        return dp::Result<bool, dp::Error>::ok(sqlite3_changes(db_) == 1);
    }

    bool SqliteSlotStore::hasRequest(const std::vector<uint8_t> &request_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!db_ || !is_open_)
            return false;

        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, "SELECT 1 FROM processed_requests WHERE request_id = ?", -1, &stmt, nullptr) !=
            SQLITE_OK) {
            return false;
        }

        bindBlob(stmt, 1, request_id.data(), request_id.size());
        bool found = (sqlite3_step(stmt) == SQLITE_ROW);
        sqlite3_finalize(stmt);
        return found;
    }

    dp::usize SqliteSlotStore::requestCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!db_ || !is_open_)
            return 0;

        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM processed_requests", -1, &stmt, nullptr) != SQLITE_OK) {
            return 0;
        }

        dp::usize count = 0;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            count = static_cast<dp::usize>(sqlite3_column_int64(stmt, 0));
        }

        sqlite3_finalize(stmt);
        return count;
    }

} // namespace keyreg::storage
