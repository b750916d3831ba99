#pragma once

#include <mutex>
#include <string>

#include "slot_store.hpp"

// Forward declaration for sqlite3 C API
struct sqlite3;
struct sqlite3_stmt;

namespace keyreg::storage {

    /// SQLite-backed slot store. One row per slot; every mutation runs in its own
    /// immediate transaction so concurrent processes sharing the file cannot interleave
    /// a read-check-write on the same slot.
    class SqliteSlotStore : public SlotStore {
      public:
        SqliteSlotStore();
        ~SqliteSlotStore() override;

        // Owns the connection and its lock
        SqliteSlotStore(const SqliteSlotStore &) = delete;
        SqliteSlotStore &operator=(const SqliteSlotStore &) = delete;

        /// Open or create database at given path
        /// @param path Database file path (e.g. "data/keyreg.db"), or ":memory:"
        /// @param opts Configuration options
        dp::Result<void, dp::Error> open(const std::string &path, const OpenOptions &opts = OpenOptions{});

        /// Close database connection
        void close();

        /// Check if database is open
        bool isOpen() const;

        /// Create the slots and processed_requests tables and run migrations
        dp::Result<void, dp::Error> initializeSchema();

        /// Current schema version (0 before initializeSchema)
        int32_t schemaVersion() const;

        /// Run SQLite integrity check
        bool quickCheck() const;

        // ===========================================
        // Transaction management (RAII)
        // ===========================================

        class TxGuard {
          public:
            explicit TxGuard(sqlite3 *db);
            ~TxGuard();

            TxGuard(const TxGuard &) = delete;
            TxGuard &operator=(const TxGuard &) = delete;

            bool isActive() const { return active_; }
            bool commit();
            void rollback();

          private:
            sqlite3 *db_;
            bool active_;
            bool committed_;
        };

        // ===========================================
        // SlotStore
        // ===========================================

        dp::Result<std::optional<std::vector<uint8_t>>, dp::Error> load(const Pubkey &address) const override;

        dp::Result<void, dp::Error> allocate(const Pubkey &address, const std::vector<uint8_t> &data) override;

        dp::Result<void, dp::Error> compareAndSwap(const Pubkey &address, const std::vector<uint8_t> &expected,
                                                   const std::vector<uint8_t> &desired) override;

        bool exists(const Pubkey &address) const override;

        dp::usize size() const override;

        dp::Result<bool, dp::Error> recordRequest(const std::vector<uint8_t> &request_id) override;

        bool hasRequest(const std::vector<uint8_t> &request_id) const override;

        dp::usize requestCount() const override;

      private:
        sqlite3 *db_;
        std::string db_path_;
        bool is_open_;
        mutable std::mutex mutex_;

        dp::Result<void, dp::Error> applyPragmas(const OpenOptions &opts);
        dp::Result<void, dp::Error> executeSql(const char *sql);
        dp::Result<std::optional<std::vector<uint8_t>>, dp::Error> loadUnlocked(const Pubkey &address) const;
        bool tableExists(const std::string &table_name) const;
        int32_t schemaVersionUnlocked() const;
        bool setSchemaVersion(int32_t version);
        dp::Error lastError(const std::string &context) const;

        static constexpr const char *SCHEMA_MIGRATIONS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS schema_migrations (
                version INTEGER PRIMARY KEY,
                applied_at INTEGER NOT NULL
            )
        )";

        static constexpr const char *SLOTS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS slots (
                address BLOB PRIMARY KEY,
                data BLOB NOT NULL,
                created_at INTEGER NOT NULL,
                updated_at INTEGER NOT NULL
            )
        )";

        static constexpr const char *PROCESSED_REQUESTS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS processed_requests (
                request_id BLOB PRIMARY KEY,
                processed_at INTEGER NOT NULL
            )
        )";
    };

    /// Get current Unix timestamp in seconds
    int64_t currentTimestamp();

} // namespace keyreg::storage
