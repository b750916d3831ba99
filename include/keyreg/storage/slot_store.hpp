#pragma once

#include <optional>
#include <vector>

#include <keyreg/common/bytes.hpp>

namespace keyreg::storage {

    /// SQLite database configuration
    struct OpenOptions {
        bool enable_wal = true;
        int32_t busy_timeout_ms = 5000;
        int32_t cache_size_kb = 20000;
        enum class Synchronous { OFF = 0, NORMAL = 1, FULL = 2 };
        Synchronous sync_mode = Synchronous::NORMAL;

        OpenOptions() = default;
    };

    /// Address-keyed byte storage backing the registry.
    ///
    /// Each slot is written at most once per call. Writers to the same slot are
    /// serialized through allocate() (create-if-absent) and compareAndSwap()
    /// (replace only if unchanged since it was read); implementations never retry.
    class SlotStore {
      public:
        virtual ~SlotStore() = default;

        /// Read a slot. Empty optional when the slot was never allocated.
        virtual dp::Result<std::optional<std::vector<uint8_t>>, dp::Error> load(const Pubkey &address) const = 0;

        /// Allocate a slot with its initial contents. Fails with slot_occupied if it exists.
        virtual dp::Result<void, dp::Error> allocate(const Pubkey &address, const std::vector<uint8_t> &data) = 0;

        /// Replace a slot's contents if they still equal `expected`.
        /// Fails with slot_missing if unallocated, write_conflict if the contents changed.
        virtual dp::Result<void, dp::Error> compareAndSwap(const Pubkey &address, const std::vector<uint8_t> &expected,
                                                           const std::vector<uint8_t> &desired) = 0;

        virtual bool exists(const Pubkey &address) const = 0;

        /// Number of allocated slots
        virtual dp::usize size() const = 0;

        // ===========================================
        // Request journal
        // ===========================================

        /// Remember a processed request id. Ok(false) if it was already recorded.
        /// Kept beside the slots so replay protection lasts as long as the records do.
        virtual dp::Result<bool, dp::Error> recordRequest(const std::vector<uint8_t> &request_id) = 0;

        virtual bool hasRequest(const std::vector<uint8_t> &request_id) const = 0;

        /// Number of recorded request ids
        virtual dp::usize requestCount() const = 0;
    };

} // namespace keyreg::storage
