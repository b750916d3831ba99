#pragma once

#include <mutex>
#include <shared_mutex>
#include <set>
#include <unordered_map>

#include "slot_store.hpp"

namespace keyreg::storage {

    /// In-process slot store
    class MemorySlotStore : public SlotStore {
      public:
        MemorySlotStore() = default;

        inline dp::Result<std::optional<std::vector<uint8_t>>, dp::Error> load(const Pubkey &address) const override {
            std::shared_lock lock(mutex_);
            auto it = slots_.find(address);
            if (it == slots_.end()) {
                return dp::Result<std::optional<std::vector<uint8_t>>, dp::Error>::ok(std::nullopt);
            }
            return dp::Result<std::optional<std::vector<uint8_t>>, dp::Error>::ok(it->second);
        }

        inline dp::Result<void, dp::Error> allocate(const Pubkey &address, const std::vector<uint8_t> &data) override {
            std::unique_lock lock(mutex_);
            if (slots_.find(address) != slots_.end()) {
                return dp::Result<void, dp::Error>::err(slot_occupied());
            }
            slots_.emplace(address, data);
            return dp::Result<void, dp::Error>::ok();
        }

        inline dp::Result<void, dp::Error> compareAndSwap(const Pubkey &address, const std::vector<uint8_t> &expected,
                                                          const std::vector<uint8_t> &desired) override {
            std::unique_lock lock(mutex_);
            auto it = slots_.find(address);
            if (it == slots_.end()) {
                return dp::Result<void, dp::Error>::err(slot_missing());
            }
            if (it->second != expected) {
                return dp::Result<void, dp::Error>::err(write_conflict());
            }
            it->second = desired;
            return dp::Result<void, dp::Error>::ok();
        }

        inline bool exists(const Pubkey &address) const override {
            std::shared_lock lock(mutex_);
            return slots_.find(address) != slots_.end();
        }

        inline dp::usize size() const override {
            std::shared_lock lock(mutex_);
            return slots_.size();
        }

        inline dp::Result<bool, dp::Error> recordRequest(const std::vector<uint8_t> &request_id) override {
            std::unique_lock lock(mutex_);
            return dp::Result<bool, dp::Error>::ok(requests_.insert(request_id).second);
        }

        inline bool hasRequest(const std::vector<uint8_t> &request_id) const override {
            std::shared_lock lock(mutex_);
            return requests_.count(request_id) > 0;
        }

        inline dp::usize requestCount() const override {
            std::shared_lock lock(mutex_);
            return requests_.size();
        }

        /// Clear all slots and recorded requests (for testing)
        inline void clear() {
            std::unique_lock lock(mutex_);
            slots_.clear();
            requests_.clear();
        }

      private:
        std::unordered_map<Pubkey, std::vector<uint8_t>> slots_;
        std::set<std::vector<uint8_t>> requests_;
        mutable std::shared_mutex mutex_;
    };

} // namespace keyreg::storage
