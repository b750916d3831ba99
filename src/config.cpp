#include <keyreg/config.hpp>
#include <keyreg/storage/memory_slot_store.hpp>
#include <keyreg/storage/sqlite_slot_store.hpp>

namespace keyreg {

    dp::Result<std::shared_ptr<storage::SlotStore>, dp::Error> openSlotStore(const RegistryConfig &config) {
        using StoreResult = dp::Result<std::shared_ptr<storage::SlotStore>, dp::Error>;

        auto valid = config.validate();
        if (!valid.is_ok()) {
            return StoreResult::err(valid.error());
        }

        switch (config.backend) {
        case StorageBackend::Memory: {
            std::shared_ptr<storage::SlotStore> store = std::make_shared<storage::MemorySlotStore>();
            return StoreResult::ok(store);
        }

        case StorageBackend::Sqlite: {
            auto store = std::make_shared<storage::SqliteSlotStore>();
            auto opened = store->open(config.path, config.options);
            if (!opened.is_ok()) {
                return StoreResult::err(opened.error());
            }
            auto schema = store->initializeSchema();
            if (!schema.is_ok()) {
                return StoreResult::err(schema.error());
            }
            return StoreResult::ok(std::shared_ptr<storage::SlotStore>(store));
        }
        }

        return StoreResult::err(dp::Error::invalid_argument("Unknown storage backend"));
    }

} // namespace keyreg
