#pragma once

#include <memory>
#include <string>

#include <keyreg/common/bytes.hpp>
#include <keyreg/storage/slot_store.hpp>

namespace keyreg {

    /// Seed that separates registry slots from any other derived address
    constexpr const char *DEFAULT_DOMAIN_TAG = "key_record";

    /// Registry program identity: "KeyRegistry" zero-padded to 32 bytes
    inline Pubkey defaultProgramId() {
        const std::string name = "KeyRegistry";
        Bytes32 raw{};
        std::copy(name.begin(), name.end(), raw.begin());
        return Pubkey(raw);
    }

    enum class StorageBackend : dp::u8 {
        Memory = 0,
        Sqlite = 1,
    };

    /// Registry configuration
    struct RegistryConfig {
        Pubkey program_id = defaultProgramId();
        std::string domain_tag = DEFAULT_DOMAIN_TAG;
        StorageBackend backend = StorageBackend::Memory;
        std::string path = "keyreg.db"; // SQLite database file
        storage::OpenOptions options;

        RegistryConfig() = default;

        /// Reject settings that would make derivation fail for every owner
        inline dp::Result<void, dp::Error> validate() const {
            if (domain_tag.empty() || domain_tag.size() > 32) {
                return dp::Result<void, dp::Error>::err(
                    invalid_seeds("Domain tag must be between 1 and 32 bytes"));
            }
            if (program_id.isZero()) {
                return dp::Result<void, dp::Error>::err(invalid_address("Program id must not be zero"));
            }
            if (backend == StorageBackend::Sqlite && path.empty()) {
                return dp::Result<void, dp::Error>::err(dp::Error::invalid_argument("SQLite backend needs a path"));
            }
            return dp::Result<void, dp::Error>::ok();
        }
    };

    /// Open the slot store selected by the configuration (schema initialized for SQLite)
    dp::Result<std::shared_ptr<storage::SlotStore>, dp::Error> openSlotStore(const RegistryConfig &config);

} // namespace keyreg
