#pragma once

#include <optional>
#include <string>
#include <vector>

#include <keyreg/address/derivation.hpp>
#include <keyreg/config.hpp>
#include <keyreg/host/log_sink.hpp>
#include <keyreg/host/request.hpp>
#include <keyreg/registry/key_record.hpp>
#include <keyreg/storage/slot_store.hpp>

namespace keyreg::registry {

    /// Identity-keyed credential registry.
    ///
    /// Each owner has exactly one slot, derived from [domain_tag, owner]. A record is created
    /// by its owner, may only be changed by the signer that matches the stored owner, and can
    /// be checked against a candidate credential by anyone.
    ///
    /// Every read re-derives the slot from the stored owner and bump before trusting the record.
    /// Writes go through the store's allocate / compare-and-swap, so a lost race surfaces as
    /// already_registered or write_conflict instead of a silent overwrite.
    class KeyRegistry {
      public:
        /// The configuration is validated here. An invalid one leaves the registry unusable:
        /// status() and every operation return the validation error.
        KeyRegistry(storage::SlotStore &store, const RegistryConfig &config, host::LogSink &log,
                    address::AddressPredicate predicate = address::isOffCurve);

        /// Result of validating the configuration at construction
        dp::Result<void, dp::Error> status() const;

        /// Derivation seeds for an owner: [domain_tag, owner]
        std::vector<address::Seed> seedsFor(const Pubkey &owner) const;

        /// Canonical slot and bump for an owner
        dp::Result<address::DerivedAddress, dp::Error> deriveSlot(const Pubkey &owner) const;

        // ===========================================
        // Mutations (signer comes from the runtime)
        // ===========================================

        /// Create the signer's record at its derived slot
        dp::Result<address::DerivedAddress, dp::Error> registerKey(const host::InvocationContext &ctx,
                                                                   const Credential &credential);

        /// Same as registerKey, with the slot named by the caller. It must be the signer's slot.
        dp::Result<address::DerivedAddress, dp::Error>
        registerKeyAt(const host::InvocationContext &ctx, const Pubkey &slot, const Credential &credential);

        /// Replace the credential in the signer's own record
        dp::Result<void, dp::Error> updateKey(const host::InvocationContext &ctx, const Credential &new_credential);

        /// Replace the credential in the record at `slot`. Only the stored owner may do this.
        dp::Result<void, dp::Error> updateKeyAt(const host::InvocationContext &ctx, const Pubkey &slot,
                                                const Credential &new_credential);

        // ===========================================
        // Queries
        // ===========================================

        /// Compare a candidate against the owner's registered credential
        dp::Result<bool, dp::Error> verifyKey(const Pubkey &owner, const Credential &candidate) const;

        dp::Result<bool, dp::Error> verifyKeyAt(const Pubkey &slot, const Credential &candidate) const;

        dp::Result<KeyRecord, dp::Error> getRecord(const Pubkey &owner) const;

        dp::Result<KeyRecord, dp::Error> getRecordAt(const Pubkey &slot) const;

        bool isRegistered(const Pubkey &owner) const;

        inline const address::AddressDeriver &deriver() const { return deriver_; }

        inline const std::string &domainTag() const { return domain_tag_; }

        /// Backing store, shared with the runtime's request journal
        inline storage::SlotStore &store() const { return store_; }

      private:
        struct LoadedRecord {
            KeyRecord record;
            std::vector<uint8_t> raw;
        };

        /// Load, decode and re-validate the record stored at `slot`
        dp::Result<LoadedRecord, dp::Error> loadCanonical(const Pubkey &slot) const;

        /// Allocate the record at a slot already derived for the signer
        dp::Result<address::DerivedAddress, dp::Error> allocateRecord(const host::InvocationContext &ctx,
                                                                      const address::DerivedAddress &slot,
                                                                      const Credential &credential);

        void logVerification(const KeyRecord &record, bool matches) const;

        storage::SlotStore &store_;
        address::AddressDeriver deriver_;
        std::string domain_tag_;
        host::LogSink &log_;
        std::optional<dp::Error> config_error_;
    };

} // namespace keyreg::registry
