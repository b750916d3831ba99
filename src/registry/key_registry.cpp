#include <keyreg/registry/key_registry.hpp>
#include <utility>

namespace keyreg::registry {

    KeyRegistry::KeyRegistry(storage::SlotStore &store, const RegistryConfig &config, host::LogSink &log,
                             address::AddressPredicate predicate)
        : store_(store), deriver_(config.program_id, std::move(predicate)), domain_tag_(config.domain_tag),
          log_(log) {
        auto valid = config.validate();
        if (!valid.is_ok()) {
            config_error_ = valid.error();
        }
    }

    dp::Result<void, dp::Error> KeyRegistry::status() const {
        if (config_error_) {
            return dp::Result<void, dp::Error>::err(*config_error_);
        }
        return dp::Result<void, dp::Error>::ok();
    }

    std::vector<address::Seed> KeyRegistry::seedsFor(const Pubkey &owner) const {
        return {address::seedFromString(domain_tag_), address::seedFromKey(owner)};
    }

    dp::Result<address::DerivedAddress, dp::Error> KeyRegistry::deriveSlot(const Pubkey &owner) const {
        if (config_error_) {
            return dp::Result<address::DerivedAddress, dp::Error>::err(*config_error_);
        }
        return deriver_.find(seedsFor(owner));
    }

    // ===========================================
    // Mutations
    // ===========================================

    dp::Result<address::DerivedAddress, dp::Error> KeyRegistry::registerKey(const host::InvocationContext &ctx,
                                                                            const Credential &credential) {
        auto derived = deriveSlot(ctx.signer);
        if (!derived.is_ok()) {
            return derived;
        }
        return allocateRecord(ctx, derived.value(), credential);
    }

    dp::Result<address::DerivedAddress, dp::Error>
    KeyRegistry::registerKeyAt(const host::InvocationContext &ctx, const Pubkey &slot, const Credential &credential) {
        auto derived = deriveSlot(ctx.signer);
        if (!derived.is_ok()) {
            return derived;
        }
        if (derived.value().address != slot) {
            return dp::Result<address::DerivedAddress, dp::Error>::err(
                seeds_mismatch("Slot is not derived from the signer"));
        }
        return allocateRecord(ctx, derived.value(), credential);
    }

    dp::Result<void, dp::Error> KeyRegistry::updateKey(const host::InvocationContext &ctx,
                                                       const Credential &new_credential) {
        auto derived = deriveSlot(ctx.signer);
        if (!derived.is_ok()) {
            return dp::Result<void, dp::Error>::err(derived.error());
        }
        return updateKeyAt(ctx, derived.value().address, new_credential);
    }

    dp::Result<void, dp::Error> KeyRegistry::updateKeyAt(const host::InvocationContext &ctx, const Pubkey &slot,
                                                         const Credential &new_credential) {
        auto loaded = loadCanonical(slot);
        if (!loaded.is_ok()) {
            return dp::Result<void, dp::Error>::err(loaded.error());
        }
        const auto &current = loaded.value();

        if (current.record.owner != ctx.signer) {
            return dp::Result<void, dp::Error>::err(unauthorized());
        }

        if (current.record.credential != new_credential) {
            KeyRecord updated = current.record;
            updated.credential = new_credential;
            auto data = updated.serialize();
            if (!data.is_ok()) {
                return dp::Result<void, dp::Error>::err(data.error());
            }

            auto swapped = store_.compareAndSwap(slot, current.raw, data.value());
            if (!swapped.is_ok()) {
                if (swapped.error().code == ERR_SLOT_MISSING) {
                    return dp::Result<void, dp::Error>::err(not_found());
                }
                return swapped;
            }
        }

        log_.log("Updated public key for user: " + ctx.signer.toBase58());
        log_.log("New public key (hex): " + toHex(new_credential));
        return dp::Result<void, dp::Error>::ok();
    }

    // ===========================================
    // Queries
    // ===========================================

    dp::Result<bool, dp::Error> KeyRegistry::verifyKey(const Pubkey &owner, const Credential &candidate) const {
        auto record = getRecord(owner);
        if (!record.is_ok()) {
            return dp::Result<bool, dp::Error>::err(record.error());
        }

        bool matches = record.value().credential == candidate;
        logVerification(record.value(), matches);
        return dp::Result<bool, dp::Error>::ok(matches);
    }

    dp::Result<bool, dp::Error> KeyRegistry::verifyKeyAt(const Pubkey &slot, const Credential &candidate) const {
        auto loaded = loadCanonical(slot);
        if (!loaded.is_ok()) {
            return dp::Result<bool, dp::Error>::err(loaded.error());
        }

        const auto &record = loaded.value().record;
        bool matches = record.credential == candidate;
        logVerification(record, matches);
        return dp::Result<bool, dp::Error>::ok(matches);
    }

    dp::Result<KeyRecord, dp::Error> KeyRegistry::getRecord(const Pubkey &owner) const {
        auto derived = deriveSlot(owner);
        if (!derived.is_ok()) {
            return dp::Result<KeyRecord, dp::Error>::err(derived.error());
        }

        auto record = getRecordAt(derived.value().address);
        if (!record.is_ok()) {
            return record;
        }
        if (record.value().owner != owner) {
            return dp::Result<KeyRecord, dp::Error>::err(seeds_mismatch("Record owner does not match slot"));
        }
        return record;
    }

    dp::Result<KeyRecord, dp::Error> KeyRegistry::getRecordAt(const Pubkey &slot) const {
        auto loaded = loadCanonical(slot);
        if (!loaded.is_ok()) {
            return dp::Result<KeyRecord, dp::Error>::err(loaded.error());
        }
        return dp::Result<KeyRecord, dp::Error>::ok(loaded.value().record);
    }

    bool KeyRegistry::isRegistered(const Pubkey &owner) const {
        auto derived = deriveSlot(owner);
        if (!derived.is_ok()) {
            return false;
        }
        return store_.exists(derived.value().address);
    }

    // ===========================================
    // Helpers
    // ===========================================

    dp::Result<KeyRegistry::LoadedRecord, dp::Error> KeyRegistry::loadCanonical(const Pubkey &slot) const {
        using LoadResult = dp::Result<LoadedRecord, dp::Error>;

        if (config_error_) {
            return LoadResult::err(*config_error_);
        }

        auto raw = store_.load(slot);
        if (!raw.is_ok()) {
            return LoadResult::err(raw.error());
        }
        if (!raw.value().has_value()) {
            return LoadResult::err(not_found());
        }

        auto record = KeyRecord::deserialize(*raw.value());
        if (!record.is_ok()) {
            return LoadResult::err(record.error());
        }

        auto confirmed = deriver_.confirm(seedsFor(record.value().owner), record.value().bump, slot);
        if (!confirmed.is_ok()) {
            return LoadResult::err(confirmed.error());
        }

        LoadedRecord loaded;
        loaded.record = record.value();
        loaded.raw = *raw.value();
        return LoadResult::ok(loaded);
    }

    dp::Result<address::DerivedAddress, dp::Error> KeyRegistry::allocateRecord(const host::InvocationContext &ctx,
                                                                               const address::DerivedAddress &slot,
                                                                               const Credential &credential) {
        using RegisterResult = dp::Result<address::DerivedAddress, dp::Error>;

        KeyRecord record(ctx.signer, credential, slot.bump);
        auto data = record.serialize();
        if (!data.is_ok()) {
            return RegisterResult::err(data.error());
        }

        auto allocated = store_.allocate(slot.address, data.value());
        if (!allocated.is_ok()) {
            if (allocated.error().code == ERR_SLOT_OCCUPIED) {
                return RegisterResult::err(already_registered());
            }
            return RegisterResult::err(allocated.error());
        }

        log_.log("Registered public key for user: " + ctx.signer.toBase58());
        log_.log("Public key (hex): " + toHex(credential));
        return RegisterResult::ok(slot);
    }

    void KeyRegistry::logVerification(const KeyRecord &record, bool matches) const {
        if (matches) {
            log_.log("Public key matches registered key for user: " + record.owner.toBase58());
        } else {
            log_.log("Public key does NOT match registered key for user: " + record.owner.toBase58());
        }
    }

} // namespace keyreg::registry
