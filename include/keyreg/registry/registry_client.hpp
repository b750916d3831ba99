#pragma once

#include <atomic>
#include <random>
#include <string>
#include <vector>

#include <keyreg/host/keypair.hpp>
#include <keyreg/host/request.hpp>
#include <keyreg/host/runtime.hpp>
#include <keyreg/registry/key_registry.hpp>

namespace keyreg::registry {

    /// Wallet-side access to the registry: derives addresses, signs and submits requests,
    /// and reads records back.
    class RegistryClient {
      public:
        RegistryClient(host::Runtime &runtime, const KeyRegistry &registry)
            : runtime_(runtime), registry_(registry), next_nonce_(randomNonce()) {}

        /// Slot holding `owner`'s record
        inline dp::Result<address::DerivedAddress, dp::Error> deriveRecordAddress(const Pubkey &owner) const {
            return registry_.deriveSlot(owner);
        }

        /// Register `public_key` for the wallet. Returns the record slot.
        inline dp::Result<Pubkey, dp::Error> registerKey(const host::Keypair &wallet,
                                                         const std::vector<uint8_t> &public_key) {
            auto result = send(wallet, host::InstructionKind::RegisterKey, public_key);
            if (!result.is_ok()) {
                return dp::Result<Pubkey, dp::Error>::err(result.error());
            }
            return dp::Result<Pubkey, dp::Error>::ok(result.value().slot);
        }

        /// Replace the wallet's registered key
        inline dp::Result<void, dp::Error> updateKey(const host::Keypair &wallet,
                                                     const std::vector<uint8_t> &new_public_key) {
            auto result = send(wallet, host::InstructionKind::UpdateKey, new_public_key);
            if (!result.is_ok()) {
                return dp::Result<void, dp::Error>::err(result.error());
            }
            return dp::Result<void, dp::Error>::ok();
        }

        /// Check a key against the record of a base58-named owner (read-only, no signature)
        inline dp::Result<bool, dp::Error> verifyKey(const std::string &owner_base58,
                                                     const std::vector<uint8_t> &public_key) const {
            auto credential = credentialFromBytes(public_key);
            if (!credential.is_ok()) {
                return dp::Result<bool, dp::Error>::err(credential.error());
            }
            auto owner = Pubkey::fromBase58(owner_base58);
            if (!owner.is_ok()) {
                return dp::Result<bool, dp::Error>::err(owner.error());
            }
            return registry_.verifyKey(owner.value(), credential.value());
        }

        inline dp::Result<KeyRecord, dp::Error> fetchRecord(const Pubkey &owner) const {
            return registry_.getRecord(owner);
        }

      private:
        /// Starting nonce, drawn at random for each client
        inline static dp::u64 randomNonce() {
            std::random_device device;
            std::uniform_int_distribution<dp::u64> dist;
            return dist(device);
        }

        inline dp::Result<host::ExecutionResult, dp::Error> send(const host::Keypair &wallet, host::InstructionKind kind,
                                                                 const std::vector<uint8_t> &public_key) {
            using SendResult = dp::Result<host::ExecutionResult, dp::Error>;

            auto credential = credentialFromBytes(public_key);
            if (!credential.is_ok()) {
                return SendResult::err(credential.error());
            }
            auto slot = deriveRecordAddress(wallet.pubkey());
            if (!slot.is_ok()) {
                return SendResult::err(slot.error());
            }

            auto request =
                host::SignedRequest::create(wallet, kind, slot.value().address, credential.value(), next_nonce_++);
            if (!request.is_ok()) {
                return SendResult::err(request.error());
            }
            return runtime_.submitBytes(request.value().toBytes());
        }

        host::Runtime &runtime_;
        const KeyRegistry &registry_;
        std::atomic<dp::u64> next_nonce_;
    };

} // namespace keyreg::registry
