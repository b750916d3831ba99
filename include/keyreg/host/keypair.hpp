#pragma once

#include <datapod/datapod.hpp>
#include <keylock/keylock.hpp>
#include <vector>

#include <keyreg/common/bytes.hpp>

namespace keyreg::host {

    /// Ed25519 wallet keypair: the identity that signs requests
    /// Header-only implementation using keylock for crypto operations
    class Keypair {
      public:
        /// Generate new Ed25519 keypair
        inline static dp::Result<Keypair, dp::Error> generate() {
            keylock::keylock crypto(keylock::Algorithm::Ed25519);
            auto keypair = crypto.generate_keypair();

            if (keypair.private_key.empty() || keypair.public_key.size() != PUBKEY_BYTES) {
                return dp::Result<Keypair, dp::Error>::err(dp::Error::io_error("Failed to generate keypair"));
            }

            return dp::Result<Keypair, dp::Error>::ok(Keypair(keypair));
        }

        /// Load from keypair bytes (private key can be 32 or 64 bytes for Ed25519)
        inline static dp::Result<Keypair, dp::Error> fromKeypair(const std::vector<uint8_t> &public_key,
                                                                 const std::vector<uint8_t> &private_key) {
            if (public_key.size() != PUBKEY_BYTES) {
                return dp::Result<Keypair, dp::Error>::err(
                    dp::Error::invalid_argument("Ed25519 public key must be 32 bytes"));
            }
            // Ed25519 private key can be 32 bytes (seed) or 64 bytes (seed + public key)
            if (private_key.size() != 32 && private_key.size() != 64) {
                return dp::Result<Keypair, dp::Error>::err(
                    dp::Error::invalid_argument("Ed25519 private key must be 32 or 64 bytes"));
            }

            keylock::KeyPair keypair;
            keypair.public_key = public_key;
            keypair.private_key = private_key;
            return dp::Result<Keypair, dp::Error>::ok(Keypair(keypair));
        }

        /// Wallet address
        inline Pubkey pubkey() const {
            Bytes32 raw{};
            std::copy(keypair_.public_key.begin(), keypair_.public_key.end(), raw.begin());
            return Pubkey(raw);
        }

        /// Raw public key bytes, e.g. to register as a credential
        inline const std::vector<uint8_t> &publicKeyBytes() const { return keypair_.public_key; }

        /// Sign data
        inline dp::Result<std::vector<uint8_t>, dp::Error> sign(const std::vector<uint8_t> &data) const {
            if (keypair_.private_key.empty()) {
                return dp::Result<std::vector<uint8_t>, dp::Error>::err(signing_failed("No private key available"));
            }

            keylock::keylock crypto(keylock::Algorithm::Ed25519);
            auto result = crypto.sign(data, keypair_.private_key);

            if (!result.success) {
                return dp::Result<std::vector<uint8_t>, dp::Error>::err(
                    signing_failed(dp::String(result.error_message.c_str())));
            }

            return dp::Result<std::vector<uint8_t>, dp::Error>::ok(result.data);
        }

        /// Check an Ed25519 signature made by `signer`
        inline static bool verify(const Pubkey &signer, const std::vector<uint8_t> &data,
                                  const std::vector<uint8_t> &signature) {
            if (signature.size() != 64) {
                return false;
            }
            keylock::keylock crypto(keylock::Algorithm::Ed25519);
            auto result = crypto.verify(data, signature, signer.toVector());
            return result.success;
        }

        /// Equality operator (compares public keys)
        inline bool operator==(const Keypair &other) const { return keypair_.public_key == other.keypair_.public_key; }

        inline bool operator!=(const Keypair &other) const { return !(*this == other); }

      private:
        inline explicit Keypair(const keylock::KeyPair &keypair) : keypair_(keypair) {}

        keylock::KeyPair keypair_;
    };

} // namespace keyreg::host
