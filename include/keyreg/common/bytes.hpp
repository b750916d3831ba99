#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <datapod/datapod.hpp>
#include <functional>
#include <keylock/keylock.hpp>
#include <string>
#include <vector>

#include "base58.hpp"
#include "error.hpp"

namespace keyreg {

    constexpr dp::usize PUBKEY_BYTES = 32;
    constexpr dp::usize CREDENTIAL_BYTES = 32;

    using Bytes32 = std::array<dp::u8, 32>;

    /// Registered credential: an Ed25519 public key, kept as opaque bytes
    using Credential = Bytes32;

    inline std::vector<uint8_t> toVector(const Bytes32 &bytes) {
        return std::vector<uint8_t>(bytes.begin(), bytes.end());
    }

    inline std::string toHex(const Bytes32 &bytes) { return keylock::keylock::to_hex(toVector(bytes)); }

    inline std::string toHex(const std::vector<uint8_t> &bytes) { return keylock::keylock::to_hex(bytes); }

    /// SHA-256 via keylock
    inline dp::Result<Bytes32, dp::Error> sha256(const std::vector<uint8_t> &data) {
        keylock::keylock crypto(keylock::Algorithm::XChaCha20_Poly1305, keylock::HashAlgorithm::SHA256);
        auto result = crypto.hash(data);
        if (!result.success || result.data.size() != 32) {
            return dp::Result<Bytes32, dp::Error>::err(hash_failed());
        }

        Bytes32 digest{};
        std::copy(result.data.begin(), result.data.end(), digest.begin());
        return dp::Result<Bytes32, dp::Error>::ok(digest);
    }

    /// Build a credential from raw bytes (must be exactly 32)
    inline dp::Result<Credential, dp::Error> credentialFromBytes(const std::vector<uint8_t> &bytes) {
        if (bytes.size() != CREDENTIAL_BYTES) {
            return dp::Result<Credential, dp::Error>::err(invalid_credential());
        }

        Credential credential{};
        std::copy(bytes.begin(), bytes.end(), credential.begin());
        return dp::Result<Credential, dp::Error>::ok(credential);
    }

    /// 32-byte identity: owner wallets, signers, program ids and derived slot addresses
    class Pubkey {
      public:
        Pubkey() : bytes_{} {}

        explicit Pubkey(const Bytes32 &bytes) : bytes_(bytes) {}

        /// Load from raw bytes (must be exactly 32)
        inline static dp::Result<Pubkey, dp::Error> fromBytes(const std::vector<uint8_t> &bytes) {
            if (bytes.size() != PUBKEY_BYTES) {
                return dp::Result<Pubkey, dp::Error>::err(invalid_address("Address must be 32 bytes"));
            }

            Bytes32 raw{};
            std::copy(bytes.begin(), bytes.end(), raw.begin());
            return dp::Result<Pubkey, dp::Error>::ok(Pubkey(raw));
        }

        /// Parse the base58 text form
        inline static dp::Result<Pubkey, dp::Error> fromBase58(const std::string &encoded) {
            auto decoded = base58Decode(encoded);
            if (!decoded.is_ok()) {
                return dp::Result<Pubkey, dp::Error>::err(decoded.error());
            }
            return fromBytes(decoded.value());
        }

        inline const Bytes32 &bytes() const { return bytes_; }

        inline std::vector<uint8_t> toVector() const { return keyreg::toVector(bytes_); }

        inline std::string toBase58() const { return base58Encode(toVector()); }

        inline std::string toHex() const { return keyreg::toHex(bytes_); }

        inline bool isZero() const {
            for (auto b : bytes_) {
                if (b != 0)
                    return false;
            }
            return true;
        }

        inline bool operator==(const Pubkey &other) const { return bytes_ == other.bytes_; }

        inline bool operator!=(const Pubkey &other) const { return !(*this == other); }

        inline bool operator<(const Pubkey &other) const { return bytes_ < other.bytes_; }

        /// Hash function for use in unordered containers
        inline size_t hash() const {
            size_t h = 0;
            for (size_t i = 0; i < sizeof(size_t) && i < bytes_.size(); ++i) {
                h = (h << 8) | bytes_[i];
            }
            return h;
        }

      private:
        Bytes32 bytes_;
    };

} // namespace keyreg

// Hash specialization for std::unordered_map
namespace std {
    template <> struct hash<keyreg::Pubkey> {
        size_t operator()(const keyreg::Pubkey &key) const { return key.hash(); }
    };
} // namespace std
